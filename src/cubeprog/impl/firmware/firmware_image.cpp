#include "firmware/firmware_image.h"
#include "api/cubeprog_error.h"
#include "utils/log.h"
#include "utils/string_utils.h"
#include <openssl/evp.h>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace cubeprog {

const char* imageFormatToString(ImageFormat format) {
    switch (format) {
        case ImageFormat::BINARY:    return "BINARY";
        case ImageFormat::INTEL_HEX: return "INTEL_HEX";
        case ImageFormat::ELF:       return "ELF";
        case ImageFormat::SREC:      return "SREC";
        case ImageFormat::UNKNOWN:   return "UNKNOWN";
        default:                     return "INVALID";
    }
}

ImageFormat detectImageFormat(const std::string& path) {
    std::string extension = utils::toUpper(std::filesystem::path(path).extension().string());

    if (extension == ".BIN") {
        return ImageFormat::BINARY;
    }
    if (extension == ".HEX") {
        return ImageFormat::INTEL_HEX;
    }
    if (extension == ".ELF" || extension == ".AXF" || extension == ".OUT") {
        return ImageFormat::ELF;
    }
    if (extension == ".SREC" || extension == ".S19" || extension == ".MOT") {
        return ImageFormat::SREC;
    }
    return ImageFormat::UNKNOWN;
}

FirmwareImage FirmwareImage::open(const std::string& path) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec || !fs::is_regular_file(absolute, ec)) {
        LOGE_FMT("Firmware image not found: " << path);
        throw CubeProgrammerException(StatusCode::NO_FILE);
    }

    FirmwareImage image;
    image.path_ = absolute.lexically_normal().string();
    image.size_ = static_cast<uint64_t>(fs::file_size(absolute));
    image.format_ = detectImageFormat(image.path_);
    image.sha256_ = computeSha256(image.path_);

    LOGD_FMT("Firmware image " << image.path_ << ": " << image.size_ << " bytes, "
             << imageFormatToString(image.format_) << ", sha256 " << image.sha256_);
    return image;
}

bool FirmwareImage::hasEmbeddedAddress() const {
    return format_ == ImageFormat::INTEL_HEX ||
           format_ == ImageFormat::ELF ||
           format_ == ImageFormat::SREC;
}

std::string FirmwareImage::computeSha256(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for hashing: " + path);
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialise SHA-256 digest");
    }

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(file.gcount())) != 1) {
            throw std::runtime_error("SHA-256 update failed for " + path);
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hashLength) != 1) {
        throw std::runtime_error("SHA-256 finalisation failed for " + path);
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < hashLength; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
    }
    return ss.str();
}

} // namespace cubeprog
