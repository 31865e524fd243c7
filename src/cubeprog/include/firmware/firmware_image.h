#ifndef CUBEPROG_FIRMWARE_IMAGE_H
#define CUBEPROG_FIRMWARE_IMAGE_H

#include <cstdint>
#include <string>

namespace cubeprog {

/**
 * @brief Container formats accepted by the programmer for download
 */
enum class ImageFormat {
    BINARY,     ///< Raw .bin, needs an explicit load address
    INTEL_HEX,  ///< .hex
    ELF,        ///< .elf / .axf / .out
    SREC,       ///< Motorola S-record (.srec / .s19 / .mot)
    UNKNOWN
};

const char* imageFormatToString(ImageFormat format);

/**
 * @brief Format implied by a file name extension (case-insensitive)
 */
ImageFormat detectImageFormat(const std::string& path);

/**
 * @brief A firmware file checked on the host before it is downloaded
 */
class FirmwareImage {
public:
    /**
     * @brief Inspect a firmware file
     *
     * @param path Path to the image, made absolute
     * @throws CubeProgrammerException (NO_FILE) if the file does not exist
     *         or is not a regular file
     */
    static FirmwareImage open(const std::string& path);

    const std::string& getPath() const { return path_; }
    uint64_t getSize() const { return size_; }
    ImageFormat getFormat() const { return format_; }

    /**
     * @brief Lowercase hex SHA-256 of the file contents
     */
    const std::string& getSha256() const { return sha256_; }

    /**
     * @brief True for formats carrying their own load addresses
     */
    bool hasEmbeddedAddress() const;

    /**
     * @brief Compute the SHA-256 of a file
     *
     * @throws std::runtime_error if the file cannot be read or hashing fails
     */
    static std::string computeSha256(const std::string& path);

private:
    FirmwareImage() = default;

    std::string path_;
    uint64_t size_ = 0;
    ImageFormat format_ = ImageFormat::UNKNOWN;
    std::string sha256_;
};

} // namespace cubeprog

#endif // CUBEPROG_FIRMWARE_IMAGE_H
