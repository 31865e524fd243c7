#include "api/cubeprog_api.h"
#include "api/cubeprogrammer_library.h"
#include "api/display_router.h"
#include "api/install_layout.h"
#include "firmware/firmware_image.h"
#include "utils/log.h"
#include "utils/string_utils.h"
#include <stdexcept>

namespace cubeprog {

CubeProgrammerApi::CubeProgrammerApi(const std::string& installDir) {
    InstallLayout layout = InstallLayout::fromInstallDir(installDir);
    LOGI_FMT("Using STM32CubeProgrammer installation " << layout.installDir);

    backend_ = std::make_unique<CubeProgrammerLibrary>(layout.libraryPath);
    loadersPath_ = layout.loadersPath;
    initialize();
}

CubeProgrammerApi::CubeProgrammerApi(std::unique_ptr<IProgrammerBackend> backend,
                                     const std::string& loadersPath)
    : backend_(std::move(backend))
    , loadersPath_(loadersPath) {
    if (!backend_) {
        throw std::invalid_argument("Programmer backend must not be null");
    }
    initialize();
}

CubeProgrammerApi::~CubeProgrammerApi() = default;

void CubeProgrammerApi::initialize() {
    LOGD_FMT("Flash loaders path: " << loadersPath_);
    backend_->setLoadersPath(loadersPath_);
    backend_->setDisplayCallbacks(DisplayRouter::callbacks());
    backend_->setVerbosityLevel(static_cast<int32_t>(Verbosity::LEVEL_0));
}

std::vector<StLinkProbe> CubeProgrammerApi::enumerate(EnumerateFn enumerateFn, const char* operation) {
    std::lock_guard<std::mutex> lock(mutex_);

    abi::DebugConnectParameters* list = nullptr;
    int32_t count = (backend_.get()->*enumerateFn)(&list, 0);

    std::vector<StLinkProbe> probes;
    if (count > 0 && list != nullptr) {
        probes.reserve(static_cast<size_t>(count));
        for (int32_t i = 0; i < count; ++i) {
            probes.emplace_back(list[i]);
        }
    }

    if (list != nullptr) {
        backend_->deleteInterfaceList();
    }

    LOGD_FMT(operation << " found " << probes.size() << " ST-LINK probe(s)");
    return probes;
}

std::vector<StLinkProbe> CubeProgrammerApi::probe() {
    return enumerate(&IProgrammerBackend::getStLinkEnumerationList, "getStLinkEnumerationList");
}

std::vector<StLinkProbe> CubeProgrammerApi::find() {
    return enumerate(&IProgrammerBackend::getStLinkList, "getStLinkList");
}

void CubeProgrammerApi::connect(const StLinkProbe& probe) {
    std::lock_guard<std::mutex> lock(mutex_);

    LOGI_FMT("Connecting through ST-LINK " << probe.getSerialNumber()
             << " (" << connectionModeToString(probe.getConnectionMode()) << ", "
             << resetModeToString(probe.getResetMode()) << ")");
    checkStatus(backend_->connectStLink(probe.getParameters()), "connectStLink");
}

void CubeProgrammerApi::download(const std::string& path, uint32_t address, bool skipErase, bool verify) {
    FirmwareImage image = FirmwareImage::open(path);

    std::lock_guard<std::mutex> lock(mutex_);

    LOGI_FMT("Downloading " << image.getPath() << " (" << image.getSize() << " bytes, sha256 "
             << image.getSha256() << ") to 0x" << utils::toHex(address));
    if (image.getFormat() == ImageFormat::UNKNOWN) {
        LOGW_FMT("Unrecognised image extension, leaving format detection to the programmer");
    }

    int32_t status = backend_->downloadFile(utils::utf8ToWide(image.getPath()),
                                            address,
                                            skipErase ? 1u : 0u,
                                            verify ? 1u : 0u,
                                            std::wstring());
    checkStatus(status, "downloadFile");
    LOGI("Download complete");
}

TargetInfo CubeProgrammerApi::info() {
    std::lock_guard<std::mutex> lock(mutex_);

    const abi::GeneralInfo* info = backend_->getDeviceGeneralInf();
    if (info == nullptr) {
        LOGE("getDeviceGeneralInf returned no device");
        throw CubeProgrammerException(StatusCode::DEVICE_NOT_CONNECTED);
    }
    return TargetInfo(*info);
}

void CubeProgrammerApi::massErase() {
    std::lock_guard<std::mutex> lock(mutex_);

    LOGI("Mass erasing flash");
    checkStatus(backend_->massErase(), "massErase");
}

std::vector<uint8_t> CubeProgrammerApi::readMemory(uint32_t address, uint32_t size) {
    if (size == 0) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    uint8_t* buffer = nullptr;
    int32_t status = backend_->readMemory(address, &buffer, size);
    if (status != 0) {
        backend_->freeLibraryMemory(buffer);
        checkStatus(status, "readMemory");
    }

    if (buffer == nullptr) {
        LOGE_FMT("readMemory returned no data for 0x" << utils::toHex(address));
        throw CubeProgrammerException(StatusCode::READ_MEMORY_FAILED);
    }

    std::vector<uint8_t> data(buffer, buffer + size);
    backend_->freeLibraryMemory(buffer);

    LOGV_FMT("Read " << size << " bytes at 0x" << utils::toHex(address));
    return data;
}

void CubeProgrammerApi::writeMemory(uint32_t address, const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    checkStatus(backend_->writeMemory(address, data.data(), static_cast<uint32_t>(data.size())),
                "writeMemory");
    LOGV_FMT("Wrote " << data.size() << " bytes at 0x" << utils::toHex(address));
}

uint32_t CubeProgrammerApi::readRegister(CortexRegister reg) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t value = 0;
    checkStatus(backend_->readCortexReg(static_cast<uint32_t>(reg), &value), "readCortexReg");
    return value;
}

void CubeProgrammerApi::writeRegister(CortexRegister reg, uint32_t value) {
    std::lock_guard<std::mutex> lock(mutex_);

    checkStatus(backend_->writeCortexRegistres(static_cast<uint32_t>(reg), value),
                "writeCortexRegistres");
}

void CubeProgrammerApi::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);

    LOGI("Disconnecting");
    backend_->disconnect();
}

void CubeProgrammerApi::reset(ResetMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);

    LOGI_FMT("Resetting target (" << resetModeToString(mode) << ")");
    checkStatus(backend_->reset(static_cast<int32_t>(mode)), "reset");
}

bool CubeProgrammerApi::connected() {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_->checkDeviceConnection() == 1;
}

void CubeProgrammerApi::startFus() {
    std::lock_guard<std::mutex> lock(mutex_);

    // startFus reports success with 1 and failure with 0, unlike the other
    // entry points. Negative results are ordinary vendor status codes.
    int32_t result = backend_->startFus();
    if (result < 0) {
        LOGE_FMT("startFus failed with status " << result);
        throw CubeProgrammerException(result);
    }
    if (result == 0) {
        LOGE("startFus failed");
        throw CubeProgrammerException(StatusCode::OTHER);
    }
    LOGI("Firmware upgrade service started");
}

void CubeProgrammerApi::setVerbosity(Verbosity verbosity) {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_->setVerbosityLevel(static_cast<int32_t>(verbosity));
}

} // namespace cubeprog
