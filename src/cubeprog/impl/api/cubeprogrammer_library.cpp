#include "api/cubeprogrammer_library.h"
#include "utils/log.h"
#include <sstream>
#include <vector>

namespace cubeprog {

// Vendor C signatures. Enum parameters are int sized; structures are passed
// by value where the vendor header does so.
struct CubeProgrammerLibrary::EntryPoints {
    void (*setLoadersPath)(const char* path) = nullptr;
    void (*setDisplayCallbacks)(abi::DisplayCallbacks callbacks) = nullptr;
    void (*setVerbosityLevel)(int level) = nullptr;
    int (*getStLinkEnumerationList)(abi::DebugConnectParameters** list, int shared) = nullptr;
    int (*getStLinkList)(abi::DebugConnectParameters** list, int shared) = nullptr;
    void (*deleteInterfaceList)() = nullptr;
    int (*connectStLink)(abi::DebugConnectParameters parameters) = nullptr;
    void (*disconnect)() = nullptr;
    int (*checkDeviceConnection)() = nullptr;
    abi::GeneralInfo* (*getDeviceGeneralInf)() = nullptr;
    int (*downloadFile)(const wchar_t* filePath, unsigned int address,
                        unsigned int skipErase, unsigned int verify,
                        const wchar_t* binPath) = nullptr;
    int (*massErase)(char* flashMemoryName) = nullptr;
    int (*readMemory)(unsigned int address, unsigned char** data, unsigned int size) = nullptr;
    int (*writeMemory)(unsigned int address, char* data, unsigned int size) = nullptr;
    void (*freeLibraryMemory)(void* ptr) = nullptr;
    int (*readCortexReg)(const unsigned int reg, unsigned int* data) = nullptr;
    int (*writeCortexRegistres)(const unsigned int reg, unsigned int data) = nullptr;
    int (*reset)(int mode) = nullptr;
    int (*startFus)() = nullptr;
};

CubeProgrammerLibrary::CubeProgrammerLibrary(const std::string& libraryPath)
    : CubeProgrammerLibrary(std::make_unique<platform::PlatformAbstraction>(), libraryPath) {
}

CubeProgrammerLibrary::CubeProgrammerLibrary(std::unique_ptr<platform::PlatformAbstraction> platform,
                                             const std::string& libraryPath)
    : platform_(std::move(platform))
    , handle_(platform::INVALID_LIBRARY_HANDLE)
    , libraryPath_(libraryPath)
    , fn_(std::make_unique<EntryPoints>()) {
    LOGI_FMT("Loading programmer API from " << libraryPath_);
    handle_ = platform_->loadLibrary(libraryPath_);

    try {
        bindEntryPoints();
    } catch (...) {
        platform_->unloadLibrary(handle_);
        throw;
    }
}

CubeProgrammerLibrary::~CubeProgrammerLibrary() {
    if (handle_ == platform::INVALID_LIBRARY_HANDLE) {
        return;
    }

    try {
        platform_->unloadLibrary(handle_);
    } catch (const platform::DynamicLoaderException& e) {
        LOGW_FMT("Failed to unload programmer API: " << e.what());
    }
}

template<typename T>
T CubeProgrammerLibrary::bindRequired(const char* symbolName) {
    T fn = platform_->getSymbol<T>(handle_, symbolName);
    if (fn == nullptr) {
        std::ostringstream oss;
        oss << "Programmer API '" << libraryPath_ << "' does not export required symbol '"
            << symbolName << "': " << platform_->getLastError();
        throw platform::DynamicLoaderException(oss.str());
    }
    return fn;
}

template<typename T>
T CubeProgrammerLibrary::bindOptional(const char* symbolName) {
    T fn = platform_->getSymbol<T>(handle_, symbolName);
    if (fn == nullptr) {
        LOGD_FMT("Optional symbol '" << symbolName << "' not exported");
    }
    return fn;
}

void CubeProgrammerLibrary::bindEntryPoints() {
    EntryPoints& f = *fn_;
    f.setLoadersPath = bindRequired<decltype(f.setLoadersPath)>("setLoadersPath");
    f.setDisplayCallbacks = bindRequired<decltype(f.setDisplayCallbacks)>("setDisplayCallbacks");
    f.setVerbosityLevel = bindRequired<decltype(f.setVerbosityLevel)>("setVerbosityLevel");
    f.getStLinkEnumerationList = bindRequired<decltype(f.getStLinkEnumerationList)>("getStLinkEnumerationList");
    f.getStLinkList = bindRequired<decltype(f.getStLinkList)>("getStLinkList");
    f.deleteInterfaceList = bindOptional<decltype(f.deleteInterfaceList)>("deleteInterfaceList");
    f.connectStLink = bindRequired<decltype(f.connectStLink)>("connectStLink");
    f.disconnect = bindRequired<decltype(f.disconnect)>("disconnect");
    f.checkDeviceConnection = bindRequired<decltype(f.checkDeviceConnection)>("checkDeviceConnection");
    f.getDeviceGeneralInf = bindRequired<decltype(f.getDeviceGeneralInf)>("getDeviceGeneralInf");
    f.downloadFile = bindRequired<decltype(f.downloadFile)>("downloadFile");
    f.massErase = bindRequired<decltype(f.massErase)>("massErase");
    f.readMemory = bindRequired<decltype(f.readMemory)>("readMemory");
    f.writeMemory = bindRequired<decltype(f.writeMemory)>("writeMemory");
    f.freeLibraryMemory = bindOptional<decltype(f.freeLibraryMemory)>("freeLibraryMemory");
    f.readCortexReg = bindRequired<decltype(f.readCortexReg)>("readCortexReg");
    f.writeCortexRegistres = bindRequired<decltype(f.writeCortexRegistres)>("writeCortexRegistres");
    f.reset = bindRequired<decltype(f.reset)>("reset");
    f.startFus = bindRequired<decltype(f.startFus)>("startFus");
    LOGD("Programmer API entry points bound");
}

void CubeProgrammerLibrary::setLoadersPath(const std::string& path) {
    fn_->setLoadersPath(path.c_str());
}

void CubeProgrammerLibrary::setDisplayCallbacks(const abi::DisplayCallbacks& callbacks) {
    fn_->setDisplayCallbacks(callbacks);
}

void CubeProgrammerLibrary::setVerbosityLevel(int32_t level) {
    fn_->setVerbosityLevel(level);
}

int32_t CubeProgrammerLibrary::getStLinkEnumerationList(abi::DebugConnectParameters** list, int32_t shared) {
    return fn_->getStLinkEnumerationList(list, shared);
}

int32_t CubeProgrammerLibrary::getStLinkList(abi::DebugConnectParameters** list, int32_t shared) {
    return fn_->getStLinkList(list, shared);
}

void CubeProgrammerLibrary::deleteInterfaceList() {
    if (fn_->deleteInterfaceList) {
        fn_->deleteInterfaceList();
    }
}

int32_t CubeProgrammerLibrary::connectStLink(const abi::DebugConnectParameters& parameters) {
    return fn_->connectStLink(parameters);
}

void CubeProgrammerLibrary::disconnect() {
    fn_->disconnect();
}

int32_t CubeProgrammerLibrary::checkDeviceConnection() {
    return fn_->checkDeviceConnection();
}

const abi::GeneralInfo* CubeProgrammerLibrary::getDeviceGeneralInf() {
    return fn_->getDeviceGeneralInf();
}

int32_t CubeProgrammerLibrary::downloadFile(const std::wstring& filePath,
                                            uint32_t address,
                                            uint32_t skipErase,
                                            uint32_t verify,
                                            const std::wstring& binPath) {
    return fn_->downloadFile(filePath.c_str(), address, skipErase, verify, binPath.c_str());
}

int32_t CubeProgrammerLibrary::massErase() {
    // nullptr selects the internal flash
    return fn_->massErase(nullptr);
}

int32_t CubeProgrammerLibrary::readMemory(uint32_t address, uint8_t** data, uint32_t size) {
    return fn_->readMemory(address, data, size);
}

int32_t CubeProgrammerLibrary::writeMemory(uint32_t address, const uint8_t* data, uint32_t size) {
    // The vendor prototype takes a mutable buffer
    std::vector<char> buffer(data, data + size);
    return fn_->writeMemory(address, buffer.data(), size);
}

void CubeProgrammerLibrary::freeLibraryMemory(void* ptr) {
    if (fn_->freeLibraryMemory && ptr != nullptr) {
        fn_->freeLibraryMemory(ptr);
    }
}

int32_t CubeProgrammerLibrary::readCortexReg(uint32_t reg, uint32_t* data) {
    unsigned int value = 0;
    int status = fn_->readCortexReg(reg, &value);
    *data = value;
    return status;
}

int32_t CubeProgrammerLibrary::writeCortexRegistres(uint32_t reg, uint32_t data) {
    return fn_->writeCortexRegistres(reg, data);
}

int32_t CubeProgrammerLibrary::reset(int32_t mode) {
    return fn_->reset(mode);
}

int32_t CubeProgrammerLibrary::startFus() {
    return fn_->startFus();
}

} // namespace cubeprog
