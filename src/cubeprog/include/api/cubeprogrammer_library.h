#ifndef CUBEPROG_CUBEPROGRAMMER_LIBRARY_H
#define CUBEPROG_CUBEPROGRAMMER_LIBRARY_H

#include "api/programmer_backend.h"
#include "platform/platform_abstraction.h"
#include <memory>
#include <string>

namespace cubeprog {

/**
 * @brief IProgrammerBackend bound to libCubeProgrammer_API at run time
 *
 * Every required entry point is resolved in the constructor, so a partially
 * usable object never exists. deleteInterfaceList and freeLibraryMemory are
 * optional: older API builds do not export them and the calls become no-ops.
 */
class CubeProgrammerLibrary : public IProgrammerBackend {
public:
    /**
     * @brief Load the library and bind its entry points
     *
     * @param libraryPath Path to libCubeProgrammer_API.so / CubeProgrammer_API.dll
     * @throws platform::DynamicLoaderException if the library cannot be
     *         loaded or a required symbol is missing
     */
    explicit CubeProgrammerLibrary(const std::string& libraryPath);

    /**
     * @brief Load through an explicit platform layer
     */
    CubeProgrammerLibrary(std::unique_ptr<platform::PlatformAbstraction> platform,
                          const std::string& libraryPath);

    ~CubeProgrammerLibrary() override;

    CubeProgrammerLibrary(const CubeProgrammerLibrary&) = delete;
    CubeProgrammerLibrary& operator=(const CubeProgrammerLibrary&) = delete;

    const std::string& getLibraryPath() const { return libraryPath_; }

    void setLoadersPath(const std::string& path) override;
    void setDisplayCallbacks(const abi::DisplayCallbacks& callbacks) override;
    void setVerbosityLevel(int32_t level) override;
    int32_t getStLinkEnumerationList(abi::DebugConnectParameters** list, int32_t shared) override;
    int32_t getStLinkList(abi::DebugConnectParameters** list, int32_t shared) override;
    void deleteInterfaceList() override;
    int32_t connectStLink(const abi::DebugConnectParameters& parameters) override;
    void disconnect() override;
    int32_t checkDeviceConnection() override;
    const abi::GeneralInfo* getDeviceGeneralInf() override;
    int32_t downloadFile(const std::wstring& filePath,
                         uint32_t address,
                         uint32_t skipErase,
                         uint32_t verify,
                         const std::wstring& binPath) override;
    int32_t massErase() override;
    int32_t readMemory(uint32_t address, uint8_t** data, uint32_t size) override;
    int32_t writeMemory(uint32_t address, const uint8_t* data, uint32_t size) override;
    void freeLibraryMemory(void* ptr) override;
    int32_t readCortexReg(uint32_t reg, uint32_t* data) override;
    int32_t writeCortexRegistres(uint32_t reg, uint32_t data) override;
    int32_t reset(int32_t mode) override;
    int32_t startFus() override;

private:
    struct EntryPoints;

    std::unique_ptr<platform::PlatformAbstraction> platform_;
    platform::LibraryHandle handle_;
    std::string libraryPath_;
    std::unique_ptr<EntryPoints> fn_;

    void bindEntryPoints();

    template<typename T>
    T bindRequired(const char* symbolName);

    template<typename T>
    T bindOptional(const char* symbolName);
};

} // namespace cubeprog

#endif // CUBEPROG_CUBEPROGRAMMER_LIBRARY_H
