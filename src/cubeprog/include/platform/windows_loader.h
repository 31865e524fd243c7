#ifndef CUBEPROG_WINDOWS_LOADER_H
#define CUBEPROG_WINDOWS_LOADER_H

#include "dynamic_loader.h"
#include <map>
#include <mutex>

namespace cubeprog {
namespace platform {

/**
 * @brief DLL loader built on LoadLibraryEx/GetProcAddress/FreeLibrary
 *
 * CubeProgrammer_API.dll pulls in sibling DLLs from its own directory, so
 * paths are made absolute and loaded with LOAD_WITH_ALTERED_SEARCH_PATH.
 * Paths are UTF-8 and reach Windows through the wide API.
 *
 * Only compiled on Windows.
 *
 * Thread-Safety: All methods are thread-safe
 */
class WindowsLoader : public IDynamicLoader {
public:
    WindowsLoader();

    /**
     * @brief Destructor - frees every library still loaded
     */
    ~WindowsLoader() override;

    WindowsLoader(const WindowsLoader&) = delete;
    WindowsLoader& operator=(const WindowsLoader&) = delete;

    /**
     * @throws DynamicLoaderException if LoadLibraryExW() fails
     */
    LibraryHandle load(const std::string& path) override;

    void unload(LibraryHandle handle) override;

    /**
     * @return void* Procedure address, or nullptr if not exported
     */
    void* getSymbol(LibraryHandle handle, const std::string& symbolName) override;

    std::string getLastError() const override;

    Platform getPlatform() const override { return Platform::WINDOWS; }

private:
    std::map<LibraryHandle, std::string> handles_;

    mutable std::mutex mutex_;

    std::string lastError_;

    bool isValidHandle(LibraryHandle handle) const;

    void setLastError(unsigned long errorCode);

    static std::string formatWindowsError(unsigned long errorCode);
};

} // namespace platform
} // namespace cubeprog

#endif // CUBEPROG_WINDOWS_LOADER_H
