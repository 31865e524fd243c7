#ifndef CUBEPROG_LINUX_LOADER_H
#define CUBEPROG_LINUX_LOADER_H

#include "dynamic_loader.h"
#include <map>
#include <mutex>

namespace cubeprog {
namespace platform {

/**
 * @brief Shared object loader built on dlopen/dlsym/dlclose
 *
 * Libraries are opened with RTLD_NOW so that an incomplete installation
 * (a sibling library of the programmer API missing from api/lib) fails in
 * load() instead of on the first call into the vendor code.
 *
 * Thread-Safety: All methods are thread-safe
 */
class LinuxLoader : public IDynamicLoader {
public:
    LinuxLoader();

    /**
     * @brief Destructor - closes every library still open
     */
    ~LinuxLoader() override;

    LinuxLoader(const LinuxLoader&) = delete;
    LinuxLoader& operator=(const LinuxLoader&) = delete;

    /**
     * @brief Open a shared object using dlopen()
     *
     * @param path Path to the .so file
     * @return LibraryHandle Handle to the loaded library
     * @throws DynamicLoaderException if dlopen() fails
     */
    LibraryHandle load(const std::string& path) override;

    /**
     * @brief Close a shared object using dlclose()
     *
     * @throws DynamicLoaderException if handle is unknown or dlclose() fails
     */
    void unload(LibraryHandle handle) override;

    /**
     * @brief Resolve a symbol using dlsym()
     *
     * @return void* Symbol address, or nullptr if not exported
     * @throws DynamicLoaderException if handle is unknown or name is empty
     */
    void* getSymbol(LibraryHandle handle, const std::string& symbolName) override;

    std::string getLastError() const override;

    Platform getPlatform() const override { return Platform::LINUX; }

private:
    // handle -> path it was opened from, for error messages
    std::map<LibraryHandle, std::string> handles_;

    mutable std::mutex mutex_;

    std::string lastError_;

    bool isValidHandle(LibraryHandle handle) const;

    void setLastError(const std::string& error);
};

} // namespace platform
} // namespace cubeprog

#endif // CUBEPROG_LINUX_LOADER_H
