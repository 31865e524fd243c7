#ifndef CUBEPROG_PLATFORM_ABSTRACTION_H
#define CUBEPROG_PLATFORM_ABSTRACTION_H

#include "platform_types.h"
#include "dynamic_loader.h"
#include <memory>
#include <string>
#include <map>
#include <mutex>

namespace cubeprog {
namespace platform {

/**
 * @brief Platform-independent front end for shared library loading
 *
 * Selects the loader for the build platform (LinuxLoader on Linux and
 * macOS) and keeps track of what it has opened.
 *
 * Usage:
 * @code
 * PlatformAbstraction platform;
 * LibraryHandle handle = platform.loadLibrary("/opt/st/api/lib/libCubeProgrammer_API.so");
 * using ResetFn = int (*)(int);
 * auto* reset = platform.getSymbol<ResetFn>(handle, "reset");
 * platform.unloadLibrary(handle);
 * @endcode
 */
class PlatformAbstraction {
public:
    /**
     * @brief Construct with the loader for the build platform
     *
     * @throws std::runtime_error if the platform has no loader
     */
    PlatformAbstraction();

    /**
     * @brief Construct over an explicit loader
     *
     * @throws std::invalid_argument if loader is null
     */
    explicit PlatformAbstraction(std::unique_ptr<IDynamicLoader> loader);

    ~PlatformAbstraction();

    PlatformAbstraction(const PlatformAbstraction&) = delete;
    PlatformAbstraction& operator=(const PlatformAbstraction&) = delete;

    /**
     * @brief Load a shared library
     *
     * @throws DynamicLoaderException on load failure
     */
    LibraryHandle loadLibrary(const std::string& path);

    /**
     * @brief Unload a library returned by loadLibrary()
     *
     * @throws DynamicLoaderException if handle is invalid or unload fails
     */
    void unloadLibrary(LibraryHandle handle);

    /**
     * @brief Resolve a symbol, nullptr if not exported
     *
     * @throws DynamicLoaderException if handle is invalid
     */
    void* getSymbol(LibraryHandle handle, const std::string& symbolName);

    /**
     * @brief Resolve a symbol and cast it to a function pointer type
     *
     * @code
     * using DisconnectFn = void (*)();
     * auto disconnect = platform.getSymbol<DisconnectFn>(handle, "disconnect");
     * @endcode
     */
    template<typename T>
    T getSymbol(LibraryHandle handle, const std::string& symbolName) {
        void* symbol = getSymbol(handle, symbolName);
        return reinterpret_cast<T>(symbol);
    }

    Platform getPlatform() const { return currentPlatform_; }

    const char* getLibraryExtension() const {
        return platform::getLibraryExtension(currentPlatform_);
    }

    const char* getLibraryPrefix() const {
        return platform::getLibraryPrefix(currentPlatform_);
    }

    std::string getLastError() const;

    bool isLibraryLoaded(LibraryHandle handle) const;

    /**
     * @brief Path a loaded library was opened from
     *
     * @throws std::out_of_range if handle not found
     */
    std::string getLibraryPath(LibraryHandle handle) const;

    size_t getLoadedLibraryCount() const;

private:
    Platform currentPlatform_;

    std::unique_ptr<IDynamicLoader> loader_;

    std::map<LibraryHandle, std::string> loadedLibraries_;

    mutable std::mutex mutex_;

    /**
     * @brief Create the loader for a platform
     *
     * @throws std::runtime_error if platform is unsupported
     */
    static std::unique_ptr<IDynamicLoader> createLoader(Platform platform);
};

} // namespace platform
} // namespace cubeprog

#endif // CUBEPROG_PLATFORM_ABSTRACTION_H
