#ifndef CUBEPROG_DYNAMIC_LOADER_H
#define CUBEPROG_DYNAMIC_LOADER_H

#include "platform_types.h"
#include <string>
#include <stdexcept>

namespace cubeprog {
namespace platform {

/**
 * @brief Exception thrown when a shared library cannot be loaded or bound
 */
class DynamicLoaderException : public std::runtime_error {
public:
    explicit DynamicLoaderException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Abstract interface for platform-specific shared library loading
 *
 * The programmer API ships as a vendor shared object which is only known at
 * run time (it lives inside the STM32CubeProgrammer installation), so it is
 * opened and bound through this interface rather than linked.
 *
 * Thread-Safety: implementations must be safe for concurrent calls.
 */
class IDynamicLoader {
public:
    virtual ~IDynamicLoader() = default;

    /**
     * @brief Load a shared library
     *
     * @param path Absolute or relative path to the library file
     * @return LibraryHandle Opaque handle to the loaded library
     * @throws DynamicLoaderException if loading fails (file not found,
     *         missing dependencies, architecture mismatch, etc.)
     */
    virtual LibraryHandle load(const std::string& path) = 0;

    /**
     * @brief Unload a library previously returned by load()
     *
     * @param handle Valid library handle from load()
     * @throws DynamicLoaderException if handle is unknown or unload fails
     *
     * @warning Function pointers resolved from the library are dangling
     *          afterwards.
     */
    virtual void unload(LibraryHandle handle) = 0;

    /**
     * @brief Resolve a symbol from a loaded library
     *
     * @param handle Valid library handle from load()
     * @param symbolName Unmangled C symbol name (e.g. "connectStLink")
     * @return void* Symbol address, or nullptr if the library does not export it
     * @throws DynamicLoaderException if handle is invalid or name is empty
     *
     * Example:
     * @code
     * LibraryHandle handle = loader->load("libCubeProgrammer_API.so");
     * auto* fn = reinterpret_cast<int (*)()>(
     *     loader->getSymbol(handle, "checkDeviceConnection"));
     * if (fn) {
     *     fn();
     * }
     * @endcode
     */
    virtual void* getSymbol(LibraryHandle handle, const std::string& symbolName) = 0;

    /**
     * @brief Last error reported by the platform loader, or empty
     */
    virtual std::string getLastError() const = 0;

    virtual Platform getPlatform() const = 0;
};

} // namespace platform
} // namespace cubeprog

#endif // CUBEPROG_DYNAMIC_LOADER_H
