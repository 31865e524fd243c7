#ifndef CUBEPROG_PLATFORM_TYPES_H
#define CUBEPROG_PLATFORM_TYPES_H

#include <cstdint>

namespace cubeprog {
namespace platform {

/**
 * @brief Host operating systems the programmer API can be loaded on
 */
enum class Platform {
    LINUX,      ///< Linux host
    WINDOWS,    ///< Windows host
    MACOS,      ///< macOS host
    UNKNOWN     ///< Unknown or unsupported host
};

/**
 * @brief Opaque handle for a dynamically loaded library
 *
 * void* from dlopen() on Linux/macOS, HMODULE on Windows.
 */
using LibraryHandle = void*;

constexpr LibraryHandle INVALID_LIBRARY_HANDLE = nullptr;

inline const char* platformToString(Platform platform) {
    switch (platform) {
        case Platform::LINUX:   return "Linux";
        case Platform::WINDOWS: return "Windows";
        case Platform::MACOS:   return "macOS";
        case Platform::UNKNOWN: return "Unknown";
        default:                return "Invalid";
    }
}

/**
 * @brief Detect the host platform at compile time
 */
inline Platform getCurrentPlatform() {
#if defined(__linux__)
    return Platform::LINUX;
#elif defined(_WIN32) || defined(_WIN64)
    return Platform::WINDOWS;
#elif defined(__APPLE__) && defined(__MACH__)
    return Platform::MACOS;
#else
    return Platform::UNKNOWN;
#endif
}

inline const char* getLibraryExtension(Platform platform) {
    switch (platform) {
        case Platform::LINUX:   return ".so";
        case Platform::WINDOWS: return ".dll";
        case Platform::MACOS:   return ".dylib";
        default:                return "";
    }
}

inline const char* getLibraryPrefix(Platform platform) {
    switch (platform) {
        case Platform::LINUX:
        case Platform::MACOS:   return "lib";
        case Platform::WINDOWS: return "";
        default:                return "";
    }
}

} // namespace platform
} // namespace cubeprog

#endif // CUBEPROG_PLATFORM_TYPES_H
