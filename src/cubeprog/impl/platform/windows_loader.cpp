#include "platform/windows_loader.h"

#if defined(_WIN32) || defined(_WIN64)

#define WIN32_LEAN_AND_MEAN
#include <windows.h>

#include "utils/log.h"
#include <filesystem>
#include <sstream>

namespace cubeprog {
namespace platform {

WindowsLoader::WindowsLoader() = default;

WindowsLoader::~WindowsLoader() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [handle, path] : handles_) {
        if (handle != INVALID_LIBRARY_HANDLE) {
            LOGD_FMT("Freeing library " << path);
            ::FreeLibrary(static_cast<HMODULE>(handle));
        }
    }
    handles_.clear();
}

LibraryHandle WindowsLoader::load(const std::string& path) {
    if (path.empty()) {
        throw DynamicLoaderException("Cannot load library: path is empty");
    }

    // The altered search order only applies to absolute paths
    std::filesystem::path fullPath = std::filesystem::absolute(std::filesystem::u8path(path));

    HMODULE module = ::LoadLibraryExW(fullPath.wstring().c_str(), nullptr,
                                      LOAD_WITH_ALTERED_SEARCH_PATH);

    if (module == nullptr) {
        setLastError(::GetLastError());

        std::ostringstream oss;
        oss << "Failed to load library '" << path << "': " << getLastError();
        throw DynamicLoaderException(oss.str());
    }

    LibraryHandle handle = static_cast<LibraryHandle>(module);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_[handle] = path;
    }

    LOGD_FMT("Loaded library " << path);
    return handle;
}

void WindowsLoader::unload(LibraryHandle handle) {
    if (handle == INVALID_LIBRARY_HANDLE) {
        throw DynamicLoaderException("Cannot unload library: invalid handle");
    }

    std::string path;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handles_.find(handle);
        if (it == handles_.end()) {
            throw DynamicLoaderException("Cannot unload library: handle not found");
        }
        path = it->second;
        handles_.erase(it);
    }

    if (!::FreeLibrary(static_cast<HMODULE>(handle))) {
        setLastError(::GetLastError());

        std::ostringstream oss;
        oss << "Failed to unload library '" << path << "': " << getLastError();
        throw DynamicLoaderException(oss.str());
    }

    LOGD_FMT("Unloaded library " << path);
}

void* WindowsLoader::getSymbol(LibraryHandle handle, const std::string& symbolName) {
    if (symbolName.empty()) {
        throw DynamicLoaderException("Cannot get symbol: symbol name is empty");
    }

    if (handle == INVALID_LIBRARY_HANDLE) {
        throw DynamicLoaderException("Cannot get symbol: invalid library handle");
    }

    if (!isValidHandle(handle)) {
        throw DynamicLoaderException("Cannot get symbol: library handle not found");
    }

    FARPROC procAddress = ::GetProcAddress(static_cast<HMODULE>(handle), symbolName.c_str());
    if (procAddress == nullptr) {
        setLastError(::GetLastError());
        return nullptr;
    }

    return reinterpret_cast<void*>(procAddress);
}

std::string WindowsLoader::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool WindowsLoader::isValidHandle(LibraryHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.find(handle) != handles_.end();
}

void WindowsLoader::setLastError(unsigned long errorCode) {
    std::string message = formatWindowsError(errorCode);
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = message;
}

std::string WindowsLoader::formatWindowsError(unsigned long errorCode) {
    if (errorCode == 0) {
        return "No error";
    }

    char* buffer = nullptr;
    DWORD size = ::FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        errorCode,
        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<LPSTR>(&buffer),
        0,
        nullptr);

    std::string message;
    if (size > 0 && buffer != nullptr) {
        message.assign(buffer, size);
        while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
            message.pop_back();
        }
    } else {
        std::ostringstream oss;
        oss << "Windows error code: " << errorCode;
        message = oss.str();
    }

    if (buffer != nullptr) {
        ::LocalFree(buffer);
    }

    return message;
}

} // namespace platform
} // namespace cubeprog

#endif // _WIN32 || _WIN64
