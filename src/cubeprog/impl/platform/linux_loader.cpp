#include "platform/linux_loader.h"

#if defined(__linux__) || defined(__APPLE__)

#include "utils/log.h"
#include <dlfcn.h>
#include <sstream>

namespace cubeprog {
namespace platform {

LinuxLoader::LinuxLoader() = default;

LinuxLoader::~LinuxLoader() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [handle, path] : handles_) {
        if (handle != INVALID_LIBRARY_HANDLE) {
            LOGD_FMT("Closing library " << path);
            ::dlclose(handle);
        }
    }
    handles_.clear();
}

LibraryHandle LinuxLoader::load(const std::string& path) {
    if (path.empty()) {
        throw DynamicLoaderException("Cannot load library: path is empty");
    }

    // Clear any previous errors
    ::dlerror();

    // RTLD_NOW: report unresolved dependencies of the vendor library here.
    // RTLD_LOCAL: keep its symbols out of the global namespace.
    void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);

    if (handle == nullptr) {
        const char* errorMsg = ::dlerror();
        std::string error = errorMsg ? errorMsg : "Unknown dlopen error";
        setLastError(error);

        std::ostringstream oss;
        oss << "Failed to load library '" << path << "': " << error;
        throw DynamicLoaderException(oss.str());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        handles_[handle] = path;
    }

    LOGD_FMT("Loaded library " << path);
    return handle;
}

void LinuxLoader::unload(LibraryHandle handle) {
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

    ::dlerror();

    if (::dlclose(handle) != 0) {
        const char* errorMsg = ::dlerror();
        std::string error = errorMsg ? errorMsg : "Unknown dlclose error";
        setLastError(error);

        std::ostringstream oss;
        oss << "Failed to unload library '" << path << "': " << error;
        throw DynamicLoaderException(oss.str());
    }

    LOGD_FMT("Unloaded library " << path);
}

void* LinuxLoader::getSymbol(LibraryHandle handle, const std::string& symbolName) {
    if (symbolName.empty()) {
        throw DynamicLoaderException("Cannot get symbol: symbol name is empty");
    }

    if (handle == INVALID_LIBRARY_HANDLE) {
        throw DynamicLoaderException("Cannot get symbol: invalid library handle");
    }

    if (!isValidHandle(handle)) {
        throw DynamicLoaderException("Cannot get symbol: library handle not found");
    }

    ::dlerror();

    void* symbol = ::dlsym(handle, symbolName.c_str());

    // A symbol may legitimately resolve to nullptr, so dlerror() decides
    const char* errorMsg = ::dlerror();
    if (errorMsg != nullptr) {
        setLastError(errorMsg);
        return nullptr;
    }

    return symbol;
}

std::string LinuxLoader::getLastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

bool LinuxLoader::isValidHandle(LibraryHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.find(handle) != handles_.end();
}

void LinuxLoader::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastError_ = error;
}

} // namespace platform
} // namespace cubeprog

#endif // __linux__ || __APPLE__
