#include "platform/platform_abstraction.h"

#if defined(__linux__) || defined(__APPLE__)
#include "platform/linux_loader.h"
#elif defined(_WIN32) || defined(_WIN64)
#include "platform/windows_loader.h"
#endif

#include <stdexcept>
#include <sstream>

namespace cubeprog {
namespace platform {

PlatformAbstraction::PlatformAbstraction()
    : currentPlatform_(getCurrentPlatform())
{
    loader_ = createLoader(currentPlatform_);
}

PlatformAbstraction::PlatformAbstraction(std::unique_ptr<IDynamicLoader> loader)
    : currentPlatform_(getCurrentPlatform())
    , loader_(std::move(loader))
{
    if (!loader_) {
        throw std::invalid_argument("Platform loader must not be null");
    }
    currentPlatform_ = loader_->getPlatform();
}

PlatformAbstraction::~PlatformAbstraction() {
    // The loader closes whatever is still open
}

LibraryHandle PlatformAbstraction::loadLibrary(const std::string& path) {
    LibraryHandle handle = loader_->load(path);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loadedLibraries_[handle] = path;
    }

    return handle;
}

void PlatformAbstraction::unloadLibrary(LibraryHandle handle) {
    loader_->unload(handle);

    std::lock_guard<std::mutex> lock(mutex_);
    loadedLibraries_.erase(handle);
}

void* PlatformAbstraction::getSymbol(LibraryHandle handle, const std::string& symbolName) {
    return loader_->getSymbol(handle, symbolName);
}

std::string PlatformAbstraction::getLastError() const {
    return loader_->getLastError();
}

bool PlatformAbstraction::isLibraryLoaded(LibraryHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadedLibraries_.find(handle) != loadedLibraries_.end();
}

std::string PlatformAbstraction::getLibraryPath(LibraryHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loadedLibraries_.find(handle);
    if (it == loadedLibraries_.end()) {
        throw std::out_of_range("Library handle not found");
    }
    return it->second;
}

size_t PlatformAbstraction::getLoadedLibraryCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loadedLibraries_.size();
}

std::unique_ptr<IDynamicLoader> PlatformAbstraction::createLoader(Platform platform) {
    switch (platform) {
#if defined(__linux__)
        case Platform::LINUX:
            return std::make_unique<LinuxLoader>();
#endif

#if defined(_WIN32) || defined(_WIN64)
        case Platform::WINDOWS:
            return std::make_unique<WindowsLoader>();
#endif

#if defined(__APPLE__)
        case Platform::MACOS:
            // Same dlopen API as Linux
            return std::make_unique<LinuxLoader>();
#endif

        default: {
            std::ostringstream oss;
            oss << "Unsupported platform: " << platformToString(platform);
            throw std::runtime_error(oss.str());
        }
    }
}

} // namespace platform
} // namespace cubeprog
