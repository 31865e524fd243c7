#include "api/install_layout.h"
#include <filesystem>
#include <stdexcept>

namespace cubeprog {

const char* apiLibraryFileName(platform::Platform platform) {
    switch (platform) {
        case platform::Platform::LINUX:   return "libCubeProgrammer_API.so";
        case platform::Platform::WINDOWS: return "CubeProgrammer_API.dll";
        default:
            throw std::runtime_error("Platform not supported yet.");
    }
}

InstallLayout InstallLayout::fromInstallDir(const std::string& installDir,
                                            platform::Platform platform) {
    namespace fs = std::filesystem;

    fs::path root = fs::absolute(fs::path(installDir)).lexically_normal();

    InstallLayout layout;
    layout.installDir = root.string();
    layout.libraryPath = (root / "api" / "lib" / apiLibraryFileName(platform)).string();
    layout.loadersPath = (root / "bin").string();
    return layout;
}

} // namespace cubeprog
