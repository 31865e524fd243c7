#ifndef CUBEPROG_INSTALL_LAYOUT_H
#define CUBEPROG_INSTALL_LAYOUT_H

#include "platform/platform_types.h"
#include <string>

namespace cubeprog {

/**
 * @brief File name of the programmer API library on a platform
 *
 * @throws std::runtime_error for platforms the vendor does not ship
 */
const char* apiLibraryFileName(platform::Platform platform);

/**
 * @brief Locations inside an STM32CubeProgrammer installation
 *
 * <installDir>/api/lib/<library>   programmer API shared library
 * <installDir>/bin                 external flash loaders
 */
struct InstallLayout {
    std::string installDir;
    std::string libraryPath;
    std::string loadersPath;

    /**
     * @brief Derive absolute library and loader paths from an install root
     *
     * @throws std::runtime_error if the platform is not supported
     */
    static InstallLayout fromInstallDir(const std::string& installDir,
                                        platform::Platform platform = platform::getCurrentPlatform());
};

} // namespace cubeprog

#endif // CUBEPROG_INSTALL_LAYOUT_H
