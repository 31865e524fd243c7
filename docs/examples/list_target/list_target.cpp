/**
 * @file list_target.cpp
 * @brief Identify the device attached to a single ST-LINK
 *
 * Enumerates probes, requires exactly one, connects to its target and
 * prints the probe and device identification.
 *
 *   list_target [install_dir]
 */

#include "api/cubeprog_api.h"
#include "config/programmer_properties.h"
#include "utils/log.h"
#include <iostream>

int main(int argc, char* argv[]) {
    std::string installDir = argc > 1 ? argv[1] : cubeprog::ProgrammerProperties::defaultInstallDir();

    try {
        cubeprog::CubeProgrammerApi api(installDir);

        auto probes = api.find();
        if (probes.size() != 1) {
            LOGE_FMT("Expected exactly one ST-LINK, found " << probes.size());
            return 1;
        }

        const cubeprog::StLinkProbe& probe = probes.front();
        std::cout << "STLink board: " << probe.getBoard() << "\n";
        std::cout << "STLink firmware version: " << probe.getFirmwareVersion() << "\n";
        std::cout << "STLink serial number: " << probe.getSerialNumber() << "\n";

        api.connect(probe);
        cubeprog::TargetInfo target = api.info();
        api.disconnect();

        std::cout << "Device ID: " << target.getDeviceId() << "\n";
        std::cout << "Device name: " << target.getName() << "\n";
        std::cout << "Device revision ID: " << target.getRevisionId() << "\n";
    } catch (const std::exception& e) {
        LOGE_FMT("list_target failed: " << e.what());
        return 1;
    }

    return 0;
}
