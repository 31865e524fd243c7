#ifndef CUBEPROG_TARGET_INFO_H
#define CUBEPROG_TARGET_INFO_H

#include "api/cubeprog_types.h"
#include <cstdint>
#include <string>

namespace cubeprog {

/**
 * @brief General information about the connected microcontroller
 *
 * Snapshot of the vendor record taken at CubeProgrammerApi::info() time.
 */
class TargetInfo {
public:
    TargetInfo();

    explicit TargetInfo(const abi::GeneralInfo& info);

    /**
     * @brief Device identifier as uppercase hex without prefix, e.g. "450"
     */
    std::string getDeviceId() const;

    uint16_t getRawDeviceId() const { return info_.deviceId; }

    std::string getName() const;
    std::string getRevisionId() const;

    /**
     * @brief Flash size in KiB
     */
    int32_t getFlashSize() const { return info_.flashSize; }

    int32_t getBootloaderVersion() const { return info_.bootloaderVersion; }

    std::string getType() const;
    std::string getCpu() const;
    std::string getSeries() const;
    std::string getDescription() const;
    std::string getBoard() const;

    std::string toString() const;

private:
    abi::GeneralInfo info_;
};

} // namespace cubeprog

#endif // CUBEPROG_TARGET_INFO_H
