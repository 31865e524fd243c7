#include "api/target_info.h"
#include "utils/string_utils.h"
#include <cstring>
#include <sstream>

namespace cubeprog {

TargetInfo::TargetInfo() {
    std::memset(&info_, 0, sizeof(info_));
}

TargetInfo::TargetInfo(const abi::GeneralInfo& info)
    : info_(info) {
}

std::string TargetInfo::getDeviceId() const {
    return utils::toHex(info_.deviceId);
}

std::string TargetInfo::getName() const {
    return utils::fixedFieldToString(info_.name, sizeof(info_.name));
}

std::string TargetInfo::getRevisionId() const {
    return utils::fixedFieldToString(info_.revisionId, sizeof(info_.revisionId));
}

std::string TargetInfo::getType() const {
    return utils::fixedFieldToString(info_.type, sizeof(info_.type));
}

std::string TargetInfo::getCpu() const {
    return utils::fixedFieldToString(info_.cpu, sizeof(info_.cpu));
}

std::string TargetInfo::getSeries() const {
    return utils::fixedFieldToString(info_.series, sizeof(info_.series));
}

std::string TargetInfo::getDescription() const {
    return utils::fixedFieldToString(info_.description, sizeof(info_.description));
}

std::string TargetInfo::getBoard() const {
    return utils::fixedFieldToString(info_.board, sizeof(info_.board));
}

std::string TargetInfo::toString() const {
    std::ostringstream oss;
    oss << "Device ID: 0x" << getDeviceId() << "\n"
        << "Device Name: " << getName() << "\n"
        << "Revision ID: " << getRevisionId() << "\n"
        << "Series: " << getSeries() << "\n"
        << "Description: " << getDescription() << "\n"
        << "CPU: " << getCpu() << "\n"
        << "Type: " << getType() << "\n"
        << "Flash Size: " << getFlashSize() << " KB\n"
        << "Bootloader Version: " << getBootloaderVersion() << "\n"
        << "Board: " << getBoard() << "\n";
    return oss.str();
}

} // namespace cubeprog
