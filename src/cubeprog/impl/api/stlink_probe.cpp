#include "api/stlink_probe.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace cubeprog {

namespace {

std::vector<uint32_t> frequencyTable(const uint32_t* table, uint32_t count) {
    uint32_t used = std::min<uint32_t>(count, abi::FREQUENCY_TABLE_SIZE);
    return std::vector<uint32_t>(table, table + used);
}

std::string listToString(const std::vector<uint32_t>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

const char* boolToString(bool value) {
    return value ? "True" : "False";
}

} // anonymous namespace

StLinkProbe::StLinkProbe() {
    std::memset(&parameters_, 0, sizeof(parameters_));
}

StLinkProbe::StLinkProbe(const abi::DebugConnectParameters& parameters)
    : parameters_(parameters) {
}

std::string StLinkProbe::getFirmwareVersion() const {
    return utils::fixedFieldToString(parameters_.firmwareVersion, sizeof(parameters_.firmwareVersion));
}

std::string StLinkProbe::getSerialNumber() const {
    return utils::fixedFieldToString(parameters_.serialNumber, sizeof(parameters_.serialNumber));
}

std::string StLinkProbe::getBoard() const {
    return utils::fixedFieldToString(parameters_.board, sizeof(parameters_.board));
}

double StLinkProbe::getTargetVoltage() const {
    std::string text = utils::trim(
        utils::fixedFieldToString(parameters_.targetVoltage, sizeof(parameters_.targetVoltage)));
    if (text.empty()) {
        return 0.0;
    }

    char* end = nullptr;
    double volts = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) {
        return 0.0;
    }
    return volts;
}

ConnectionMode StLinkProbe::getConnectionMode() const {
    return static_cast<ConnectionMode>(parameters_.connectionMode);
}

ResetMode StLinkProbe::getResetMode() const {
    return static_cast<ResetMode>(parameters_.resetMode);
}

int32_t StLinkProbe::getAccessPort() const {
    return parameters_.accessPort;
}

int32_t StLinkProbe::getIndex() const {
    return parameters_.index;
}

int32_t StLinkProbe::getAccessPortCount() const {
    return parameters_.accessPortNumber;
}

DebugPort StLinkProbe::getDebugPort() const {
    return static_cast<DebugPort>(parameters_.debugPort);
}

int32_t StLinkProbe::getFrequency() const {
    return parameters_.frequency;
}

int32_t StLinkProbe::getSpeed() const {
    return parameters_.speed;
}

bool StLinkProbe::isOldFirmware() const {
    return parameters_.isOldFirmware == 1;
}

bool StLinkProbe::isBridge() const {
    return parameters_.isBridge == 1;
}

bool StLinkProbe::isShared() const {
    return parameters_.shared == 1;
}

bool StLinkProbe::isDebugSleep() const {
    return parameters_.dbgSleep == 1;
}

std::vector<uint32_t> StLinkProbe::getJtagFrequencies() const {
    return frequencyTable(parameters_.jtagFreq, parameters_.jtagFreqNumber);
}

std::vector<uint32_t> StLinkProbe::getSwdFrequencies() const {
    return frequencyTable(parameters_.swdFreq, parameters_.swdFreqNumber);
}

void StLinkProbe::setAccessPort(int32_t accessPort) {
    parameters_.accessPort = accessPort;
}

void StLinkProbe::setFrequency(int32_t frequency) {
    parameters_.frequency = frequency;
}

void StLinkProbe::setResetMode(ResetMode mode) {
    parameters_.resetMode = static_cast<int32_t>(mode);
}

void StLinkProbe::setConnectionMode(ConnectionMode mode) {
    parameters_.connectionMode = static_cast<int32_t>(mode);
}

void StLinkProbe::setDebugPort(DebugPort port) {
    parameters_.debugPort = static_cast<int32_t>(port);
}

std::string StLinkProbe::toString() const {
    std::ostringstream oss;
    oss << "Board: " << getBoard() << "\n"
        << "Serial Number: " << getSerialNumber() << "\n"
        << "Firmware Version: " << getFirmwareVersion() << "\n"
        << "Index: " << getIndex() << "\n"
        << "Connection Mode: " << connectionModeToString(getConnectionMode()) << "\n"
        << "Reset Mode: " << resetModeToString(getResetMode()) << "\n"
        << "Access Port Count: " << getAccessPortCount() << "\n"
        << "Access Port: " << getAccessPort() << "\n"
        << "Debug Port: " << debugPortToString(getDebugPort()) << "\n"
        << "Old Firmware: " << boolToString(isOldFirmware()) << "\n"
        << "SWD Frequencies: " << listToString(getSwdFrequencies()) << "\n"
        << "JTAG Frequencies: " << listToString(getJtagFrequencies()) << "\n"
        << "Frequency: " << getFrequency() << "\n"
        << "Bridge: " << boolToString(isBridge()) << "\n"
        << "Shared: " << boolToString(isShared()) << "\n"
        << "Debug Sleep: " << boolToString(isDebugSleep()) << "\n"
        << "Speed: " << getSpeed() << "\n"
        << "Target Voltage: " << getTargetVoltage() << "\n";
    return oss.str();
}

} // namespace cubeprog
