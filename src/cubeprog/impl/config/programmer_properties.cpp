#include "config/programmer_properties.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <map>
#include <stdexcept>

namespace cubeprog {

namespace {

template<typename Enum>
Enum lookup(const std::map<std::string, Enum>& table, const std::string& name, const char* what) {
    auto it = table.find(utils::toUpper(utils::trim(name)));
    if (it == table.end()) {
        throw std::invalid_argument(std::string("Unknown ") + what + ": " + name);
    }
    return it->second;
}

} // anonymous namespace

ConnectionMode parseConnectionMode(const std::string& name) {
    static const std::map<std::string, ConnectionMode> table = {
        {"NORMAL", ConnectionMode::NORMAL},
        {"HOTPLUG", ConnectionMode::HOTPLUG},
        {"UNDER_RESET", ConnectionMode::UNDER_RESET},
        {"POWER_DOWN", ConnectionMode::POWER_DOWN},
        {"PRE_RESET", ConnectionMode::PRE_RESET},
    };
    return lookup(table, name, "connection mode");
}

ResetMode parseResetMode(const std::string& name) {
    static const std::map<std::string, ResetMode> table = {
        {"SOFTWARE_RESET", ResetMode::SOFTWARE_RESET},
        {"SOFTWARE", ResetMode::SOFTWARE_RESET},
        {"HARDWARE_RESET", ResetMode::HARDWARE_RESET},
        {"HARDWARE", ResetMode::HARDWARE_RESET},
        {"CORE_RESET", ResetMode::CORE_RESET},
        {"CORE", ResetMode::CORE_RESET},
    };
    return lookup(table, name, "reset mode");
}

CortexRegister parseRegister(const std::string& name) {
    static const std::map<std::string, CortexRegister> table = {
        {"R0", CortexRegister::R0}, {"R1", CortexRegister::R1},
        {"R2", CortexRegister::R2}, {"R3", CortexRegister::R3},
        {"R4", CortexRegister::R4}, {"R5", CortexRegister::R5},
        {"R6", CortexRegister::R6}, {"R7", CortexRegister::R7},
        {"R8", CortexRegister::R8}, {"R9", CortexRegister::R9},
        {"R10", CortexRegister::R10}, {"R11", CortexRegister::R11},
        {"R12", CortexRegister::R12},
        {"SP", CortexRegister::SP}, {"R13", CortexRegister::SP},
        {"LR", CortexRegister::LR}, {"R14", CortexRegister::LR},
        {"PC", CortexRegister::PC}, {"R15", CortexRegister::PC},
    };
    return lookup(table, name, "register");
}

utils::LogLevel parseLogLevel(const std::string& name) {
    static const std::map<std::string, utils::LogLevel> table = {
        {"VERBOSE", utils::LogLevel::VERBOSE},
        {"DEBUG", utils::LogLevel::DEBUG},
        {"INFO", utils::LogLevel::INFO},
        {"WARNING", utils::LogLevel::WARNING},
        {"WARN", utils::LogLevel::WARNING},
        {"ERROR", utils::LogLevel::ERROR},
        {"FATAL", utils::LogLevel::FATAL},
    };
    return lookup(table, name, "log level");
}

Verbosity parseVerbosity(int level) {
    if (level < 0 || level > 3) {
        throw std::invalid_argument("Verbosity must be between 0 and 3: " + std::to_string(level));
    }
    return static_cast<Verbosity>(level);
}

ProgrammerProperties::ProgrammerProperties() : Properties() {
    loadDefaults();
}

ProgrammerProperties::ProgrammerProperties(const Properties& props) : Properties(props) {
    loadDefaults();
}

std::string ProgrammerProperties::defaultInstallDir() {
    const char* home = std::getenv("HOME");
    std::string base = home ? home : ".";
    return base + "/STMicroelectronics/STM32Cube/STM32CubeProgrammer";
}

std::string ProgrammerProperties::getInstallDir() const {
    return getString(PROP_INSTALL_DIR, defaultInstallDir());
}

void ProgrammerProperties::setInstallDir(const std::string& dir) {
    set(PROP_INSTALL_DIR, dir);
}

Verbosity ProgrammerProperties::getVerbosity() const {
    return parseVerbosity(getInt(PROP_VERBOSITY, 0));
}

void ProgrammerProperties::setVerbosity(Verbosity verbosity) {
    set(PROP_VERBOSITY, static_cast<int>(verbosity));
}

utils::LogLevel ProgrammerProperties::getLogLevel() const {
    return parseLogLevel(getString(PROP_LOG_LEVEL, "INFO"));
}

void ProgrammerProperties::setLogLevel(const std::string& level) {
    set(PROP_LOG_LEVEL, level);
}

int ProgrammerProperties::getProbeIndex() const {
    return getInt(PROP_PROBE_INDEX, 0);
}

void ProgrammerProperties::setProbeIndex(int index) {
    set(PROP_PROBE_INDEX, index);
}

std::string ProgrammerProperties::getProbeSerial() const {
    return getString(PROP_PROBE_SERIAL, "");
}

void ProgrammerProperties::setProbeSerial(const std::string& serial) {
    set(PROP_PROBE_SERIAL, serial);
}

ConnectionMode ProgrammerProperties::getConnectionMode() const {
    return parseConnectionMode(getString(PROP_CONNECTION_MODE, "NORMAL"));
}

void ProgrammerProperties::setConnectionMode(ConnectionMode mode) {
    set(PROP_CONNECTION_MODE, std::string(connectionModeToString(mode)));
}

ResetMode ProgrammerProperties::getResetMode() const {
    return parseResetMode(getString(PROP_RESET_MODE, "HARDWARE_RESET"));
}

void ProgrammerProperties::setResetMode(ResetMode mode) {
    set(PROP_RESET_MODE, std::string(resetModeToString(mode)));
}

int ProgrammerProperties::getAccessPort() const {
    return getInt(PROP_ACCESS_PORT, 0);
}

void ProgrammerProperties::setAccessPort(int accessPort) {
    set(PROP_ACCESS_PORT, accessPort);
}

int ProgrammerProperties::getFrequency() const {
    return getInt(PROP_FREQUENCY, 0);
}

void ProgrammerProperties::setFrequency(int frequency) {
    set(PROP_FREQUENCY, frequency);
}

bool ProgrammerProperties::isDownloadVerifyEnabled() const {
    return getBool(PROP_DOWNLOAD_VERIFY, true);
}

void ProgrammerProperties::setDownloadVerifyEnabled(bool enabled) {
    set(PROP_DOWNLOAD_VERIFY, enabled);
}

bool ProgrammerProperties::isDownloadSkipEraseEnabled() const {
    return getBool(PROP_DOWNLOAD_SKIP_ERASE, false);
}

void ProgrammerProperties::setDownloadSkipEraseEnabled(bool enabled) {
    set(PROP_DOWNLOAD_SKIP_ERASE, enabled);
}

bool ProgrammerProperties::validate() const {
    if (getInstallDir().empty()) {
        return false;
    }

    if (getProbeIndex() < 0 || getAccessPort() < 0 || getFrequency() < 0) {
        return false;
    }

    try {
        getVerbosity();
        getLogLevel();
        getConnectionMode();
        getResetMode();
    } catch (const std::invalid_argument&) {
        return false;
    }

    return true;
}

void ProgrammerProperties::loadDefaults() {
    if (!has(PROP_INSTALL_DIR)) {
        set(PROP_INSTALL_DIR, defaultInstallDir());
    }
    if (!has(PROP_VERBOSITY)) {
        set(PROP_VERBOSITY, 0);
    }
    if (!has(PROP_LOG_LEVEL)) {
        set(PROP_LOG_LEVEL, std::string("INFO"));
    }

    if (!has(PROP_PROBE_INDEX)) {
        set(PROP_PROBE_INDEX, 0);
    }
    if (!has(PROP_PROBE_SERIAL)) {
        set(PROP_PROBE_SERIAL, std::string());
    }
    if (!has(PROP_CONNECTION_MODE)) {
        set(PROP_CONNECTION_MODE, std::string("NORMAL"));
    }
    if (!has(PROP_RESET_MODE)) {
        set(PROP_RESET_MODE, std::string("HARDWARE_RESET"));
    }
    if (!has(PROP_ACCESS_PORT)) {
        set(PROP_ACCESS_PORT, 0);
    }
    if (!has(PROP_FREQUENCY)) {
        set(PROP_FREQUENCY, 0);
    }

    if (!has(PROP_DOWNLOAD_VERIFY)) {
        set(PROP_DOWNLOAD_VERIFY, true);
    }
    if (!has(PROP_DOWNLOAD_SKIP_ERASE)) {
        set(PROP_DOWNLOAD_SKIP_ERASE, false);
    }
}

} // namespace cubeprog
