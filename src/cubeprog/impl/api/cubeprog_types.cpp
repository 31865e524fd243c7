#include "api/cubeprog_types.h"

namespace cubeprog {

const char* verbosityToString(Verbosity verbosity) {
    switch (verbosity) {
        case Verbosity::LEVEL_0: return "LEVEL_0";
        case Verbosity::LEVEL_1: return "LEVEL_1";
        case Verbosity::LEVEL_2: return "LEVEL_2";
        case Verbosity::LEVEL_3: return "LEVEL_3";
        default:                 return "UNKNOWN";
    }
}

const char* debugPortToString(DebugPort port) {
    switch (port) {
        case DebugPort::JTAG: return "JTAG";
        case DebugPort::SWD:  return "SWD";
        default:              return "UNKNOWN";
    }
}

const char* registerToString(CortexRegister reg) {
    static const char* const names[] = {
        "R0", "R1", "R2", "R3", "R4", "R5", "R6", "R7",
        "R8", "R9", "R10", "R11", "R12", "SP", "LR", "PC"
    };
    auto index = static_cast<uint32_t>(reg);
    if (index < sizeof(names) / sizeof(names[0])) {
        return names[index];
    }
    return "UNKNOWN";
}

const char* connectionModeToString(ConnectionMode mode) {
    switch (mode) {
        case ConnectionMode::NORMAL:      return "NORMAL";
        case ConnectionMode::HOTPLUG:     return "HOTPLUG";
        case ConnectionMode::UNDER_RESET: return "UNDER_RESET";
        case ConnectionMode::POWER_DOWN:  return "POWER_DOWN";
        case ConnectionMode::PRE_RESET:   return "PRE_RESET";
        default:                          return "UNKNOWN";
    }
}

const char* resetModeToString(ResetMode mode) {
    switch (mode) {
        case ResetMode::SOFTWARE_RESET: return "SOFTWARE_RESET";
        case ResetMode::HARDWARE_RESET: return "HARDWARE_RESET";
        case ResetMode::CORE_RESET:     return "CORE_RESET";
        default:                        return "UNKNOWN";
    }
}

const char* logMessageTypeToString(LogMessageType type) {
    switch (type) {
        case LogMessageType::NORMAL:              return "NORMAL";
        case LogMessageType::INFO:                return "INFO";
        case LogMessageType::GREEN_INFO:          return "GREEN_INFO";
        case LogMessageType::TITLE:               return "TITLE";
        case LogMessageType::WARNING:             return "WARNING";
        case LogMessageType::ERROR:               return "ERROR";
        case LogMessageType::VERBOSITY_1:         return "VERBOSITY_1";
        case LogMessageType::VERBOSITY_2:         return "VERBOSITY_2";
        case LogMessageType::VERBOSITY_3:         return "VERBOSITY_3";
        case LogMessageType::GREEN_INFO_NO_POPUP: return "GREEN_INFO_NO_POPUP";
        case LogMessageType::WARNING_NO_POPUP:    return "WARNING_NO_POPUP";
        case LogMessageType::ERROR_NO_POPUP:      return "ERROR_NO_POPUP";
        default:                                  return "UNKNOWN";
    }
}

} // namespace cubeprog
