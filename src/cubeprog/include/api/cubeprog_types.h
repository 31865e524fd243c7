#ifndef CUBEPROG_API_TYPES_H
#define CUBEPROG_API_TYPES_H

#include <cstdint>
#include <cwchar>

namespace cubeprog {

/**
 * @brief Vendor library output verbosity
 */
enum class Verbosity : int32_t {
    LEVEL_0 = 0,
    LEVEL_1 = 1,
    LEVEL_2 = 2,
    LEVEL_3 = 3
};

enum class DebugPort : int32_t {
    JTAG = 0,
    SWD = 1
};

/**
 * @brief Cortex-M core registers addressable through readCortexReg()
 */
enum class CortexRegister : uint32_t {
    R0 = 0,
    R1 = 1,
    R2 = 2,
    R3 = 3,
    R4 = 4,
    R5 = 5,
    R6 = 6,
    R7 = 7,
    R8 = 8,
    R9 = 9,
    R10 = 10,
    R11 = 11,
    R12 = 12,
    SP = 13,
    LR = 14,
    PC = 15
};

enum class ConnectionMode : int32_t {
    NORMAL = 0,
    HOTPLUG = 1,
    UNDER_RESET = 2,
    POWER_DOWN = 3,
    PRE_RESET = 4
};

enum class ResetMode : int32_t {
    SOFTWARE_RESET = 0,
    HARDWARE_RESET = 1,
    CORE_RESET = 2
};

/**
 * @brief Message categories passed to the display log callback
 */
enum class LogMessageType : int32_t {
    NORMAL = 0,
    INFO = 1,
    GREEN_INFO = 2,
    TITLE = 3,
    WARNING = 4,
    ERROR = 5,
    VERBOSITY_1 = 6,
    VERBOSITY_2 = 7,
    VERBOSITY_3 = 8,
    GREEN_INFO_NO_POPUP = 9,
    WARNING_NO_POPUP = 10,
    ERROR_NO_POPUP = 11
};

const char* verbosityToString(Verbosity verbosity);
const char* debugPortToString(DebugPort port);
const char* registerToString(CortexRegister reg);
const char* connectionModeToString(ConnectionMode mode);
const char* resetModeToString(ResetMode mode);
const char* logMessageTypeToString(LogMessageType type);

namespace abi {

// Binary layouts of the vendor API structures. Field order and sizes must
// not change: records are passed by value and by pointer across the C ABI.

constexpr int SERIAL_NUMBER_SIZE = 33;
constexpr int FIRMWARE_VERSION_SIZE = 20;
constexpr int TARGET_VOLTAGE_SIZE = 5;
constexpr int FREQUENCY_TABLE_SIZE = 12;
constexpr int BOARD_NAME_SIZE = 100;

struct DebugConnectParameters {
    int32_t debugPort;
    int32_t index;
    char serialNumber[SERIAL_NUMBER_SIZE];
    char firmwareVersion[FIRMWARE_VERSION_SIZE];
    char targetVoltage[TARGET_VOLTAGE_SIZE];
    int32_t accessPortNumber;
    int32_t accessPort;
    int32_t connectionMode;
    int32_t resetMode;
    int32_t isOldFirmware;
    uint32_t jtagFreq[FREQUENCY_TABLE_SIZE];
    uint32_t jtagFreqNumber;
    uint32_t swdFreq[FREQUENCY_TABLE_SIZE];
    uint32_t swdFreqNumber;
    int32_t frequency;
    int32_t isBridge;
    int32_t shared;
    char board[BOARD_NAME_SIZE];
    int32_t dbgSleep;
    int32_t speed;
};

struct GeneralInfo {
    uint16_t deviceId;
    int32_t flashSize;
    int32_t bootloaderVersion;
    char type[4];
    char cpu[20];
    char name[100];
    char series[100];
    char description[150];
    char revisionId[8];
    char board[100];
};

using InitProgressBarFn = void (*)();
using LogMessageFn = void (*)(int32_t msgType, const wchar_t* message);
using LoadBarFn = void (*)(int32_t current, int32_t total);

struct DisplayCallbacks {
    InitProgressBarFn initProgressBar;
    LogMessageFn logMessage;
    LoadBarFn loadBar;
};

} // namespace abi

} // namespace cubeprog

#endif // CUBEPROG_API_TYPES_H
