/**
 * @file command_handler.cpp
 * @brief Implementation of the programmer command-line interface
 */

#include "utils/command_handler.h"
#include "api/cubeprog_api.h"
#include "config/config_loader.h"
#include "firmware/firmware_image.h"
#include "utils/log.h"
#include "utils/string_utils.h"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

// Include readline for command history support
#ifdef _WIN32
    #define NO_READLINE
#else
    #include <readline/readline.h>
    #include <readline/history.h>
#endif

namespace cubeprog {

CommandHandler::CommandHandler(CubeProgrammerApi* api, const ProgrammerProperties& properties)
    : api_(api)
    , properties_(properties)
    , exitRequested_(false) {
    registerCommands();
}

CommandHandler::~CommandHandler() {
}

void CommandHandler::requestExit() {
    exitRequested_ = true;
}

void CommandHandler::registerCommands() {
    commands_["probe"] = [this](const std::vector<std::string>& args) { return handleProbe(args); };
    commands_["find"] = [this](const std::vector<std::string>& args) { return handleFind(args); };
    commands_["connect"] = [this](const std::vector<std::string>& args) { return handleConnect(args); };
    commands_["disconnect"] = [this](const std::vector<std::string>& args) { return handleDisconnect(args); };
    commands_["status"] = [this](const std::vector<std::string>& args) { return handleStatus(args); };
    commands_["info"] = [this](const std::vector<std::string>& args) { return handleInfo(args); };
    commands_["read"] = [this](const std::vector<std::string>& args) { return handleRead(args); };
    commands_["write"] = [this](const std::vector<std::string>& args) { return handleWrite(args); };
    commands_["erase"] = [this](const std::vector<std::string>& args) { return handleErase(args); };
    commands_["flash"] = [this](const std::vector<std::string>& args) { return handleFlash(args); };
    commands_["reg"] = [this](const std::vector<std::string>& args) { return handleRegister(args); };
    commands_["reset"] = [this](const std::vector<std::string>& args) { return handleReset(args); };
    commands_["fus"] = [this](const std::vector<std::string>& args) { return handleFus(args); };
    commands_["verbosity"] = [this](const std::vector<std::string>& args) { return handleVerbosity(args); };
    commands_["hash"] = [this](const std::vector<std::string>& args) { return handleHash(args); };
    commands_["help"] = [this](const std::vector<std::string>& args) { return handleHelp(args); };
    commands_["exit"] = [this](const std::vector<std::string>& args) { return handleExit(args); };
}

std::vector<std::string> CommandHandler::parseCommandLine(const std::string& commandLine) {
    std::vector<std::string> tokens;
    std::istringstream iss(commandLine);
    std::string token;

    while (iss >> token) {
        tokens.push_back(token);
    }

    return tokens;
}

CommandResult CommandHandler::processCommand(const std::string& commandLine) {
    return processArguments(parseCommandLine(commandLine));
}

CommandResult CommandHandler::processArguments(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        return CommandResult(true, "");
    }

    std::string command = tokens[0];
    std::vector<std::string> args(tokens.begin() + 1, tokens.end());

    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return CommandResult(false, "Unknown command: " + command + ". Type 'help' for available commands.");
    }

    try {
        return it->second(args);
    } catch (const std::exception& e) {
        return CommandResult(false, std::string("Error executing command: ") + e.what());
    }
}

std::string CommandHandler::getHelpText() const {
    std::ostringstream oss;
    oss << "Available commands:\n";
    oss << "  probe                             - Enumerate ST-LINK probes (full scan)\n";
    oss << "  find                              - Enumerate ST-LINK probes (quick scan)\n";
    oss << "  connect [index]                   - Connect to the target behind a probe\n";
    oss << "  disconnect                        - Disconnect from the target\n";
    oss << "  status                            - Show whether a target is connected\n";
    oss << "  info                              - Show target device information\n";
    oss << "  read <addr> <size>                - Dump target memory\n";
    oss << "  write <addr> <hexbytes>           - Write bytes to target memory\n";
    oss << "  erase                             - Mass erase the flash\n";
    oss << "  flash <file> [addr] [options]     - Program a firmware image\n";
    oss << "    --skip-erase                    - Do not erase before programming\n";
    oss << "    --verify | --no-verify          - Read back after programming\n";
    oss << "  reg read <reg>                    - Read a core register (R0-R12, SP, LR, PC)\n";
    oss << "  reg write <reg> <value>           - Write a core register\n";
    oss << "  reset [software|hardware|core]    - Reset the target\n";
    oss << "  fus                               - Start the firmware upgrade service (STM32WB)\n";
    oss << "  verbosity <0-3>                   - Set programmer output verbosity\n";
    oss << "  hash <file>                       - Show size, format and SHA-256 of an image\n";
    oss << "  help                              - Show this help message\n";
    oss << "  exit                              - Exit the command interface\n";
    return oss.str();
}

void CommandHandler::runInteractive() {
    std::cout << "STM32CubeProgrammer Interactive Command Interface\n";
    std::cout << "Type 'help' for available commands, 'exit' to quit.\n";

#ifndef NO_READLINE
    std::cout << "Use UP/DOWN arrow keys to navigate command history.\n\n";
#else
    std::cout << "\n";
#endif

    exitRequested_ = false;

    while (!exitRequested_) {
        std::string commandLine;

#ifdef NO_READLINE
        std::cout << "cubeprog> " << std::flush;
        if (!std::getline(std::cin, commandLine)) {
            break;
        }
#else
        char* line = readline("cubeprog> ");
        if (!line) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }
        commandLine = line;
        std::free(line);
#endif

        commandLine = utils::trim(commandLine);
        if (commandLine.empty()) {
            continue;
        }

#ifndef NO_READLINE
        add_history(commandLine.c_str());
#endif

        CommandResult result = processCommand(commandLine);

        if (!result.message.empty()) {
            std::cout << result.message << "\n";
        }

        if (!result.success) {
            std::cout << "[ERROR] Command failed\n";
        }
    }

    std::cout << "Exiting command interface.\n";
}

CubeProgrammerApi& CommandHandler::requireApi() {
    if (!api_) {
        throw std::runtime_error("Programmer API not loaded");
    }
    return *api_;
}

std::string CommandHandler::describeProbes() const {
    std::ostringstream oss;
    oss << "Found " << probes_.size() << " ST-LINK probe(s)";
    for (size_t i = 0; i < probes_.size(); ++i) {
        const auto& probe = probes_[i];
        oss << "\n  [" << i << "] " << probe.getBoard()
            << "  SN " << probe.getSerialNumber()
            << "  FW " << probe.getFirmwareVersion()
            << "  " << probe.getTargetVoltage() << " V";
    }
    return oss.str();
}

CommandResult CommandHandler::handleProbe(const std::vector<std::string>& args) {
    (void)args;
    probes_ = requireApi().probe();
    return CommandResult(true, describeProbes());
}

CommandResult CommandHandler::handleFind(const std::vector<std::string>& args) {
    (void)args;
    probes_ = requireApi().find();
    return CommandResult(true, describeProbes());
}

CommandResult CommandHandler::handleConnect(const std::vector<std::string>& args) {
    CubeProgrammerApi& api = requireApi();

    bool enumerated = false;
    if (probes_.empty()) {
        probes_ = api.find();
        enumerated = true;
    }

    ProgrammerProperties selection(properties_);
    if (!args.empty()) {
        selection.setProbeSerial("");
        selection.setProbeIndex(static_cast<int>(utils::parseUint32(args[0])));
    }

    const StLinkProbe* selected = selectProbe(probes_, selection);
    if (!selected && !enumerated) {
        // Cached list may predate a replug
        probes_ = api.find();
        selected = selectProbe(probes_, selection);
    }
    if (!selected) {
        return CommandResult(false, "No matching ST-LINK probe. " + describeProbes());
    }

    StLinkProbe probe = *selected;
    applyProbeSettings(selection, probe);
    api.connect(probe);

    return CommandResult(true, "Connected through ST-LINK " + probe.getSerialNumber());
}

CommandResult CommandHandler::handleDisconnect(const std::vector<std::string>& args) {
    (void)args;
    requireApi().disconnect();
    return CommandResult(true, "Disconnected");
}

CommandResult CommandHandler::handleStatus(const std::vector<std::string>& args) {
    (void)args;
    bool connected = requireApi().connected();
    return CommandResult(true, connected ? "Target connected" : "Target not connected");
}

CommandResult CommandHandler::handleInfo(const std::vector<std::string>& args) {
    (void)args;
    return CommandResult(true, requireApi().info().toString());
}

CommandResult CommandHandler::handleRead(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return CommandResult(false, "Usage: read <addr> <size>");
    }

    uint32_t address = utils::parseUint32(args[0]);
    uint32_t size = utils::parseUint32(args[1]);
    auto data = requireApi().readMemory(address, size);
    return CommandResult(true, utils::hexDump(data, address));
}

CommandResult CommandHandler::handleWrite(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult(false, "Usage: write <addr> <hexbytes>");
    }

    uint32_t address = utils::parseUint32(args[0]);

    std::string hex;
    for (size_t i = 1; i < args.size(); ++i) {
        hex += args[i];
    }
    auto data = utils::parseHexBytes(hex);
    if (data.empty()) {
        return CommandResult(false, "Nothing to write");
    }

    requireApi().writeMemory(address, data);

    std::ostringstream oss;
    oss << "Wrote " << data.size() << " byte(s) at 0x" << utils::toHex(address);
    return CommandResult(true, oss.str());
}

CommandResult CommandHandler::handleErase(const std::vector<std::string>& args) {
    (void)args;
    requireApi().massErase();
    return CommandResult(true, "Mass erase complete");
}

CommandResult CommandHandler::handleFlash(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult(false, "Usage: flash <file> [addr] [--skip-erase] [--verify|--no-verify]");
    }

    std::string path;
    uint32_t address = DEFAULT_FLASH_ADDRESS;
    bool addressGiven = false;
    bool skipErase = properties_.isDownloadSkipEraseEnabled();
    bool verify = properties_.isDownloadVerifyEnabled();

    for (const auto& arg : args) {
        if (arg == "--skip-erase") {
            skipErase = true;
        } else if (arg == "--verify") {
            verify = true;
        } else if (arg == "--no-verify") {
            verify = false;
        } else if (arg.rfind("--", 0) == 0) {
            return CommandResult(false, "Unknown option: " + arg);
        } else if (path.empty()) {
            path = arg;
        } else if (!addressGiven) {
            address = utils::parseUint32(arg);
            addressGiven = true;
        } else {
            return CommandResult(false, "Unexpected argument: " + arg);
        }
    }

    if (path.empty()) {
        return CommandResult(false, "Missing firmware file");
    }

    requireApi().download(path, address, skipErase, verify);
    return CommandResult(true, "Programmed " + path);
}

CommandResult CommandHandler::handleRegister(const std::vector<std::string>& args) {
    if (args.size() == 2 && args[0] == "read") {
        CortexRegister reg = parseRegister(args[1]);
        uint32_t value = requireApi().readRegister(reg);

        char buffer[16];
        std::snprintf(buffer, sizeof(buffer), "0x%08X", value);
        return CommandResult(true, std::string(registerToString(reg)) + " = " + buffer);
    }

    if (args.size() == 3 && args[0] == "write") {
        CortexRegister reg = parseRegister(args[1]);
        uint32_t value = utils::parseUint32(args[2]);
        requireApi().writeRegister(reg, value);
        return CommandResult(true, std::string(registerToString(reg)) + " written");
    }

    return CommandResult(false, "Usage: reg read <reg> | reg write <reg> <value>");
}

CommandResult CommandHandler::handleReset(const std::vector<std::string>& args) {
    ResetMode mode = args.empty() ? properties_.getResetMode() : parseResetMode(args[0]);
    requireApi().reset(mode);
    return CommandResult(true, std::string("Reset (") + resetModeToString(mode) + ")");
}

CommandResult CommandHandler::handleFus(const std::vector<std::string>& args) {
    (void)args;
    requireApi().startFus();
    return CommandResult(true, "Firmware upgrade service started");
}

CommandResult CommandHandler::handleVerbosity(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult(false, "Usage: verbosity <0-3>");
    }

    Verbosity verbosity = parseVerbosity(static_cast<int>(utils::parseUint32(args[0])));
    requireApi().setVerbosity(verbosity);
    properties_.setVerbosity(verbosity);
    return CommandResult(true, std::string("Verbosity set to ") + verbosityToString(verbosity));
}

CommandResult CommandHandler::handleHash(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return CommandResult(false, "Usage: hash <file>");
    }

    FirmwareImage image = FirmwareImage::open(args[0]);

    std::ostringstream oss;
    oss << "File: " << image.getPath() << "\n"
        << "Size: " << image.getSize() << " bytes\n"
        << "Format: " << imageFormatToString(image.getFormat()) << "\n"
        << "SHA-256: " << image.getSha256();
    return CommandResult(true, oss.str());
}

CommandResult CommandHandler::handleHelp(const std::vector<std::string>& args) {
    (void)args;
    return CommandResult(true, getHelpText());
}

CommandResult CommandHandler::handleExit(const std::vector<std::string>& args) {
    (void)args;
    requestExit();
    return CommandResult(true, "Exiting...");
}

} // namespace cubeprog
