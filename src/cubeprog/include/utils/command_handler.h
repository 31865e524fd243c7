/**
 * @file command_handler.h
 * @brief Command-line interface for a programming session
 */

#ifndef CUBEPROG_COMMAND_HANDLER_H
#define CUBEPROG_COMMAND_HANDLER_H

#include "api/stlink_probe.h"
#include "config/programmer_properties.h"
#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace cubeprog {

class CubeProgrammerApi;

/**
 * @brief Command result structure
 */
struct CommandResult {
    bool success;
    std::string message;

    CommandResult(bool s = true, const std::string& m = "")
        : success(s), message(m) {}
};

/**
 * @brief Processes programmer commands typed at the terminal or passed on
 *        the command line
 *
 * - probe / find                   - enumerate ST-LINK probes
 * - connect [index]                - connect to the target behind a probe
 * - disconnect, status, info
 * - read <addr> <size>             - hex dump of target memory
 * - write <addr> <hexbytes>
 * - erase                          - mass erase
 * - flash <file> [addr] [--skip-erase] [--verify|--no-verify]
 * - reg read <reg>, reg write <reg> <value>
 * - reset [software|hardware|core]
 * - fus, verbosity <0-3>, hash <file>, help, exit
 */
class CommandHandler {
public:
    /**
     * @param api Programmer session, may be null (every device command fails)
     * @param properties Session settings (probe selection, download defaults)
     */
    CommandHandler(CubeProgrammerApi* api, const ProgrammerProperties& properties);

    ~CommandHandler();

    /**
     * @brief Process a command line
     */
    CommandResult processCommand(const std::string& commandLine);

    /**
     * @brief Process an already tokenised command (e.g. from argv)
     */
    CommandResult processArguments(const std::vector<std::string>& tokens);

    std::string getHelpText() const;

    /**
     * @brief Read and process commands from the terminal until 'exit' or EOF
     */
    void runInteractive();

    /**
     * @brief Make runInteractive() return after the current command
     */
    void requestExit();

    bool isExitRequested() const { return exitRequested_; }

    /**
     * @brief Default load address for .bin images
     */
    static constexpr uint32_t DEFAULT_FLASH_ADDRESS = 0x08000000;

private:
    using CommandFunc = std::function<CommandResult(const std::vector<std::string>&)>;

    CubeProgrammerApi* api_;
    ProgrammerProperties properties_;
    std::map<std::string, CommandFunc> commands_;
    std::vector<StLinkProbe> probes_;
    std::atomic<bool> exitRequested_;

    void registerCommands();

    std::vector<std::string> parseCommandLine(const std::string& commandLine);

    CubeProgrammerApi& requireApi();

    std::string describeProbes() const;

    CommandResult handleProbe(const std::vector<std::string>& args);
    CommandResult handleFind(const std::vector<std::string>& args);
    CommandResult handleConnect(const std::vector<std::string>& args);
    CommandResult handleDisconnect(const std::vector<std::string>& args);
    CommandResult handleStatus(const std::vector<std::string>& args);
    CommandResult handleInfo(const std::vector<std::string>& args);
    CommandResult handleRead(const std::vector<std::string>& args);
    CommandResult handleWrite(const std::vector<std::string>& args);
    CommandResult handleErase(const std::vector<std::string>& args);
    CommandResult handleFlash(const std::vector<std::string>& args);
    CommandResult handleRegister(const std::vector<std::string>& args);
    CommandResult handleReset(const std::vector<std::string>& args);
    CommandResult handleFus(const std::vector<std::string>& args);
    CommandResult handleVerbosity(const std::vector<std::string>& args);
    CommandResult handleHash(const std::vector<std::string>& args);
    CommandResult handleHelp(const std::vector<std::string>& args);
    CommandResult handleExit(const std::vector<std::string>& args);
};

} // namespace cubeprog

#endif // CUBEPROG_COMMAND_HANDLER_H
