/**
 * @file main.cpp
 * @brief Entry point of the cubeprog command-line tool
 *
 * Loads the session configuration, binds the STM32CubeProgrammer API from
 * the configured installation and runs either the command given on the
 * command line or the interactive command interface.
 *
 *   cubeprog [--config <file>] [--install-dir <dir>] [--log-level <level>] [command [args...]]
 */

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "api/cubeprog_api.h"
#include "api/display_router.h"
#include "config/config_loader.h"
#include "config/programmer_properties.h"
#include "platform/dynamic_loader.h"
#include "utils/command_handler.h"
#include "utils/console_progress_bar.h"
#include "utils/log.h"

namespace {

cubeprog::CommandHandler* g_commandHandler = nullptr;

void signalHandler(int signal) {
    (void)signal;
    if (g_commandHandler) {
        g_commandHandler->requestExit();
    }
}

struct Options {
    std::string configPath;
    std::string installDir;
    std::string logLevel;
    std::vector<std::string> command;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program
              << " [--config <file>] [--install-dir <dir>] [--log-level <level>] [command [args...]]\n"
              << "Without a command the interactive interface is started.\n";
}

bool parseOptions(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (!options.command.empty()) {
            options.command.push_back(arg);
        } else if ((arg == "--config" || arg == "--install-dir" || arg == "--log-level") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") {
                options.configPath = value;
            } else if (arg == "--install-dir") {
                options.installDir = value;
            } else {
                options.logLevel = value;
            }
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg.rfind("--", 0) == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            options.command.push_back(arg);
        }
    }
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        std::string configPath = cubeprog::resolveConfigPath(options.configPath);
        cubeprog::ProgrammerProperties properties = cubeprog::loadProgrammerConfig(configPath);

        if (!options.installDir.empty()) {
            properties.setInstallDir(options.installDir);
        }
        if (!options.logLevel.empty()) {
            properties.setLogLevel(options.logLevel);
        }

        if (!properties.validate()) {
            LOGF("Invalid configuration");
            return 1;
        }

        cubeprog::utils::setLogLevel(properties.getLogLevel());

        cubeprog::CubeProgrammerApi api(properties.getInstallDir());
        api.setVerbosity(properties.getVerbosity());

        cubeprog::DisplayRouter::setProgressListener(
            std::make_shared<cubeprog::ConsoleProgressBar>(std::cout));

        cubeprog::CommandHandler commandHandler(&api, properties);

        int exitCode = 0;
        if (!options.command.empty()) {
            cubeprog::CommandResult result = commandHandler.processArguments(options.command);
            if (!result.message.empty()) {
                (result.success ? std::cout : std::cerr) << result.message << "\n";
            }
            exitCode = result.success ? 0 : 1;
        } else {
            g_commandHandler = &commandHandler;
            std::signal(SIGINT, signalHandler);
            std::signal(SIGTERM, signalHandler);

            commandHandler.runInteractive();

            g_commandHandler = nullptr;
        }

        cubeprog::DisplayRouter::clearProgressListener();
        return exitCode;

    } catch (const cubeprog::platform::DynamicLoaderException& e) {
        LOGF_FMT("Cannot load STM32CubeProgrammer: " << e.what());
    } catch (const std::exception& e) {
        LOGF_FMT("Fatal error: " << e.what());
    }

    cubeprog::DisplayRouter::clearProgressListener();
    return 1;
}
