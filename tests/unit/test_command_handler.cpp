/**
 * @file test_command_handler.cpp
 * @brief Unit tests for the programmer command interface
 *
 * Tests include:
 * - Command parsing and dispatch
 * - Probe selection and connection
 * - Memory, register, reset and flash commands
 * - Argument validation and error reporting
 */

#include "utils/command_handler.h"
#include "api/cubeprog_api.h"
#include "fake_programmer_backend.h"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <unistd.h>

using namespace cubeprog;
using cubeprog::test::FakeProgrammerBackend;
using cubeprog::test::makeProbeRecord;

namespace fs = std::filesystem;

// ============================================================================
// Test Fixtures
// ============================================================================

class CommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::setLogSink([](utils::LogLevel, const std::string&) {});

        auto backend = std::make_unique<FakeProgrammerBackend>();
        fake = backend.get();
        fake->probes.push_back(makeProbeRecord(0, "066DFF485550755187121615"));
        fake->probes.push_back(makeProbeRecord(1, "0671FF3833554B3043164817", "NUCLEO-WB55RG"));
        api = std::make_unique<CubeProgrammerApi>(std::move(backend), "/opt/st/bin");

        handler = std::make_unique<CommandHandler>(api.get(), properties);
    }

    void TearDown() override {
        handler.reset();
        api.reset();
        utils::setLogSink(nullptr);
    }

    void rebuildHandler() {
        handler = std::make_unique<CommandHandler>(api.get(), properties);
    }

    ProgrammerProperties properties;
    FakeProgrammerBackend* fake = nullptr;
    std::unique_ptr<CubeProgrammerApi> api;
    std::unique_ptr<CommandHandler> handler;
};

class CommandHandlerWithoutApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler = std::make_unique<CommandHandler>(nullptr, ProgrammerProperties());
    }

    std::unique_ptr<CommandHandler> handler;
};

// ============================================================================
// Command Parsing Tests
// ============================================================================

TEST_F(CommandHandlerWithoutApiTest, EmptyCommand) {
    auto result = handler->processCommand("");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.message.empty());

    result = handler->processCommand("   \t  ");
    EXPECT_TRUE(result.success);
}

TEST_F(CommandHandlerWithoutApiTest, UnknownCommand) {
    auto result = handler->processCommand("program app.hex");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Unknown command: program. Type 'help' for available commands.");
}

TEST_F(CommandHandlerWithoutApiTest, CommandsAreCaseSensitive) {
    EXPECT_FALSE(handler->processCommand("HELP").success);
}

TEST_F(CommandHandlerWithoutApiTest, HelpListsCommands) {
    auto result = handler->processCommand("help");
    EXPECT_TRUE(result.success);
    for (const char* command : {"probe", "find", "connect", "flash", "reg read", "reset", "fus", "hash"}) {
        EXPECT_NE(result.message.find(command), std::string::npos) << command;
    }
    EXPECT_EQ(result.message, handler->getHelpText());
}

TEST_F(CommandHandlerWithoutApiTest, DeviceCommandsNeedApi) {
    auto result = handler->processCommand("find");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Error executing command: Programmer API not loaded");
}

TEST_F(CommandHandlerWithoutApiTest, Exit) {
    EXPECT_FALSE(handler->isExitRequested());
    auto result = handler->processCommand("exit");
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(handler->isExitRequested());
}

// ============================================================================
// Probe and Connection Tests
// ============================================================================

TEST_F(CommandHandlerTest, FindListsProbes) {
    auto result = handler->processCommand("find");
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Found 2 ST-LINK probe(s)"), std::string::npos);
    EXPECT_NE(result.message.find("[1] NUCLEO-WB55RG"), std::string::npos);
    EXPECT_NE(result.message.find("SN 066DFF485550755187121615"), std::string::npos);
}

TEST_F(CommandHandlerTest, ProbeUsesFullEnumeration) {
    EXPECT_TRUE(handler->processCommand("probe").success);
    EXPECT_EQ(std::count(fake->calls.begin(), fake->calls.end(), "getStLinkEnumerationList"), 1);
}

TEST_F(CommandHandlerTest, ConnectDefaultProbe) {
    auto result = handler->processCommand("connect");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Connected through ST-LINK 066DFF485550755187121615");
    EXPECT_EQ(fake->lastConnect.index, 0);
    EXPECT_EQ(fake->lastConnect.resetMode, static_cast<int32_t>(ResetMode::HARDWARE_RESET));
}

TEST_F(CommandHandlerTest, ConnectByIndexAppliesSettings) {
    properties.setConnectionMode(ConnectionMode::UNDER_RESET);
    properties.setFrequency(4000);
    rebuildHandler();

    auto result = handler->processCommand("connect 1");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(fake->lastConnect.index, 1);
    EXPECT_EQ(fake->lastConnect.connectionMode, static_cast<int32_t>(ConnectionMode::UNDER_RESET));
    EXPECT_EQ(fake->lastConnect.frequency, 4000);
}

TEST_F(CommandHandlerTest, ConnectBySerialFromSettings) {
    properties.setProbeSerial("0671FF3833554B3043164817");
    rebuildHandler();

    EXPECT_TRUE(handler->processCommand("connect").success);
    EXPECT_EQ(fake->lastConnect.index, 1);
}

TEST_F(CommandHandlerTest, ConnectUnknownIndex) {
    auto result = handler->processCommand("connect 5");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("No matching ST-LINK probe"), std::string::npos);
}

TEST_F(CommandHandlerTest, ConnectRefreshesStaleProbeList) {
    auto replugged = fake->probes.back();
    fake->probes.pop_back();
    EXPECT_NE(handler->processCommand("find").message.find("Found 1 ST-LINK probe(s)"),
              std::string::npos);

    fake->probes.push_back(replugged);
    auto result = handler->processCommand("connect 1");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Connected through ST-LINK 0671FF3833554B3043164817");
    EXPECT_EQ(fake->lastConnect.index, 1);
    EXPECT_EQ(std::count(fake->calls.begin(), fake->calls.end(), "getStLinkList"), 2);
}

TEST_F(CommandHandlerTest, ConnectUsesCachedProbeList) {
    EXPECT_TRUE(handler->processCommand("find").success);
    EXPECT_TRUE(handler->processCommand("connect 1").success);
    EXPECT_EQ(std::count(fake->calls.begin(), fake->calls.end(), "getStLinkList"), 1);
}

TEST_F(CommandHandlerTest, ConnectFailureReportsStatus) {
    fake->connectStatus = -2;
    auto result = handler->processCommand("connect");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.message, "Error executing command: Device not found (Status code: -2)");
}

TEST_F(CommandHandlerTest, StatusAndDisconnect) {
    EXPECT_EQ(handler->processCommand("status").message, "Target not connected");

    handler->processCommand("connect");
    EXPECT_EQ(handler->processCommand("status").message, "Target connected");

    EXPECT_TRUE(handler->processCommand("disconnect").success);
    EXPECT_EQ(handler->processCommand("status").message, "Target not connected");
}

TEST_F(CommandHandlerTest, Info) {
    auto result = handler->processCommand("info");
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Device ID: 0x421"), std::string::npos);

    fake->hasDevice = false;
    EXPECT_FALSE(handler->processCommand("info").success);
}

// ============================================================================
// Memory Command Tests
// ============================================================================

TEST_F(CommandHandlerTest, WriteThenRead) {
    auto result = handler->processCommand("write 0x20000000 DE AD BE EF");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "Wrote 4 byte(s) at 0x20000000");

    result = handler->processCommand("read 0x20000000 4");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message.rfind("0x20000000: DE AD BE EF ", 0), 0u);
}

TEST_F(CommandHandlerTest, MemoryArgumentErrors) {
    EXPECT_FALSE(handler->processCommand("read 0x20000000").success);
    EXPECT_FALSE(handler->processCommand("write 0x20000000").success);
    EXPECT_FALSE(handler->processCommand("read flash 4").success);
    EXPECT_FALSE(handler->processCommand("write 0x20000000 ABC").success);
    EXPECT_FALSE(handler->processCommand("write 0x20000000 0x").success);
}

TEST_F(CommandHandlerTest, Erase) {
    EXPECT_TRUE(handler->processCommand("erase").success);

    fake->eraseStatus = -11;
    auto result = handler->processCommand("erase");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("Memory erase failure"), std::string::npos);
}

// ============================================================================
// Register, Reset and Miscellaneous Commands
// ============================================================================

TEST_F(CommandHandlerTest, RegisterCommands) {
    auto result = handler->processCommand("reg write pc 0x08000199");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "PC written");

    result = handler->processCommand("reg read PC");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "PC = 0x08000199");

    EXPECT_FALSE(handler->processCommand("reg read R16").success);
    EXPECT_FALSE(handler->processCommand("reg peek R0").success);
}

TEST_F(CommandHandlerTest, ResetModes) {
    EXPECT_EQ(handler->processCommand("reset").message, "Reset (HARDWARE_RESET)");
    EXPECT_EQ(fake->lastResetMode, 1);

    EXPECT_EQ(handler->processCommand("reset core").message, "Reset (CORE_RESET)");
    EXPECT_EQ(fake->lastResetMode, 2);

    EXPECT_FALSE(handler->processCommand("reset warm").success);
}

TEST_F(CommandHandlerTest, FusAndVerbosity) {
    EXPECT_TRUE(handler->processCommand("fus").success);

    auto result = handler->processCommand("verbosity 2");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(fake->verbosity, 2);

    EXPECT_FALSE(handler->processCommand("verbosity 9").success);
    EXPECT_FALSE(handler->processCommand("verbosity").success);
}

// ============================================================================
// Flash and Hash Commands
// ============================================================================

class CommandHandlerFileTest : public CommandHandlerTest {
protected:
    void SetUp() override {
        CommandHandlerTest::SetUp();
        image = fs::temp_directory_path() / ("cubeprog_cli_" + std::to_string(::getpid()) + ".bin");
        std::ofstream out(image, std::ios::binary);
        out << "abc";
    }

    void TearDown() override {
        fs::remove(image);
        CommandHandlerTest::TearDown();
    }

    fs::path image;
};

TEST_F(CommandHandlerFileTest, FlashWithDefaults) {
    auto result = handler->processCommand("flash " + image.string());
    EXPECT_TRUE(result.success);
    EXPECT_EQ(fake->lastDownloadAddress, CommandHandler::DEFAULT_FLASH_ADDRESS);
    EXPECT_EQ(fake->lastSkipErase, 0u);
    EXPECT_EQ(fake->lastVerify, 1u);
}

TEST_F(CommandHandlerFileTest, FlashWithOptions) {
    auto result = handler->processCommand("flash " + image.string() + " 0x08020000 --skip-erase --no-verify");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(fake->lastDownloadAddress, 0x08020000u);
    EXPECT_EQ(fake->lastSkipErase, 1u);
    EXPECT_EQ(fake->lastVerify, 0u);
}

TEST_F(CommandHandlerFileTest, FlashArgumentErrors) {
    EXPECT_FALSE(handler->processCommand("flash").success);
    EXPECT_FALSE(handler->processCommand("flash " + image.string() + " --fast").success);
    EXPECT_FALSE(handler->processCommand("flash " + image.string() + " 0x08000000 extra").success);

    auto result = handler->processCommand("flash /nonexistent/app.hex");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("No such file"), std::string::npos);
}

TEST_F(CommandHandlerFileTest, Hash) {
    auto result = handler->processCommand("hash " + image.string());
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Size: 3 bytes"), std::string::npos);
    EXPECT_NE(result.message.find("Format: BINARY"), std::string::npos);
    EXPECT_NE(result.message.find("SHA-256: ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
              std::string::npos);
}

TEST_F(CommandHandlerFileTest, ProcessArgumentsFromArgv) {
    auto result = handler->processArguments({"flash", image.string(), "--verify"});
    EXPECT_TRUE(result.success);
    EXPECT_EQ(fake->lastVerify, 1u);
}
