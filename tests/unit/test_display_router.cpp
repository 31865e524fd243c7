#include <gtest/gtest.h>
#include "api/display_router.h"
#include "utils/console_progress_bar.h"

#include <sstream>
#include <stdexcept>
#include <vector>

using namespace cubeprog;

namespace {

class RecordingListener : public IProgressListener {
public:
    int starts = 0;
    std::vector<std::pair<int32_t, int32_t>> updates;

    void onProgressStart() override { ++starts; }

    void onProgress(int32_t current, int32_t total) override {
        updates.emplace_back(current, total);
    }
};

class ThrowingListener : public IProgressListener {
public:
    void onProgressStart() override { throw std::runtime_error("listener broke"); }

    void onProgress(int32_t, int32_t) override { throw std::runtime_error("listener broke"); }
};

struct LogLine {
    utils::LogLevel level;
    std::string text;
};

} // anonymous namespace

class DisplayRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousLevel = utils::getLogLevel();
        utils::setLogLevel(utils::LogLevel::VERBOSE);
        utils::setLogSink([this](utils::LogLevel level, const std::string& line) {
            lines.push_back({level, line});
        });
    }

    void TearDown() override {
        DisplayRouter::clearProgressListener();
        utils::setLogSink(nullptr);
        utils::setLogLevel(previousLevel);
    }

    std::vector<LogLine> lines;
    utils::LogLevel previousLevel = utils::LogLevel::INFO;
};

// ============================================================================
// Log Message Routing Tests
// ============================================================================

TEST(DisplayRouterLevelTest, MessageTypeMapping) {
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::ERROR), utils::LogLevel::ERROR);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::ERROR_NO_POPUP), utils::LogLevel::ERROR);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::WARNING), utils::LogLevel::WARNING);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::WARNING_NO_POPUP), utils::LogLevel::WARNING);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::INFO), utils::LogLevel::INFO);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::GREEN_INFO), utils::LogLevel::INFO);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::TITLE), utils::LogLevel::INFO);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::VERBOSITY_2), utils::LogLevel::VERBOSE);
    EXPECT_EQ(DisplayRouter::levelFor(LogMessageType::NORMAL), utils::LogLevel::DEBUG);
    EXPECT_EQ(DisplayRouter::levelFor(static_cast<LogMessageType>(77)), utils::LogLevel::DEBUG);
}

TEST_F(DisplayRouterTest, LogMessageIsTaggedAndTrimmed) {
    DisplayRouter::logMessage(static_cast<int32_t>(LogMessageType::WARNING), L"  Flash is protected \n");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, utils::LogLevel::WARNING);
    EXPECT_NE(lines[0].text.find("[CubeProgrammer_API] Flash is protected"), std::string::npos);
    EXPECT_EQ(lines[0].text.back(), 'd');
}

TEST_F(DisplayRouterTest, LogMessageConvertsWideText) {
    DisplayRouter::logMessage(static_cast<int32_t>(LogMessageType::INFO), L"Temp 25\u00B0C");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].text.find("Temp 25\xC2\xB0" "C"), std::string::npos);
}

TEST_F(DisplayRouterTest, EmptyMessagesIgnored) {
    DisplayRouter::logMessage(static_cast<int32_t>(LogMessageType::INFO), nullptr);
    DisplayRouter::logMessage(static_cast<int32_t>(LogMessageType::INFO), L"");
    DisplayRouter::logMessage(static_cast<int32_t>(LogMessageType::INFO), L" \r\n");

    EXPECT_TRUE(lines.empty());
}

TEST_F(DisplayRouterTest, LevelFilterApplies) {
    utils::setLogLevel(utils::LogLevel::WARNING);

    DisplayRouter::logMessage(static_cast<int32_t>(LogMessageType::VERBOSITY_1), L"verbose detail");
    DisplayRouter::logMessage(static_cast<int32_t>(LogMessageType::ERROR), L"Error: no STM32 target found");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].level, utils::LogLevel::ERROR);
}

// ============================================================================
// Progress Routing Tests
// ============================================================================

TEST_F(DisplayRouterTest, CallbacksPointAtRouter) {
    cubeprog::abi::DisplayCallbacks callbacks = DisplayRouter::callbacks();
    EXPECT_EQ(callbacks.initProgressBar, &DisplayRouter::initProgressBar);
    EXPECT_EQ(callbacks.logMessage, &DisplayRouter::logMessage);
    EXPECT_EQ(callbacks.loadBar, &DisplayRouter::loadBar);
}

TEST_F(DisplayRouterTest, ProgressWithoutListener) {
    EXPECT_NO_THROW(DisplayRouter::initProgressBar());
    EXPECT_NO_THROW(DisplayRouter::loadBar(10, 100));
}

TEST_F(DisplayRouterTest, ProgressReachesListener) {
    auto listener = std::make_shared<RecordingListener>();
    DisplayRouter::setProgressListener(listener);

    cubeprog::abi::DisplayCallbacks callbacks = DisplayRouter::callbacks();
    callbacks.initProgressBar();
    callbacks.loadBar(25, 100);
    callbacks.loadBar(100, 100);

    EXPECT_EQ(listener->starts, 1);
    ASSERT_EQ(listener->updates.size(), 2u);
    EXPECT_EQ(listener->updates[0], std::make_pair(25, 100));

    DisplayRouter::clearProgressListener();
    callbacks.loadBar(50, 100);
    EXPECT_EQ(listener->updates.size(), 2u);
}

TEST_F(DisplayRouterTest, ListenerExceptionsAreContained) {
    DisplayRouter::setProgressListener(std::make_shared<ThrowingListener>());

    EXPECT_NO_THROW(DisplayRouter::initProgressBar());
    EXPECT_NO_THROW(DisplayRouter::loadBar(1, 2));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].level, utils::LogLevel::WARNING);
    EXPECT_NE(lines[0].text.find("listener broke"), std::string::npos);
}

// ============================================================================
// Console Progress Bar Tests
// ============================================================================

TEST(ConsoleProgressBarTest, Render) {
    EXPECT_EQ(ConsoleProgressBar::render(0, 100, 10), "[----------]   0%");
    EXPECT_EQ(ConsoleProgressBar::render(50, 100, 10), "[#####-----]  50%");
    EXPECT_EQ(ConsoleProgressBar::render(100, 100, 10), "[##########] 100%");
}

TEST(ConsoleProgressBarTest, RenderClampsOutOfRange) {
    EXPECT_EQ(ConsoleProgressBar::render(5, 0, 4), "[----]   0%");
    EXPECT_EQ(ConsoleProgressBar::render(300, 100, 4), "[####] 100%");
    EXPECT_EQ(ConsoleProgressBar::render(-5, 100, 4), "[----]   0%");
}

TEST(ConsoleProgressBarTest, RedrawsOnlyOnChange) {
    std::ostringstream out;
    ConsoleProgressBar bar(out, 4);

    bar.onProgressStart();
    bar.onProgress(1, 1000);
    bar.onProgress(2, 1000);
    bar.onProgress(500, 1000);
    bar.onProgress(1000, 1000);

    EXPECT_EQ(out.str(), "\r[----]   0%\r[##--]  50%\r[####] 100%\n");
}
