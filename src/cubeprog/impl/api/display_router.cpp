#include "api/display_router.h"
#include "utils/string_utils.h"
#include <mutex>

namespace cubeprog {

namespace {

const char* const VENDOR_TAG = "CubeProgrammer_API";

std::mutex& listenerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<IProgressListener>& listenerSlot() {
    static std::shared_ptr<IProgressListener> listener;
    return listener;
}

} // anonymous namespace

abi::DisplayCallbacks DisplayRouter::callbacks() {
    abi::DisplayCallbacks callbacks;
    callbacks.initProgressBar = &DisplayRouter::initProgressBar;
    callbacks.logMessage = &DisplayRouter::logMessage;
    callbacks.loadBar = &DisplayRouter::loadBar;
    return callbacks;
}

void DisplayRouter::setProgressListener(std::shared_ptr<IProgressListener> listener) {
    std::lock_guard<std::mutex> lock(listenerMutex());
    listenerSlot() = std::move(listener);
}

void DisplayRouter::clearProgressListener() {
    setProgressListener(nullptr);
}

std::shared_ptr<IProgressListener> DisplayRouter::currentListener() {
    std::lock_guard<std::mutex> lock(listenerMutex());
    return listenerSlot();
}

utils::LogLevel DisplayRouter::levelFor(LogMessageType type) {
    switch (type) {
        case LogMessageType::ERROR:
        case LogMessageType::ERROR_NO_POPUP:
            return utils::LogLevel::ERROR;
        case LogMessageType::WARNING:
        case LogMessageType::WARNING_NO_POPUP:
            return utils::LogLevel::WARNING;
        case LogMessageType::VERBOSITY_1:
        case LogMessageType::VERBOSITY_2:
        case LogMessageType::VERBOSITY_3:
            return utils::LogLevel::VERBOSE;
        case LogMessageType::INFO:
        case LogMessageType::GREEN_INFO:
        case LogMessageType::GREEN_INFO_NO_POPUP:
        case LogMessageType::TITLE:
            return utils::LogLevel::INFO;
        case LogMessageType::NORMAL:
        default:
            return utils::LogLevel::DEBUG;
    }
}

void DisplayRouter::initProgressBar() {
    auto listener = currentListener();
    if (!listener) {
        return;
    }

    // Exceptions must not unwind through the vendor's C frames
    try {
        listener->onProgressStart();
    } catch (const std::exception& e) {
        LOGW_FMT("Progress listener failed: " << e.what());
    }
}

void DisplayRouter::logMessage(int32_t msgType, const wchar_t* message) {
    if (message == nullptr) {
        return;
    }

    std::string text = utils::trim(utils::wideToUtf8(message));
    if (text.empty()) {
        return;
    }

    utils::logTagged(levelFor(static_cast<LogMessageType>(msgType)), VENDOR_TAG, text);
}

void DisplayRouter::loadBar(int32_t current, int32_t total) {
    auto listener = currentListener();
    if (!listener) {
        return;
    }

    try {
        listener->onProgress(current, total);
    } catch (const std::exception& e) {
        LOGW_FMT("Progress listener failed: " << e.what());
    }
}

} // namespace cubeprog
