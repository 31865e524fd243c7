#include "utils/console_progress_bar.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace cubeprog {

ConsoleProgressBar::ConsoleProgressBar(std::ostream& out, int width)
    : out_(out)
    , width_(std::max(width, 1))
    , lastPercent_(-1) {
}

void ConsoleProgressBar::onProgressStart() {
    std::lock_guard<std::mutex> lock(mutex_);
    lastPercent_ = -1;
}

void ConsoleProgressBar::onProgress(int32_t current, int32_t total) {
    std::lock_guard<std::mutex> lock(mutex_);

    int percent = 0;
    if (total > 0) {
        percent = static_cast<int>(std::clamp<int64_t>(int64_t(current) * 100 / total, 0, 100));
    }

    // Vendor reports far more often than the bar can change
    if (percent == lastPercent_) {
        return;
    }
    lastPercent_ = percent;

    out_ << '\r' << render(current, total, width_) << std::flush;
    if (percent == 100) {
        out_ << '\n';
    }
}

std::string ConsoleProgressBar::render(int32_t current, int32_t total, int width) {
    int64_t percent = 0;
    if (total > 0) {
        percent = std::clamp<int64_t>(int64_t(current) * 100 / total, 0, 100);
    }
    int filled = static_cast<int>(percent * width / 100);

    std::ostringstream oss;
    oss << '[' << std::string(filled, '#') << std::string(width - filled, '-') << "] "
        << std::setw(3) << percent << '%';
    return oss.str();
}

} // namespace cubeprog
