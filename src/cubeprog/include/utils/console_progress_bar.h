#ifndef CUBEPROG_CONSOLE_PROGRESS_BAR_H
#define CUBEPROG_CONSOLE_PROGRESS_BAR_H

#include "api/display_router.h"
#include <mutex>
#include <ostream>
#include <string>

namespace cubeprog {

/**
 * @brief Text progress bar for download and erase operations
 *
 * Redraws a single line: "[#########-----------]  45%".
 */
class ConsoleProgressBar : public IProgressListener {
public:
    explicit ConsoleProgressBar(std::ostream& out, int width = 40);

    void onProgressStart() override;

    void onProgress(int32_t current, int32_t total) override;

    /**
     * @brief Bar text for a ratio, without carriage return
     */
    static std::string render(int32_t current, int32_t total, int width);

private:
    std::ostream& out_;
    int width_;
    int lastPercent_;
    std::mutex mutex_;
};

} // namespace cubeprog

#endif // CUBEPROG_CONSOLE_PROGRESS_BAR_H
