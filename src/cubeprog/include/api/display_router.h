#ifndef CUBEPROG_DISPLAY_ROUTER_H
#define CUBEPROG_DISPLAY_ROUTER_H

#include "api/cubeprog_types.h"
#include "utils/log.h"
#include <memory>
#include <string>

namespace cubeprog {

/**
 * @brief Receives progress of long running vendor operations
 *
 * Called on whichever thread is inside the vendor library.
 */
class IProgressListener {
public:
    virtual ~IProgressListener() = default;

    virtual void onProgressStart() = 0;

    virtual void onProgress(int32_t current, int32_t total) = 0;
};

/**
 * @brief Process wide target of the vendor display callbacks
 *
 * The vendor library takes bare C function pointers without a context
 * argument, so there is exactly one routing point per process. Log messages
 * are forwarded to the logger, progress updates to the registered listener.
 */
class DisplayRouter {
public:
    DisplayRouter() = delete;

    /**
     * @brief Trampolines to hand to setDisplayCallbacks()
     */
    static abi::DisplayCallbacks callbacks();

    static void setProgressListener(std::shared_ptr<IProgressListener> listener);

    static void clearProgressListener();

    static utils::LogLevel levelFor(LogMessageType type);

    // C entry points
    static void initProgressBar();
    static void logMessage(int32_t msgType, const wchar_t* message);
    static void loadBar(int32_t current, int32_t total);

private:
    static std::shared_ptr<IProgressListener> currentListener();
};

} // namespace cubeprog

#endif // CUBEPROG_DISPLAY_ROUTER_H
