#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace tether {
namespace runtime {

/**
 * @brief Single "exit requested" event, raised by a window close or an OS signal
 *
 * request() may be called from any thread, any number of times. consume()
 * returns true exactly once, so the shutdown sequence runs at most once.
 *
 * Signal handlers cannot notify a condition variable, so an optional polled
 * source (normally SignalHandler::is_shutdown_requested) is checked on every
 * wake-up tick.
 */
class ExitSignal {
public:
    using Source = std::function<bool()>;

    explicit ExitSignal(Source polled_source = nullptr,
                        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(100));

    void request();
    bool is_requested() const;

    // Blocks until an exit is requested
    void wait();

    // Returns true if an exit was requested within timeout
    bool wait_for(std::chrono::milliseconds timeout);

    // True for the first caller after a request, false afterwards
    bool consume();

private:
    bool poll_source();

    Source polled_source_;
    std::chrono::milliseconds poll_interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool requested_ = false;
    std::atomic<bool> consumed_{false};
};

}  // namespace runtime
}  // namespace tether
