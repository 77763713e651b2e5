#include "exit_signal.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace tether {
namespace runtime {

ExitSignal::ExitSignal(Source polled_source, std::chrono::milliseconds poll_interval)
    : polled_source_(std::move(polled_source)), poll_interval_(poll_interval) {}

void ExitSignal::request() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_) {
            return;
        }
        requested_ = true;
    }
    LOG_INFO("[Exit] Exit requested");
    cv_.notify_all();
}

bool ExitSignal::is_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
}

void ExitSignal::wait() {
    while (!wait_for(poll_interval_)) {
    }
}

bool ExitSignal::wait_for(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        if (poll_source()) {
            request();
        }

        std::unique_lock<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (requested_) {
            return true;
        }
        if (now >= deadline) {
            return false;
        }

        auto tick = std::min<std::chrono::steady_clock::duration>(deadline - now, poll_interval_);
        cv_.wait_for(lock, tick, [this] { return requested_; });
    }
}

bool ExitSignal::consume() {
    if (!is_requested()) {
        return false;
    }
    return !consumed_.exchange(true);
}

bool ExitSignal::poll_source() { return polled_source_ && polled_source_(); }

}  // namespace runtime
}  // namespace tether
