#pragma once

#include <atomic>

namespace tether {
namespace runtime {

// Turns SIGINT/SIGTERM (SIGBREAK on Windows) into a flag the main thread polls
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Tests only
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace tether
