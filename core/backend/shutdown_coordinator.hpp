#pragma once

#include <chrono>

#include "backend_http.hpp"
#include "endpoint.hpp"
#include "process/process_supervisor.hpp"

namespace tether {
namespace backend {

enum class ShutdownOutcome {
    GRACEFUL_ACKED,      // Backend answered 2xx and is exiting on its own
    GRACEFUL_TIMED_OUT,  // Request sent, no (successful) answer in time
    UNREACHABLE,         // Connection refused / nothing listening
    FORCED_KILL          // Fell back to killing the process tree
};

const char *shutdown_outcome_to_string(ShutdownOutcome outcome);

struct ShutdownTimings {
    std::chrono::milliseconds request_timeout{2000};  // POST /api/shutdown timeout
    std::chrono::milliseconds grace_period{1000};     // Wait for self-exit after acknowledgment
};

/**
 * @brief Graceful-then-forceful backend shutdown
 *
 * 1. POST /api/shutdown with a bounded timeout
 * 2. 2xx: wait up to grace_period for the process to exit, release the handle
 * 3. Anything else: ProcessSupervisor::terminate (SIGKILL on the process group)
 *
 * Worst-case wall time is request_timeout + grace_period (plus the launcher's
 * short reap wait after a kill). Errors are logged, never thrown.
 */
class ShutdownCoordinator {
public:
    ShutdownCoordinator(IBackendHttp &http, process::ProcessSupervisor &supervisor, ShutdownTimings timings = {})
        : http_(http), supervisor_(supervisor), timings_(timings) {}

    ShutdownOutcome shutdown(const BackendEndpoint &endpoint, const process::ProcessHandle &handle);

    // Classification of the graceful request in the last shutdown() call
    ShutdownOutcome last_request_result() const { return last_request_result_; }

private:
    IBackendHttp &http_;
    process::ProcessSupervisor &supervisor_;
    ShutdownTimings timings_;
    ShutdownOutcome last_request_result_ = ShutdownOutcome::UNREACHABLE;
};

}  // namespace backend
}  // namespace tether
