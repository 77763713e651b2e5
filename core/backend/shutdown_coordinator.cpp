#include "shutdown_coordinator.hpp"

#include "logging/logger.hpp"

namespace tether {
namespace backend {

const char *shutdown_outcome_to_string(ShutdownOutcome outcome) {
    switch (outcome) {
        case ShutdownOutcome::GRACEFUL_ACKED:
            return "GRACEFUL_ACKED";
        case ShutdownOutcome::GRACEFUL_TIMED_OUT:
            return "GRACEFUL_TIMED_OUT";
        case ShutdownOutcome::UNREACHABLE:
            return "UNREACHABLE";
        case ShutdownOutcome::FORCED_KILL:
            return "FORCED_KILL";
    }
    return "UNKNOWN";
}

ShutdownOutcome ShutdownCoordinator::shutdown(const BackendEndpoint &endpoint, const process::ProcessHandle &handle) {
    LOG_INFO("[Shutdown] Requesting graceful shutdown: POST " << endpoint.shutdown_url());

    HttpOutcome response =
        http_.post(endpoint, kShutdownPath, static_cast<int>(timings_.request_timeout.count()));

    if (response.success()) {
        last_request_result_ = ShutdownOutcome::GRACEFUL_ACKED;
        LOG_INFO("[Shutdown] Backend acknowledged (" << response.status << "), waiting up to "
                                                     << timings_.grace_period.count() << "ms for exit");

        if (supervisor_.wait_for_exit(handle, timings_.grace_period)) {
            LOG_INFO("[Shutdown] Backend exited cleanly");
        } else {
            LOG_WARN("[Shutdown] Backend still running after grace period, leaving it to finish");
        }
        supervisor_.release(handle);
        return ShutdownOutcome::GRACEFUL_ACKED;
    }

    if (response.transport == Transport::REFUSED) {
        last_request_result_ = ShutdownOutcome::UNREACHABLE;
        LOG_WARN("[Shutdown] Backend unreachable (" << response.detail << ")");
    } else if (response.completed()) {
        last_request_result_ = ShutdownOutcome::GRACEFUL_TIMED_OUT;
        LOG_WARN("[Shutdown] Backend rejected shutdown request (" << response.status << ")");
    } else {
        last_request_result_ = ShutdownOutcome::GRACEFUL_TIMED_OUT;
        LOG_WARN("[Shutdown] Shutdown request " << transport_to_string(response.transport)
                                                << (response.detail.empty() ? "" : " (" + response.detail + ")"));
    }

    LOG_WARN("[Shutdown] Falling back to forced termination");
    supervisor_.terminate(handle);
    return ShutdownOutcome::FORCED_KILL;
}

}  // namespace backend
}  // namespace tether
