#include "health_probe.hpp"

#include "logging/logger.hpp"

namespace tether {
namespace backend {

const char *probe_result_to_string(ProbeResult result) {
    switch (result) {
        case ProbeResult::HEALTHY:
            return "healthy";
        case ProbeResult::NOT_READY:
            return "not ready";
        case ProbeResult::UNREACHABLE:
            return "unreachable";
    }
    return "unknown";
}

ProbeResult HealthProbe::probe(const BackendEndpoint &endpoint) {
    HttpOutcome outcome = http_.get(endpoint, kHealthPath, timeout_ms_);

    if (!outcome.completed()) {
        LOG_DEBUG("[Probe] " << endpoint.health_url() << " " << transport_to_string(outcome.transport)
                             << (outcome.detail.empty() ? "" : " (" + outcome.detail + ")"));
        return ProbeResult::UNREACHABLE;
    }

    if (outcome.success()) {
        return ProbeResult::HEALTHY;
    }

    LOG_DEBUG("[Probe] " << endpoint.health_url() << " answered " << outcome.status);
    return ProbeResult::NOT_READY;
}

}  // namespace backend
}  // namespace tether
