#pragma once

#include "backend_http.hpp"
#include "endpoint.hpp"

namespace tether {
namespace backend {

enum class ProbeResult {
    HEALTHY,     // 2xx from /api/health
    NOT_READY,   // Server answered, but not with 2xx (still initializing)
    UNREACHABLE  // Request did not complete (refused, timeout)
};

const char *probe_result_to_string(ProbeResult result);

// Interface for HealthProbe to enable mocking
class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    // Single bounded request, no retries. Never throws.
    virtual ProbeResult probe(const BackendEndpoint &endpoint) = 0;
};

class HealthProbe : public IHealthProbe {
public:
    HealthProbe(IBackendHttp &http, int timeout_ms) : http_(http), timeout_ms_(timeout_ms) {}

    ProbeResult probe(const BackendEndpoint &endpoint) override;

private:
    IBackendHttp &http_;
    int timeout_ms_;
};

}  // namespace backend
}  // namespace tether
