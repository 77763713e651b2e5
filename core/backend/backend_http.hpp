#pragma once

#include <string>

#include "endpoint.hpp"

namespace tether {
namespace backend {

// How far a request got before it ended
enum class Transport {
    COMPLETED,  // Response received (any status)
    REFUSED,    // Could not connect (refused, unresolvable, no listener)
    TIMED_OUT,  // Connected but no response within the timeout
    FAILED      // Any other transport error
};

struct HttpOutcome {
    Transport transport = Transport::FAILED;
    int status = 0;      // HTTP status, valid only when COMPLETED
    std::string detail;  // Error text for logging

    bool completed() const { return transport == Transport::COMPLETED; }
    bool success() const { return completed() && status >= 200 && status < 300; }
};

const char *transport_to_string(Transport transport);

// Minimal HTTP seam used by the probe and the shutdown path.
// timeout_ms is one budget for the whole request (connect, send, response); a call
// never blocks much longer than that.
class IBackendHttp {
public:
    virtual ~IBackendHttp() = default;

    virtual HttpOutcome get(const BackendEndpoint &endpoint, const std::string &path, int timeout_ms) = 0;
    virtual HttpOutcome post(const BackendEndpoint &endpoint, const std::string &path, int timeout_ms) = 0;
};

// cpp-httplib implementation. Creates a fresh client per call so no connection
// state leaks between the poller thread and the shutdown path.
//
// httplib's read/write timeouts apply per socket operation, so a trickled response
// could outlive them. Each request therefore runs on a helper thread against an
// overall deadline; when it passes, Client::stop() shuts the socket down.
class HttplibBackendHttp : public IBackendHttp {
public:
    HttpOutcome get(const BackendEndpoint &endpoint, const std::string &path, int timeout_ms) override;
    HttpOutcome post(const BackendEndpoint &endpoint, const std::string &path, int timeout_ms) override;
};

}  // namespace backend
}  // namespace tether
