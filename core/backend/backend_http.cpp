#include "backend_http.hpp"

#include <httplib.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>

#include "logging/logger.hpp"

namespace tether {
namespace backend {

namespace {

std::unique_ptr<httplib::Client> make_client(const BackendEndpoint &endpoint, int timeout_ms) {
    auto client = std::make_unique<httplib::Client>(endpoint.host, endpoint.port);
    client->set_connection_timeout(std::chrono::milliseconds(timeout_ms));
    client->set_read_timeout(std::chrono::milliseconds(timeout_ms));
    client->set_write_timeout(std::chrono::milliseconds(timeout_ms));
    client->set_keep_alive(false);
    return client;
}

HttpOutcome to_outcome(const httplib::Result &result) {
    HttpOutcome outcome;
    if (result) {
        outcome.transport = Transport::COMPLETED;
        outcome.status = result->status;
        return outcome;
    }

    auto err = result.error();
    outcome.detail = httplib::to_string(err);
    switch (err) {
        case httplib::Error::Connection:
            outcome.transport = Transport::REFUSED;
            break;
        case httplib::Error::Read:
            // Connected, but the response did not arrive before the read timeout
            outcome.transport = Transport::TIMED_OUT;
            break;
        default:
            outcome.transport = Transport::FAILED;
            break;
    }
    return outcome;
}

// Runs request against a single deadline of timeout_ms from now. The connection
// timeout equals the deadline, so the only phase stop() cannot cut short ends
// at the deadline anyway.
HttpOutcome perform_with_deadline(const BackendEndpoint &endpoint, int timeout_ms,
                                  const std::function<httplib::Result(httplib::Client &)> &request) {
    auto client = make_client(endpoint, timeout_ms);
    std::future<HttpOutcome> pending =
        std::async(std::launch::async, [&client, &request]() { return to_outcome(request(*client)); });

    if (pending.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready) {
        return pending.get();
    }

    client->stop();
    HttpOutcome outcome = pending.get();
    if (!outcome.completed()) {
        outcome.transport = Transport::TIMED_OUT;
        outcome.detail = "No response within " + std::to_string(timeout_ms) + "ms";
    }
    return outcome;
}

}  // namespace

const char *transport_to_string(Transport transport) {
    switch (transport) {
        case Transport::COMPLETED:
            return "completed";
        case Transport::REFUSED:
            return "refused";
        case Transport::TIMED_OUT:
            return "timed out";
        case Transport::FAILED:
            return "failed";
    }
    return "unknown";
}

HttpOutcome HttplibBackendHttp::get(const BackendEndpoint &endpoint, const std::string &path, int timeout_ms) {
    auto outcome =
        perform_with_deadline(endpoint, timeout_ms, [&path](httplib::Client &client) { return client.Get(path); });
    LOG_DEBUG("[HTTP] GET " << endpoint.base_url() << path << " -> " << transport_to_string(outcome.transport)
                            << (outcome.completed() ? " " + std::to_string(outcome.status) : ""));
    return outcome;
}

HttpOutcome HttplibBackendHttp::post(const BackendEndpoint &endpoint, const std::string &path, int timeout_ms) {
    auto outcome = perform_with_deadline(endpoint, timeout_ms, [&path](httplib::Client &client) {
        return client.Post(path, "", "application/json");
    });
    LOG_DEBUG("[HTTP] POST " << endpoint.base_url() << path << " -> " << transport_to_string(outcome.transport)
                             << (outcome.completed() ? " " + std::to_string(outcome.status) : ""));
    return outcome;
}

}  // namespace backend
}  // namespace tether
