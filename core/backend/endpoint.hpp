#pragma once

#include <cstdint>
#include <string>

namespace tether {
namespace backend {

constexpr const char *kHealthPath = "/api/health";
constexpr const char *kShutdownPath = "/api/shutdown";

// Address of the sidecar's HTTP listener. Fixed for the lifetime of the shell.
struct BackendEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 4000;

    // e.g. "http://127.0.0.1:4000"
    std::string base_url() const { return "http://" + host + ":" + std::to_string(port); }

    std::string health_url() const { return base_url() + kHealthPath; }
    std::string shutdown_url() const { return base_url() + kShutdownPath; }
};

}  // namespace backend
}  // namespace tether
