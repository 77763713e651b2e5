#pragma once

#include <map>
#include <string>
#include <vector>

namespace tether {
namespace runtime {

// Sidecar executable and where it listens (backend: in YAML)
struct BackendConfig {
    std::string command;                     // Path to backend executable
    std::vector<std::string> args;           // Command-line arguments
    std::string host = "127.0.0.1";          // Health/shutdown host
    int port = 4000;                         // Also exported to the child as PORT
    std::map<std::string, std::string> env;  // Extra environment, e.g. MIX_ENV=prod
};

struct ReadinessConfig {
    int max_attempts = 60;         // Health probes before giving up
    int interval_ms = 1000;        // Sleep between probes
    int probe_timeout_ms = 1000;   // Per-probe connect/read timeout
    int initializing_after = 10;   // Attempt from which status reads "initializing"
    int almost_ready_after = 30;   // Attempt from which status reads "almost ready"
};

struct ShutdownConfig {
    int request_timeout_ms = 2000;  // POST /api/shutdown timeout
    int grace_period_ms = 1000;     // Wait for self-exit after acknowledgment
};

struct UiConfig {
    std::string title = "tether";
    int width = 1200;
    int height = 800;
    int min_width = 800;
    int min_height = 600;
    std::string splash;             // Splash page (local file); empty = built-in
    int failure_display_ms = 3000;  // How long the failure message stays up before exit
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
    std::string file;            // Optional log file (appended)
};

struct LauncherConfig {
    BackendConfig backend;
    ReadinessConfig readiness;
    ShutdownConfig shutdown;
    UiConfig ui;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, LauncherConfig &config, std::string &error);

// Same, from YAML text (used by tests)
bool load_config_from_string(const std::string &yaml_text, LauncherConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const LauncherConfig &config, std::string &error);

}  // namespace runtime
}  // namespace tether
