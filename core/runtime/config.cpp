#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"

namespace tether {
namespace runtime {

namespace {

constexpr int kMinTimeoutMs = 100;
constexpr int kMinIntervalMs = 10;

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown key: '" << section << key << "' (will be ignored)");
        }
    }
}

template <typename T>
void read_if_present(const YAML::Node &node, const char *key, T &out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

bool parse_yaml(const YAML::Node &yaml, LauncherConfig &config, std::string &error) {
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    warn_unknown_keys(yaml, "", {"backend", "readiness", "shutdown", "ui", "logging"});

    // Load backend config
    if (const auto backend = yaml["backend"]) {
        warn_unknown_keys(backend, "backend.", {"command", "args", "host", "port", "env"});

        read_if_present(backend, "command", config.backend.command);
        read_if_present(backend, "host", config.backend.host);
        read_if_present(backend, "port", config.backend.port);

        if (backend["args"]) {
            config.backend.args.clear();  // Ensure idempotent parsing
            for (const auto &arg : backend["args"]) {
                config.backend.args.push_back(arg.as<std::string>());
            }
        }

        if (backend["env"]) {
            if (!backend["env"].IsMap()) {
                error = "backend.env must be a mapping of NAME: value";
                return false;
            }
            config.backend.env.clear();
            for (const auto &entry : backend["env"]) {
                config.backend.env[entry.first.as<std::string>()] = entry.second.as<std::string>();
            }
        }
    }

    // Load readiness config
    if (const auto readiness = yaml["readiness"]) {
        warn_unknown_keys(readiness, "readiness.",
                          {"max_attempts", "interval_ms", "probe_timeout_ms", "initializing_after",
                           "almost_ready_after"});

        read_if_present(readiness, "max_attempts", config.readiness.max_attempts);
        read_if_present(readiness, "interval_ms", config.readiness.interval_ms);
        read_if_present(readiness, "probe_timeout_ms", config.readiness.probe_timeout_ms);
        read_if_present(readiness, "initializing_after", config.readiness.initializing_after);
        read_if_present(readiness, "almost_ready_after", config.readiness.almost_ready_after);
    }

    // Load shutdown config
    if (const auto shutdown = yaml["shutdown"]) {
        warn_unknown_keys(shutdown, "shutdown.", {"request_timeout_ms", "grace_period_ms"});

        read_if_present(shutdown, "request_timeout_ms", config.shutdown.request_timeout_ms);
        read_if_present(shutdown, "grace_period_ms", config.shutdown.grace_period_ms);
    }

    // Load UI config
    if (const auto ui = yaml["ui"]) {
        warn_unknown_keys(ui, "ui.",
                          {"title", "width", "height", "min_width", "min_height", "splash", "failure_display_ms"});

        read_if_present(ui, "title", config.ui.title);
        read_if_present(ui, "width", config.ui.width);
        read_if_present(ui, "height", config.ui.height);
        read_if_present(ui, "min_width", config.ui.min_width);
        read_if_present(ui, "min_height", config.ui.min_height);
        read_if_present(ui, "splash", config.ui.splash);
        read_if_present(ui, "failure_display_ms", config.ui.failure_display_ms);
    }

    // Load logging config
    if (const auto logging = yaml["logging"]) {
        warn_unknown_keys(logging, "logging.", {"level", "file"});

        read_if_present(logging, "level", config.logging.level);
        read_if_present(logging, "file", config.logging.file);
    }

    // Port override from the environment (packaged builds pick a free port at install time)
    const char *port_env = std::getenv("TETHER_BACKEND_PORT");
    if (port_env != nullptr && *port_env != '\0') {
        try {
            config.backend.port = std::stoi(port_env);
        } catch (const std::exception &) {
            error = std::string("TETHER_BACKEND_PORT is not a number: ") + port_env;
            return false;
        }
    }

    return validate_config(config, error);
}

void log_summary(const LauncherConfig &config) {
    LOG_INFO("[Config] Backend: " << config.backend.command << " (" << config.backend.host << ":"
                                  << config.backend.port << ", " << config.backend.env.size() << " env var(s))");
    LOG_INFO("[Config] Readiness: " << config.readiness.max_attempts << " attempts every "
                                    << config.readiness.interval_ms << "ms (probe timeout "
                                    << config.readiness.probe_timeout_ms << "ms)");
    LOG_INFO("[Config] Shutdown: request timeout " << config.shutdown.request_timeout_ms << "ms, grace period "
                                                   << config.shutdown.grace_period_ms << "ms");
    LOG_INFO("[Config] Log level: " << config.logging.level);
}

}  // namespace

bool validate_config(const LauncherConfig &config, std::string &error) {
    // Validate backend settings
    if (config.backend.command.empty()) {
        error = "backend.command must be set";
        return false;
    }
    if (config.backend.host.empty()) {
        error = "backend.host must not be empty";
        return false;
    }
    if (config.backend.port < 1 || config.backend.port > 65535) {
        error = "backend.port must be between 1 and 65535";
        return false;
    }
    for (const auto &[name, value] : config.backend.env) {
        if (name.empty() || name.find('=') != std::string::npos) {
            error = "backend.env has invalid variable name '" + name + "'";
            return false;
        }
        if (name == "PORT") {
            LOG_WARN("[Config] backend.env.PORT is ignored, backend.port (" << config.backend.port << ") is used");
        }
    }

    // Validate readiness settings
    if (config.readiness.max_attempts < 1) {
        error = "readiness.max_attempts must be >= 1";
        return false;
    }
    if (config.readiness.interval_ms < kMinIntervalMs) {
        error = "readiness.interval_ms must be >= " + std::to_string(kMinIntervalMs) + "ms";
        return false;
    }
    if (config.readiness.probe_timeout_ms < kMinTimeoutMs) {
        error = "readiness.probe_timeout_ms must be >= " + std::to_string(kMinTimeoutMs) + "ms";
        return false;
    }
    if (config.readiness.initializing_after < 1 ||
        config.readiness.almost_ready_after < config.readiness.initializing_after) {
        error = "readiness phase thresholds must satisfy 1 <= initializing_after <= almost_ready_after";
        return false;
    }

    // Validate shutdown settings
    if (config.shutdown.request_timeout_ms < kMinTimeoutMs) {
        error = "shutdown.request_timeout_ms must be >= " + std::to_string(kMinTimeoutMs) + "ms";
        return false;
    }
    if (config.shutdown.grace_period_ms < 0) {
        error = "shutdown.grace_period_ms must be >= 0";
        return false;
    }

    // Validate UI settings
    if (config.ui.width < 1 || config.ui.height < 1 || config.ui.min_width < 1 || config.ui.min_height < 1) {
        error = "ui window sizes must be positive";
        return false;
    }
    if (config.ui.min_width > config.ui.width || config.ui.min_height > config.ui.height) {
        error = "ui minimum size must not exceed the initial size";
        return false;
    }
    if (config.ui.failure_display_ms < 0) {
        error = "ui.failure_display_ms must be >= 0";
        return false;
    }

    // Validate logging settings
    if (!logging::is_valid_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, LauncherConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        if (!parse_yaml(yaml, config, error)) {
            return false;
        }
        log_summary(config);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_string(const std::string &yaml_text, LauncherConfig &config, std::string &error) {
    try {
        return parse_yaml(YAML::Load(yaml_text), config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace tether
