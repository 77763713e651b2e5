// tether-shell
// Launches the backend sidecar, waits for it to become healthy and shuts it down on exit

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "backend/backend_http.hpp"
#include "backend/health_probe.hpp"
#include "backend/readiness_poller.hpp"
#include "backend/shutdown_coordinator.hpp"
#include "logging/logger.hpp"
#include "process/native_process_launcher.hpp"
#include "process/process_supervisor.hpp"
#include "runtime/config.hpp"
#include "runtime/exit_signal.hpp"
#include "runtime/lifecycle_orchestrator.hpp"
#include "runtime/signal_handler.hpp"
#include "ui/event_stream_window_host.hpp"
#include "ui/status_sink.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#endif

namespace {

// Directory of the running binary; sidecars ship next to it
std::string executable_dir(const char *argv0) {
    std::error_code ec;
#ifdef _WIN32
    char buffer[MAX_PATH];
    DWORD len = GetModuleFileNameA(NULL, buffer, MAX_PATH);
    if (len > 0 && len < MAX_PATH) {
        return std::filesystem::path(std::string(buffer, len)).parent_path().string();
    }
#else
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        return self.parent_path().string();
    }
#endif
    auto fallback = std::filesystem::absolute(argv0, ec);
    return ec ? std::string() : fallback.parent_path().string();
}

void print_usage() {
    std::cerr << "Usage: tether-shell [OPTIONS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH       Path to config file (default: tether.yaml)\n";
    std::cerr << "  --log-level=LEVEL   Override logging.level (debug, info, warn, error)\n";
    std::cerr << "  --help, -h          Show this help\n";
}

}  // namespace

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "tether.yaml";  // Default
    std::string log_level_override;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level_override = argv[++i];
        } else if (arg.rfind("--log-level=", 0) == 0) {
            log_level_override = arg.substr(12);
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!log_level_override.empty() && !tether::logging::is_valid_level(log_level_override)) {
        std::cerr << "Invalid log level: " << log_level_override << "\n";
        return 1;
    }

    // Check if config exists
    if (!std::filesystem::exists(config_path)) {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("tether-shell starting...");
    LOG_INFO("Loading config: " << config_path);

    tether::runtime::LauncherConfig config;
    std::string error;

    if (!tether::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    if (!log_level_override.empty()) {
        config.logging.level = log_level_override;
    }
    tether::logging::Logger::set_level(tether::logging::string_to_level(config.logging.level));
    if (!tether::logging::Logger::set_file(config.logging.file)) {
        LOG_WARN("Cannot open log file '" << config.logging.file << "', logging to console only");
    }

    // Install signal handler; the exit signal polls it
    tether::runtime::SignalHandler::install();
    tether::runtime::ExitSignal exit_signal(&tether::runtime::SignalHandler::is_shutdown_requested);

    // UI events go to stdout, logs to stderr
    tether::ui::EventStreamWindowHost windows(std::cout);
    tether::ui::WindowStatusSink splash_status(windows, tether::ui::kSplashWindowId);

    tether::backend::HttplibBackendHttp http;
    tether::backend::HealthProbe probe(http, config.readiness.probe_timeout_ms);
    tether::backend::PhaseThresholds thresholds{config.readiness.initializing_after,
                                                config.readiness.almost_ready_after};
    tether::backend::ReadinessPoller poller(probe, &splash_status, thresholds);

    tether::process::NativeProcessLauncher launcher;
    tether::process::ProcessSupervisor supervisor(launcher);

    tether::backend::ShutdownTimings timings;
    timings.request_timeout = std::chrono::milliseconds(config.shutdown.request_timeout_ms);
    timings.grace_period = std::chrono::milliseconds(config.shutdown.grace_period_ms);
    tether::backend::ShutdownCoordinator coordinator(http, supervisor, timings);

    tether::runtime::LifecycleOrchestrator orchestrator(
        tether::runtime::make_settings(config, executable_dir(argv[0])), supervisor, poller, coordinator, windows,
        exit_signal);

    int status = orchestrator.run();

    LOG_INFO("Shutdown complete (exit status " << status << ")");
    return status;
}
