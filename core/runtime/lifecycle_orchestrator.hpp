#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "backend/endpoint.hpp"
#include "backend/readiness_poller.hpp"
#include "backend/shutdown_coordinator.hpp"
#include "exit_signal.hpp"
#include "process/launch_spec.hpp"
#include "process/process_supervisor.hpp"
#include "ui/window_host.hpp"

namespace tether {
namespace runtime {

struct LauncherConfig;

/**
 * Lifecycle of the shell and its backend.
 *
 * State transitions:
 * - LAUNCHING -> WAITING_FOR_READY (spawn succeeded)
 * - WAITING_FOR_READY -> RUNNING (health probe answered 2xx)
 * - RUNNING -> SHUTTING_DOWN (exit requested)
 * - SHUTTING_DOWN -> TERMINATED (shutdown finished, any outcome)
 * - LAUNCHING | WAITING_FOR_READY -> FAILED (spawn error, readiness timeout)
 * - FAILED -> TERMINATED
 */
enum class LifecycleState { LAUNCHING, WAITING_FOR_READY, RUNNING, SHUTTING_DOWN, TERMINATED, FAILED };

const char *lifecycle_state_to_string(LifecycleState state);

bool is_valid_transition(LifecycleState from, LifecycleState to);

// Everything the orchestrator needs, resolved from LauncherConfig
struct OrchestratorSettings {
    backend::BackendEndpoint endpoint;
    process::LaunchSpec launch;
    int max_attempts = 60;
    std::chrono::milliseconds poll_interval{1000};
    ui::ContentSource splash_source;
    ui::WindowOptions splash_options;
    ui::WindowOptions main_options;
    std::chrono::milliseconds failure_display{3000};
};

// Builds settings from config. PORT is always exported from backend.port;
// executable_dir is searched for a relative backend.command.
OrchestratorSettings make_settings(const LauncherConfig &config, const std::string &executable_dir);

/**
 * LifecycleOrchestrator - drives startup -> ready -> running -> shutdown
 *
 * Threads:
 * - run() executes on the main (UI) thread; all window create/show/close calls happen there
 * - a single worker thread performs spawn + readiness polling and hands the result
 *   back through a std::future; meanwhile the main thread ticks, calling
 *   IWindowHost::process_events and watching the exit signal
 * - shutdown runs synchronously on the main thread once the exit request is consumed
 *
 * The readiness loop is never cancelled. An exit request raised while polling is
 * acted on only after the loop resolves: from RUNNING it starts the shutdown,
 * after a startup failure it is discarded. Shutdown therefore never overlaps
 * with polling.
 */
class LifecycleOrchestrator {
public:
    using StateChangeCallback = std::function<void(LifecycleState previous, LifecycleState next)>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    LifecycleOrchestrator(OrchestratorSettings settings, process::ProcessSupervisor &supervisor,
                          backend::ReadinessPoller &poller, backend::ShutdownCoordinator &coordinator,
                          ui::IWindowHost &windows, ExitSignal &exit_signal,
                          Sleeper sleeper = backend::ReadinessPoller::default_sleeper());

    ~LifecycleOrchestrator();

    LifecycleOrchestrator(const LifecycleOrchestrator &) = delete;
    LifecycleOrchestrator &operator=(const LifecycleOrchestrator &) = delete;

    // Blocking. Returns the process exit status: 0 after a normal shutdown, 1 on startup failure.
    int run();

    LifecycleState state() const;

    // Invoked after each transition with the lock released; may run on the worker thread
    void on_state_change(const StateChangeCallback &callback);

    // Outcome of the shutdown sequence, valid once TERMINATED via SHUTTING_DOWN
    backend::ShutdownOutcome shutdown_outcome() const;

    // User-visible reason for FAILED, empty otherwise
    std::string failure_message() const;

private:
    struct StartupResult {
        enum class Kind { READY, SPAWN_FAILED, READINESS_TIMEOUT };
        Kind kind = Kind::READY;
        std::string error;
    };

    StartupResult startup_sequence();
    void show_splash();
    void show_main_window();
    int fail(const std::string &message);
    void shutdown_backend();
    void transition(LifecycleState next);

    OrchestratorSettings settings_;
    process::ProcessSupervisor &supervisor_;
    backend::ReadinessPoller &poller_;
    backend::ShutdownCoordinator &coordinator_;
    ui::IWindowHost &windows_;
    ExitSignal &exit_signal_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    LifecycleState state_ = LifecycleState::LAUNCHING;
    std::vector<StateChangeCallback> callbacks_;
    backend::ShutdownOutcome shutdown_outcome_ = backend::ShutdownOutcome::UNREACHABLE;
    std::string failure_message_;
    bool splash_open_ = false;
};

}  // namespace runtime
}  // namespace tether
