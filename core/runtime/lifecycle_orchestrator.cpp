#include "runtime/lifecycle_orchestrator.hpp"

#include <exception>
#include <future>
#include <thread>

#include "logging/logger.hpp"
#include "runtime/config.hpp"

namespace tether {
namespace runtime {

namespace {
constexpr std::chrono::milliseconds kMainThreadTick{50};
constexpr int kSplashWidth = 420;
constexpr int kSplashHeight = 280;
constexpr const char *kSpawnFailedText = "Failed to start backend";
constexpr const char *kTimeoutText = "Backend failed to start";
}  // namespace

const char *lifecycle_state_to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::LAUNCHING:
            return "LAUNCHING";
        case LifecycleState::WAITING_FOR_READY:
            return "WAITING_FOR_READY";
        case LifecycleState::RUNNING:
            return "RUNNING";
        case LifecycleState::SHUTTING_DOWN:
            return "SHUTTING_DOWN";
        case LifecycleState::TERMINATED:
            return "TERMINATED";
        case LifecycleState::FAILED:
            return "FAILED";
        default:
            return "UNKNOWN";
    }
}

bool is_valid_transition(LifecycleState from, LifecycleState to) {
    switch (from) {
        case LifecycleState::LAUNCHING:
            return to == LifecycleState::WAITING_FOR_READY || to == LifecycleState::FAILED;
        case LifecycleState::WAITING_FOR_READY:
            return to == LifecycleState::RUNNING || to == LifecycleState::FAILED;
        case LifecycleState::RUNNING:
            return to == LifecycleState::SHUTTING_DOWN;
        case LifecycleState::SHUTTING_DOWN:
        case LifecycleState::FAILED:
            return to == LifecycleState::TERMINATED;
        case LifecycleState::TERMINATED:
            return false;
    }
    return false;
}

OrchestratorSettings make_settings(const LauncherConfig &config, const std::string &executable_dir) {
    OrchestratorSettings settings;

    settings.endpoint.host = config.backend.host;
    settings.endpoint.port = static_cast<uint16_t>(config.backend.port);

    settings.launch.executable = config.backend.command;
    settings.launch.args = config.backend.args;
    settings.launch.env = config.backend.env;
    settings.launch.env["PORT"] = std::to_string(config.backend.port);
    if (!executable_dir.empty()) {
        settings.launch.search_dirs.push_back(executable_dir);
    }

    settings.max_attempts = config.readiness.max_attempts;
    settings.poll_interval = std::chrono::milliseconds(config.readiness.interval_ms);

    settings.splash_source =
        config.ui.splash.empty() ? ui::ContentSource::builtin("splash") : ui::ContentSource::file(config.ui.splash);
    settings.splash_options.title = config.ui.title;
    settings.splash_options.width = kSplashWidth;
    settings.splash_options.height = kSplashHeight;
    settings.splash_options.min_width = kSplashWidth;
    settings.splash_options.min_height = kSplashHeight;
    settings.splash_options.decorations = false;

    settings.main_options.title = config.ui.title;
    settings.main_options.width = config.ui.width;
    settings.main_options.height = config.ui.height;
    settings.main_options.min_width = config.ui.min_width;
    settings.main_options.min_height = config.ui.min_height;
    // Created hidden, shown once the splash is replaced
    settings.main_options.visible = false;

    settings.failure_display = std::chrono::milliseconds(config.ui.failure_display_ms);
    return settings;
}

LifecycleOrchestrator::LifecycleOrchestrator(OrchestratorSettings settings, process::ProcessSupervisor &supervisor,
                                             backend::ReadinessPoller &poller,
                                             backend::ShutdownCoordinator &coordinator, ui::IWindowHost &windows,
                                             ExitSignal &exit_signal, Sleeper sleeper)
    : settings_(std::move(settings)),
      supervisor_(supervisor),
      poller_(poller),
      coordinator_(coordinator),
      windows_(windows),
      exit_signal_(exit_signal),
      sleeper_(std::move(sleeper)) {}

LifecycleOrchestrator::~LifecycleOrchestrator() = default;

int LifecycleOrchestrator::run() {
    LOG_INFO("[Lifecycle] Starting backend " << settings_.launch.executable << " on "
                                             << settings_.endpoint.base_url());

    show_splash();

    // Spawn + poll off the UI thread; the result comes back through the future
    std::promise<StartupResult> startup_promise;
    std::future<StartupResult> startup_future = startup_promise.get_future();
    std::thread worker([this, &startup_promise]() {
        try {
            startup_promise.set_value(startup_sequence());
        } catch (...) {
            // Re-thrown on the main thread by get()
            startup_promise.set_exception(std::current_exception());
        }
    });

    // The main thread keeps servicing the window host until the worker reports back
    bool exit_noted = false;
    while (startup_future.wait_for(kMainThreadTick) != std::future_status::ready) {
        windows_.process_events();
        if (!exit_noted && exit_signal_.wait_for(std::chrono::milliseconds(0))) {
            LOG_INFO("[Lifecycle] Exit requested during startup, deferred until the backend is ready");
            exit_noted = true;
        }
    }

    worker.join();
    StartupResult result = startup_future.get();

    switch (result.kind) {
        case StartupResult::Kind::SPAWN_FAILED:
            return fail(std::string(kSpawnFailedText) + ": " + result.error);
        case StartupResult::Kind::READINESS_TIMEOUT:
            return fail(std::string(kTimeoutText) + " after " + std::to_string(settings_.max_attempts) +
                        " attempts");
        case StartupResult::Kind::READY:
            break;
    }

    show_main_window();
    transition(LifecycleState::RUNNING);
    LOG_INFO("[Lifecycle] Running - backend at " << settings_.endpoint.base_url());

    exit_signal_.wait();
    if (!exit_signal_.consume()) {
        LOG_DEBUG("[Lifecycle] Exit request already handled");
    }

    transition(LifecycleState::SHUTTING_DOWN);
    shutdown_backend();
    windows_.close_window(ui::kMainWindowId);
    transition(LifecycleState::TERMINATED);

    LOG_INFO("[Lifecycle] Terminated (" << backend::shutdown_outcome_to_string(shutdown_outcome()) << ")");
    return 0;
}

LifecycleOrchestrator::StartupResult LifecycleOrchestrator::startup_sequence() {
    StartupResult result;

    if (!supervisor_.spawn(settings_.launch, result.error)) {
        result.kind = StartupResult::Kind::SPAWN_FAILED;
        return result;
    }
    transition(LifecycleState::WAITING_FOR_READY);

    if (!poller_.wait_until_ready(settings_.endpoint, settings_.max_attempts, settings_.poll_interval)) {
        result.kind = StartupResult::Kind::READINESS_TIMEOUT;
        return result;
    }

    result.kind = StartupResult::Kind::READY;
    return result;
}

void LifecycleOrchestrator::show_splash() {
    if (!windows_.create_window(ui::kSplashWindowId, settings_.splash_source, settings_.splash_options)) {
        LOG_WARN("[Lifecycle] Splash window could not be created, continuing without it");
        return;
    }
    windows_.show_window(ui::kSplashWindowId);
    splash_open_ = true;
}

void LifecycleOrchestrator::show_main_window() {
    auto source = ui::ContentSource::url(settings_.endpoint.base_url());
    if (!windows_.create_window(ui::kMainWindowId, source, settings_.main_options)) {
        LOG_ERROR("[Lifecycle] Failed to create main window for " << source.location);
    } else {
        windows_.show_window(ui::kMainWindowId);
    }

    if (splash_open_) {
        windows_.close_window(ui::kSplashWindowId);
        splash_open_ = false;
    }
}

int LifecycleOrchestrator::fail(const std::string &message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_message_ = message;
    }
    LOG_ERROR("[Lifecycle] " << message);
    transition(LifecycleState::FAILED);

    // A child that never became healthy is not left running
    supervisor_.terminate();

    if (splash_open_ && windows_.update_status_text(ui::kSplashWindowId, message)) {
        sleeper_(settings_.failure_display);
    }

    if (splash_open_) {
        windows_.close_window(ui::kSplashWindowId);
        splash_open_ = false;
    }

    if (exit_signal_.is_requested()) {
        LOG_DEBUG("[Lifecycle] Discarding exit request raised during startup");
    }

    transition(LifecycleState::TERMINATED);
    return 1;
}

void LifecycleOrchestrator::shutdown_backend() {
    auto handle = supervisor_.handle();
    if (!handle) {
        LOG_WARN("[Lifecycle] No backend process owned at shutdown");
        return;
    }

    auto outcome = coordinator_.shutdown(settings_.endpoint, *handle);
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_outcome_ = outcome;
}

LifecycleState LifecycleOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void LifecycleOrchestrator::on_state_change(const StateChangeCallback &callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.push_back(callback);
}

backend::ShutdownOutcome LifecycleOrchestrator::shutdown_outcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_outcome_;
}

std::string LifecycleOrchestrator::failure_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_message_;
}

void LifecycleOrchestrator::transition(LifecycleState next) {
    LifecycleState previous;
    std::vector<StateChangeCallback> callbacks_copy;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_valid_transition(state_, next)) {
            LOG_ERROR("[Lifecycle] Invalid transition: " << lifecycle_state_to_string(state_) << " -> "
                                                         << lifecycle_state_to_string(next));
            return;
        }
        previous = state_;
        state_ = next;
        callbacks_copy = callbacks_;
    }

    LOG_INFO("[Lifecycle] " << lifecycle_state_to_string(previous) << " -> " << lifecycle_state_to_string(next));

    for (const auto &callback : callbacks_copy) {
        callback(previous, next);
    }
}

}  // namespace runtime
}  // namespace tether
