#include "readiness_poller.hpp"

#include <exception>
#include <thread>

#include "logging/logger.hpp"

namespace tether {
namespace backend {

const char *phase_to_string(ReadinessPhase phase) {
    switch (phase) {
        case ReadinessPhase::STARTING:
            return "starting";
        case ReadinessPhase::INITIALIZING:
            return "initializing";
        case ReadinessPhase::ALMOST_READY:
            return "almost ready";
    }
    return "starting";
}

ReadinessPhase phase_for_attempt(int attempt, const PhaseThresholds &thresholds) {
    if (attempt >= thresholds.almost_ready_after) {
        return ReadinessPhase::ALMOST_READY;
    }
    if (attempt >= thresholds.initializing_after) {
        return ReadinessPhase::INITIALIZING;
    }
    return ReadinessPhase::STARTING;
}

const char *readiness_kind_to_string(ReadinessState::Kind kind) {
    switch (kind) {
        case ReadinessState::Kind::STARTING:
            return "STARTING";
        case ReadinessState::Kind::PROBING:
            return "PROBING";
        case ReadinessState::Kind::READY:
            return "READY";
        case ReadinessState::Kind::FAILED:
            return "FAILED";
    }
    return "UNKNOWN";
}

ReadinessPoller::ReadinessPoller(IHealthProbe &probe, ui::IStatusSink *status_sink, PhaseThresholds thresholds,
                                 Sleeper sleeper)
    : probe_(probe), status_sink_(status_sink), thresholds_(thresholds), sleeper_(std::move(sleeper)) {}

ReadinessPoller::Sleeper ReadinessPoller::default_sleeper() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

bool ReadinessPoller::wait_until_ready(const BackendEndpoint &endpoint, int max_attempts,
                                       std::chrono::milliseconds interval) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.kind == ReadinessState::Kind::READY) {
            return true;
        }
        if (state_.kind == ReadinessState::Kind::FAILED) {
            return false;
        }
    }

    LOG_INFO("[Poller] Waiting for " << endpoint.health_url() << " (max " << max_attempts << " attempts, "
                                     << interval.count() << "ms interval)");

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        set_state(ReadinessState::Kind::PROBING, attempt);
        push_status(phase_for_attempt(attempt, thresholds_));

        ProbeResult result = probe_.probe(endpoint);
        if (result == ProbeResult::HEALTHY) {
            set_state(ReadinessState::Kind::READY, attempt);
            LOG_INFO("[Poller] Backend ready after " << attempt << " attempt(s)");
            return true;
        }

        LOG_INFO("[Poller] Waiting for backend... attempt " << attempt << "/" << max_attempts << " ("
                                                            << probe_result_to_string(result) << ")");

        if (attempt < max_attempts) {
            sleeper_(interval);
        }
    }

    set_state(ReadinessState::Kind::FAILED, max_attempts);
    LOG_ERROR("[Poller] Backend failed to start after " << max_attempts << " attempts");
    return false;
}

ReadinessState ReadinessPoller::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ReadinessPoller::set_state(ReadinessState::Kind kind, int attempt) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_.kind = kind;
        state_.attempt = attempt;
    }
    LOG_DEBUG("[Poller] State " << readiness_kind_to_string(kind) << " (attempt " << attempt << ")");
}

void ReadinessPoller::push_status(ReadinessPhase phase) {
    if (status_sink_ == nullptr) {
        return;
    }

    // Best effort: the splash surface may already be gone
    try {
        if (!status_sink_->update_status(phase_to_string(phase))) {
            LOG_DEBUG("[Poller] Status update not delivered: " << phase_to_string(phase));
        }
    } catch (const std::exception &e) {
        LOG_DEBUG("[Poller] Status update failed: " << e.what());
    }
}

}  // namespace backend
}  // namespace tether
