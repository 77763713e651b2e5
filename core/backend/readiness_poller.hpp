#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

#include "endpoint.hpp"
#include "health_probe.hpp"
#include "ui/status_sink.hpp"

namespace tether {
namespace backend {

// Coarse, user-facing description of how far startup has progressed
enum class ReadinessPhase { STARTING, INITIALIZING, ALMOST_READY };

const char *phase_to_string(ReadinessPhase phase);

struct PhaseThresholds {
    int initializing_after = 10;  // First attempt reported as INITIALIZING
    int almost_ready_after = 30;  // First attempt reported as ALMOST_READY
};

// [1, initializing_after) -> STARTING, [initializing_after, almost_ready_after) -> INITIALIZING,
// [almost_ready_after, ...) -> ALMOST_READY
ReadinessPhase phase_for_attempt(int attempt, const PhaseThresholds &thresholds = {});

// Observable poller state. attempt is meaningful only while PROBING.
struct ReadinessState {
    enum class Kind { STARTING, PROBING, READY, FAILED };

    Kind kind = Kind::STARTING;
    int attempt = 0;
};

const char *readiness_kind_to_string(ReadinessState::Kind kind);

/**
 * @brief Polls the sidecar health endpoint until it answers 2xx or the attempt budget runs out
 *
 * Runs on the startup worker thread. The only suspension point is the sleep
 * between attempts; a probe blocks for at most its own timeout.
 *
 * Resolution is sticky: once READY or FAILED, later calls return the same
 * answer without probing again.
 */
class ReadinessPoller {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // status_sink may be null (no UI surface)
    ReadinessPoller(IHealthProbe &probe, ui::IStatusSink *status_sink, PhaseThresholds thresholds = {},
                    Sleeper sleeper = default_sleeper());

    bool wait_until_ready(const BackendEndpoint &endpoint, int max_attempts, std::chrono::milliseconds interval);

    ReadinessState state() const;

    static Sleeper default_sleeper();

private:
    void set_state(ReadinessState::Kind kind, int attempt);
    void push_status(ReadinessPhase phase);

    IHealthProbe &probe_;
    ui::IStatusSink *status_sink_;
    PhaseThresholds thresholds_;
    Sleeper sleeper_;

    mutable std::mutex mutex_;
    ReadinessState state_;
};

}  // namespace backend
}  // namespace tether
