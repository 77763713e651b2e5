#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "i_process_launcher.hpp"
#include "launch_spec.hpp"

namespace tether {
namespace process {

// ProcessSupervisor owns the one backend child of this shell
//
// - At most one live handle at a time; a second spawn is refused
// - The handle slot is shared between the startup worker (writes once) and the
//   shutdown path (reads and clears), guarded by mutex_
// - No restart on crash: a dead backend stays dead
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(IProcessLauncher &launcher) : launcher_(launcher) {}

    // Kills a child that is still owned
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Launch the backend. Fails if the executable cannot be located or launched,
    // or if a handle is already held.
    bool spawn(const LaunchSpec &spec, std::string &error);

    // Currently owned handle, if any
    std::optional<ProcessHandle> handle() const;

    // Unconditional kill. Idempotent: returns false (and does nothing) if the
    // handle is not the owned one, was already terminated or released.
    bool terminate(const ProcessHandle &handle);

    // Kill whatever is owned. Idempotent.
    bool terminate();

    // Give up ownership without killing (the backend is shutting itself down).
    // The launcher stops tracking the child too, so nothing kills it at teardown.
    void release(const ProcessHandle &handle);

    // Bounded wait for the child to exit. Does not change ownership.
    bool wait_for_exit(const ProcessHandle &handle, std::chrono::milliseconds timeout);

    bool is_running() const;

private:
    std::optional<ProcessHandle> take(const ProcessHandle *expected);

    IProcessLauncher &launcher_;

    mutable std::mutex mutex_;
    std::optional<ProcessHandle> handle_;
};

}  // namespace process
}  // namespace tether
