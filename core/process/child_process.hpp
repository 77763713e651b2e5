#pragma once

#include <string>

#include "launch_spec.hpp"

#ifndef _WIN32
#include <sys/types.h>
#endif

namespace tether {
namespace process {

// ChildProcess wraps one spawned backend executable
// Responsibilities:
// - Resolve the executable and spawn it with an overlaid environment
// - Report exec failures synchronously to the caller
// - Liveness check, bounded wait and forced kill of the whole process tree
//
// stdio is inherited from the shell so backend output lands in the same console.
class ChildProcess {
public:
    explicit ChildProcess(LaunchSpec spec);
    ~ChildProcess();

    // Delete copy/move
    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Returns true on success, false on failure (sets error_)
    bool spawn();

    // Reaps the child if it has exited
    bool is_running();

    // Returns true if the process exited within timeout_ms
    bool wait_for_exit(int timeout_ms);

    // SIGKILL / TerminateProcess. Safe to call repeatedly and after exit.
    void force_terminate();

    // Hand the child off: the destructor no longer kills it (on Windows the
    // job stops killing on close). Used once the backend stops on its own.
    void detach();

    int64_t pid() const;
    int exit_code() const { return exit_code_; }
    const std::string &resolved_path() const { return resolved_path_; }
    const std::string &last_error() const { return error_; }

    // Locate spec.executable: as given, then relative to each search dir.
    // Returns empty string if no executable file was found.
    static std::string resolve_executable(const LaunchSpec &spec);

private:
    LaunchSpec spec_;
    std::string resolved_path_;
    std::string error_;
    int exit_code_ = -1;
    bool detached_ = false;

#ifdef _WIN32
    void *process_handle_;  // HANDLE
    void *job_handle_;      // HANDLE (job object holding the process tree)
    unsigned long process_id_;
    bool spawn_windows();
#else
    pid_t pid_;
    bool spawn_linux();
    void record_status(int status);
#endif
};

}  // namespace process
}  // namespace tether
