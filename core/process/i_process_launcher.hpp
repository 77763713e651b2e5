#pragma once

#include <chrono>
#include <string>

#include "launch_spec.hpp"

namespace tether {
namespace process {

// Platform process collaborator. Interface so the supervisor and shutdown path
// can be tested without real children.
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Returns false and fills error if the executable cannot be located or launched
    virtual bool spawn(const LaunchSpec &spec, ProcessHandle &handle, std::string &error) = 0;

    // Unconditional kill of the child and its process group. No-op for unknown or exited handles.
    virtual void kill(const ProcessHandle &handle) = 0;

    // Stop tracking the child without killing it; it finishes on its own. No-op for unknown handles.
    virtual void release(const ProcessHandle &handle) = 0;

    virtual bool is_running(const ProcessHandle &handle) = 0;

    // True once the child has exited (or the handle is unknown); false on timeout
    virtual bool wait_for_exit(const ProcessHandle &handle, std::chrono::milliseconds timeout) = 0;
};

}  // namespace process
}  // namespace tether
