#include "process_supervisor.hpp"

#include "logging/logger.hpp"

namespace tether {
namespace process {

ProcessSupervisor::~ProcessSupervisor() { terminate(); }

bool ProcessSupervisor::spawn(const LaunchSpec &spec, std::string &error) {
    // Held for the whole spawn so two concurrent callers cannot both launch
    std::lock_guard<std::mutex> lock(mutex_);

    if (handle_) {
        error = "Backend already running (PID=" + std::to_string(handle_->pid) + ")";
        LOG_ERROR("[Supervisor] " << error);
        return false;
    }

    ProcessHandle handle;
    if (!launcher_.spawn(spec, handle, error)) {
        LOG_ERROR("[Supervisor] Failed to spawn backend: " << error);
        return false;
    }

    handle_ = handle;
    LOG_INFO("[Supervisor] Backend started (PID=" << handle.pid << ")");
    return true;
}

std::optional<ProcessHandle> ProcessSupervisor::handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_;
}

bool ProcessSupervisor::terminate(const ProcessHandle &handle) {
    auto owned = take(&handle);
    if (!owned) {
        LOG_DEBUG("[Supervisor] terminate: handle " << handle.id << " not owned (already terminated)");
        return false;
    }

    LOG_WARN("[Supervisor] Terminating backend (PID=" << owned->pid << ")");
    launcher_.kill(*owned);
    return true;
}

bool ProcessSupervisor::terminate() {
    auto owned = take(nullptr);
    if (!owned) {
        return false;
    }

    LOG_WARN("[Supervisor] Terminating backend (PID=" << owned->pid << ")");
    launcher_.kill(*owned);
    return true;
}

void ProcessSupervisor::release(const ProcessHandle &handle) {
    auto owned = take(&handle);
    if (!owned) {
        return;
    }

    launcher_.release(*owned);
    LOG_INFO("[Supervisor] Released backend (PID=" << owned->pid << ")");
}

bool ProcessSupervisor::wait_for_exit(const ProcessHandle &handle, std::chrono::milliseconds timeout) {
    return launcher_.wait_for_exit(handle, timeout);
}

bool ProcessSupervisor::is_running() const {
    std::optional<ProcessHandle> current = handle();
    return current && launcher_.is_running(*current);
}

std::optional<ProcessHandle> ProcessSupervisor::take(const ProcessHandle *expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        return std::nullopt;
    }
    if (expected != nullptr && *handle_ != *expected) {
        return std::nullopt;
    }

    std::optional<ProcessHandle> taken = handle_;
    handle_.reset();
    return taken;
}

}  // namespace process
}  // namespace tether
