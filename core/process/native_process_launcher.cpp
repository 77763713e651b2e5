#include "native_process_launcher.hpp"

#include "logging/logger.hpp"

namespace tether {
namespace process {

namespace {
constexpr int kReapAfterKillMs = 500;
}

NativeProcessLauncher::~NativeProcessLauncher() {
    std::lock_guard<std::mutex> lock(mutex_);
    children_.clear();  // ChildProcess destructor kills anything still alive
}

bool NativeProcessLauncher::spawn(const LaunchSpec &spec, ProcessHandle &handle, std::string &error) {
    auto child = std::make_shared<ChildProcess>(spec);
    if (!child->spawn()) {
        error = child->last_error();
        return false;
    }

    handle.id = next_id_.fetch_add(1);
    handle.pid = child->pid();

    std::lock_guard<std::mutex> lock(mutex_);
    children_[handle.id] = std::move(child);
    return true;
}

void NativeProcessLauncher::kill(const ProcessHandle &handle) {
    auto child = find(handle);
    if (!child) {
        LOG_DEBUG("[Launcher] kill: unknown handle " << handle.id);
        return;
    }

    if (!child->is_running()) {
        LOG_DEBUG("[Launcher] kill: PID " << handle.pid << " already exited");
        return;
    }

    LOG_WARN("[Launcher] Killing PID " << handle.pid);
    child->force_terminate();
    if (!child->wait_for_exit(kReapAfterKillMs)) {
        LOG_WARN("[Launcher] PID " << handle.pid << " not reaped within " << kReapAfterKillMs << "ms after kill");
    }
}

void NativeProcessLauncher::release(const ProcessHandle &handle) {
    std::shared_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = children_.find(handle.id);
        if (it == children_.end()) {
            return;
        }
        child = std::move(it->second);
        children_.erase(it);
    }

    // Detach before the last reference goes away so ~ChildProcess leaves it alone
    child->detach();
}

bool NativeProcessLauncher::is_running(const ProcessHandle &handle) {
    auto child = find(handle);
    return child && child->is_running();
}

bool NativeProcessLauncher::wait_for_exit(const ProcessHandle &handle, std::chrono::milliseconds timeout) {
    auto child = find(handle);
    if (!child) {
        return true;
    }
    return child->wait_for_exit(static_cast<int>(timeout.count()));
}


std::shared_ptr<ChildProcess> NativeProcessLauncher::find(const ProcessHandle &handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(handle.id);
    if (it == children_.end()) {
        return nullptr;
    }
    return it->second;
}

}  // namespace process
}  // namespace tether
