#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "child_process.hpp"
#include "i_process_launcher.hpp"

namespace tether {
namespace process {

// IProcessLauncher backed by real child processes (fork/execve or CreateProcess)
class NativeProcessLauncher : public IProcessLauncher {
public:
    NativeProcessLauncher() = default;
    ~NativeProcessLauncher() override;

    NativeProcessLauncher(const NativeProcessLauncher &) = delete;
    NativeProcessLauncher &operator=(const NativeProcessLauncher &) = delete;

    bool spawn(const LaunchSpec &spec, ProcessHandle &handle, std::string &error) override;
    void kill(const ProcessHandle &handle) override;
    void release(const ProcessHandle &handle) override;
    bool is_running(const ProcessHandle &handle) override;
    bool wait_for_exit(const ProcessHandle &handle, std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<ChildProcess> find(const ProcessHandle &handle);

    std::mutex mutex_;
    std::unordered_map<uint64_t, std::shared_ptr<ChildProcess>> children_;
    std::atomic<uint64_t> next_id_{1};
};

}  // namespace process
}  // namespace tether
