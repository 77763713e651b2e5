#include "child_process.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>
#include <vector>

#include "logging/logger.hpp"

#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <windows.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace tether {
namespace process {

namespace {

bool is_executable_file(const std::filesystem::path &path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return access(path.c_str(), X_OK) == 0;
#endif
}

// Parent environment with spec.env applied on top, as KEY=VALUE strings
std::vector<std::string> build_environment(const LaunchSpec &spec) {
    std::vector<std::string> result;

#ifdef _WIN32
    LPCH block = GetEnvironmentStringsA();
    if (block != nullptr) {
        for (LPCH entry = block; *entry != '\0'; entry += strlen(entry) + 1) {
            result.emplace_back(entry);
        }
        FreeEnvironmentStringsA(block);
    }
#else
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        result.emplace_back(*entry);
    }
#endif

    for (const auto &[key, value] : spec.env) {
        const std::string prefix = key + "=";
        bool replaced = false;
        for (auto &existing : result) {
            if (existing.compare(0, prefix.size(), prefix) == 0) {
                existing = prefix + value;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            result.push_back(prefix + value);
        }
    }

    return result;
}

}  // namespace

ChildProcess::ChildProcess(LaunchSpec spec)
    : spec_(std::move(spec))
#ifdef _WIN32
      ,
      process_handle_(nullptr),
      job_handle_(nullptr),
      process_id_(0)
#else
      ,
      pid_(-1)
#endif
{
}

ChildProcess::~ChildProcess() {
    // The owner decides between graceful and forced shutdown; here we only make
    // sure nothing is left behind, unless the child was handed off with detach()
    if (!detached_ && is_running()) {
        LOG_WARN("[Process] " << resolved_path_ << " still running at teardown - killing");
        force_terminate();
    }
#ifdef _WIN32
    if (process_handle_) {
        CloseHandle(process_handle_);
        process_handle_ = nullptr;
    }
    if (job_handle_) {
        CloseHandle(job_handle_);
        job_handle_ = nullptr;
    }
#endif
}

std::string ChildProcess::resolve_executable(const LaunchSpec &spec) {
    if (spec.executable.empty()) {
        return "";
    }

    std::filesystem::path candidate(spec.executable);
    if (is_executable_file(candidate)) {
        return std::filesystem::absolute(candidate).string();
    }

    if (candidate.is_relative()) {
        for (const auto &dir : spec.search_dirs) {
            auto in_dir = std::filesystem::path(dir) / candidate;
            if (is_executable_file(in_dir)) {
                return std::filesystem::absolute(in_dir).string();
            }
        }
    }

    return "";
}

int64_t ChildProcess::pid() const {
#ifdef _WIN32
    return static_cast<int64_t>(process_id_);
#else
    return static_cast<int64_t>(pid_);
#endif
}

bool ChildProcess::spawn() {
    LOG_INFO("[Process] Spawning: " << spec_.executable);

    resolved_path_ = resolve_executable(spec_);
    if (resolved_path_.empty()) {
        error_ = "Executable not found: " + spec_.executable;
        LOG_ERROR("[Process] " << error_);
        return false;
    }

#ifdef _WIN32
    return spawn_windows();
#else
    return spawn_linux();
#endif
}

#ifdef _WIN32
bool ChildProcess::spawn_windows() {
    // Environment block: KEY=VALUE\0KEY=VALUE\0\0
    std::string env_block;
    for (const auto &entry : build_environment(spec_)) {
        env_block += entry;
        env_block.push_back('\0');
    }
    env_block.push_back('\0');

    std::string cmdline = "\"" + resolved_path_ + "\"";
    for (const auto &arg : spec_.args) {
        cmdline += " \"" + arg + "\"";
    }
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    BOOL success = CreateProcessA(NULL,                // lpApplicationName
                                  cmdline_buf.data(),  // lpCommandLine (mutable)
                                  NULL,                // lpProcessAttributes
                                  NULL,                // lpThreadAttributes
                                  FALSE,               // bInheritHandles
                                  CREATE_SUSPENDED,    // dwCreationFlags (resumed after joining the job)
                                  env_block.data(),    // lpEnvironment
                                  NULL,                // lpCurrentDirectory
                                  &si,                 // lpStartupInfo
                                  &pi                  // lpProcessInformation
    );

    if (!success) {
        error_ = "CreateProcess failed for " + resolved_path_ + ": " + std::to_string(GetLastError());
        LOG_ERROR("[Process] " << error_);
        return false;
    }

    // Job object so a forced kill takes the backend's own children with it
    job_handle_ = CreateJobObjectA(NULL, NULL);
    if (job_handle_) {
        JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits = {};
        limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
        SetInformationJobObject(job_handle_, JobObjectExtendedLimitInformation, &limits, sizeof(limits));
        if (!AssignProcessToJobObject(job_handle_, pi.hProcess)) {
            LOG_WARN("[Process] Could not assign backend to job object: " << GetLastError());
        }
    }

    ResumeThread(pi.hThread);
    CloseHandle(pi.hThread);

    process_handle_ = pi.hProcess;
    process_id_ = pi.dwProcessId;

    LOG_INFO("[Process] Spawned " << resolved_path_ << " (PID=" << pi.dwProcessId << ")");
    return true;
}
#else
bool ChildProcess::spawn_linux() {
    // Everything the child needs is built before fork(): only async-signal-safe
    // calls are allowed between fork and exec in a multithreaded parent
    std::vector<std::string> env_strings = build_environment(spec_);
    std::vector<char *> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto &entry : env_strings) {
        envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(resolved_path_.c_str()));
    for (const auto &arg : spec_.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // exec-status pipe: closed by a successful exec (CLOEXEC), carries errno otherwise
    int status_pipe[2];
    if (pipe(status_pipe) < 0) {
        error_ = std::string("Failed to create status pipe: ") + strerror(errno);
        return false;
    }
    if (fcntl(status_pipe[0], F_SETFD, FD_CLOEXEC) < 0 || fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC) < 0) {
        error_ = std::string("Failed to set FD_CLOEXEC on status pipe: ") + strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return false;
    }

    pid_ = fork();
    if (pid_ < 0) {
        error_ = std::string("Fork failed: ") + strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return false;
    }

    if (pid_ == 0) {
        // Child process
        close(status_pipe[0]);

        // Own process group so a forced kill reaches the backend's children too
        setpgid(0, 0);

        execve(argv[0], argv.data(), envp.data());

        // If we get here, exec failed
        int exec_errno = errno;
        ssize_t ignored = write(status_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        // exec failed; reap the child so it does not linger as a zombie
        int status;
        waitpid(pid_, &status, 0);
        pid_ = -1;
        error_ = "Failed to launch " + resolved_path_ + ": " + strerror(exec_errno);
        LOG_ERROR("[Process] " << error_);
        return false;
    }

    LOG_INFO("[Process] Spawned " << resolved_path_ << " (PID=" << pid_ << ")");
    return true;
}

void ChildProcess::record_status(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    pid_ = -1;
}
#endif

bool ChildProcess::is_running() {
#ifdef _WIN32
    if (!process_handle_) return false;
    DWORD exit_code;
    if (!GetExitCodeProcess(process_handle_, &exit_code)) return false;
    if (exit_code == STILL_ACTIVE) return true;
    exit_code_ = static_cast<int>(exit_code);
    return false;
#else
    if (pid_ <= 0) return false;

    int status;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0) {
        return true;
    }
    if (result == pid_) {
        record_status(status);
        return false;
    }
    // ECHILD: already reaped elsewhere
    pid_ = -1;
    return false;
#endif
}

bool ChildProcess::wait_for_exit(int timeout_ms) {
#ifdef _WIN32
    if (!process_handle_) return true;
    DWORD result = WaitForSingleObject(process_handle_, static_cast<DWORD>(timeout_ms));
    if (result == WAIT_OBJECT_0) {
        is_running();  // capture exit code
        return true;
    }
    return false;
#else
    if (pid_ <= 0) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            record_status(status);
            return true;
        }
        if (result == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECHILD) {
                pid_ = -1;
                return true;
            }
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_ms) {
            return false;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
#endif
}

void ChildProcess::detach() {
    detached_ = true;
#ifdef _WIN32
    if (job_handle_) {
        // Closing the job handle would otherwise kill every process in it
        JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits = {};
        if (!SetInformationJobObject(job_handle_, JobObjectExtendedLimitInformation, &limits, sizeof(limits))) {
            LOG_WARN("[Process] Could not clear kill-on-close for " << resolved_path_ << ": " << GetLastError());
        }
    }
#endif
    LOG_DEBUG("[Process] Detached " << resolved_path_ << " (PID=" << pid() << ")");
}

void ChildProcess::force_terminate() {
#ifdef _WIN32
    if (!is_running()) return;
    if (job_handle_) {
        TerminateJobObject(job_handle_, 1);
    } else {
        TerminateProcess(process_handle_, 1);
    }
#else
    if (pid_ <= 0) return;

    // Whole group first; fall back to the pid if the group is already gone
    if (::kill(-pid_, SIGKILL) < 0) {
        ::kill(pid_, SIGKILL);
    }
#endif
}

}  // namespace process
}  // namespace tether
