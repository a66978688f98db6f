#include "process_supervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <thread>

#include "client/i_guider_client.hpp"
#include "executable_locator.hpp"
#include "logging/logger.hpp"
#include "transport/tcp_connection.hpp"

#ifdef _WIN32
#include <windows.h>
#else
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;
#endif

namespace guidelink {
namespace process {

namespace {

constexpr int kExitPollMs = 50;
constexpr int kKillWaitMs = 2000;

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return static_cast<int>(std::max<long long>(0, left.count()));
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(const ProcessOptions &options,
                                     std::shared_ptr<transport::IConnectionFactory> factory)
    : options_(options),
      factory_(factory ? std::move(factory) : std::make_shared<transport::TcpConnectionFactory>())
#ifdef _WIN32
      ,
      process_handle_(nullptr)
#else
      ,
      pid_(-1)
#endif
{
}

ProcessSupervisor::~ProcessSupervisor() {
    // PHD2 outlives the supervisor unless stop() was called
    std::lock_guard<std::mutex> lock(mutex_);
    if (poll_running_locked()) {
        LOG_DEBUG("[Process] Leaving PHD2 running");
    }
    release_locked();
}

bool ProcessSupervisor::is_reachable() {
    return factory_->can_connect(options_.host, options_.port, options_.poll_interval_ms);
}

Status ProcessSupervisor::start(const std::optional<std::string> &executable_override) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (poll_running_locked()) {
            return Status::error(ErrorCode::PROCESS_ALREADY_RUNNING, "PHD2 process is already running");
        }
    }

    // An instance we did not start is reused as-is
    if (is_reachable()) {
        LOG_INFO("[Process] PHD2 already listening on " << options_.host << ":" << options_.port);
        return Status::success();
    }

    std::optional<std::string> requested = executable_override ? executable_override : options_.executable_path;
    std::string error;
    auto path = locate_executable(requested, error);
    if (!path) {
        LOG_ERROR("[Process] " << error);
        return Status::error(ErrorCode::EXECUTABLE_NOT_FOUND, error);
    }

    LOG_INFO("[Process] Spawning: " << *path);
    if (!spawn(*path, error)) {
        LOG_ERROR("[Process] " << error);
        return Status::error(ErrorCode::PROCESS_START_FAILED, error);
    }

    return wait_until_reachable(options_.startup_timeout_ms);
}

bool ProcessSupervisor::spawn(const std::string &path, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_exit_status_.reset();
#ifdef _WIN32
    return spawn_windows(path, error);
#else
    return spawn_linux(path, error);
#endif
}

#ifdef _WIN32
bool ProcessSupervisor::spawn_windows(const std::string &path, std::string &error) {
    std::string abs_path = std::filesystem::absolute(path).string();

    // CreateProcess (command line must be mutable)
    std::string cmdline = "\"" + abs_path + "\"";
    for (const auto &arg : options_.args) {
        cmdline += " \"" + arg + "\"";
    }
    std::vector<char> cmdline_buf(cmdline.begin(), cmdline.end());
    cmdline_buf.push_back('\0');

    // Environment block: inherited variables minus overridden ones, then overrides
    std::vector<char> env_block;
    if (!options_.spawn_env.empty()) {
        LPCH inherited = GetEnvironmentStringsA();
        if (inherited != nullptr) {
            for (const char *entry = inherited; *entry != '\0'; entry += std::strlen(entry) + 1) {
                std::string var(entry);
                std::string key = var.substr(0, var.find('='));
                if (!key.empty() && options_.spawn_env.count(key) > 0) {
                    continue;
                }
                env_block.insert(env_block.end(), var.begin(), var.end());
                env_block.push_back('\0');
            }
            FreeEnvironmentStringsA(inherited);
        }
        for (const auto &kv : options_.spawn_env) {
            std::string var = kv.first + "=" + kv.second;
            env_block.insert(env_block.end(), var.begin(), var.end());
            env_block.push_back('\0');
        }
        env_block.push_back('\0');
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    BOOL success = CreateProcessA(NULL, cmdline_buf.data(), NULL, NULL, FALSE, 0,
                                  env_block.empty() ? NULL : env_block.data(), NULL, &si, &pi);
    if (!success) {
        error = "CreateProcess failed: " + std::to_string(GetLastError());
        return false;
    }

    CloseHandle(pi.hThread);
    process_handle_ = pi.hProcess;

    LOG_INFO("[Process] PHD2 spawned (PID=" << pi.dwProcessId << ")");
    return true;
}
#else
bool ProcessSupervisor::spawn_linux(const std::string &path, std::string &error) {
    std::string abs_path = std::filesystem::absolute(path).string();

    // Build argv and envp before fork; the child only calls async-signal-safe functions
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(abs_path.c_str()));
    for (const auto &arg : options_.args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string var(*entry);
        std::string key = var.substr(0, var.find('='));
        if (options_.spawn_env.count(key) > 0) {
            continue;
        }
        env_storage.push_back(std::move(var));
    }
    for (const auto &kv : options_.spawn_env) {
        env_storage.push_back(kv.first + "=" + kv.second);
    }
    std::vector<char *> envp;
    for (auto &var : env_storage) {
        envp.push_back(const_cast<char *>(var.c_str()));
    }
    envp.push_back(nullptr);

    pid_ = fork();
    if (pid_ < 0) {
        error = std::string("Fork failed: ") + std::strerror(errno);
        pid_ = -1;
        return false;
    }

    if (pid_ == 0) {
        // Child process
        execve(abs_path.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    LOG_INFO("[Process] PHD2 spawned (PID=" << pid_ << ")");
    return true;
}
#endif

bool ProcessSupervisor::poll_running_locked() {
#ifdef _WIN32
    if (!process_handle_) return false;
    DWORD exit_code;
    if (!GetExitCodeProcess(process_handle_, &exit_code)) {
        release_locked();
        return false;
    }
    if (exit_code == STILL_ACTIVE) {
        return true;
    }
    last_exit_status_ = static_cast<int>(exit_code);
    release_locked();
    return false;
#else
    if (pid_ <= 0) return false;

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == 0) {
            return true;
        }
        if (result == pid_) {
            if (WIFEXITED(status)) {
                last_exit_status_ = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                last_exit_status_ = 128 + WTERMSIG(status);
            }
            pid_ = -1;
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: reaped elsewhere
        LOG_WARN("[Process] waitpid failed for PID " << pid_ << ": " << std::strerror(errno));
        pid_ = -1;
        return false;
    }
#endif
}

bool ProcessSupervisor::is_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    return poll_running_locked();
}

bool ProcessSupervisor::has_managed_process() const {
    std::lock_guard<std::mutex> lock(mutex_);
#ifdef _WIN32
    return process_handle_ != nullptr;
#else
    return pid_ > 0;
#endif
}

std::optional<int> ProcessSupervisor::last_exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_exit_status_;
}

Status ProcessSupervisor::wait_until_reachable(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    bool managed = has_managed_process();

    while (true) {
        int probe_ms = std::max(1, std::min(options_.poll_interval_ms, remaining_ms(deadline)));
        if (factory_->can_connect(options_.host, options_.port, probe_ms)) {
            LOG_INFO("[Process] PHD2 is accepting connections on " << options_.host << ":" << options_.port);
            return Status::success();
        }

        if (managed && !is_running()) {
            std::string message = "PHD2 process exited prematurely";
            auto status = last_exit_status();
            if (status) {
                message += " with status: " + std::to_string(*status);
            }
            LOG_ERROR("[Process] " << message);
            return Status::error(ErrorCode::PROCESS_START_FAILED, message);
        }

        int left = remaining_ms(deadline);
        if (left <= 0) {
            std::string message = "PHD2 did not become ready within " + std::to_string(timeout_ms) + "ms";
            LOG_ERROR("[Process] " << message);
            return Status::error(ErrorCode::TIMEOUT, message);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(options_.poll_interval_ms, left)));
    }
}

Status ProcessSupervisor::stop(client::IGuiderClient *client) {
    Status graceful = Status::success();
    bool attempted = false;

    if (client != nullptr && client->is_connected()) {
        LOG_INFO("[Process] Requesting PHD2 shutdown");
        attempted = true;
        graceful = client->shutdown_application();
        if (graceful.ok()) {
            if (wait_for_exit(options_.shutdown_timeout_ms)) {
                LOG_INFO("[Process] Clean shutdown");
                return Status::success();
            }
            LOG_WARN("[Process] PHD2 did not exit within " << options_.shutdown_timeout_ms << "ms");
        } else {
            LOG_WARN("[Process] Shutdown request failed: " << graceful.message);
        }
    }

    if (!is_running()) {
        if (attempted && !graceful.ok()) {
            return graceful;
        }
        LOG_DEBUG("[Process] No managed PHD2 process to stop");
        return Status::success();
    }

    LOG_WARN("[Process] Forcing termination");
    force_terminate();
    if (!wait_for_exit(kKillWaitMs)) {
        return Status::error(ErrorCode::TIMEOUT, "PHD2 process did not exit after being killed");
    }
    return Status::success();
}

bool ProcessSupervisor::wait_for_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (!is_running()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kExitPollMs));
    }
}

void ProcessSupervisor::force_terminate() {
    std::lock_guard<std::mutex> lock(mutex_);
#ifdef _WIN32
    if (process_handle_) {
        TerminateProcess(process_handle_, 1);
    }
#else
    if (pid_ > 0) {
        kill(pid_, SIGKILL);
    }
#endif
}

void ProcessSupervisor::release_locked() {
#ifdef _WIN32
    if (process_handle_) {
        CloseHandle(process_handle_);
        process_handle_ = nullptr;
    }
#else
    pid_ = -1;
#endif
}

}  // namespace process
}  // namespace guidelink
