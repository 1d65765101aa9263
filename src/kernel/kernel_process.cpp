#include "kernel/kernel_process.hpp"
#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>
#include <signal.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace jotter::kernel {

const char* process_state_to_string(ProcessState state) {
    switch (state) {
        case ProcessState::CREATED: return "created";
        case ProcessState::STARTING: return "starting";
        case ProcessState::RUNNING: return "running";
        case ProcessState::STOPPING: return "stopping";
        case ProcessState::STOPPED: return "stopped";
        case ProcessState::FAILED: return "failed";
        default: return "unknown";
    }
}

KernelProcess::KernelProcess(std::vector<std::string> argv, std::string socket_path)
    : argv_(std::move(argv))
    , socket_path_(std::move(socket_path)) {}

KernelProcess::~KernelProcess() {
    if (state_ == ProcessState::RUNNING || state_ == ProcessState::STARTING) {
        stop();
    }
}

bool KernelProcess::start() {
    if (state_ == ProcessState::RUNNING && is_running()) {
        spdlog::warn("Kernel process already running (pid={})", pid_);
        return false;
    }
    if (argv_.empty()) {
        spdlog::error("Kernel spec has an empty argv");
        set_state(ProcessState::FAILED);
        return false;
    }

    set_state(ProcessState::STARTING);

    auto args = build_args();
    std::vector<char*> c_args;
    c_args.reserve(args.size() + 1);
    for (auto& arg : args) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Failed to fork kernel process: {}", strerror(errno));
        set_state(ProcessState::FAILED);
        return false;
    }

    if (pid == 0) {
        // Own process group so terminal SIGINTs don't hit the kernel
        setpgid(0, 0);
        execvp(c_args[0], c_args.data());
        _exit(127);
    }

    pid_ = pid;
    exit_code_ = -1;
    set_state(ProcessState::RUNNING);
    spdlog::info("Kernel process started: {} (pid={})", args[0], pid_);
    return true;
}

bool KernelProcess::stop(int timeout_ms) {
    if (state_ != ProcessState::RUNNING && state_ != ProcessState::STARTING) {
        return true;
    }

    set_state(ProcessState::STOPPING);

    if (pid_ > 0 && !reap(WNOHANG)) {
        kill(pid_, SIGTERM);

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            if (reap(WNOHANG)) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (pid_ > 0) {
            spdlog::warn("Kernel process {} ignored SIGTERM, killing", pid_);
            kill(pid_, SIGKILL);
            reap(0);
        }
    }

    set_state(ProcessState::STOPPED);
    spdlog::info("Kernel process stopped (exit={})", exit_code_);
    return true;
}

bool KernelProcess::restart() {
    stop();
    return start();
}

bool KernelProcess::interrupt() {
    if (pid_ <= 0 || !is_running()) {
        spdlog::debug("Interrupt ignored: kernel process not running");
        return false;
    }
    if (kill(pid_, SIGINT) < 0) {
        spdlog::error("Failed to interrupt kernel process {}: {}", pid_, strerror(errno));
        return false;
    }
    spdlog::info("Sent SIGINT to kernel process {}", pid_);
    return true;
}

bool KernelProcess::is_running() {
    if (state_ != ProcessState::RUNNING || pid_ <= 0) {
        return false;
    }
    if (reap(WNOHANG)) {
        set_state(ProcessState::STOPPED);
        return false;
    }
    return true;
}

void KernelProcess::set_event_callback(ProcessEventCallback callback) {
    event_callback_ = std::move(callback);
}

std::vector<std::string> KernelProcess::build_args() const {
    std::vector<std::string> args;
    args.reserve(argv_.size());
    for (const auto& arg : argv_) {
        args.push_back(arg == "{socket}" ? socket_path_ : arg);
    }
    return args;
}

void KernelProcess::set_state(ProcessState new_state) {
    spdlog::debug("Kernel process state: {} -> {}",
        process_state_to_string(state_),
        process_state_to_string(new_state));

    state_ = new_state;

    if (event_callback_) {
        event_callback_(this, new_state);
    }
}

bool KernelProcess::reap(int options) {
    int status = 0;
    pid_t r = waitpid(pid_, &status, options);
    if (r == 0) {
        return false;
    }
    if (r < 0) {
        // ECHILD: already reaped elsewhere
        pid_ = -1;
        return true;
    }

    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
    pid_ = -1;
    return true;
}

} // namespace jotter::kernel
