#pragma once
#include <functional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace jotter::kernel {

// Kernel process state
enum class ProcessState {
    CREATED,
    STARTING,
    RUNNING,
    STOPPING,
    STOPPED,
    FAILED
};

const char* process_state_to_string(ProcessState state);

class KernelProcess;

// Callback for process state changes
using ProcessEventCallback = std::function<void(KernelProcess*, ProcessState)>;

// A launched kernel executable. argv entries equal to "{socket}" are
// replaced with the socket path the kernel must connect back to.
class KernelProcess {
public:
    KernelProcess(std::vector<std::string> argv, std::string socket_path);
    ~KernelProcess();

    // Non-copyable
    KernelProcess(const KernelProcess&) = delete;
    KernelProcess& operator=(const KernelProcess&) = delete;

    // Lifecycle
    bool start();
    bool stop(int timeout_ms = 5000);
    bool restart();

    // Deliver SIGINT
    bool interrupt();

    // Status
    ProcessState state() const { return state_; }
    pid_t pid() const { return pid_; }
    bool is_running();
    int exit_code() const { return exit_code_; }

    void set_event_callback(ProcessEventCallback callback);

    std::vector<std::string> build_args() const;

private:
    std::vector<std::string> argv_;
    std::string socket_path_;
    ProcessState state_ = ProcessState::CREATED;
    pid_t pid_ = -1;
    int exit_code_ = -1;
    ProcessEventCallback event_callback_;

    void set_state(ProcessState new_state);
    bool reap(int options);
};

} // namespace jotter::kernel
