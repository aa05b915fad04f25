#pragma once
// =============================================================================
// Tether - Child Process Execution
// =============================================================================
// runProcess():  synchronous exec with a timeout, stdout+stderr captured.
// ChildProcess:  long-lived process handle (mirroring sessions).
// No shell is involved; argv goes straight to execvp().
// =============================================================================

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <sys/types.h>

#include "result.hpp"

namespace tether {

struct ProcessResult {
    int exit_code = -1;        // exit status, or 128+signal when killed
    std::string output;        // stdout and stderr interleaved
    bool timed_out = false;
};

// Upper bound on captured output (runaway child protection)
constexpr size_t kMaxProcessOutput = 1024 * 1024;

// Exit code reported when exec itself failed in the child
constexpr int kExecFailedExitCode = 127;

/**
 * Run argv[0] with the given arguments and wait for it to exit.
 * On timeout the child gets SIGTERM, then SIGKILL after a short grace period.
 * Errors: spawn failure (fork/pipe/exec) -> IoError.
 */
Result<ProcessResult, IoError> runProcess(const std::vector<std::string>& argv,
                                          std::chrono::milliseconds timeout);

std::string joinCommandLine(const std::vector<std::string>& argv);

// =============================================================================
// ChildProcess - handle to a spawned, still-running process
// =============================================================================
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    virtual int pid() const = 0;
    virtual bool running() const = 0;

    // Blocks until the process exits and returns its exit code.
    virtual int wait() = 0;

    // Waits up to `timeout` for the exit; true once the process has exited.
    virtual bool waitFor(std::chrono::milliseconds timeout) = 0;

    virtual void terminate() = 0;   // SIGTERM
    virtual void kill() = 0;        // SIGKILL
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;
    virtual Result<std::shared_ptr<ChildProcess>, IoError> launch(
        const std::vector<std::string>& argv) = 0;
};

/**
 * fork/exec backed process. Exactly one thread reaps the child via wait();
 * running() and waitFor() observe the state that thread publishes.
 */
class PosixChildProcess : public ChildProcess {
public:
    explicit PosixChildProcess(pid_t pid) : pid_(pid) {}
    ~PosixChildProcess() override = default;

    int pid() const override { return static_cast<int>(pid_); }
    bool running() const override;
    int wait() override;
    bool waitFor(std::chrono::milliseconds timeout) override;
    void terminate() override;
    void kill() override;

private:
    void signal(int sig);

    const pid_t pid_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool reaping_ = false;
    bool exited_ = false;
    int exit_code_ = -1;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    Result<std::shared_ptr<ChildProcess>, IoError> launch(
        const std::vector<std::string>& argv) override;
};

} // namespace tether
