#include "process_runner.hpp"
#include "tether_log.hpp"

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tether {

namespace {

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

IoError::Kind kindFromErrno(int err) {
    switch (err) {
        case ENOENT:  return IoError::Kind::NotFound;
        case EACCES:
        case EPERM:   return IoError::Kind::PermissionDenied;
        default:      return IoError::Kind::Other;
    }
}

// fork + execvp. The CLOEXEC error pipe reports exec failure back to the
// parent so a missing binary is a spawn error rather than exit code 127.
// output_fd: -1 = inherit the parent's stdout/stderr.
Result<pid_t, IoError> spawnChild(const std::vector<std::string>& argv, int output_fd) {
    if (argv.empty() || argv[0].empty()) {
        return IoError("empty command line", IoError::Kind::Other);
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    int err_pipe[2];
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        return IoError(std::string("pipe2: ") + std::strerror(e), IoError::Kind::Other, e);
    }

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        if (devnull >= 0) ::close(devnull);
        return IoError(std::string("fork: ") + std::strerror(e), IoError::Kind::Other, e);
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (output_fd >= 0) {
            ::dup2(output_fd, STDOUT_FILENO);
            ::dup2(output_fd, STDERR_FILENO);
        }
        ::execvp(cargv[0], cargv.data());
        int e = errno;
        ssize_t ignored = ::write(err_pipe[1], &e, sizeof(e));
        (void)ignored;
        ::_exit(kExecFailedExitCode);
    }

    ::close(err_pipe[1]);
    if (devnull >= 0) ::close(devnull);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        return IoError(argv[0] + ": " + std::strerror(child_errno),
                       kindFromErrno(child_errno), child_errno);
    }

    return pid;
}

} // anonymous namespace

std::string joinCommandLine(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out += ' ';
        out += argv[i];
    }
    return out;
}

// =============================================================================
// runProcess
// =============================================================================

Result<ProcessResult, IoError> runProcess(const std::vector<std::string>& argv,
                                          std::chrono::milliseconds timeout) {
    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        return IoError(std::string("pipe2: ") + std::strerror(e), IoError::Kind::Other, e);
    }

    auto spawned = spawnChild(argv, out_pipe[1]);
    ::close(out_pipe[1]);
    if (spawned.is_err()) {
        ::close(out_pipe[0]);
        return spawned.error();
    }
    const pid_t pid = spawned.value();

    ProcessResult result;
    int read_fd = out_pipe[0];
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    // Drain output until EOF or deadline
    while (read_fd >= 0) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }
        int wait_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
        pollfd pfd{read_fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;

        char buf[4096];
        ssize_t n = ::read(read_fd, buf, sizeof(buf));
        if (n > 0) {
            if (result.output.size() < kMaxProcessOutput) {
                size_t room = kMaxProcessOutput - result.output.size();
                result.output.append(buf, static_cast<size_t>(n) < room ? static_cast<size_t>(n) : room);
            }
        } else if (n == 0) {
            closeFd(read_fd);
        } else if (errno != EINTR && errno != EAGAIN) {
            closeFd(read_fd);
        }
    }
    closeFd(read_fd);

    int status = 0;
    if (result.timed_out) {
        TLOG_WARN("process", "Timeout after %lldms: %s",
                  static_cast<long long>(timeout.count()), argv[0].c_str());
        ::kill(pid, SIGTERM);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (::waitpid(pid, &status, WNOHANG) == 0) {
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        }
        result.exit_code = decodeStatus(status);
        return result;
    }

    // Output closed; the child may still be finishing. Keep honoring the deadline.
    for (;;) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            result.exit_code = -1;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            ::kill(pid, SIGKILL);
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    result.exit_code = decodeStatus(status);
    return result;
}

// =============================================================================
// PosixChildProcess
// =============================================================================

bool PosixChildProcess::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !exited_;
}

int PosixChildProcess::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (exited_) return exit_code_;
    if (reaping_) {
        cv_.wait(lock, [this] { return exited_; });
        return exit_code_;
    }
    reaping_ = true;
    lock.unlock();

    int status = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);

    lock.lock();
    exited_ = true;
    exit_code_ = (r == pid_) ? decodeStatus(status) : -1;
    cv_.notify_all();
    return exit_code_;
}

bool PosixChildProcess::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return exited_; });
}

void PosixChildProcess::signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) return;
    if (::kill(pid_, sig) != 0 && errno != ESRCH) {
        TLOG_WARN("process", "kill(%d, %d) failed: %s", (int)pid_, sig, std::strerror(errno));
    }
}

void PosixChildProcess::terminate() { signal(SIGTERM); }

void PosixChildProcess::kill() { signal(SIGKILL); }

Result<std::shared_ptr<ChildProcess>, IoError> PosixProcessLauncher::launch(
        const std::vector<std::string>& argv) {
    auto spawned = spawnChild(argv, -1);
    if (spawned.is_err()) return spawned.error();
    std::shared_ptr<ChildProcess> proc = std::make_shared<PosixChildProcess>(spawned.value());
    return proc;
}

} // namespace tether
