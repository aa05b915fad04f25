#pragma once
// =============================================================================
// Tether - Unix domain socket helpers
// =============================================================================

#include <chrono>
#include <string>

#include "result.hpp"

namespace tether::ipc {

// Owning file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& o) noexcept : fd_(o.release()) {}
    UniqueFd& operator=(UniqueFd&& o) noexcept {
        if (this != &o) reset(o.release());
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() { int fd = fd_; fd_ = -1; return fd; }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

IoError::Kind errnoKind(int err);

/**
 * Bind and listen on `path`. A leftover socket file nobody answers on is
 * unlinked first; a live listener makes this fail.
 */
Result<UniqueFd, IoError> listenUnix(const std::string& path, int backlog = 8);

Result<UniqueFd, IoError> connectUnix(const std::string& path);

// Wait up to `timeout` for a pending connection. Empty fd on timeout.
Result<UniqueFd, IoError> acceptWithTimeout(int listen_fd, std::chrono::milliseconds timeout);

Result<void, IoError> sendAll(int fd, const std::string& data);

// Single bounded read
Result<std::string, IoError> recvOnce(int fd, size_t max_bytes, std::chrono::milliseconds timeout);

// Read until the peer closes or `max_bytes` is reached
Result<std::string, IoError> recvAll(int fd, size_t max_bytes, std::chrono::milliseconds timeout);

} // namespace tether::ipc
