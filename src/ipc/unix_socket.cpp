#include "ipc/unix_socket.hpp"
#include "tether_log.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace tether::ipc {

namespace {

Result<sockaddr_un, IoError> makeAddress(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        return IoError("socket path too long: " + path, IoError::Kind::Other, ENAMETOOLONG);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

IoError errnoError(const std::string& what, int err) {
    return IoError(what + ": " + std::strerror(err), errnoKind(err), err);
}

// -1 error, 0 timeout, 1 ready
int waitReadable(int fd, std::chrono::milliseconds timeout) {
    pollfd pfd{fd, POLLIN, 0};
    for (;;) {
        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0 && errno == EINTR) continue;
        return rc < 0 ? -1 : (rc == 0 ? 0 : 1);
    }
}

} // anonymous namespace

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
}

IoError::Kind errnoKind(int err) {
    switch (err) {
        case ENOENT:        return IoError::Kind::NotFound;
        case EACCES:
        case EPERM:         return IoError::Kind::PermissionDenied;
        case ECONNREFUSED:  return IoError::Kind::ConnectionRefused;
        case ETIMEDOUT:
        case EAGAIN:        return IoError::Kind::Timeout;
        default:            return IoError::Kind::Other;
    }
}

Result<UniqueFd, IoError> connectUnix(const std::string& path) {
    auto addr = makeAddress(path);
    if (addr.is_err()) return addr.error();

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) return errnoError("socket", errno);

    const sockaddr_un& a = addr.value();
    int rc;
    do {
        rc = ::connect(fd.get(), reinterpret_cast<const sockaddr*>(&a), sizeof(a));
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) return errnoError("connect " + path, errno);
    return std::move(fd);
}

Result<UniqueFd, IoError> listenUnix(const std::string& path, int backlog) {
    auto addr = makeAddress(path);
    if (addr.is_err()) return addr.error();

    struct stat st;
    if (::lstat(path.c_str(), &st) == 0) {
        if (!S_ISSOCK(st.st_mode)) {
            return IoError(path + " exists and is not a socket", IoError::Kind::Other, EEXIST);
        }
        auto live = connectUnix(path);
        if (live.is_ok()) {
            return IoError(path + " is already served by another process",
                           IoError::Kind::Other, EADDRINUSE);
        }
        TLOG_INFO("ipc", "Removing stale socket %s", path.c_str());
        ::unlink(path.c_str());
    }

    UniqueFd fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (!fd.valid()) return errnoError("socket", errno);

    const sockaddr_un& a = addr.value();
    if (::bind(fd.get(), reinterpret_cast<const sockaddr*>(&a), sizeof(a)) < 0) {
        return errnoError("bind " + path, errno);
    }
    if (::listen(fd.get(), backlog) < 0) {
        int e = errno;
        ::unlink(path.c_str());
        return errnoError("listen " + path, e);
    }
    return std::move(fd);
}

Result<UniqueFd, IoError> acceptWithTimeout(int listen_fd, std::chrono::milliseconds timeout) {
    int ready = waitReadable(listen_fd, timeout);
    if (ready < 0) return errnoError("poll", errno);
    if (ready == 0) return UniqueFd();

    int client = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
        // Peer gave up between poll and accept
        if (errno == EAGAIN || errno == ECONNABORTED || errno == EINTR) return UniqueFd();
        return errnoError("accept", errno);
    }
    return UniqueFd(client);
}

Result<void, IoError> sendAll(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errnoError("send", errno);
        }
        sent += static_cast<size_t>(n);
    }
    return Result<void, IoError>();
}

Result<std::string, IoError> recvOnce(int fd, size_t max_bytes, std::chrono::milliseconds timeout) {
    int ready = waitReadable(fd, timeout);
    if (ready < 0) return errnoError("poll", errno);
    if (ready == 0) return IoError("recv timed out", IoError::Kind::Timeout);

    std::string buf(max_bytes, '\0');
    ssize_t n;
    do {
        n = ::recv(fd, &buf[0], max_bytes, 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) return errnoError("recv", errno);
    buf.resize(static_cast<size_t>(n));
    return buf;
}

Result<std::string, IoError> recvAll(int fd, size_t max_bytes, std::chrono::milliseconds timeout) {
    std::string out;
    while (out.size() < max_bytes) {
        auto chunk = recvOnce(fd, max_bytes - out.size(), timeout);
        if (chunk.is_err()) {
            if (chunk.error().kind == IoError::Kind::Timeout && !out.empty()) break;
            return chunk.error();
        }
        if (chunk.value().empty()) break;   // peer closed
        out += chunk.value();
    }
    return out;
}

} // namespace tether::ipc
