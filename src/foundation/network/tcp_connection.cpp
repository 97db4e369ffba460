/// @file tcp_connection.cpp
/// @brief TcpConnection over non-blocking POSIX sockets and poll().

#include "arl/foundation/tcp_connection.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace arl::foundation {

namespace {

int remainingMs(SteadyTime deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                      SteadyClock::now());
    return static_cast<int>(std::max<std::chrono::milliseconds::rep>(0, left.count()));
}

/// 1 ready, 0 timed out, -1 error.
int waitFor(int fd, short events, SteadyTime deadline) {
    for (;;) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        int ret = ::poll(&pfd, 1, remainingMs(deadline));
        if (ret < 0 && errno == EINTR) {
            continue;
        }
        if (ret < 0) {
            return -1;
        }
        return ret == 0 ? 0 : 1;
    }
}

RouterError timeoutError(std::string_view what) {
    return RouterError(ErrorCode::Timeout, std::string(what) + " timed out");
}

RouterError ioError(std::string_view what) {
    return RouterError(ErrorCode::IoError,
                       std::string(what) + " failed: " + std::strerror(errno));
}

} // namespace

RouterResult<TcpConnection> TcpConnection::connect(const std::string& host, uint16_t port,
                                                   std::chrono::milliseconds timeout) {
    const auto deadline = SteadyClock::now() + timeout;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* resolved = nullptr;
    auto portText = std::to_string(port);
    int rc = ::getaddrinfo(host.c_str(), portText.c_str(), &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        return RouterResult<TcpConnection>::err(RouterError(
            ErrorCode::IoError, "resolve " + host + " failed: " + ::gai_strerror(rc)));
    }

    RouterError lastError(ErrorCode::IoError, "no address for " + host);
    for (auto* ai = resolved; ai != nullptr; ai = ai->ai_next) {
        int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                          ai->ai_protocol);
        if (fd < 0) {
            lastError = ioError("socket");
            continue;
        }

        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            if (errno != EINPROGRESS) {
                lastError = ioError("connect " + host + ":" + portText);
                ::close(fd);
                continue;
            }
            int ready = waitFor(fd, POLLOUT, deadline);
            if (ready <= 0) {
                lastError = ready == 0 ? timeoutError("connect " + host + ":" + portText)
                                       : ioError("connect " + host + ":" + portText);
                ::close(fd);
                if (ready == 0) {
                    break;
                }
                continue;
            }
            int soError = 0;
            socklen_t len = sizeof(soError);
            if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                errno = soError;
                lastError = ioError("connect " + host + ":" + portText);
                ::close(fd);
                continue;
            }
        }

        ::freeaddrinfo(resolved);
        return RouterResult<TcpConnection>::ok(TcpConnection(fd, deadline));
    }

    ::freeaddrinfo(resolved);
    return RouterResult<TcpConnection>::err(std::move(lastError));
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept
    : fd_(other.fd_), deadline_(other.deadline_), buffer_(std::move(other.buffer_)) {
    other.fd_ = -1;
}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        deadline_ = other.deadline_;
        buffer_ = std::move(other.buffer_);
        other.fd_ = -1;
    }
    return *this;
}

TcpConnection::~TcpConnection() {
    close();
}

void TcpConnection::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buffer_.clear();
}

void TcpConnection::extendDeadline(std::chrono::milliseconds timeout) {
    deadline_ = SteadyClock::now() + timeout;
}

RouterResult<void> TcpConnection::sendAll(std::string_view data) {
    std::size_t off = 0;
    while (off < data.size()) {
        int ready = waitFor(fd_, POLLOUT, deadline_);
        if (ready == 0) {
            return RouterResult<void>::err(timeoutError("send"));
        }
        if (ready < 0) {
            return RouterResult<void>::err(ioError("send"));
        }
        ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
            continue;
        }
        if (n <= 0) {
            return RouterResult<void>::err(ioError("send"));
        }
        off += static_cast<std::size_t>(n);
    }
    return RouterResult<void>::ok();
}

RouterResult<bool> TcpConnection::fill(std::size_t maxBytes) {
    for (;;) {
        if (buffer_.size() >= maxBytes) {
            return RouterResult<bool>::err(RouterError(
                ErrorCode::IoError, "response exceeds " + std::to_string(maxBytes) + " bytes"));
        }
        int ready = waitFor(fd_, POLLIN, deadline_);
        if (ready == 0) {
            return RouterResult<bool>::err(timeoutError("receive"));
        }
        if (ready < 0) {
            return RouterResult<bool>::err(ioError("receive"));
        }
        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0 && (errno == EAGAIN || errno == EINTR)) {
            continue;
        }
        if (n < 0) {
            return RouterResult<bool>::err(ioError("receive"));
        }
        if (n == 0) {
            return RouterResult<bool>::ok(false);
        }
        buffer_.append(chunk, static_cast<std::size_t>(n));
        return RouterResult<bool>::ok(true);
    }
}

RouterResult<std::string> TcpConnection::readLine(std::size_t maxBytes) {
    for (;;) {
        auto pos = buffer_.find("\r\n");
        if (pos != std::string::npos) {
            auto line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 2);
            return RouterResult<std::string>::ok(std::move(line));
        }
        auto more = fill(maxBytes);
        if (!more) {
            return RouterResult<std::string>::err(more.error());
        }
        if (!more.value()) {
            return RouterResult<std::string>::err(
                RouterError(ErrorCode::IoError, "connection closed before end of line"));
        }
    }
}

RouterResult<std::string> TcpConnection::readExact(std::size_t count) {
    while (buffer_.size() < count) {
        auto more = fill(count + kDefaultMaxBytes);
        if (!more) {
            return RouterResult<std::string>::err(more.error());
        }
        if (!more.value()) {
            return RouterResult<std::string>::err(
                RouterError(ErrorCode::IoError, "connection closed mid-payload"));
        }
    }
    auto out = buffer_.substr(0, count);
    buffer_.erase(0, count);
    return RouterResult<std::string>::ok(std::move(out));
}

RouterResult<std::string> TcpConnection::readToEnd(std::size_t maxBytes) {
    for (;;) {
        auto more = fill(maxBytes);
        if (!more) {
            return RouterResult<std::string>::err(more.error());
        }
        if (!more.value()) {
            break;
        }
    }
    std::string out;
    out.swap(buffer_);
    return RouterResult<std::string>::ok(std::move(out));
}

} // namespace arl::foundation
