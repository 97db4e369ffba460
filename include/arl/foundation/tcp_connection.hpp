#pragma once

/// @file tcp_connection.hpp
/// @brief Blocking TCP client connection with a single deadline.
///
/// Used by the health probe for its HTTP GET liveness check.
/// Every operation waits with poll() against the deadline fixed at connect
/// time, so one slow peer can never stall the caller past its budget.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "arl/foundation/router_result.hpp"
#include "arl/foundation/types.hpp"

namespace arl::foundation {

/// Owning handle to a connected socket. Move-only; closes on destruction.
///
/// Errors: Timeout when the deadline passes, IoError for connect, resolve,
/// send or receive failures and for a peer that closes early.
class TcpConnection {
public:
    static constexpr std::size_t kDefaultMaxBytes = 1024 * 1024;

    /// Resolve @p host and connect within @p timeout. The same budget then
    /// bounds every later read and write on the connection.
    static RouterResult<TcpConnection> connect(const std::string& host, uint16_t port,
                                               std::chrono::milliseconds timeout);

    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    RouterResult<void> sendAll(std::string_view data);

    /// Read up to and excluding the next CRLF.
    RouterResult<std::string> readLine(std::size_t maxBytes = kDefaultMaxBytes);

    /// Read exactly @p count bytes.
    RouterResult<std::string> readExact(std::size_t count);

    /// Read until the peer closes, up to @p maxBytes.
    RouterResult<std::string> readToEnd(std::size_t maxBytes = kDefaultMaxBytes);

    /// Push the deadline out to now + @p timeout (for reused connections).
    void extendDeadline(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isOpen() const noexcept { return fd_ >= 0; }

    void close() noexcept;

private:
    TcpConnection(int fd, SteadyTime deadline) : fd_(fd), deadline_(deadline) {}

    /// Append at least one byte to buffer_. Returns ok(false) on orderly EOF.
    RouterResult<bool> fill(std::size_t maxBytes);

    int fd_ = -1;
    SteadyTime deadline_;
    std::string buffer_;
};

} // namespace arl::foundation
