/// @file http_liveness_probe.cpp
/// @brief HttpLivenessProbe over TcpConnection.

#include "arl/health/liveness_probe.hpp"

#include <cctype>

#include "arl/foundation/tcp_connection.hpp"

namespace arl::health {

using foundation::ErrorCode;
using foundation::SteadyClock;
using foundation::TcpConnection;

namespace {

constexpr std::size_t kMaxStatusLine = 8 * 1024;

RouterError probeError(const RouterError& cause, const routing::ServiceInstance& instance) {
    auto code = cause.code() == ErrorCode::Timeout ? ErrorCode::ProbeTimeout
                                                   : ErrorCode::ProbeFailure;
    return RouterError(code, "probe " + instance.url() + ": " + std::string(cause.message()));
}

} // namespace

HttpLivenessProbe::HttpLivenessProbe(std::string path)
    : path_(path.empty() || path.front() != '/' ? "/" + path : std::move(path)) {}

int HttpLivenessProbe::parseStatusLine(std::string_view line) {
    if (!line.starts_with("HTTP/")) {
        return -1;
    }
    auto space = line.find(' ');
    if (space == std::string_view::npos || line.size() < space + 4) {
        return -1;
    }
    int code = 0;
    for (std::size_t i = space + 1; i < space + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(line[i]))) {
            return -1;
        }
        code = code * 10 + (line[i] - '0');
    }
    if (line.size() > space + 4 && line[space + 4] != ' ') {
        return -1;
    }
    return code;
}

RouterResult<ProbeResponse> HttpLivenessProbe::probe(const routing::ServiceInstance& instance,
                                                     std::chrono::milliseconds timeout) {
    const auto start = SteadyClock::now();
    const auto& address = instance.address();

    auto conn = TcpConnection::connect(address.host, address.port, timeout);
    if (!conn) {
        return RouterResult<ProbeResponse>::err(probeError(conn.error(), instance));
    }

    std::string request = "GET " + path_ + " HTTP/1.1\r\n";
    request += "Host: " + address.host + ":" + std::to_string(address.port) + "\r\n";
    request += "User-Agent: arl-health-probe\r\n";
    request += "Accept: */*\r\n";
    request += "Connection: close\r\n\r\n";

    auto sent = conn.value().sendAll(request);
    if (!sent) {
        return RouterResult<ProbeResponse>::err(probeError(sent.error(), instance));
    }

    auto line = conn.value().readLine(kMaxStatusLine);
    if (!line) {
        return RouterResult<ProbeResponse>::err(probeError(line.error(), instance));
    }

    int status = parseStatusLine(line.value());
    if (status < 0) {
        return RouterResult<ProbeResponse>::err(
            RouterError(ErrorCode::ProbeFailure,
                        "probe " + instance.url() + ": malformed status line '" + line.value() + "'"));
    }

    return RouterResult<ProbeResponse>::ok(ProbeResponse{
        .statusCode = status,
        .latencySeconds = foundation::toSeconds(SteadyClock::now() - start),
    });
}

} // namespace arl::health
