#pragma once

/// @file request_context.hpp
/// @brief Caller identity attached to a routing or admission request.

#include <optional>
#include <string>

namespace arl::routing {

/// Identity of the caller, as far as the front end knows it.
///
/// userId / sessionId drive consistent-hash affinity; userId, apiKey and
/// ip drive rate-limit subject keys.
struct RequestContext {
    std::optional<std::string> userId;
    std::optional<std::string> sessionId;
    std::optional<std::string> ip;
    std::optional<std::string> apiKey;

    /// Request path, used to pick per-route rate-limit rules.
    std::string path;
};

} // namespace arl::routing
