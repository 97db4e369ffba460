#pragma once

/// @file router_result.hpp
/// @brief RouterResult<T> alias for routing-layer operations.

#include "arl/core/result.hpp"
#include "arl/foundation/router_error.hpp"

namespace arl::foundation {

/// Result type specialized with RouterError.
///
/// Example:
/// @code
///   RouterResult<RateLimitRule> makeRule(int requests, int window) {
///       if (requests <= 0) {
///           return RouterResult<RateLimitRule>::err(
///               RouterError(ErrorCode::InvalidArgument, "requests must be positive"));
///       }
///       ...
///   }
/// @endcode
template <typename T>
using RouterResult = arl::Result<T, RouterError>;

}  // namespace arl::foundation
