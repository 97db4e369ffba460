#pragma once

/// @file router_error.hpp
/// @brief Error type used with Result<T, RouterError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "arl/foundation/error_code.hpp"

namespace arl::foundation {

/// Error carrying a categorized code, a human-readable message and optional
/// typed context (e.g. the rate-limit headers of a RateLimited rejection).
class RouterError {
public:
    RouterError() = default;

    explicit RouterError(ErrorCode code)
        : code_(code) {}

    RouterError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RouterError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Typed context, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True for the request-path rejections a caller is expected to handle
    /// (as opposed to infrastructure failures).
    [[nodiscard]] bool isRejection() const noexcept {
        return code_ == ErrorCode::NoHealthyInstance || code_ == ErrorCode::CircuitOpen ||
               code_ == ErrorCode::RateLimited;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace arl::foundation
