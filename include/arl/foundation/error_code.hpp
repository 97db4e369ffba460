#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the routing layer.

#include <cstdint>
#include <string_view>

namespace arl::foundation {

/// Error codes grouped by subsystem in 256-value ranges, so the source of a
/// failure can be read from the code alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    Timeout = 0x0005,
    IoError = 0x0006,

    // Routing (0x0100 - 0x01FF)
    NoHealthyInstance = 0x0100,
    CircuitOpen = 0x0101,

    // Rate limiting and shared store (0x0200 - 0x02FF)
    RateLimited = 0x0200,
    StoreUnavailable = 0x0201,
    StoreProtocolError = 0x0202,

    // Health probing (0x0300 - 0x03FF)
    ProbeTimeout = 0x0300,
    ProbeFailure = 0x0301,
    ProbeBadStatus = 0x0302,

    // Scaling (0x0400 - 0x04FF)
    ScaleActionFailed = 0x0400,
    DrainTimeout = 0x0401,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    ConfigInvalid = 0x0603,

    // Thread (0x0700 - 0x07FF)
    TaskScheduleFailed = 0x0700,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0800,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto category = static_cast<uint32_t>(code) & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Routing";
        case 0x0200: return "RateLimit";
        case 0x0300: return "Health";
        case 0x0400: return "Scaling";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Short symbolic name, used in log lines.
constexpr std::string_view errorName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::NoHealthyInstance: return "NoHealthyInstance";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::StoreUnavailable: return "StoreUnavailable";
        case ErrorCode::StoreProtocolError: return "StoreProtocolError";
        case ErrorCode::ProbeTimeout: return "ProbeTimeout";
        case ErrorCode::ProbeFailure: return "ProbeFailure";
        case ErrorCode::ProbeBadStatus: return "ProbeBadStatus";
        case ErrorCode::ScaleActionFailed: return "ScaleActionFailed";
        case ErrorCode::DrainTimeout: return "DrainTimeout";
        case ErrorCode::ConfigLoadFailed: return "ConfigLoadFailed";
        case ErrorCode::ConfigKeyNotFound: return "ConfigKeyNotFound";
        case ErrorCode::ConfigTypeMismatch: return "ConfigTypeMismatch";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::TaskScheduleFailed: return "TaskScheduleFailed";
        case ErrorCode::LoggerFlushFailed: return "LoggerFlushFailed";
    }
    return "Unknown";
}

} // namespace arl::foundation
