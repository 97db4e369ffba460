#pragma once

/// @file router_logger.hpp
/// @brief RouterLogger wrapping kcenon logger_system for structured,
///        category-filtered logging of the routing layer.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arl/foundation/router_result.hpp"

namespace arl::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories, each with its own runtime level.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Composition root, lifecycle
    Registry  = 1, ///< Instance registration
    Balancer  = 2, ///< Strategy selection
    Breaker   = 3, ///< Circuit breaker transitions
    RateLimit = 4, ///< Admission control
    Health    = 5, ///< Health probing
    Scaler    = 6, ///< Auto-scaling decisions
    Store     = 7  ///< Shared store (Redis) access
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Registry", "Balancer", "Breaker", "RateLimit", "Health", "Scaler", "Store"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "INFO", "warning", ...). Unknown names
/// yield std::nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Structured fields appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.instanceId = "api-2";
///   ctx.extra["failures"] = "5";
///   logger.logWithContext(LogLevel::Warning, LogCategory::Breaker,
///                         "circuit opened", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> instanceId;
    std::optional<std::string> subjectKey;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger on top of kcenon's GlobalLoggerRegistry.
///
/// Default levels: Balancer and Breaker at Debug (high-volume decisions worth
/// seeing while tuning), everything else at Info. Uses PIMPL to keep kcenon
/// headers out of the public API.
class RouterLogger {
public:
    RouterLogger();
    ~RouterLogger();

    RouterLogger(const RouterLogger&) = delete;
    RouterLogger& operator=(const RouterLogger&) = delete;
    RouterLogger(RouterLogger&&) noexcept;
    RouterLogger& operator=(RouterLogger&&) noexcept;

    /// Log a message under the given category.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as {key=val, ...}.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Set every category to the same minimum level.
    void setAllLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    RouterResult<void> flush();

    /// Process-wide logger used by the ARL_LOG macros.
    static RouterLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace arl::foundation

/// @name ARL_LOG Macros
/// ARL_MIN_LOG_LEVEL removes calls below the threshold at compile time
/// (0=Trace ... 6=Off).
/// @{

#ifndef ARL_MIN_LOG_LEVEL
    #define ARL_MIN_LOG_LEVEL 0
#endif

#define ARL_LOG(level, cat, msg)                                                   \
    do {                                                                           \
        _Pragma("GCC diagnostic push")                                             \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                        \
        if (static_cast<int>(level) >= ARL_MIN_LOG_LEVEL &&                        \
            ::arl::foundation::RouterLogger::instance().isEnabled((level), (cat)))  \
        {                                                                          \
            ::arl::foundation::RouterLogger::instance().log((level), (cat), (msg)); \
        }                                                                          \
        _Pragma("GCC diagnostic pop")                                              \
    } while (0)

#define ARL_LOG_DEBUG(cat, msg) \
    ARL_LOG(::arl::foundation::LogLevel::Debug, (cat), (msg))

#define ARL_LOG_INFO(cat, msg) \
    ARL_LOG(::arl::foundation::LogLevel::Info, (cat), (msg))

#define ARL_LOG_WARN(cat, msg) \
    ARL_LOG(::arl::foundation::LogLevel::Warning, (cat), (msg))

#define ARL_LOG_ERROR(cat, msg) \
    ARL_LOG(::arl::foundation::LogLevel::Error, (cat), (msg))

/// @}
