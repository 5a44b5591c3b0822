#pragma once

/// @file service_logger.hpp
/// @brief ServiceLogger wrapping kcenon logger interfaces for structured
///        identity-service logging.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "cis/foundation/service_result.hpp"

namespace cis::foundation {

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

/// Log categories, one per identity subsystem.
enum class LogCategory : uint8_t {
    Core         = 0, ///< Startup, configuration
    Auth         = 1, ///< Registration, login, tokens
    Verification = 2, ///< Email verification codes
    OAuth        = 3, ///< External identity linking
    Settings     = 4, ///< Per-account settings resolution
    Cipher       = 5, ///< Secret encryption
    Storage      = 6, ///< Persistence layer
    Mail         = 7  ///< Outbound mail delivery
};

inline constexpr std::size_t kLogCategoryCount = 8;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Auth", "Verification", "OAuth", "Settings", "Cipher", "Storage", "Mail"
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

/// Structured context data attached to log entries.
///
/// Never put passwords, verification codes or decrypted secrets here.
struct LogContext {
    std::optional<uint64_t> accountId;
    std::optional<std::string> traceId;
    std::unordered_map<std::string, std::string> extra;
};

/// Identity-service logger wrapping kcenon's logger registry.
///
/// Uses PIMPL to keep kcenon headers out of the public API. Every category
/// defaults to Info except Storage, which defaults to Warning.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.accountId = account.id;
///   ServiceLogger::instance().logWithContext(
///       LogLevel::Info, LogCategory::Auth, "password changed", ctx);
/// @endcode
class ServiceLogger {
public:
    ServiceLogger();
    ~ServiceLogger();

    ServiceLogger(const ServiceLogger&) = delete;
    ServiceLogger& operator=(const ServiceLogger&) = delete;
    ServiceLogger(ServiceLogger&&) noexcept;
    ServiceLogger& operator=(ServiceLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as key=value pairs.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    ServiceResult<void> flush();

    /// Process-wide logger instance.
    static ServiceLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cis::foundation

// ---------------------------------------------------------------------------
// Convenience macros (outside the namespace; macros are global)
// ---------------------------------------------------------------------------

/// CIS_MIN_LOG_LEVEL can be defined before including this header to
/// eliminate logging calls below the threshold at compile time.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
#ifndef CIS_MIN_LOG_LEVEL
    #define CIS_MIN_LOG_LEVEL 0
#endif

#define CIS_LOG(level, cat, msg)                                                    \
    do {                                                                            \
        _Pragma("GCC diagnostic push")                                              \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                         \
        if (static_cast<int>(level) >= CIS_MIN_LOG_LEVEL &&                         \
            ::cis::foundation::ServiceLogger::instance().isEnabled((level), (cat)))  \
        {                                                                           \
            ::cis::foundation::ServiceLogger::instance().log((level), (cat), (msg)); \
        }                                                                           \
        _Pragma("GCC diagnostic pop")                                               \
    } while (0)

#define CIS_LOG_DEBUG(cat, msg) \
    CIS_LOG(::cis::foundation::LogLevel::Debug, (cat), (msg))

#define CIS_LOG_INFO(cat, msg) \
    CIS_LOG(::cis::foundation::LogLevel::Info, (cat), (msg))

#define CIS_LOG_WARN(cat, msg) \
    CIS_LOG(::cis::foundation::LogLevel::Warning, (cat), (msg))

#define CIS_LOG_ERROR(cat, msg) \
    CIS_LOG(::cis::foundation::LogLevel::Error, (cat), (msg))
