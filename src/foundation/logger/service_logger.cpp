/// @file service_logger.cpp
/// @brief ServiceLogger implementation on top of kcenon's logger registry.

#include "cis/foundation/service_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace cis::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,    // Core
    LogLevel::Info,    // Auth
    LogLevel::Info,    // Verification
    LogLevel::Info,    // OAuth
    LogLevel::Info,    // Settings
    LogLevel::Info,    // Cipher
    LogLevel::Warning, // Storage
    LogLevel::Info     // Mail
};

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.accountId && *ctx.accountId != 0) {
        append("account_id", std::to_string(*ctx.accountId));
    }
    if (ctx.traceId && !ctx.traceId->empty()) {
        append("trace_id", *ctx.traceId);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

struct ServiceLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in the registry, one per category ("cis.Auth", ...)
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i], std::memory_order_relaxed);
            loggerNames[i] = std::string("cis.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        auto& registry = kci::GlobalLoggerRegistry::instance();
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // A category without a registered logger resolves to a null logger,
        // which reports nothing as enabled; route those to the default logger.
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger || !logger->is_enabled(kci::log_level::off)) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg, std::string_view ctx) {
        // Format: [Category] message {key=val, ...}
        std::string formatted;
        formatted.reserve(msg.size() + ctx.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!ctx.empty()) {
            formatted += " {";
            formatted += ctx;
            formatted += '}';
        }
        // A failing sink must not fail the request being logged.
        (void)getLogger(cat)->log(mapLevel(level), formatted);
    }
};

ServiceLogger::ServiceLogger() : impl_(std::make_unique<Impl>()) {}

ServiceLogger::~ServiceLogger() = default;

ServiceLogger::ServiceLogger(ServiceLogger&&) noexcept = default;
ServiceLogger& ServiceLogger::operator=(ServiceLogger&&) noexcept = default;

void ServiceLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, {});
}

void ServiceLogger::logWithContext(LogLevel level, LogCategory cat,
                                   std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->write(level, cat, msg, formatContext(ctx));
}

void ServiceLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel ServiceLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ServiceLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

ServiceResult<void> ServiceLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ServiceResult<void>::ok();
}

ServiceLogger& ServiceLogger::instance() {
    static ServiceLogger inst;
    return inst;
}

} // namespace cis::foundation
