#pragma once

/// @file service_error.hpp
/// @brief Service error type used with Result<T, ServiceError>.

#include <any>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "cis/foundation/error_code.hpp"

namespace cis::foundation {

/// Context attached to verification errors that carry a count.
struct VerificationDetail {
    uint32_t attemptsRemaining = 0;  ///< Set for CodeMismatch.
    int64_t retryAfterSeconds = 0;   ///< Set for CodeCooldown.
};

/// Rich error type carrying an error code, a human-readable message,
/// and optional type-erased context data (e.g. attempts remaining).
class ServiceError {
public:
    ServiceError() = default;

    explicit ServiceError(ErrorCode code)
        : code_(code) {}

    ServiceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ServiceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Internal description; see publicMessage() for what may leave the service.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

/// Fixed client-facing reason for an error.
///
/// Validation, conflict and verification errors keep their specific reason.
/// Storage and unknown failures collapse into a generic message so that no
/// raw storage detail crosses the service boundary.
std::string publicMessage(const ServiceError& error);

} // namespace cis::foundation
