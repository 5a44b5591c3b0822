/// @file service_error.cpp
/// @brief Client-facing message mapping for ServiceError.

#include "cis/foundation/service_error.hpp"

#include <string>

namespace cis::foundation {

std::string publicMessage(const ServiceError& error) {
    const auto* detail = error.context<VerificationDetail>();

    switch (error.code()) {
        // Validation keeps its specific reason.
        case ErrorCode::InvalidUsername:
        case ErrorCode::InvalidEmail:
        case ErrorCode::WeakPassword:
        case ErrorCode::InvalidCodePurpose:
        case ErrorCode::UnknownSettingKey:
        case ErrorCode::MissingField:
        case ErrorCode::InvalidArgument:
            return std::string(error.message());

        case ErrorCode::NotFound: return "not found";

        case ErrorCode::UsernameTaken: return "username already taken";
        case ErrorCode::EmailTaken: return "email already registered";
        case ErrorCode::OAuthIdentityTaken: return "identity already linked to another account";

        case ErrorCode::InvalidCredentials: return "invalid email or password";
        case ErrorCode::AccountDisabled: return "account is disabled";
        case ErrorCode::TokenExpired: return "token has expired";
        case ErrorCode::PermissionDenied: return "admin access required";
        case ErrorCode::InvalidToken:
        case ErrorCode::AuthenticationFailed: return "authentication required";

        case ErrorCode::CodeNotFound: return "verification code does not exist or has expired";
        case ErrorCode::CodeExpired: return "verification code has expired, request a new one";
        case ErrorCode::TooManyAttempts: return "too many attempts, request a new code";
        case ErrorCode::CodeMismatch:
            if (detail != nullptr) {
                return "verification code is incorrect, " +
                       std::to_string(detail->attemptsRemaining) + " attempts remaining";
            }
            return "verification code is incorrect";
        case ErrorCode::CodeCooldown:
            if (detail != nullptr) {
                return "codes are sent too frequently, retry in " +
                       std::to_string(detail->retryAfterSeconds) + " seconds";
            }
            return "codes are sent too frequently";

        case ErrorCode::MailerNotConfigured: return "mail service is not configured";
        case ErrorCode::MailSendFailed: return "failed to send email";

        default:
            return "internal error";
    }
}

} // namespace cis::foundation
