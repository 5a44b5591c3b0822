#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the identity service.

#include <cstdint>
#include <string_view>

namespace cis::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the error class
/// (validation, conflict, auth, ...) can be recovered from the value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Storage (0x0200 - 0x02FF)
    DatabaseError = 0x0200,
    QueryFailed = 0x0201,
    TransactionFailed = 0x0202,
    ConnectionPoolExhausted = 0x0203,
    NotConnected = 0x0205,
    ConstraintViolation = 0x0206,

    // Auth (0x0500 - 0x05FF)
    AuthenticationFailed = 0x0500,
    TokenExpired = 0x0501,
    InvalidToken = 0x0502,
    PermissionDenied = 0x0503,
    InvalidCredentials = 0x0504,
    AccountDisabled = 0x0505,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    InvalidEncryptionKey = 0x0603,

    // Logger (0x0800 - 0x08FF)
    LoggerFlushFailed = 0x0801,

    // Validation (0x0900 - 0x09FF)
    InvalidUsername = 0x0900,
    InvalidEmail = 0x0901,
    WeakPassword = 0x0902,
    InvalidCodePurpose = 0x0903,
    UnknownSettingKey = 0x0904,
    MissingField = 0x0905,

    // Conflict (0x0A00 - 0x0AFF)
    UsernameTaken = 0x0A00,
    EmailTaken = 0x0A01,
    OAuthIdentityTaken = 0x0A02,

    // Verification (0x0B00 - 0x0BFF)
    CodeNotFound = 0x0B00,
    CodeExpired = 0x0B01,
    TooManyAttempts = 0x0B02,
    CodeMismatch = 0x0B03,
    CodeCooldown = 0x0B04,

    // Secret (0x0C00 - 0x0CFF)
    InvalidSecret = 0x0C00,
    EncryptionFailed = 0x0C01,

    // Mail (0x0D00 - 0x0DFF)
    MailerNotConfigured = 0x0D00,
    MailSendFailed = 0x0D01,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0200: return "Storage";
        case 0x0500: return "Auth";
        case 0x0600: return "Config";
        case 0x0800: return "Logger";
        case 0x0900: return "Validation";
        case 0x0A00: return "Conflict";
        case 0x0B00: return "Verification";
        case 0x0C00: return "Secret";
        case 0x0D00: return "Mail";
        default: return "Unknown";
    }
}

/// True for codes produced by the storage layer.
constexpr bool isStorageError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xFF00) == 0x0200;
}

} // namespace cis::foundation
