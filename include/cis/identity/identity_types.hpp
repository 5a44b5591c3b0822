#pragma once

/// @file identity_types.hpp
/// @brief Core type definitions for the identity service.
///
/// Defines account records, settings rows, verification codes, token
/// structures and configuration types used throughout the identity layer.

#include <charconv>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace cis::identity {

using AccountId = uint64_t;
using TimePoint = std::chrono::system_clock::time_point;

/// Injectable wall clock. Tests substitute a controllable one.
using Clock = std::function<TimePoint()>;

[[nodiscard]] inline Clock systemClock() {
    return [] { return std::chrono::system_clock::now(); };
}

// -- Account model ------------------------------------------------------------

enum class AccountRole : uint8_t { User, Admin };

[[nodiscard]] constexpr std::string_view accountRoleName(AccountRole role) {
    return role == AccountRole::Admin ? "admin" : "user";
}

[[nodiscard]] inline std::optional<AccountRole> parseAccountRole(std::string_view name) {
    if (name == "user") {
        return AccountRole::User;
    }
    if (name == "admin") {
        return AccountRole::Admin;
    }
    return std::nullopt;
}

/// Parse a token subject into an account id. Ids start at 1, so "0",
/// signs, whitespace and trailing characters are all rejected.
[[nodiscard]] inline std::optional<AccountId> parseAccountId(std::string_view subject) {
    AccountId id = 0;
    auto [ptr, ec] = std::from_chars(subject.data(), subject.data() + subject.size(), id);
    if (ec != std::errc{} || ptr != subject.data() + subject.size() || id == 0) {
        return std::nullopt;
    }
    return id;
}

/// Stored account record.
///
/// Email is always held case-normalized. The password hash is absent for
/// accounts created purely through an external identity provider.
struct Account {
    AccountId id = 0;
    std::string username;
    std::string email;
    std::optional<std::string> passwordHash;
    bool active = true;
    AccountRole role = AccountRole::User;
    std::optional<std::string> oauthProvider;
    std::optional<std::string> oauthId;
    std::optional<std::string> avatarUrl;
    TimePoint createdAt{};
    TimePoint updatedAt{};

    [[nodiscard]] bool hasPassword() const noexcept {
        return passwordHash.has_value() && !passwordHash->empty();
    }
};

/// Per-account overrides, 1:1 with Account.
///
/// Secret fields hold SecretCipher output only, never plaintext.
struct AccountSettings {
    AccountId accountId = 0;
    std::optional<std::string> googleApiKeyEncrypted;
    std::optional<std::string> mineruTokenEncrypted;
    std::optional<std::string> googleApiBase;
    std::optional<std::string> mineruApiBase;
    std::optional<std::string> imageCaptionModel;
    std::optional<int> maxDescriptionWorkers;
    std::optional<int> maxImageWorkers;
    TimePoint createdAt{};
    TimePoint updatedAt{};
};

// -- Overridable settings -----------------------------------------------------

enum class SettingKey : uint8_t {
    GoogleApiKey,
    GoogleApiBase,
    MineruToken,
    MineruApiBase,
    ImageCaptionModel,
    MaxDescriptionWorkers,
    MaxImageWorkers
};

inline constexpr std::size_t kSettingKeyCount = 7;

inline constexpr SettingKey kAllSettingKeys[kSettingKeyCount] = {
    SettingKey::GoogleApiKey,      SettingKey::GoogleApiBase,
    SettingKey::MineruToken,       SettingKey::MineruApiBase,
    SettingKey::ImageCaptionModel, SettingKey::MaxDescriptionWorkers,
    SettingKey::MaxImageWorkers};

[[nodiscard]] constexpr std::string_view settingKeyName(SettingKey key) {
    switch (key) {
        case SettingKey::GoogleApiKey:          return "google_api_key";
        case SettingKey::GoogleApiBase:         return "google_api_base";
        case SettingKey::MineruToken:           return "mineru_token";
        case SettingKey::MineruApiBase:         return "mineru_api_base";
        case SettingKey::ImageCaptionModel:     return "image_caption_model";
        case SettingKey::MaxDescriptionWorkers: return "max_description_workers";
        case SettingKey::MaxImageWorkers:       return "max_image_workers";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<SettingKey> parseSettingKey(std::string_view name) {
    for (auto key : kAllSettingKeys) {
        if (settingKeyName(key) == name) {
            return key;
        }
    }
    return std::nullopt;
}

[[nodiscard]] constexpr bool isSecretSetting(SettingKey key) {
    return key == SettingKey::GoogleApiKey || key == SettingKey::MineruToken;
}

[[nodiscard]] constexpr bool isWorkerSetting(SettingKey key) {
    return key == SettingKey::MaxDescriptionWorkers || key == SettingKey::MaxImageWorkers;
}

/// Inclusive bounds for worker-count overrides.
inline constexpr int kMinWorkers = 1;
inline constexpr int kMaxWorkers = 20;

/// System-wide fallback values for every overridable setting.
struct SystemDefaults {
    std::string googleApiKey;
    std::string googleApiBase = "https://generativelanguage.googleapis.com";
    std::string mineruToken;
    std::string mineruApiBase = "https://mineru.net";
    std::string imageCaptionModel = "gemini-2.5-flash";
    int maxDescriptionWorkers = 5;
    int maxImageWorkers = 8;
};

// -- Verification codes -------------------------------------------------------

enum class CodePurpose : uint8_t { Register, ResetPassword };

[[nodiscard]] constexpr std::string_view codePurposeName(CodePurpose purpose) {
    return purpose == CodePurpose::Register ? "register" : "reset_password";
}

[[nodiscard]] inline std::optional<CodePurpose> parseCodePurpose(std::string_view name) {
    if (name == "register") {
        return CodePurpose::Register;
    }
    if (name == "reset_password") {
        return CodePurpose::ResetPassword;
    }
    return std::nullopt;
}

/// Stored one-time email verification code.
struct VerificationCode {
    uint64_t id = 0;
    std::string email;
    std::string code;
    CodePurpose purpose = CodePurpose::Register;
    TimePoint expiresAt{};
    bool used = false;
    uint32_t attempts = 0;
    TimePoint createdAt{};
};

/// Result of an attempt increment applied by the store.
enum class AttemptStatus : uint8_t {
    Recorded,    ///< Counter incremented; attempts holds the new value.
    AlreadyUsed, ///< Code was consumed (or superseded) concurrently.
    CapReached   ///< Counter was already at the cap; nothing changed.
};

struct AttemptOutcome {
    AttemptStatus status = AttemptStatus::Recorded;
    uint32_t attempts = 0;
};

// -- Token structures ---------------------------------------------------------

inline constexpr std::string_view kAccessTokenType = "access";
inline constexpr std::string_view kRefreshTokenType = "refresh";

/// Decoded JWT claims payload.
struct TokenClaims {
    std::string subject;                 ///< Account ID ("sub").
    std::string username;                ///< Username snapshot ("usr").
    AccountRole role = AccountRole::User; ///< Role snapshot ("role").
    std::string tokenType;               ///< "access" or "refresh" ("typ").
    std::string jti;                     ///< Unique token ID.
    TimePoint issuedAt{};                ///< Issued-at ("iat").
    TimePoint expiresAt{};               ///< Expiry ("exp").
};

/// Access + refresh token pair returned on successful authentication.
struct TokenPair {
    std::string accessToken;
    std::string refreshToken;
    std::string tokenType = "Bearer";
    std::chrono::seconds accessExpiresIn{};
    std::chrono::seconds refreshExpiresIn{};
};

// -- Configuration ------------------------------------------------------------

/// Configuration for credential handling and token issuance.
struct IdentityConfig {
    /// Secret key for HMAC-SHA256 token signing (min 32 bytes recommended).
    std::string signingKey = "change-me-in-production";

    /// Access token lifetime.
    std::chrono::seconds accessTokenExpiry{900};  // 15 minutes

    /// Refresh token lifetime.
    std::chrono::seconds refreshTokenExpiry{7 * 24 * 3600};

    /// Refresh token lifetime when the client asked to be remembered.
    std::chrono::seconds rememberMeRefreshExpiry{30 * 24 * 3600};

    /// PBKDF2 iteration count for new password hashes.
    uint32_t passwordHashIterations = 600000;

    uint32_t minPasswordLength = 6;
    uint32_t minUsernameLength = 3;
};

/// Configuration for the verification code engine.
struct VerificationConfig {
    std::chrono::seconds cooldown{60};
    std::chrono::seconds ttl{300};
    uint32_t maxAttempts = 5;
};

inline constexpr std::size_t kVerificationCodeLength = 6;

}  // namespace cis::identity
