#pragma once

/// @file credential_manager.hpp
/// @brief Registration, login, password management and token issuance.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/identity_types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cis::identity {

class PasswordHasher;
class TokenProvider;

/// Fields a user may change on their own profile. Absent means unchanged.
struct ProfileUpdate {
    std::optional<std::string> username;
    std::optional<std::string> avatarUrl;  ///< Empty string clears the avatar.
};

/// Credential and token manager.
///
/// Owns the password hasher and token provider; all persistence goes
/// through the injected IIdentityStore.
///
/// Example:
/// @code
///   CredentialManager credentials(config, store);
///   auto account = credentials.registerAccount("alice", "a@example.com", "secret1");
///   auto login = credentials.login("a@example.com", "secret1");
///   auto tokens = credentials.issueTokens(login.value(), false);
/// @endcode
class CredentialManager {
public:
    CredentialManager(IdentityConfig config,
                      std::shared_ptr<IIdentityStore> store,
                      Clock clock = systemClock());
    ~CredentialManager();

    CredentialManager(const CredentialManager&) = delete;
    CredentialManager& operator=(const CredentialManager&) = delete;
    CredentialManager(CredentialManager&&) noexcept;
    CredentialManager& operator=(CredentialManager&&) noexcept;

    /// Run every registration check without storing anything.
    [[nodiscard]] foundation::ServiceResult<void> checkRegistration(std::string_view username,
                                                                    std::string_view email,
                                                                    std::string_view password) const;

    /// Validate, hash and store a new account with default settings.
    ///
    /// Fails with InvalidUsername, InvalidEmail, WeakPassword, UsernameTaken
    /// or EmailTaken.
    [[nodiscard]] foundation::ServiceResult<Account> registerAccount(std::string_view username,
                                                                     std::string_view email,
                                                                     std::string_view password);

    /// Authenticate by email and password.
    ///
    /// Unknown email and wrong password both yield InvalidCredentials. The
    /// disabled flag is only revealed (AccountDisabled) once the password
    /// has verified.
    [[nodiscard]] foundation::ServiceResult<Account> login(std::string_view email,
                                                           std::string_view password) const;

    /// Sign an access token and a refresh token for @p account.
    [[nodiscard]] foundation::ServiceResult<TokenPair> issueTokens(const Account& account,
                                                                   bool rememberMe) const;

    /// Exchange a refresh token for a new access token.
    ///
    /// The account must still exist and be active.
    [[nodiscard]] foundation::ServiceResult<std::string> refresh(
        std::string_view refreshToken) const;

    /// Validate an access token (signature, expiry, type).
    [[nodiscard]] foundation::ServiceResult<TokenClaims> validateAccessToken(
        std::string_view accessToken) const;

    /// Change the password after verifying the current one.
    [[nodiscard]] foundation::ServiceResult<void> changePassword(const Account& account,
                                                                 std::string_view oldPassword,
                                                                 std::string_view newPassword);

    /// Set a new password without the old one (verified reset flow).
    [[nodiscard]] foundation::ServiceResult<void> setPassword(AccountId accountId,
                                                              std::string_view newPassword);

    /// Apply a profile update and return the stored account.
    [[nodiscard]] foundation::ServiceResult<Account> updateProfile(AccountId accountId,
                                                                   const ProfileUpdate& update);

    /// Delete an account together with its settings.
    [[nodiscard]] foundation::ServiceResult<void> deleteAccount(AccountId accountId);

    [[nodiscard]] const IdentityConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] foundation::ServiceResult<Account> loadAccount(AccountId accountId) const;

    [[nodiscard]] foundation::ServiceResult<void> storePassword(Account account,
                                                                std::string_view newPassword);

    IdentityConfig config_;
    std::shared_ptr<IIdentityStore> store_;
    Clock clock_;
    std::unique_ptr<PasswordHasher> hasher_;
    std::unique_ptr<TokenProvider> tokens_;
};

}  // namespace cis::identity
