#pragma once

/// @file identity_server.hpp
/// @brief IdentityServer wiring the identity components into end-to-end flows.
///
/// Flows: verification-code mail, registration with code, login, refresh,
/// password reset, OAuth sign-in and per-account settings.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/access_guard.hpp"
#include "cis/identity/credential_manager.hpp"
#include "cis/identity/effective_config_resolver.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/identity_types.hpp"
#include "cis/identity/mailer.hpp"
#include "cis/identity/oauth_identity_resolver.hpp"
#include "cis/identity/secret_cipher.hpp"
#include "cis/identity/settings_manager.hpp"
#include "cis/identity/verification_code_engine.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cis::identity {

/// Configuration for the whole identity server.
struct IdentityServerConfig {
    IdentityConfig identity;
    VerificationConfig verification;
    SystemDefaults defaults;
    std::string productName = "Identity Service";
};

/// Account plus the tokens issued for it.
struct AuthSession {
    Account account;
    TokenPair tokens;
};

/// Outcome of a code request.
struct CodeRequestOutcome {
    /// False when nothing was sent on purpose (reset for an unknown email).
    /// Callers must not reveal this to the requester.
    bool sent = false;
    std::chrono::seconds expiresIn{};
};

/// Identity server orchestrating credentials, codes, OAuth and settings.
///
/// Components are built once in the constructor; the cipher, store and
/// mailer are shared with the caller.
///
/// Example:
/// @code
///   IdentityServer server(config, store, cipher, mailer);
///   auto sent = server.requestCode("a@example.com", "register");
///   auto session = server.registerWithCode("alice", "a@example.com", "secret1", code);
/// @endcode
class IdentityServer {
public:
    IdentityServer(IdentityServerConfig config,
                   std::shared_ptr<IIdentityStore> store,
                   std::shared_ptr<const SecretCipher> cipher,
                   std::shared_ptr<IMailer> mailer,
                   Clock clock = systemClock());

    // -- Verification codes ---------------------------------------------------

    /// Issue and mail a code.
    ///
    /// Fails with InvalidEmail, InvalidCodePurpose, MailerNotConfigured,
    /// EmailTaken (register), CodeCooldown or MailSendFailed.
    [[nodiscard]] foundation::ServiceResult<CodeRequestOutcome> requestCode(
        std::string_view email, std::string_view purpose);

    /// Pre-check a code without consuming it. Wrong codes count as attempts.
    [[nodiscard]] foundation::ServiceResult<bool> checkCode(std::string_view email,
                                                            std::string_view purpose,
                                                            std::string_view code);

    // -- Credentials ----------------------------------------------------------

    /// Verify a registration code, create the account and log it in.
    [[nodiscard]] foundation::ServiceResult<AuthSession> registerWithCode(
        std::string_view username,
        std::string_view email,
        std::string_view password,
        std::string_view code);

    [[nodiscard]] foundation::ServiceResult<AuthSession> login(std::string_view email,
                                                               std::string_view password,
                                                               bool rememberMe);

    [[nodiscard]] foundation::ServiceResult<std::string> refresh(std::string_view refreshToken);

    /// Verify a reset code and set a new password.
    [[nodiscard]] foundation::ServiceResult<void> resetPassword(std::string_view email,
                                                                std::string_view code,
                                                                std::string_view newPassword);

    /// Resolve an external identity and log the account in.
    [[nodiscard]] foundation::ServiceResult<AuthSession> oauthLogin(
        const ExternalIdentity& identity);

    // -- Components -----------------------------------------------------------

    [[nodiscard]] CredentialManager& credentials() noexcept { return *credentials_; }
    [[nodiscard]] VerificationCodeEngine& codes() noexcept { return *codes_; }
    [[nodiscard]] OAuthIdentityResolver& oauth() noexcept { return *oauth_; }
    [[nodiscard]] SettingsManager& settings() noexcept { return *settings_; }
    [[nodiscard]] const EffectiveConfigResolver& resolver() const noexcept { return *resolver_; }
    [[nodiscard]] const AccessGuard& guard() const noexcept { return *guard_; }

private:
    [[nodiscard]] foundation::ServiceResult<AuthSession> startSession(Account account,
                                                                      bool rememberMe) const;

    IdentityServerConfig config_;
    std::shared_ptr<IIdentityStore> store_;
    std::shared_ptr<IMailer> mailer_;
    std::shared_ptr<CredentialManager> credentials_;
    std::unique_ptr<VerificationCodeEngine> codes_;
    std::unique_ptr<OAuthIdentityResolver> oauth_;
    std::shared_ptr<const EffectiveConfigResolver> resolver_;
    std::unique_ptr<SettingsManager> settings_;
    std::unique_ptr<AccessGuard> guard_;
};

}  // namespace cis::identity
