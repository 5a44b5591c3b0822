/// @file identity_server.cpp
/// @brief IdentityServer implementation orchestrating the identity flows.

#include "cis/identity/identity_server.hpp"

#include "cis/foundation/service_logger.hpp"
#include "cis/identity/input_validator.hpp"

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;
using foundation::VerificationDetail;

// -- Construction ---------------------------------------------------------------

IdentityServer::IdentityServer(IdentityServerConfig config,
                               std::shared_ptr<IIdentityStore> store,
                               std::shared_ptr<const SecretCipher> cipher,
                               std::shared_ptr<IMailer> mailer,
                               Clock clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      mailer_(std::move(mailer)),
      credentials_(std::make_shared<CredentialManager>(config_.identity, store_, clock)),
      codes_(std::make_unique<VerificationCodeEngine>(store_, config_.verification, clock)),
      oauth_(std::make_unique<OAuthIdentityResolver>(store_, clock)),
      resolver_(std::make_shared<const EffectiveConfigResolver>(std::move(cipher),
                                                                config_.defaults)),
      settings_(std::make_unique<SettingsManager>(store_, resolver_, clock)),
      guard_(std::make_unique<AccessGuard>(credentials_, store_)) {}

// -- Verification codes ---------------------------------------------------------

ServiceResult<CodeRequestOutcome> IdentityServer::requestCode(std::string_view email,
                                                              std::string_view purpose) {
    using R = ServiceResult<CodeRequestOutcome>;

    auto normalized = InputValidator::normalizeEmail(email);
    if (auto check = InputValidator::validateEmail(normalized); !check) {
        return R::err(ServiceError(ErrorCode::InvalidEmail, "invalid email address"));
    }

    auto parsed = parseCodePurpose(purpose);
    if (!parsed) {
        return R::err(ServiceError(ErrorCode::InvalidCodePurpose, "invalid code purpose"));
    }

    if (!mailer_ || !mailer_->isConfigured()) {
        return R::err(ServiceError(ErrorCode::MailerNotConfigured, "mailer not configured"));
    }

    auto existing = store_->findAccountByEmail(normalized);
    if (existing.hasError()) {
        return existing.propagate<CodeRequestOutcome>();
    }
    if (*parsed == CodePurpose::Register && existing.value()) {
        return R::err(ServiceError(ErrorCode::EmailTaken, "email already registered"));
    }
    if (*parsed == CodePurpose::ResetPassword && !existing.value()) {
        // Indistinguishable from a real send for the requester.
        CIS_LOG_DEBUG(LogCategory::Verification, "reset code requested for unknown email");
        return R::ok({false, config_.verification.ttl});
    }

    auto decision = codes_->canIssue(normalized, *parsed);
    if (decision.hasError()) {
        return decision.propagate<CodeRequestOutcome>();
    }
    if (!decision.value().allowed) {
        VerificationDetail detail;
        detail.retryAfterSeconds = decision.value().retryAfterSeconds;
        return R::err(ServiceError(ErrorCode::CodeCooldown, "code requested too soon", detail));
    }

    auto issued = codes_->issue(normalized, *parsed);
    if (issued.hasError()) {
        return issued.propagate<CodeRequestOutcome>();
    }

    auto minutes = static_cast<int>(
        std::chrono::duration_cast<std::chrono::minutes>(config_.verification.ttl).count());
    auto message = buildVerificationMail(normalized, issued.value().code, *parsed, minutes,
                                         config_.productName);
    auto sent = mailer_->send(message);
    if (sent.hasError()) {
        CIS_LOG_ERROR(LogCategory::Mail,
                      "verification mail failed: " + std::string(sent.error().message()));
        return R::err(ServiceError(ErrorCode::MailSendFailed, std::string(sent.error().message())));
    }
    return R::ok({true, config_.verification.ttl});
}

ServiceResult<bool> IdentityServer::checkCode(std::string_view email,
                                              std::string_view purpose,
                                              std::string_view code) {
    auto parsed = parseCodePurpose(purpose);
    if (!parsed) {
        return ServiceResult<bool>::err(
            ServiceError(ErrorCode::InvalidCodePurpose, "invalid code purpose"));
    }
    return codes_->peek(email, *parsed, code);
}

// -- Credentials ----------------------------------------------------------------

ServiceResult<AuthSession> IdentityServer::startSession(Account account, bool rememberMe) const {
    auto tokens = credentials_->issueTokens(account, rememberMe);
    if (tokens.hasError()) {
        return tokens.propagate<AuthSession>();
    }
    return ServiceResult<AuthSession>::ok(
        AuthSession{std::move(account), std::move(tokens).value()});
}

ServiceResult<AuthSession> IdentityServer::registerWithCode(std::string_view username,
                                                            std::string_view email,
                                                            std::string_view password,
                                                            std::string_view code) {
    if (code.empty()) {
        return ServiceResult<AuthSession>::err(
            ServiceError(ErrorCode::MissingField, "verification code is required"));
    }

    // Reject bad input before spending an attempt on the code.
    auto check = credentials_->checkRegistration(username, email, password);
    if (check.hasError()) {
        return check.propagate<AuthSession>();
    }

    auto verified = codes_->verify(email, CodePurpose::Register, code);
    if (verified.hasError()) {
        return verified.propagate<AuthSession>();
    }

    auto account = credentials_->registerAccount(username, email, password);
    if (account.hasError()) {
        return account.propagate<AuthSession>();
    }
    return startSession(std::move(account).value(), false);
}

ServiceResult<AuthSession> IdentityServer::login(std::string_view email,
                                                 std::string_view password,
                                                 bool rememberMe) {
    auto account = credentials_->login(email, password);
    if (account.hasError()) {
        return account.propagate<AuthSession>();
    }
    return startSession(std::move(account).value(), rememberMe);
}

ServiceResult<std::string> IdentityServer::refresh(std::string_view refreshToken) {
    return credentials_->refresh(refreshToken);
}

ServiceResult<void> IdentityServer::resetPassword(std::string_view email,
                                                  std::string_view code,
                                                  std::string_view newPassword) {
    if (email.empty() || code.empty() || newPassword.empty()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::MissingField, "email, code and new password are required"));
    }
    if (auto check = InputValidator::validatePassword(newPassword,
                                                      config_.identity.minPasswordLength);
        !check) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::WeakPassword, check.message));
    }

    auto verified = codes_->verify(email, CodePurpose::ResetPassword, code);
    if (verified.hasError()) {
        return verified;
    }

    auto account = store_->findAccountByEmail(InputValidator::normalizeEmail(email));
    if (account.hasError()) {
        return account.propagate<void>();
    }
    if (!account.value()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::NotFound, "account not found"));
    }
    return credentials_->setPassword(account.value()->id, newPassword);
}

ServiceResult<AuthSession> IdentityServer::oauthLogin(const ExternalIdentity& identity) {
    auto account = oauth_->resolve(identity);
    if (account.hasError()) {
        return account.propagate<AuthSession>();
    }
    if (!account.value().active) {
        return ServiceResult<AuthSession>::err(
            ServiceError(ErrorCode::AccountDisabled, "account is disabled"));
    }
    return startSession(std::move(account).value(), false);
}

}  // namespace cis::identity
