/// @file credential_manager.cpp
/// @brief CredentialManager implementation.

#include "cis/identity/credential_manager.hpp"

#include "cis/foundation/service_logger.hpp"
#include "cis/identity/input_validator.hpp"
#include "cis/identity/password_hasher.hpp"
#include "cis/identity/token_provider.hpp"

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceError;
using foundation::ServiceLogger;
using foundation::ServiceResult;

namespace {

ServiceError invalidCredentials() {
    return ServiceError(ErrorCode::InvalidCredentials, "invalid email or password");
}

void logAccountEvent(LogLevel level, std::string_view message, AccountId id) {
    auto& logger = ServiceLogger::instance();
    if (!logger.isEnabled(level, LogCategory::Auth)) {
        return;
    }
    LogContext ctx;
    ctx.accountId = id;
    logger.logWithContext(level, LogCategory::Auth, message, ctx);
}

}  // anonymous namespace

// -- Construction / destruction -----------------------------------------------

CredentialManager::CredentialManager(IdentityConfig config,
                                     std::shared_ptr<IIdentityStore> store,
                                     Clock clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      clock_(std::move(clock)),
      hasher_(std::make_unique<PasswordHasher>(config_.passwordHashIterations)),
      tokens_(std::make_unique<TokenProvider>(config_, clock_)) {}

CredentialManager::~CredentialManager() = default;
CredentialManager::CredentialManager(CredentialManager&&) noexcept = default;
CredentialManager& CredentialManager::operator=(CredentialManager&&) noexcept = default;

// -- Registration -------------------------------------------------------------

ServiceResult<void> CredentialManager::checkRegistration(std::string_view username,
                                                        std::string_view email,
                                                        std::string_view password) const {
    if (auto check = InputValidator::validateUsername(username, config_.minUsernameLength);
        !check) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::InvalidUsername, check.message));
    }

    auto normalizedEmail = InputValidator::normalizeEmail(email);
    if (auto check = InputValidator::validateEmail(normalizedEmail); !check) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::InvalidEmail, check.message));
    }

    if (auto check = InputValidator::validatePassword(password, config_.minPasswordLength);
        !check) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::WeakPassword, check.message));
    }

    auto byUsername = store_->findAccountByUsername(username);
    if (byUsername.hasError()) {
        return byUsername.propagate<void>();
    }
    if (byUsername.value()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::UsernameTaken, "username already exists"));
    }

    auto byEmail = store_->findAccountByEmail(normalizedEmail);
    if (byEmail.hasError()) {
        return byEmail.propagate<void>();
    }
    if (byEmail.value()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::EmailTaken, "email already exists"));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<Account> CredentialManager::registerAccount(std::string_view username,
                                                          std::string_view email,
                                                          std::string_view password) {
    auto check = checkRegistration(username, email, password);
    if (check.hasError()) {
        return check.propagate<Account>();
    }

    auto hashed = hasher_->hash(password);
    if (!hashed) {
        return ServiceResult<Account>::err(
            ServiceError(ErrorCode::Unknown, "password hashing failed"));
    }

    auto now = clock_();
    Account account;
    account.username = std::string(username);
    account.email = InputValidator::normalizeEmail(email);
    account.passwordHash = std::move(*hashed);
    account.active = true;
    account.role = AccountRole::User;
    account.createdAt = now;
    account.updatedAt = now;

    // The store re-checks uniqueness atomically, so a concurrent
    // registration still ends in a conflict rather than a duplicate.
    auto created = store_->createAccountWithSettings(std::move(account));
    if (created.hasValue()) {
        logAccountEvent(LogLevel::Info, "account registered", created.value().id);
    }
    return created;
}

// -- Login ----------------------------------------------------------------------

ServiceResult<Account> CredentialManager::login(std::string_view email,
                                                std::string_view password) const {
    auto found = store_->findAccountByEmail(InputValidator::normalizeEmail(email));
    if (found.hasError()) {
        return found.propagate<Account>();
    }
    if (!found.value()) {
        return ServiceResult<Account>::err(invalidCredentials());
    }

    auto& account = *found.value();
    if (!account.hasPassword() || !hasher_->verify(password, *account.passwordHash)) {
        return ServiceResult<Account>::err(invalidCredentials());
    }

    if (!account.active) {
        logAccountEvent(LogLevel::Warning, "login rejected: account disabled", account.id);
        return ServiceResult<Account>::err(
            ServiceError(ErrorCode::AccountDisabled, "account is disabled"));
    }

    logAccountEvent(LogLevel::Info, "login succeeded", account.id);
    return ServiceResult<Account>::ok(std::move(account));
}

// -- Tokens ---------------------------------------------------------------------

ServiceResult<TokenPair> CredentialManager::issueTokens(const Account& account,
                                                        bool rememberMe) const {
    TokenClaims claims;
    claims.subject = std::to_string(account.id);
    claims.username = account.username;
    claims.role = account.role;
    claims.issuedAt = clock_();

    auto refreshExpiry = rememberMe ? config_.rememberMeRefreshExpiry : config_.refreshTokenExpiry;

    TokenPair pair;
    claims.tokenType = std::string(kAccessTokenType);
    pair.accessToken = tokens_->generateToken(claims, config_.accessTokenExpiry);
    claims.tokenType = std::string(kRefreshTokenType);
    pair.refreshToken = tokens_->generateToken(claims, refreshExpiry);
    pair.tokenType = "Bearer";
    pair.accessExpiresIn = config_.accessTokenExpiry;
    pair.refreshExpiresIn = refreshExpiry;
    return ServiceResult<TokenPair>::ok(std::move(pair));
}

ServiceResult<std::string> CredentialManager::refresh(std::string_view refreshToken) const {
    auto claims = tokens_->validate(refreshToken, kRefreshTokenType);
    if (claims.hasError()) {
        return claims.propagate<std::string>();
    }

    auto id = parseAccountId(claims.value().subject);
    if (!id) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::InvalidToken, "token subject is not an account id"));
    }

    auto found = store_->findAccountById(*id);
    if (found.hasError()) {
        return found.propagate<std::string>();
    }
    if (!found.value()) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::AuthenticationFailed, "account no longer exists"));
    }
    if (!found.value()->active) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::AccountDisabled, "account is disabled"));
    }

    // Fresh snapshot of username and role.
    TokenClaims access;
    access.subject = claims.value().subject;
    access.username = found.value()->username;
    access.role = found.value()->role;
    access.tokenType = std::string(kAccessTokenType);
    return ServiceResult<std::string>::ok(
        tokens_->generateToken(access, config_.accessTokenExpiry));
}

ServiceResult<TokenClaims> CredentialManager::validateAccessToken(
    std::string_view accessToken) const {
    return tokens_->validate(accessToken, kAccessTokenType);
}

// -- Passwords ------------------------------------------------------------------

ServiceResult<void> CredentialManager::changePassword(const Account& account,
                                                      std::string_view oldPassword,
                                                      std::string_view newPassword) {
    auto current = loadAccount(account.id);
    if (current.hasError()) {
        return current.propagate<void>();
    }
    if (!current.value().hasPassword() ||
        !hasher_->verify(oldPassword, *current.value().passwordHash)) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::InvalidCredentials, "current password is incorrect"));
    }
    return storePassword(std::move(current).value(), newPassword);
}

ServiceResult<void> CredentialManager::setPassword(AccountId accountId,
                                                   std::string_view newPassword) {
    auto current = loadAccount(accountId);
    if (current.hasError()) {
        return current.propagate<void>();
    }
    return storePassword(std::move(current).value(), newPassword);
}

ServiceResult<void> CredentialManager::storePassword(Account account,
                                                     std::string_view newPassword) {
    if (auto check = InputValidator::validatePassword(newPassword, config_.minPasswordLength);
        !check) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::WeakPassword, check.message));
    }

    auto hashed = hasher_->hash(newPassword);
    if (!hashed) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::Unknown, "password hashing failed"));
    }

    account.passwordHash = std::move(*hashed);
    account.updatedAt = clock_();
    auto updated = store_->updateAccount(account);
    if (updated.hasValue()) {
        logAccountEvent(LogLevel::Info, "password changed", account.id);
    }
    return updated;
}

// -- Profile --------------------------------------------------------------------

ServiceResult<Account> CredentialManager::updateProfile(AccountId accountId,
                                                        const ProfileUpdate& update) {
    auto current = loadAccount(accountId);
    if (current.hasError()) {
        return current;
    }
    auto account = std::move(current).value();

    if (update.username && *update.username != account.username) {
        if (auto check = InputValidator::validateUsername(*update.username,
                                                          config_.minUsernameLength);
            !check) {
            return ServiceResult<Account>::err(
                ServiceError(ErrorCode::InvalidUsername, check.message));
        }
        auto taken = store_->findAccountByUsername(*update.username);
        if (taken.hasError()) {
            return taken.propagate<Account>();
        }
        if (taken.value()) {
            return ServiceResult<Account>::err(
                ServiceError(ErrorCode::UsernameTaken, "username already exists"));
        }
        account.username = *update.username;
    }

    if (update.avatarUrl) {
        account.avatarUrl = update.avatarUrl->empty() ? std::nullopt
                                                      : std::optional<std::string>(*update.avatarUrl);
    }

    account.updatedAt = clock_();
    auto stored = store_->updateAccount(account);
    if (stored.hasError()) {
        return stored.propagate<Account>();
    }
    return ServiceResult<Account>::ok(std::move(account));
}

ServiceResult<void> CredentialManager::deleteAccount(AccountId accountId) {
    auto deleted = store_->deleteAccount(accountId);
    if (deleted.hasError()) {
        return deleted.propagate<void>();
    }
    if (!deleted.value()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::NotFound, "account not found"));
    }
    logAccountEvent(LogLevel::Info, "account deleted", accountId);
    return ServiceResult<void>::ok();
}

ServiceResult<Account> CredentialManager::loadAccount(AccountId accountId) const {
    auto found = store_->findAccountById(accountId);
    if (found.hasError()) {
        return found.propagate<Account>();
    }
    if (!found.value()) {
        return ServiceResult<Account>::err(ServiceError(ErrorCode::NotFound, "account not found"));
    }
    return ServiceResult<Account>::ok(std::move(*found.value()));
}

}  // namespace cis::identity
