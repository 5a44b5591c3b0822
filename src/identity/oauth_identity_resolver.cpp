/// @file oauth_identity_resolver.cpp
/// @brief OAuthIdentityResolver implementation.

#include "cis/identity/oauth_identity_resolver.hpp"

#include "cis/foundation/service_logger.hpp"
#include "cis/identity/input_validator.hpp"

#include <algorithm>
#include <cctype>

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

/// Bound on suffix probing and on retries after a lost creation race.
constexpr int kMaxUsernameSuffixes = 10000;
constexpr int kMaxCreateRetries = 3;

/// Leave room for a numeric suffix within the username column.
constexpr std::size_t kMaxBaseLength = InputValidator::kMaxUsernameLength - 8;

}  // anonymous namespace

OAuthIdentityResolver::OAuthIdentityResolver(std::shared_ptr<IIdentityStore> store, Clock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

ServiceResult<Account> OAuthIdentityResolver::resolve(const ExternalIdentity& identity) {
    if (identity.provider.empty() || identity.externalId.empty()) {
        return ServiceResult<Account>::err(
            ServiceError(ErrorCode::MissingField, "provider and external id are required"));
    }

    // 1. Already linked.
    auto linked = store_->findAccountByOAuth(identity.provider, identity.externalId);
    if (linked.hasError()) {
        return linked.propagate<Account>();
    }
    if (linked.value()) {
        auto account = std::move(*linked.value());
        if (!identity.avatarUrl.empty() && account.avatarUrl != identity.avatarUrl) {
            account.avatarUrl = identity.avatarUrl;
            account.updatedAt = clock_();
            auto updated = store_->updateAccount(account);
            if (updated.hasError()) {
                return updated.propagate<Account>();
            }
        }
        return ServiceResult<Account>::ok(std::move(account));
    }

    auto email = InputValidator::normalizeEmail(identity.email);
    if (auto check = InputValidator::validateEmail(email); !check) {
        return ServiceResult<Account>::err(ServiceError(ErrorCode::InvalidEmail, check.message));
    }

    // 2. Same email: link onto the existing account.
    auto byEmail = store_->findAccountByEmail(email);
    if (byEmail.hasError()) {
        return byEmail.propagate<Account>();
    }
    if (byEmail.value()) {
        auto account = std::move(*byEmail.value());
        account.oauthProvider = identity.provider;
        account.oauthId = identity.externalId;
        if (!account.avatarUrl && !identity.avatarUrl.empty()) {
            account.avatarUrl = identity.avatarUrl;
        }
        account.updatedAt = clock_();
        auto updated = store_->updateAccount(account);
        if (updated.hasError()) {
            return updated.propagate<Account>();
        }
        CIS_LOG_INFO(LogCategory::OAuth,
                     "linked " + identity.provider + " identity to account #" +
                         std::to_string(account.id));
        return ServiceResult<Account>::ok(std::move(account));
    }

    // 3. New account.
    return createAccount(identity, email);
}

std::string OAuthIdentityResolver::baseUsername(std::string_view displayName,
                                                std::string_view email) {
    std::string_view source = displayName;
    auto blank = std::all_of(displayName.begin(), displayName.end(),
                             [](unsigned char c) { return std::isspace(c) != 0; });
    if (blank) {
        source = email.substr(0, email.find('@'));
    }

    std::string base;
    base.reserve(source.size());
    for (char c : source) {
        base.push_back(c == ' ' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (base.size() > kMaxBaseLength) {
        base.resize(kMaxBaseLength);
    }
    if (base.empty()) {
        base = "user";
    }
    return base;
}

ServiceResult<std::string> OAuthIdentityResolver::uniqueUsername(const std::string& base) const {
    std::string candidate = base;
    for (int suffix = 1; suffix <= kMaxUsernameSuffixes; ++suffix) {
        auto taken = store_->findAccountByUsername(candidate);
        if (taken.hasError()) {
            return taken.propagate<std::string>();
        }
        if (!taken.value()) {
            return ServiceResult<std::string>::ok(std::move(candidate));
        }
        candidate = base + "_" + std::to_string(suffix);
    }
    return ServiceResult<std::string>::err(
        ServiceError(ErrorCode::UsernameTaken, "no free username for " + base));
}

ServiceResult<Account> OAuthIdentityResolver::createAccount(const ExternalIdentity& identity,
                                                            const std::string& normalizedEmail) {
    auto base = baseUsername(identity.displayName, normalizedEmail);

    for (int attempt = 0; attempt < kMaxCreateRetries; ++attempt) {
        auto username = uniqueUsername(base);
        if (username.hasError()) {
            return username.propagate<Account>();
        }

        auto now = clock_();
        Account account;
        account.username = std::move(username).value();
        account.email = normalizedEmail;
        account.active = true;
        account.role = AccountRole::User;
        account.oauthProvider = identity.provider;
        account.oauthId = identity.externalId;
        if (!identity.avatarUrl.empty()) {
            account.avatarUrl = identity.avatarUrl;
        }
        account.createdAt = now;
        account.updatedAt = now;

        auto created = store_->createAccountWithSettings(std::move(account));
        if (created.hasValue()) {
            CIS_LOG_INFO(LogCategory::OAuth,
                         "created account #" + std::to_string(created.value().id) + " from " +
                             identity.provider + " identity");
            return created;
        }
        // Only a username lost to a concurrent creation is worth another suffix.
        if (created.error().code() != ErrorCode::UsernameTaken) {
            return created;
        }
    }
    return ServiceResult<Account>::err(
        ServiceError(ErrorCode::UsernameTaken, "could not allocate a unique username"));
}

}  // namespace cis::identity
