/// @file in_memory_identity_store.cpp
/// @brief InMemoryIdentityStore implementation.

#include "cis/identity/identity_store.hpp"

namespace cis::identity {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

// -- Accounts -----------------------------------------------------------------

ServiceResult<std::optional<Account>> InMemoryIdentityStore::findAccountById(AccountId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(id);
    if (it == accounts_.end()) {
        return ServiceResult<std::optional<Account>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<Account>>::ok(it->second);
}

ServiceResult<std::optional<Account>> InMemoryIdentityStore::findAccountByUsername(
    std::string_view username) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, account] : accounts_) {
        if (account.username == username) {
            return ServiceResult<std::optional<Account>>::ok(account);
        }
    }
    return ServiceResult<std::optional<Account>>::ok(std::nullopt);
}

ServiceResult<std::optional<Account>> InMemoryIdentityStore::findAccountByEmail(
    std::string_view email) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, account] : accounts_) {
        if (account.email == email) {
            return ServiceResult<std::optional<Account>>::ok(account);
        }
    }
    return ServiceResult<std::optional<Account>>::ok(std::nullopt);
}

ServiceResult<std::optional<Account>> InMemoryIdentityStore::findAccountByOAuth(
    std::string_view provider, std::string_view externalId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, account] : accounts_) {
        if (account.oauthProvider && account.oauthId && *account.oauthProvider == provider &&
            *account.oauthId == externalId) {
            return ServiceResult<std::optional<Account>>::ok(account);
        }
    }
    return ServiceResult<std::optional<Account>>::ok(std::nullopt);
}

std::optional<ServiceError> InMemoryIdentityStore::findConflict(const Account& account,
                                                                AccountId selfId) const {
    for (const auto& [id, other] : accounts_) {
        if (id == selfId) {
            continue;
        }
        if (other.username == account.username) {
            return ServiceError(ErrorCode::UsernameTaken, "username already exists");
        }
        if (other.email == account.email) {
            return ServiceError(ErrorCode::EmailTaken, "email already exists");
        }
        if (account.oauthProvider && account.oauthId && other.oauthProvider && other.oauthId &&
            *other.oauthProvider == *account.oauthProvider && *other.oauthId == *account.oauthId) {
            return ServiceError(ErrorCode::OAuthIdentityTaken, "oauth identity already linked");
        }
    }
    return std::nullopt;
}

ServiceResult<Account> InMemoryIdentityStore::createAccountWithSettings(Account account) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto conflict = findConflict(account, 0)) {
        return ServiceResult<Account>::err(std::move(*conflict));
    }

    account.id = nextAccountId_++;

    AccountSettings settings;
    settings.accountId = account.id;
    settings.createdAt = account.createdAt;
    settings.updatedAt = account.createdAt;

    accounts_.emplace(account.id, account);
    settings_.emplace(account.id, std::move(settings));
    return ServiceResult<Account>::ok(std::move(account));
}

ServiceResult<void> InMemoryIdentityStore::updateAccount(const Account& account) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account.id);
    if (it == accounts_.end()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::NotFound, "account not found"));
    }
    if (auto conflict = findConflict(account, account.id)) {
        return ServiceResult<void>::err(std::move(*conflict));
    }
    it->second = account;
    return ServiceResult<void>::ok();
}

ServiceResult<bool> InMemoryIdentityStore::deleteAccount(AccountId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.erase(id);
    return ServiceResult<bool>::ok(accounts_.erase(id) > 0);
}

std::size_t InMemoryIdentityStore::accountCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

// -- Settings -----------------------------------------------------------------

ServiceResult<std::optional<AccountSettings>> InMemoryIdentityStore::findSettings(
    AccountId accountId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(accountId);
    if (it == settings_.end()) {
        return ServiceResult<std::optional<AccountSettings>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<AccountSettings>>::ok(it->second);
}

ServiceResult<void> InMemoryIdentityStore::saveSettings(const AccountSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (accounts_.find(settings.accountId) == accounts_.end()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::NotFound, "account not found"));
    }
    settings_[settings.accountId] = settings;
    return ServiceResult<void>::ok();
}

// -- Verification codes -------------------------------------------------------

ServiceResult<std::optional<VerificationCode>> InMemoryIdentityStore::findLatestCode(
    std::string_view email, CodePurpose purpose) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = codes_.rbegin(); it != codes_.rend(); ++it) {
        if (it->second.email == email && it->second.purpose == purpose) {
            return ServiceResult<std::optional<VerificationCode>>::ok(it->second);
        }
    }
    return ServiceResult<std::optional<VerificationCode>>::ok(std::nullopt);
}

ServiceResult<std::optional<VerificationCode>> InMemoryIdentityStore::findActiveCode(
    std::string_view email, CodePurpose purpose) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = codes_.rbegin(); it != codes_.rend(); ++it) {
        const auto& code = it->second;
        if (code.email == email && code.purpose == purpose && !code.used) {
            return ServiceResult<std::optional<VerificationCode>>::ok(code);
        }
    }
    return ServiceResult<std::optional<VerificationCode>>::ok(std::nullopt);
}

ServiceResult<bool> InMemoryIdentityStore::isRetiredCode(std::string_view email,
                                                         CodePurpose purpose,
                                                         std::string_view code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, existing] : codes_) {
        if (existing.email == email && existing.purpose == purpose && existing.used &&
            existing.code == code) {
            return ServiceResult<bool>::ok(true);
        }
    }
    return ServiceResult<bool>::ok(false);
}

ServiceResult<VerificationCode> InMemoryIdentityStore::supersedeAndInsertCode(
    VerificationCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, existing] : codes_) {
        if (existing.email == code.email && existing.purpose == code.purpose) {
            existing.used = true;
        }
    }
    code.id = nextCodeId_++;
    codes_.emplace(code.id, code);
    return ServiceResult<VerificationCode>::ok(std::move(code));
}

ServiceResult<AttemptOutcome> InMemoryIdentityStore::recordAttempt(uint64_t codeId,
                                                                   uint32_t maxAttempts) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(codeId);
    if (it == codes_.end()) {
        return ServiceResult<AttemptOutcome>::err(
            ServiceError(ErrorCode::NotFound, "verification code not found"));
    }
    auto& code = it->second;
    if (code.used) {
        return ServiceResult<AttemptOutcome>::ok({AttemptStatus::AlreadyUsed, code.attempts});
    }
    if (code.attempts >= maxAttempts) {
        return ServiceResult<AttemptOutcome>::ok({AttemptStatus::CapReached, code.attempts});
    }
    ++code.attempts;
    return ServiceResult<AttemptOutcome>::ok({AttemptStatus::Recorded, code.attempts});
}

ServiceResult<bool> InMemoryIdentityStore::consumeCode(uint64_t codeId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = codes_.find(codeId);
    if (it == codes_.end() || it->second.used) {
        return ServiceResult<bool>::ok(false);
    }
    it->second.used = true;
    return ServiceResult<bool>::ok(true);
}

}  // namespace cis::identity
