#pragma once

/// @file identity_store.hpp
/// @brief Identity persistence interface and in-memory implementation.
///
/// Abstracts account, settings and verification-code storage so the
/// identity components can work with any backend (in-memory, SQL database
/// via the Database adapter, etc.).

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_types.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace cis::identity {

/// Abstract interface for identity persistence.
///
/// Every compound operation is atomic: a failure leaves no partial state.
/// Emails are passed already case-normalized. Timestamps are supplied by
/// callers; the store only assigns ids. Implementations must be thread-safe
/// when shared across threads.
class IIdentityStore {
public:
    virtual ~IIdentityStore() = default;

    // -- Accounts -------------------------------------------------------------

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<Account>> findAccountById(
        AccountId id) const = 0;

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<Account>> findAccountByUsername(
        std::string_view username) const = 0;

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<Account>> findAccountByEmail(
        std::string_view email) const = 0;

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<Account>> findAccountByOAuth(
        std::string_view provider, std::string_view externalId) const = 0;

    /// Insert an account together with an empty settings row.
    ///
    /// Fails with UsernameTaken, EmailTaken or OAuthIdentityTaken when a
    /// unique constraint would be violated.
    [[nodiscard]] virtual foundation::ServiceResult<Account> createAccountWithSettings(
        Account account) = 0;

    /// Replace an existing account row. Fails with NotFound or a conflict code.
    [[nodiscard]] virtual foundation::ServiceResult<void> updateAccount(const Account& account) = 0;

    /// Delete an account and its settings row.
    /// @return false if no such account existed.
    [[nodiscard]] virtual foundation::ServiceResult<bool> deleteAccount(AccountId id) = 0;

    // -- Settings -------------------------------------------------------------

    [[nodiscard]] virtual foundation::ServiceResult<std::optional<AccountSettings>> findSettings(
        AccountId accountId) const = 0;

    /// Insert or replace the settings row. Fails with NotFound if the owning
    /// account does not exist.
    [[nodiscard]] virtual foundation::ServiceResult<void> saveSettings(
        const AccountSettings& settings) = 0;

    // -- Verification codes ---------------------------------------------------

    /// Most recently created code for the pair, used or not.
    [[nodiscard]] virtual foundation::ServiceResult<std::optional<VerificationCode>> findLatestCode(
        std::string_view email, CodePurpose purpose) const = 0;

    /// Most recently created unused code for the pair.
    [[nodiscard]] virtual foundation::ServiceResult<std::optional<VerificationCode>> findActiveCode(
        std::string_view email, CodePurpose purpose) const = 0;

    /// True if @p code equals a code of the pair that is already used,
    /// whether superseded or consumed.
    [[nodiscard]] virtual foundation::ServiceResult<bool> isRetiredCode(
        std::string_view email, CodePurpose purpose, std::string_view code) const = 0;

    /// Mark every unused code for the pair as used, then insert @p code.
    [[nodiscard]] virtual foundation::ServiceResult<VerificationCode> supersedeAndInsertCode(
        VerificationCode code) = 0;

    /// Increment the attempt counter unless the code is used or already at
    /// @p maxAttempts.
    [[nodiscard]] virtual foundation::ServiceResult<AttemptOutcome> recordAttempt(
        uint64_t codeId, uint32_t maxAttempts) = 0;

    /// Mark the code used.
    /// @return false if it was already used; at most one caller ever sees true.
    [[nodiscard]] virtual foundation::ServiceResult<bool> consumeCode(uint64_t codeId) = 0;
};

/// Thread-safe in-memory identity store for testing and development.
///
/// A single mutex serializes every operation, which makes each compound
/// operation trivially atomic.
class InMemoryIdentityStore : public IIdentityStore {
public:
    [[nodiscard]] foundation::ServiceResult<std::optional<Account>> findAccountById(
        AccountId id) const override;

    [[nodiscard]] foundation::ServiceResult<std::optional<Account>> findAccountByUsername(
        std::string_view username) const override;

    [[nodiscard]] foundation::ServiceResult<std::optional<Account>> findAccountByEmail(
        std::string_view email) const override;

    [[nodiscard]] foundation::ServiceResult<std::optional<Account>> findAccountByOAuth(
        std::string_view provider, std::string_view externalId) const override;

    [[nodiscard]] foundation::ServiceResult<Account> createAccountWithSettings(
        Account account) override;

    [[nodiscard]] foundation::ServiceResult<void> updateAccount(const Account& account) override;

    [[nodiscard]] foundation::ServiceResult<bool> deleteAccount(AccountId id) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<AccountSettings>> findSettings(
        AccountId accountId) const override;

    [[nodiscard]] foundation::ServiceResult<void> saveSettings(
        const AccountSettings& settings) override;

    [[nodiscard]] foundation::ServiceResult<std::optional<VerificationCode>> findLatestCode(
        std::string_view email, CodePurpose purpose) const override;

    [[nodiscard]] foundation::ServiceResult<std::optional<VerificationCode>> findActiveCode(
        std::string_view email, CodePurpose purpose) const override;

    [[nodiscard]] foundation::ServiceResult<bool> isRetiredCode(
        std::string_view email, CodePurpose purpose, std::string_view code) const override;

    [[nodiscard]] foundation::ServiceResult<VerificationCode> supersedeAndInsertCode(
        VerificationCode code) override;

    [[nodiscard]] foundation::ServiceResult<AttemptOutcome> recordAttempt(
        uint64_t codeId, uint32_t maxAttempts) override;

    [[nodiscard]] foundation::ServiceResult<bool> consumeCode(uint64_t codeId) override;

    /// Number of stored accounts (test helper).
    [[nodiscard]] std::size_t accountCount() const;

private:
    /// Conflict check against every account except @p selfId.
    [[nodiscard]] std::optional<foundation::ServiceError> findConflict(const Account& account,
                                                                       AccountId selfId) const;

    mutable std::mutex mutex_;
    std::unordered_map<AccountId, Account> accounts_;
    std::unordered_map<AccountId, AccountSettings> settings_;
    std::map<uint64_t, VerificationCode> codes_;  // ordered by id == insertion order
    AccountId nextAccountId_ = 1;
    uint64_t nextCodeId_ = 1;
};

}  // namespace cis::identity
