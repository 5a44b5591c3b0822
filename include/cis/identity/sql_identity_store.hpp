#pragma once

/// @file sql_identity_store.hpp
/// @brief IIdentityStore backed by the Database adapter (SQLite/PostgreSQL).

#include "cis/foundation/database.hpp"
#include "cis/identity/identity_store.hpp"

#include <memory>

namespace cis::identity {

/// Relational identity store.
///
/// Every compound operation runs inside one Transaction; conditional
/// UPDATE ... RETURNING statements make attempt recording and code
/// consumption race-free across processes sharing the database.
///
/// Timestamps are stored as epoch milliseconds.
///
/// Example:
/// @code
///   auto db = std::make_shared<foundation::Database>();
///   if (db->connect(dbConfig)) {
///       SqlIdentityStore store(db);
///       auto schema = store.initializeSchema();
///   }
/// @endcode
class SqlIdentityStore : public IIdentityStore {
public:
    explicit SqlIdentityStore(std::shared_ptr<foundation::Database> db);

    /// Create tables and indexes if they do not exist.
    [[nodiscard]] foundation::ServiceResult<void> initializeSchema();

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

private:
    [[nodiscard]] foundation::ServiceResult<std::optional<Account>> findOneAccount(
        const foundation::PreparedStatement& stmt) const;

    [[nodiscard]] foundation::ServiceResult<std::optional<VerificationCode>> findOneCode(
        const foundation::PreparedStatement& stmt) const;

    std::shared_ptr<foundation::Database> db_;
};

}  // namespace cis::identity
