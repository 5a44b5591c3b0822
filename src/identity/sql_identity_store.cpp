/// @file sql_identity_store.cpp
/// @brief SqlIdentityStore implementation on the Database adapter.

#include "cis/identity/sql_identity_store.hpp"

#include "cis/foundation/service_logger.hpp"

#include <charconv>
#include <string>

namespace cis::identity {

using foundation::DatabaseType;
using foundation::DbNull;
using foundation::DbRow;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::PreparedStatement;
using foundation::QueryResult;
using foundation::ServiceError;
using foundation::ServiceResult;
using foundation::Transaction;

namespace {

// -- Schema -------------------------------------------------------------------

std::vector<std::string> schemaStatements(DatabaseType type) {
    const std::string idColumn = type == DatabaseType::PostgreSQL
                                     ? "id BIGSERIAL PRIMARY KEY"
                                     : "id INTEGER PRIMARY KEY AUTOINCREMENT";
    return {
        "CREATE TABLE IF NOT EXISTS accounts ("
        "  " + idColumn + ","
        "  username VARCHAR(80) NOT NULL UNIQUE,"
        "  email VARCHAR(120) NOT NULL UNIQUE,"
        "  password_hash VARCHAR(255),"
        "  active BOOLEAN NOT NULL DEFAULT TRUE,"
        "  role VARCHAR(20) NOT NULL DEFAULT 'user',"
        "  oauth_provider VARCHAR(50),"
        "  oauth_id VARCHAR(255),"
        "  avatar_url VARCHAR(500),"
        "  created_at BIGINT NOT NULL,"
        "  updated_at BIGINT NOT NULL,"
        "  CONSTRAINT uq_accounts_oauth UNIQUE (oauth_provider, oauth_id))",

        "CREATE TABLE IF NOT EXISTS account_settings ("
        "  account_id BIGINT PRIMARY KEY REFERENCES accounts(id) ON DELETE CASCADE,"
        "  google_api_key_encrypted TEXT,"
        "  mineru_token_encrypted TEXT,"
        "  google_api_base VARCHAR(500),"
        "  mineru_api_base VARCHAR(500),"
        "  image_caption_model VARCHAR(100),"
        "  max_description_workers INTEGER,"
        "  max_image_workers INTEGER,"
        "  created_at BIGINT NOT NULL,"
        "  updated_at BIGINT NOT NULL)",

        "CREATE TABLE IF NOT EXISTS verification_codes ("
        "  " + idColumn + ","
        "  email VARCHAR(120) NOT NULL,"
        "  code VARCHAR(6) NOT NULL,"
        "  purpose VARCHAR(20) NOT NULL,"
        "  expires_at BIGINT NOT NULL,"
        "  used BOOLEAN NOT NULL DEFAULT FALSE,"
        "  attempts INTEGER NOT NULL DEFAULT 0,"
        "  created_at BIGINT NOT NULL)",

        "CREATE INDEX IF NOT EXISTS ix_verification_codes_email_purpose "
        "ON verification_codes (email, purpose)",

        // At most one unused code per (email, purpose), even under concurrent issue.
        "CREATE UNIQUE INDEX IF NOT EXISTS ux_verification_codes_active "
        "ON verification_codes (email, purpose) WHERE used = FALSE",
    };
}

constexpr const char* kAccountColumns =
    "id, username, email, password_hash, active, role, oauth_provider, oauth_id, "
    "avatar_url, created_at, updated_at";

constexpr const char* kCodeColumns =
    "id, email, code, purpose, expires_at, used, attempts, created_at";

// -- Value conversion ---------------------------------------------------------

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

std::optional<std::string> columnString(const DbRow& row, const std::string& name) {
    auto it = row.find(name);
    if (it == row.end()) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    if (const auto* i = std::get_if<std::int64_t>(&it->second)) {
        return std::to_string(*i);
    }
    return std::nullopt;
}

std::optional<int64_t> columnInt(const DbRow& row, const std::string& name) {
    auto it = row.find(name);
    if (it == row.end()) {
        return std::nullopt;
    }
    const auto& value = it->second;
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return static_cast<int64_t>(*d);
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        int64_t parsed = 0;
        auto [ptr, ec] = std::from_chars(s->data(), s->data() + s->size(), parsed);
        if (ec == std::errc{} && ptr == s->data() + s->size()) {
            return parsed;
        }
    }
    return std::nullopt;
}

bool columnBool(const DbRow& row, const std::string& name) {
    auto it = row.find(name);
    if (it != row.end()) {
        if (const auto* s = std::get_if<std::string>(&it->second)) {
            return *s == "t" || *s == "true" || *s == "TRUE" || *s == "1";
        }
    }
    return columnInt(row, name).value_or(0) != 0;
}

std::optional<int> columnOptInt(const DbRow& row, const std::string& name) {
    auto v = columnInt(row, name);
    if (!v) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

Account rowToAccount(const DbRow& row) {
    Account account;
    account.id = static_cast<AccountId>(columnInt(row, "id").value_or(0));
    account.username = columnString(row, "username").value_or("");
    account.email = columnString(row, "email").value_or("");
    account.passwordHash = columnString(row, "password_hash");
    account.active = columnBool(row, "active");
    account.role = parseAccountRole(columnString(row, "role").value_or("user"))
                       .value_or(AccountRole::User);
    account.oauthProvider = columnString(row, "oauth_provider");
    account.oauthId = columnString(row, "oauth_id");
    account.avatarUrl = columnString(row, "avatar_url");
    account.createdAt = fromMillis(columnInt(row, "created_at").value_or(0));
    account.updatedAt = fromMillis(columnInt(row, "updated_at").value_or(0));
    return account;
}

AccountSettings rowToSettings(const DbRow& row) {
    AccountSettings s;
    s.accountId = static_cast<AccountId>(columnInt(row, "account_id").value_or(0));
    s.googleApiKeyEncrypted = columnString(row, "google_api_key_encrypted");
    s.mineruTokenEncrypted = columnString(row, "mineru_token_encrypted");
    s.googleApiBase = columnString(row, "google_api_base");
    s.mineruApiBase = columnString(row, "mineru_api_base");
    s.imageCaptionModel = columnString(row, "image_caption_model");
    s.maxDescriptionWorkers = columnOptInt(row, "max_description_workers");
    s.maxImageWorkers = columnOptInt(row, "max_image_workers");
    s.createdAt = fromMillis(columnInt(row, "created_at").value_or(0));
    s.updatedAt = fromMillis(columnInt(row, "updated_at").value_or(0));
    return s;
}

VerificationCode rowToCode(const DbRow& row) {
    VerificationCode code;
    code.id = static_cast<uint64_t>(columnInt(row, "id").value_or(0));
    code.email = columnString(row, "email").value_or("");
    code.code = columnString(row, "code").value_or("");
    code.purpose = parseCodePurpose(columnString(row, "purpose").value_or(""))
                       .value_or(CodePurpose::Register);
    code.expiresAt = fromMillis(columnInt(row, "expires_at").value_or(0));
    code.used = columnBool(row, "used");
    code.attempts = static_cast<uint32_t>(columnInt(row, "attempts").value_or(0));
    code.createdAt = fromMillis(columnInt(row, "created_at").value_or(0));
    return code;
}

void bindAccount(PreparedStatement& stmt, const Account& account) {
    stmt.bindString("username", account.username)
        .bindString("email", account.email)
        .bindOptional("password_hash", account.passwordHash)
        .bindBool("active", account.active)
        .bindString("role", std::string(accountRoleName(account.role)))
        .bindOptional("oauth_provider", account.oauthProvider)
        .bindOptional("oauth_id", account.oauthId)
        .bindOptional("avatar_url", account.avatarUrl)
        .bindInt("created_at", toMillis(account.createdAt))
        .bindInt("updated_at", toMillis(account.updatedAt));
}

/// Log a storage failure and pass it on unchanged.
ServiceError storageFailure(std::string_view operation, const ServiceError& error) {
    CIS_LOG_ERROR(LogCategory::Storage,
                  std::string(operation) + " failed: " + std::string(error.message()));
    return error;
}

/// Conflict check inside a transaction against every row except @p selfId.
ServiceResult<void> checkConflicts(Transaction& txn, const Account& account, AccountId selfId) {
    PreparedStatement stmt(
        "SELECT username, email, oauth_provider, oauth_id FROM accounts "
        "WHERE id <> $self_id AND (username = $username OR email = $email OR "
        "(oauth_provider = $oauth_provider AND oauth_id = $oauth_id))");
    stmt.bindInt("self_id", static_cast<int64_t>(selfId))
        .bindString("username", account.username)
        .bindString("email", account.email)
        .bindOptional("oauth_provider", account.oauthProvider)
        .bindOptional("oauth_id", account.oauthId);

    auto rows = txn.query(stmt);
    if (rows.hasError()) {
        return ServiceResult<void>::err(storageFailure("conflict check", rows.error()));
    }
    for (const auto& row : rows.value()) {
        if (columnString(row, "username").value_or("") == account.username) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::UsernameTaken, "username already exists"));
        }
        if (columnString(row, "email").value_or("") == account.email) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::EmailTaken, "email already exists"));
        }
    }
    if (!rows.value().empty()) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::OAuthIdentityTaken, "oauth identity already linked"));
    }
    return ServiceResult<void>::ok();
}

/// Map a failed write to a conflict when the backend reports a unique violation.
ServiceError classifyWriteError(const ServiceError& error) {
    std::string message(error.message());
    bool unique = message.find("UNIQUE") != std::string::npos ||
                  message.find("unique") != std::string::npos ||
                  message.find("duplicate") != std::string::npos;
    if (!unique) {
        return error;
    }
    if (message.find("username") != std::string::npos) {
        return ServiceError(ErrorCode::UsernameTaken, "username already exists");
    }
    if (message.find("email") != std::string::npos) {
        return ServiceError(ErrorCode::EmailTaken, "email already exists");
    }
    if (message.find("oauth") != std::string::npos) {
        return ServiceError(ErrorCode::OAuthIdentityTaken, "oauth identity already linked");
    }
    return ServiceError(ErrorCode::ConstraintViolation, message);
}

/// A unique violation on the active-code index means a concurrent issue won.
ServiceError classifyCodeInsertError(const ServiceError& error) {
    std::string message(error.message());
    bool activeIndex = message.find("ux_verification_codes_active") != std::string::npos ||
                       message.find("verification_codes.email") != std::string::npos;
    if (!activeIndex) {
        return error;
    }
    foundation::VerificationDetail detail;
    detail.retryAfterSeconds = 1;
    return ServiceError(ErrorCode::CodeCooldown, "code issued concurrently", detail);
}

}  // anonymous namespace

SqlIdentityStore::SqlIdentityStore(std::shared_ptr<foundation::Database> db)
    : db_(std::move(db)) {}

ServiceResult<void> SqlIdentityStore::initializeSchema() {
    for (const auto& sql : schemaStatements(db_->type())) {
        auto result = db_->execute(sql);
        if (result.hasError()) {
            return ServiceResult<void>::err(storageFailure("schema creation", result.error()));
        }
    }
    CIS_LOG_INFO(LogCategory::Storage, "identity schema ready");
    return ServiceResult<void>::ok();
}

// -- Accounts -----------------------------------------------------------------

ServiceResult<std::optional<Account>> SqlIdentityStore::findOneAccount(
    const PreparedStatement& stmt) const {
    auto rows = db_->query(stmt);
    if (rows.hasError()) {
        return ServiceResult<std::optional<Account>>::err(
            storageFailure("account lookup", rows.error()));
    }
    if (rows.value().empty()) {
        return ServiceResult<std::optional<Account>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<Account>>::ok(rowToAccount(rows.value().front()));
}

ServiceResult<std::optional<Account>> SqlIdentityStore::findAccountById(AccountId id) const {
    PreparedStatement stmt(std::string("SELECT ") + kAccountColumns +
                           " FROM accounts WHERE id = $id");
    stmt.bindInt("id", static_cast<int64_t>(id));
    return findOneAccount(stmt);
}

ServiceResult<std::optional<Account>> SqlIdentityStore::findAccountByUsername(
    std::string_view username) const {
    PreparedStatement stmt(std::string("SELECT ") + kAccountColumns +
                           " FROM accounts WHERE username = $username");
    stmt.bindString("username", std::string(username));
    return findOneAccount(stmt);
}

ServiceResult<std::optional<Account>> SqlIdentityStore::findAccountByEmail(
    std::string_view email) const {
    PreparedStatement stmt(std::string("SELECT ") + kAccountColumns +
                           " FROM accounts WHERE email = $email");
    stmt.bindString("email", std::string(email));
    return findOneAccount(stmt);
}

ServiceResult<std::optional<Account>> SqlIdentityStore::findAccountByOAuth(
    std::string_view provider, std::string_view externalId) const {
    PreparedStatement stmt(std::string("SELECT ") + kAccountColumns +
                           " FROM accounts WHERE oauth_provider = $provider"
                           " AND oauth_id = $external_id");
    stmt.bindString("provider", std::string(provider))
        .bindString("external_id", std::string(externalId));
    return findOneAccount(stmt);
}

ServiceResult<Account> SqlIdentityStore::createAccountWithSettings(Account account) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return ServiceResult<Account>::err(storageFailure("begin transaction", txn.error()));
    }

    auto conflict = checkConflicts(txn.value(), account, 0);
    if (conflict.hasError()) {
        return conflict.propagate<Account>();
    }

    PreparedStatement insert(
        "INSERT INTO accounts (username, email, password_hash, active, role, oauth_provider, "
        "oauth_id, avatar_url, created_at, updated_at) VALUES ($username, $email, "
        "$password_hash, $active, $role, $oauth_provider, $oauth_id, $avatar_url, "
        "$created_at, $updated_at) RETURNING id");
    bindAccount(insert, account);

    auto inserted = txn.value().query(insert);
    if (inserted.hasError()) {
        return ServiceResult<Account>::err(
            classifyWriteError(storageFailure("account insert", inserted.error())));
    }
    if (inserted.value().empty()) {
        return ServiceResult<Account>::err(
            ServiceError(ErrorCode::QueryFailed, "account insert returned no id"));
    }
    account.id = static_cast<AccountId>(columnInt(inserted.value().front(), "id").value_or(0));

    PreparedStatement settings(
        "INSERT INTO account_settings (account_id, created_at, updated_at) "
        "VALUES ($account_id, $created_at, $updated_at)");
    settings.bindInt("account_id", static_cast<int64_t>(account.id))
        .bindInt("created_at", toMillis(account.createdAt))
        .bindInt("updated_at", toMillis(account.createdAt));

    auto settingsResult = txn.value().execute(settings);
    if (settingsResult.hasError()) {
        return ServiceResult<Account>::err(storageFailure("settings insert", settingsResult.error()));
    }

    auto commit = txn.value().commit();
    if (commit.hasError()) {
        return ServiceResult<Account>::err(storageFailure("account commit", commit.error()));
    }
    return ServiceResult<Account>::ok(std::move(account));
}

ServiceResult<void> SqlIdentityStore::updateAccount(const Account& account) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return ServiceResult<void>::err(storageFailure("begin transaction", txn.error()));
    }

    auto conflict = checkConflicts(txn.value(), account, account.id);
    if (conflict.hasError()) {
        return conflict;
    }

    PreparedStatement update(
        "UPDATE accounts SET username = $username, email = $email, "
        "password_hash = $password_hash, active = $active, role = $role, "
        "oauth_provider = $oauth_provider, oauth_id = $oauth_id, avatar_url = $avatar_url, "
        "created_at = $created_at, updated_at = $updated_at WHERE id = $id RETURNING id");
    bindAccount(update, account);
    update.bindInt("id", static_cast<int64_t>(account.id));

    auto updated = txn.value().query(update);
    if (updated.hasError()) {
        return ServiceResult<void>::err(
            classifyWriteError(storageFailure("account update", updated.error())));
    }
    if (updated.value().empty()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::NotFound, "account not found"));
    }
    auto commit = txn.value().commit();
    if (commit.hasError()) {
        return ServiceResult<void>::err(storageFailure("account commit", commit.error()));
    }
    return ServiceResult<void>::ok();
}

ServiceResult<bool> SqlIdentityStore::deleteAccount(AccountId id) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return ServiceResult<bool>::err(storageFailure("begin transaction", txn.error()));
    }

    // Settings go first so SQLite connections without foreign_keys enabled
    // still cascade.
    PreparedStatement settings("DELETE FROM account_settings WHERE account_id = $id");
    settings.bindInt("id", static_cast<int64_t>(id));
    auto settingsResult = txn.value().execute(settings);
    if (settingsResult.hasError()) {
        return ServiceResult<bool>::err(storageFailure("settings delete", settingsResult.error()));
    }

    PreparedStatement account("DELETE FROM accounts WHERE id = $id RETURNING id");
    account.bindInt("id", static_cast<int64_t>(id));
    auto deleted = txn.value().query(account);
    if (deleted.hasError()) {
        return ServiceResult<bool>::err(storageFailure("account delete", deleted.error()));
    }

    auto commit = txn.value().commit();
    if (commit.hasError()) {
        return ServiceResult<bool>::err(storageFailure("account commit", commit.error()));
    }
    return ServiceResult<bool>::ok(!deleted.value().empty());
}

// -- Settings -----------------------------------------------------------------

ServiceResult<std::optional<AccountSettings>> SqlIdentityStore::findSettings(
    AccountId accountId) const {
    PreparedStatement stmt(
        "SELECT account_id, google_api_key_encrypted, mineru_token_encrypted, google_api_base, "
        "mineru_api_base, image_caption_model, max_description_workers, max_image_workers, "
        "created_at, updated_at FROM account_settings WHERE account_id = $account_id");
    stmt.bindInt("account_id", static_cast<int64_t>(accountId));

    auto rows = db_->query(stmt);
    if (rows.hasError()) {
        return ServiceResult<std::optional<AccountSettings>>::err(
            storageFailure("settings lookup", rows.error()));
    }
    if (rows.value().empty()) {
        return ServiceResult<std::optional<AccountSettings>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<AccountSettings>>::ok(rowToSettings(rows.value().front()));
}

ServiceResult<void> SqlIdentityStore::saveSettings(const AccountSettings& settings) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return ServiceResult<void>::err(storageFailure("begin transaction", txn.error()));
    }

    PreparedStatement owner("SELECT id FROM accounts WHERE id = $account_id");
    owner.bindInt("account_id", static_cast<int64_t>(settings.accountId));
    auto ownerRows = txn.value().query(owner);
    if (ownerRows.hasError()) {
        return ServiceResult<void>::err(storageFailure("settings owner lookup", ownerRows.error()));
    }
    if (ownerRows.value().empty()) {
        return ServiceResult<void>::err(ServiceError(ErrorCode::NotFound, "account not found"));
    }

    PreparedStatement upsert(
        "INSERT INTO account_settings (account_id, google_api_key_encrypted, "
        "mineru_token_encrypted, google_api_base, mineru_api_base, image_caption_model, "
        "max_description_workers, max_image_workers, created_at, updated_at) VALUES "
        "($account_id, $google_api_key_encrypted, $mineru_token_encrypted, $google_api_base, "
        "$mineru_api_base, $image_caption_model, $max_description_workers, $max_image_workers, "
        "$created_at, $updated_at) ON CONFLICT (account_id) DO UPDATE SET "
        "google_api_key_encrypted = excluded.google_api_key_encrypted, "
        "mineru_token_encrypted = excluded.mineru_token_encrypted, "
        "google_api_base = excluded.google_api_base, "
        "mineru_api_base = excluded.mineru_api_base, "
        "image_caption_model = excluded.image_caption_model, "
        "max_description_workers = excluded.max_description_workers, "
        "max_image_workers = excluded.max_image_workers, "
        "updated_at = excluded.updated_at");
    upsert.bindInt("account_id", static_cast<int64_t>(settings.accountId))
        .bindOptional("google_api_key_encrypted", settings.googleApiKeyEncrypted)
        .bindOptional("mineru_token_encrypted", settings.mineruTokenEncrypted)
        .bindOptional("google_api_base", settings.googleApiBase)
        .bindOptional("mineru_api_base", settings.mineruApiBase)
        .bindOptional("image_caption_model", settings.imageCaptionModel)
        .bindOptional("max_description_workers", settings.maxDescriptionWorkers)
        .bindOptional("max_image_workers", settings.maxImageWorkers)
        .bindInt("created_at", toMillis(settings.createdAt))
        .bindInt("updated_at", toMillis(settings.updatedAt));

    auto result = txn.value().execute(upsert);
    if (result.hasError()) {
        return ServiceResult<void>::err(storageFailure("settings upsert", result.error()));
    }
    auto commit = txn.value().commit();
    if (commit.hasError()) {
        return ServiceResult<void>::err(storageFailure("settings commit", commit.error()));
    }
    return ServiceResult<void>::ok();
}

// -- Verification codes -------------------------------------------------------

ServiceResult<std::optional<VerificationCode>> SqlIdentityStore::findOneCode(
    const PreparedStatement& stmt) const {
    auto rows = db_->query(stmt);
    if (rows.hasError()) {
        return ServiceResult<std::optional<VerificationCode>>::err(
            storageFailure("code lookup", rows.error()));
    }
    if (rows.value().empty()) {
        return ServiceResult<std::optional<VerificationCode>>::ok(std::nullopt);
    }
    return ServiceResult<std::optional<VerificationCode>>::ok(rowToCode(rows.value().front()));
}

ServiceResult<std::optional<VerificationCode>> SqlIdentityStore::findLatestCode(
    std::string_view email, CodePurpose purpose) const {
    PreparedStatement stmt(std::string("SELECT ") + kCodeColumns +
                           " FROM verification_codes WHERE email = $email AND purpose = $purpose"
                           " ORDER BY created_at DESC, id DESC LIMIT 1");
    stmt.bindString("email", std::string(email))
        .bindString("purpose", std::string(codePurposeName(purpose)));
    return findOneCode(stmt);
}

ServiceResult<std::optional<VerificationCode>> SqlIdentityStore::findActiveCode(
    std::string_view email, CodePurpose purpose) const {
    PreparedStatement stmt(std::string("SELECT ") + kCodeColumns +
                           " FROM verification_codes WHERE email = $email AND purpose = $purpose"
                           " AND used = FALSE ORDER BY created_at DESC, id DESC LIMIT 1");
    stmt.bindString("email", std::string(email))
        .bindString("purpose", std::string(codePurposeName(purpose)));
    return findOneCode(stmt);
}

ServiceResult<bool> SqlIdentityStore::isRetiredCode(std::string_view email,
                                                    CodePurpose purpose,
                                                    std::string_view code) const {
    PreparedStatement stmt(
        "SELECT id FROM verification_codes WHERE email = $email AND purpose = $purpose"
        " AND code = $code AND used = TRUE LIMIT 1");
    stmt.bindString("email", std::string(email))
        .bindString("purpose", std::string(codePurposeName(purpose)))
        .bindString("code", std::string(code));
    auto rows = db_->query(stmt);
    if (rows.hasError()) {
        return ServiceResult<bool>::err(storageFailure("retired code lookup", rows.error()));
    }
    return ServiceResult<bool>::ok(!rows.value().empty());
}

ServiceResult<VerificationCode> SqlIdentityStore::supersedeAndInsertCode(VerificationCode code) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return ServiceResult<VerificationCode>::err(
            storageFailure("begin transaction", txn.error()));
    }

    const std::string purposeName(codePurposeName(code.purpose));
    if (db_->type() == DatabaseType::PostgreSQL) {
        // Serialize issuers of the same pair until commit.
        PreparedStatement lock("SELECT pg_advisory_xact_lock(hashtext($key))");
        lock.bindString("key", code.email + ":" + purposeName);
        auto locked = txn.value().query(lock);
        if (locked.hasError()) {
            return ServiceResult<VerificationCode>::err(
                storageFailure("code issue lock", locked.error()));
        }
    }

    PreparedStatement supersede(
        "UPDATE verification_codes SET used = TRUE "
        "WHERE email = $email AND purpose = $purpose AND used = FALSE");
    supersede.bindString("email", code.email).bindString("purpose", purposeName);
    auto superseded = txn.value().execute(supersede);
    if (superseded.hasError()) {
        return ServiceResult<VerificationCode>::err(
            storageFailure("code supersede", superseded.error()));
    }

    PreparedStatement insert(
        "INSERT INTO verification_codes (email, code, purpose, expires_at, used, attempts, "
        "created_at) VALUES ($email, $code, $purpose, $expires_at, FALSE, 0, $created_at) "
        "RETURNING id");
    insert.bindString("email", code.email)
        .bindString("code", code.code)
        .bindString("purpose", purposeName)
        .bindInt("expires_at", toMillis(code.expiresAt))
        .bindInt("created_at", toMillis(code.createdAt));
    auto inserted = txn.value().query(insert);
    if (inserted.hasError()) {
        return ServiceResult<VerificationCode>::err(
            classifyCodeInsertError(storageFailure("code insert", inserted.error())));
    }
    if (inserted.value().empty()) {
        return ServiceResult<VerificationCode>::err(
            ServiceError(ErrorCode::QueryFailed, "code insert returned no id"));
    }

    auto commit = txn.value().commit();
    if (commit.hasError()) {
        return ServiceResult<VerificationCode>::err(storageFailure("code commit", commit.error()));
    }

    code.id = static_cast<uint64_t>(columnInt(inserted.value().front(), "id").value_or(0));
    code.used = false;
    code.attempts = 0;
    return ServiceResult<VerificationCode>::ok(std::move(code));
}

ServiceResult<AttemptOutcome> SqlIdentityStore::recordAttempt(uint64_t codeId,
                                                              uint32_t maxAttempts) {
    auto txn = db_->beginTransaction();
    if (txn.hasError()) {
        return ServiceResult<AttemptOutcome>::err(storageFailure("begin transaction", txn.error()));
    }

    PreparedStatement increment(
        "UPDATE verification_codes SET attempts = attempts + 1 "
        "WHERE id = $id AND used = FALSE AND attempts < $max_attempts RETURNING attempts");
    increment.bindInt("id", static_cast<int64_t>(codeId))
        .bindInt("max_attempts", static_cast<int64_t>(maxAttempts));
    auto incremented = txn.value().query(increment);
    if (incremented.hasError()) {
        return ServiceResult<AttemptOutcome>::err(
            storageFailure("attempt increment", incremented.error()));
    }

    AttemptOutcome outcome;
    if (!incremented.value().empty()) {
        outcome.status = AttemptStatus::Recorded;
        outcome.attempts =
            static_cast<uint32_t>(columnInt(incremented.value().front(), "attempts").value_or(0));
    } else {
        PreparedStatement current("SELECT used, attempts FROM verification_codes WHERE id = $id");
        current.bindInt("id", static_cast<int64_t>(codeId));
        auto rows = txn.value().query(current);
        if (rows.hasError()) {
            return ServiceResult<AttemptOutcome>::err(
                storageFailure("attempt lookup", rows.error()));
        }
        if (rows.value().empty()) {
            return ServiceResult<AttemptOutcome>::err(
                ServiceError(ErrorCode::NotFound, "verification code not found"));
        }
        const auto& row = rows.value().front();
        outcome.status = columnBool(row, "used") ? AttemptStatus::AlreadyUsed
                                                 : AttemptStatus::CapReached;
        outcome.attempts = static_cast<uint32_t>(columnInt(row, "attempts").value_or(0));
    }

    auto commit = txn.value().commit();
    if (commit.hasError()) {
        return ServiceResult<AttemptOutcome>::err(storageFailure("attempt commit", commit.error()));
    }
    return ServiceResult<AttemptOutcome>::ok(outcome);
}

ServiceResult<bool> SqlIdentityStore::consumeCode(uint64_t codeId) {
    PreparedStatement consume(
        "UPDATE verification_codes SET used = TRUE WHERE id = $id AND used = FALSE RETURNING id");
    consume.bindInt("id", static_cast<int64_t>(codeId));
    auto rows = db_->query(consume);
    if (rows.hasError()) {
        return ServiceResult<bool>::err(storageFailure("code consume", rows.error()));
    }
    return ServiceResult<bool>::ok(!rows.value().empty());
}

}  // namespace cis::identity
