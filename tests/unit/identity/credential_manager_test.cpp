#include <gtest/gtest.h>

#include "cis/foundation/error_code.hpp"
#include "cis/identity/credential_manager.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/password_hasher.hpp"

#include "../support/manual_clock.hpp"

#include <chrono>
#include <memory>
#include <string>

using namespace cis::identity;
using cis::foundation::ErrorCode;
using cis::testing::ManualClock;

// =============================================================================
// Test fixture
// =============================================================================

class CredentialManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryIdentityStore>();

        IdentityConfig config;
        config.signingKey = "credential-manager-test-key";
        config.passwordHashIterations = 1000;
        manager_ = std::make_unique<CredentialManager>(std::move(config), store_, clock_.clock());
    }

    /// Register and assert success (avoids nodiscard warnings in setup).
    Account registerAlice() {
        auto result = manager_->registerAccount("alice", "alice@example.com", "secret1");
        EXPECT_TRUE(result.hasValue());
        return result.value();
    }

    ManualClock clock_;
    std::shared_ptr<InMemoryIdentityStore> store_;
    std::unique_ptr<CredentialManager> manager_;
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(CredentialManagerTest, RegisterThenLogin) {
    auto account = registerAlice();
    EXPECT_GT(account.id, 0u);
    EXPECT_EQ(account.username, "alice");
    EXPECT_EQ(account.email, "alice@example.com");
    EXPECT_EQ(account.role, AccountRole::User);
    EXPECT_TRUE(account.active);
    ASSERT_TRUE(account.passwordHash.has_value());
    EXPECT_EQ(account.passwordHash->find("secret1"), std::string::npos);

    auto login = manager_->login("alice@example.com", "secret1");
    ASSERT_TRUE(login.hasValue());
    EXPECT_EQ(login.value().id, account.id);
}

TEST_F(CredentialManagerTest, RegisterNormalizesEmail) {
    auto result = manager_->registerAccount("bob", "  Bob@Example.COM ", "secret1");
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().email, "bob@example.com");
    EXPECT_TRUE(manager_->login("BOB@example.com", "secret1").hasValue());
}

TEST_F(CredentialManagerTest, RegisterCreatesSettingsRow) {
    auto account = registerAlice();
    auto settings = store_->findSettings(account.id);
    ASSERT_TRUE(settings.hasValue());
    EXPECT_TRUE(settings.value().has_value());
}

TEST_F(CredentialManagerTest, RegisterValidatesInput) {
    auto shortName = manager_->registerAccount("al", "a@x.com", "secret1");
    ASSERT_TRUE(shortName.hasError());
    EXPECT_EQ(shortName.error().code(), ErrorCode::InvalidUsername);

    auto badEmail = manager_->registerAccount("alice", "not-an-email", "secret1");
    ASSERT_TRUE(badEmail.hasError());
    EXPECT_EQ(badEmail.error().code(), ErrorCode::InvalidEmail);

    auto weak = manager_->registerAccount("alice", "a@x.com", "12345");
    ASSERT_TRUE(weak.hasError());
    EXPECT_EQ(weak.error().code(), ErrorCode::WeakPassword);

    EXPECT_EQ(store_->accountCount(), 0u);
}

TEST_F(CredentialManagerTest, DuplicateUsernameRegardlessOfEmail) {
    registerAlice();
    auto dup = manager_->registerAccount("alice", "someone-else@example.com", "secret1");
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::UsernameTaken);
}

TEST_F(CredentialManagerTest, DuplicateEmail) {
    registerAlice();
    auto dup = manager_->registerAccount("alice2", "ALICE@example.com", "secret1");
    ASSERT_TRUE(dup.hasError());
    EXPECT_EQ(dup.error().code(), ErrorCode::EmailTaken);
}

TEST_F(CredentialManagerTest, CheckRegistrationHasNoSideEffects) {
    EXPECT_TRUE(manager_->checkRegistration("alice", "alice@example.com", "secret1").hasValue());
    EXPECT_EQ(store_->accountCount(), 0u);
}

// =============================================================================
// Login
// =============================================================================

TEST_F(CredentialManagerTest, LoginFailuresAreUniform) {
    registerAlice();

    auto wrongPassword = manager_->login("alice@example.com", "wrong-password");
    auto unknownEmail = manager_->login("nobody@example.com", "secret1");
    ASSERT_TRUE(wrongPassword.hasError());
    ASSERT_TRUE(unknownEmail.hasError());
    EXPECT_EQ(wrongPassword.error().code(), ErrorCode::InvalidCredentials);
    EXPECT_EQ(unknownEmail.error().code(), ErrorCode::InvalidCredentials);
    EXPECT_EQ(wrongPassword.error().message(), unknownEmail.error().message());
}

TEST_F(CredentialManagerTest, PasswordlessAccountCannotLogin) {
    Account oauthOnly;
    oauthOnly.username = "oauth_user";
    oauthOnly.email = "o@example.com";
    oauthOnly.oauthProvider = "google";
    oauthOnly.oauthId = "g-1";
    ASSERT_TRUE(store_->createAccountWithSettings(oauthOnly).hasValue());

    auto result = manager_->login("o@example.com", "");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidCredentials);
}

TEST_F(CredentialManagerTest, DisabledAccountCheckedAfterPassword) {
    auto account = registerAlice();
    account.active = false;
    ASSERT_TRUE(store_->updateAccount(account).hasValue());

    auto wrong = manager_->login("alice@example.com", "wrong-password");
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::InvalidCredentials);

    auto right = manager_->login("alice@example.com", "secret1");
    ASSERT_TRUE(right.hasError());
    EXPECT_EQ(right.error().code(), ErrorCode::AccountDisabled);
}

// =============================================================================
// Tokens
// =============================================================================

TEST_F(CredentialManagerTest, IssuedTokensCarryAccountClaims) {
    auto account = registerAlice();
    auto pair = manager_->issueTokens(account, false);
    ASSERT_TRUE(pair.hasValue());
    EXPECT_EQ(pair.value().tokenType, "Bearer");
    EXPECT_EQ(pair.value().accessExpiresIn, std::chrono::seconds{900});
    EXPECT_EQ(pair.value().refreshExpiresIn, std::chrono::seconds{7 * 24 * 3600});

    auto claims = manager_->validateAccessToken(pair.value().accessToken);
    ASSERT_TRUE(claims.hasValue());
    EXPECT_EQ(claims.value().subject, std::to_string(account.id));
    EXPECT_EQ(claims.value().username, "alice");
    EXPECT_EQ(claims.value().tokenType, kAccessTokenType);
}

TEST_F(CredentialManagerTest, RememberMeExtendsRefreshLifetime) {
    auto account = registerAlice();
    auto pair = manager_->issueTokens(account, true);
    ASSERT_TRUE(pair.hasValue());
    EXPECT_EQ(pair.value().refreshExpiresIn, std::chrono::seconds{30 * 24 * 3600});

    clock_.advance(std::chrono::hours{24 * 8});
    EXPECT_TRUE(manager_->refresh(pair.value().refreshToken).hasValue());
}

TEST_F(CredentialManagerTest, RefreshTokenIsNotAnAccessToken) {
    auto account = registerAlice();
    auto pair = manager_->issueTokens(account, false).value();

    auto asAccess = manager_->validateAccessToken(pair.refreshToken);
    ASSERT_TRUE(asAccess.hasError());
    EXPECT_EQ(asAccess.error().code(), ErrorCode::InvalidToken);

    auto asRefresh = manager_->refresh(pair.accessToken);
    ASSERT_TRUE(asRefresh.hasError());
    EXPECT_EQ(asRefresh.error().code(), ErrorCode::InvalidToken);
}

TEST_F(CredentialManagerTest, RefreshIssuesFreshAccessToken) {
    auto account = registerAlice();
    auto pair = manager_->issueTokens(account, false).value();

    clock_.advance(std::chrono::seconds{1000});
    auto expired = manager_->validateAccessToken(pair.accessToken);
    ASSERT_TRUE(expired.hasError());
    EXPECT_EQ(expired.error().code(), ErrorCode::TokenExpired);

    auto refreshed = manager_->refresh(pair.refreshToken);
    ASSERT_TRUE(refreshed.hasValue());
    auto claims = manager_->validateAccessToken(refreshed.value());
    ASSERT_TRUE(claims.hasValue());
    EXPECT_EQ(claims.value().subject, std::to_string(account.id));
}

TEST_F(CredentialManagerTest, RefreshRechecksAccount) {
    auto account = registerAlice();
    auto pair = manager_->issueTokens(account, false).value();

    account.active = false;
    ASSERT_TRUE(store_->updateAccount(account).hasValue());
    auto disabled = manager_->refresh(pair.refreshToken);
    ASSERT_TRUE(disabled.hasError());
    EXPECT_EQ(disabled.error().code(), ErrorCode::AccountDisabled);

    ASSERT_TRUE(manager_->deleteAccount(account.id).hasValue());
    auto deleted = manager_->refresh(pair.refreshToken);
    ASSERT_TRUE(deleted.hasError());
    EXPECT_EQ(deleted.error().code(), ErrorCode::AuthenticationFailed);
}

TEST_F(CredentialManagerTest, ExpiredRefreshTokenIsRejected) {
    auto account = registerAlice();
    auto pair = manager_->issueTokens(account, false).value();

    clock_.advance(std::chrono::hours{24 * 7} + std::chrono::seconds{1});
    auto result = manager_->refresh(pair.refreshToken);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenExpired);
}

// =============================================================================
// Passwords and profile
// =============================================================================

TEST_F(CredentialManagerTest, ChangePasswordRequiresOldPassword) {
    auto account = registerAlice();

    auto wrong = manager_->changePassword(account, "not-it", "newsecret");
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::InvalidCredentials);

    auto weak = manager_->changePassword(account, "secret1", "123");
    ASSERT_TRUE(weak.hasError());
    EXPECT_EQ(weak.error().code(), ErrorCode::WeakPassword);

    ASSERT_TRUE(manager_->changePassword(account, "secret1", "newsecret").hasValue());
    EXPECT_TRUE(manager_->login("alice@example.com", "newsecret").hasValue());
    EXPECT_TRUE(manager_->login("alice@example.com", "secret1").hasError());
}

TEST_F(CredentialManagerTest, SetPasswordWithoutOldPassword) {
    auto account = registerAlice();
    ASSERT_TRUE(manager_->setPassword(account.id, "resetpass").hasValue());
    EXPECT_TRUE(manager_->login("alice@example.com", "resetpass").hasValue());

    auto missing = manager_->setPassword(account.id + 100, "resetpass");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::NotFound);
}

TEST_F(CredentialManagerTest, UpdateProfile) {
    auto account = registerAlice();
    ASSERT_TRUE(manager_->registerAccount("bob", "bob@example.com", "secret1").hasValue());

    ProfileUpdate rename;
    rename.username = "bob";
    auto taken = manager_->updateProfile(account.id, rename);
    ASSERT_TRUE(taken.hasError());
    EXPECT_EQ(taken.error().code(), ErrorCode::UsernameTaken);

    ProfileUpdate update;
    update.username = "alice_w";
    update.avatarUrl = "https://img.example.com/a.png";
    auto updated = manager_->updateProfile(account.id, update);
    ASSERT_TRUE(updated.hasValue());
    EXPECT_EQ(updated.value().username, "alice_w");
    EXPECT_EQ(updated.value().avatarUrl, "https://img.example.com/a.png");

    ProfileUpdate clear;
    clear.avatarUrl = "";
    auto cleared = manager_->updateProfile(account.id, clear);
    ASSERT_TRUE(cleared.hasValue());
    EXPECT_FALSE(cleared.value().avatarUrl.has_value());
    EXPECT_EQ(cleared.value().username, "alice_w");
}

TEST_F(CredentialManagerTest, DeleteAccountRemovesSettings) {
    auto account = registerAlice();
    ASSERT_TRUE(manager_->deleteAccount(account.id).hasValue());
    EXPECT_FALSE(store_->findAccountById(account.id).value().has_value());
    EXPECT_FALSE(store_->findSettings(account.id).value().has_value());

    auto again = manager_->deleteAccount(account.id);
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::NotFound);
}
