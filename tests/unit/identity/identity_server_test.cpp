#include <gtest/gtest.h>

#include "cis/foundation/error_code.hpp"
#include "cis/identity/identity_server.hpp"

#include "../support/manual_clock.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace cis::identity;
using cis::foundation::ErrorCode;
using cis::foundation::ServiceError;
using cis::foundation::ServiceResult;
using cis::foundation::VerificationDetail;
using cis::testing::ManualClock;

namespace {

/// Captures outgoing mail; can be switched to fail or to report no
/// configuration.
class FakeMailer : public IMailer {
public:
    ServiceResult<void> send(const MailMessage& message) override {
        if (failSends) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::MailSendFailed, "smtp connection refused"));
        }
        sent.push_back(message);
        return ServiceResult<void>::ok();
    }

    bool isConfigured() const override { return configured; }

    /// Code from the most recent message.
    std::string lastCode() const {
        if (sent.empty()) {
            return {};
        }
        const auto& text = sent.back().text;
        auto pos = text.find("Code: ");
        return pos == std::string::npos ? std::string() : text.substr(pos + 6, 6);
    }

    std::vector<MailMessage> sent;
    bool failSends = false;
    bool configured = true;
};

}  // namespace

class IdentityServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryIdentityStore>();
        mailer_ = std::make_shared<FakeMailer>();

        auto key = SecretCipher::generateKey();
        ASSERT_TRUE(key.hasValue());
        auto cipher = SecretCipher::fromKey(key.value());
        ASSERT_TRUE(cipher.hasValue());

        IdentityServerConfig config;
        config.identity.signingKey = "identity-server-test-key";
        config.identity.passwordHashIterations = 1000;
        config.productName = "Acme";
        server_ = std::make_unique<IdentityServer>(config, store_, cipher.value(), mailer_,
                                                   clock_.clock());
    }

    /// Full register-with-code flow for a fresh account.
    AuthSession registerUser(const std::string& username, const std::string& email) {
        auto requested = server_->requestCode(email, "register");
        EXPECT_TRUE(requested.hasValue());
        auto session = server_->registerWithCode(username, email, "secret1", mailer_->lastCode());
        EXPECT_TRUE(session.hasValue());
        return session.value();
    }

    ManualClock clock_;
    std::shared_ptr<InMemoryIdentityStore> store_;
    std::shared_ptr<FakeMailer> mailer_;
    std::unique_ptr<IdentityServer> server_;
};

// =============================================================================
// Code requests
// =============================================================================

TEST_F(IdentityServerTest, RequestCodeSendsMail) {
    auto outcome = server_->requestCode("Alice@Example.com", "register");
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_TRUE(outcome.value().sent);
    EXPECT_EQ(outcome.value().expiresIn, std::chrono::seconds(300));

    ASSERT_EQ(mailer_->sent.size(), 1u);
    EXPECT_EQ(mailer_->sent[0].to, "alice@example.com");
    EXPECT_EQ(mailer_->sent[0].subject, "[Acme] Registration code");
    EXPECT_EQ(mailer_->lastCode().size(), 6u);
}

TEST_F(IdentityServerTest, RequestCodeValidatesInput) {
    auto badEmail = server_->requestCode("not-an-email", "register");
    ASSERT_TRUE(badEmail.hasError());
    EXPECT_EQ(badEmail.error().code(), ErrorCode::InvalidEmail);

    auto badPurpose = server_->requestCode("a@example.com", "login");
    ASSERT_TRUE(badPurpose.hasError());
    EXPECT_EQ(badPurpose.error().code(), ErrorCode::InvalidCodePurpose);
    EXPECT_TRUE(mailer_->sent.empty());
}

TEST_F(IdentityServerTest, RequestCodeNeedsConfiguredMailer) {
    mailer_->configured = false;
    auto outcome = server_->requestCode("a@example.com", "register");
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::MailerNotConfigured);
}

TEST_F(IdentityServerTest, RequestCodeReportsCooldown) {
    ASSERT_TRUE(server_->requestCode("a@example.com", "register").hasValue());
    clock_.advance(std::chrono::seconds(15));

    auto again = server_->requestCode("a@example.com", "register");
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::CodeCooldown);
    const auto* detail = again.error().context<VerificationDetail>();
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(detail->retryAfterSeconds, 45);
    EXPECT_EQ(mailer_->sent.size(), 1u);
}

TEST_F(IdentityServerTest, RequestCodeReportsMailFailure) {
    mailer_->failSends = true;
    auto outcome = server_->requestCode("a@example.com", "register");
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::MailSendFailed);
}

TEST_F(IdentityServerTest, RegisterCodeForTakenEmailIsRefused) {
    registerUser("alice", "alice@example.com");
    auto outcome = server_->requestCode("alice@example.com", "register");
    ASSERT_TRUE(outcome.hasError());
    EXPECT_EQ(outcome.error().code(), ErrorCode::EmailTaken);
}

TEST_F(IdentityServerTest, ResetCodeForUnknownEmailIsSilent) {
    auto outcome = server_->requestCode("ghost@example.com", "reset_password");
    ASSERT_TRUE(outcome.hasValue());
    EXPECT_FALSE(outcome.value().sent);
    EXPECT_EQ(outcome.value().expiresIn, std::chrono::seconds(300));
    EXPECT_TRUE(mailer_->sent.empty());
}

TEST_F(IdentityServerTest, CheckCodeDoesNotConsume) {
    ASSERT_TRUE(server_->requestCode("a@example.com", "register").hasValue());
    auto code = mailer_->lastCode();

    auto check = server_->checkCode("a@example.com", "register", code);
    ASSERT_TRUE(check.hasValue());
    EXPECT_TRUE(check.value());

    auto badPurpose = server_->checkCode("a@example.com", "bogus", code);
    ASSERT_TRUE(badPurpose.hasError());
    EXPECT_EQ(badPurpose.error().code(), ErrorCode::InvalidCodePurpose);

    auto session = server_->registerWithCode("alice", "a@example.com", "secret1", code);
    EXPECT_TRUE(session.hasValue());
}

TEST_F(IdentityServerTest, CheckCodeWrongGuessesSpendAttempts) {
    ASSERT_TRUE(server_->requestCode("a@example.com", "register").hasValue());
    auto code = mailer_->lastCode();
    auto wrong = code == "000000" ? std::string("111111") : std::string("000000");

    for (int i = 0; i < 5; ++i) {
        auto check = server_->checkCode("a@example.com", "register", wrong);
        ASSERT_TRUE(check.hasValue());
        EXPECT_FALSE(check.value());
    }

    auto session = server_->registerWithCode("alice", "a@example.com", "secret1", code);
    ASSERT_TRUE(session.hasError());
    EXPECT_EQ(session.error().code(), ErrorCode::TooManyAttempts);
}

// =============================================================================
// Registration and login
// =============================================================================

TEST_F(IdentityServerTest, RegisterWithCodeStartsSession) {
    auto session = registerUser("alice", "alice@example.com");
    EXPECT_EQ(session.account.username, "alice");
    EXPECT_FALSE(session.tokens.accessToken.empty());
    EXPECT_FALSE(session.tokens.refreshToken.empty());

    auto identity = server_->guard().requireIdentity("Bearer " + session.tokens.accessToken);
    ASSERT_TRUE(identity.hasValue());
    EXPECT_EQ(identity.value().account.id, session.account.id);
}

TEST_F(IdentityServerTest, RegisterCodeIsSingleUse) {
    auto session = registerUser("alice", "alice@example.com");
    (void)session;

    auto replay = server_->registerWithCode("alice2", "alice@example.com", "secret1",
                                            mailer_->lastCode());
    ASSERT_TRUE(replay.hasError());
}

TEST_F(IdentityServerTest, RegisterWithWrongCode) {
    ASSERT_TRUE(server_->requestCode("a@example.com", "register").hasValue());
    auto wrong = mailer_->lastCode() == "000000" ? "111111" : "000000";

    auto session = server_->registerWithCode("alice", "a@example.com", "secret1", wrong);
    ASSERT_TRUE(session.hasError());
    EXPECT_EQ(session.error().code(), ErrorCode::CodeMismatch);
    EXPECT_EQ(store_->accountCount(), 0u);
}

TEST_F(IdentityServerTest, RegisterInputErrorsDoNotSpendAttempts) {
    ASSERT_TRUE(server_->requestCode("a@example.com", "register").hasValue());
    auto code = mailer_->lastCode();

    auto weak = server_->registerWithCode("alice", "a@example.com", "123", code);
    ASSERT_TRUE(weak.hasError());
    EXPECT_EQ(weak.error().code(), ErrorCode::WeakPassword);

    auto missing = server_->registerWithCode("alice", "a@example.com", "secret1", "");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::MissingField);

    auto active = store_->findActiveCode("a@example.com", CodePurpose::Register).value();
    ASSERT_TRUE(active.has_value());
    EXPECT_EQ(active->attempts, 0u);
}

TEST_F(IdentityServerTest, LoginAndRefresh) {
    registerUser("alice", "alice@example.com");

    auto session = server_->login("alice@example.com", "secret1", true);
    ASSERT_TRUE(session.hasValue());
    EXPECT_EQ(session.value().tokens.refreshExpiresIn, std::chrono::hours(24 * 30));

    auto access = server_->refresh(session.value().tokens.refreshToken);
    ASSERT_TRUE(access.hasValue());
    EXPECT_TRUE(server_->guard().requireIdentity("Bearer " + access.value()).hasValue());

    auto wrong = server_->login("alice@example.com", "wrong-password", false);
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::InvalidCredentials);
}

// =============================================================================
// Password reset
// =============================================================================

TEST_F(IdentityServerTest, ResetPasswordWithCode) {
    registerUser("alice", "alice@example.com");
    clock_.advance(std::chrono::minutes(2));

    auto requested = server_->requestCode("alice@example.com", "reset_password");
    ASSERT_TRUE(requested.hasValue());
    EXPECT_TRUE(requested.value().sent);
    EXPECT_EQ(mailer_->sent.back().subject, "[Acme] Password reset code");

    auto reset = server_->resetPassword("alice@example.com", mailer_->lastCode(), "newsecret");
    ASSERT_TRUE(reset.hasValue());

    EXPECT_TRUE(server_->login("alice@example.com", "newsecret", false).hasValue());
    EXPECT_FALSE(server_->login("alice@example.com", "secret1", false).hasValue());
}

TEST_F(IdentityServerTest, ResetPasswordValidatesFirst) {
    auto missing = server_->resetPassword("alice@example.com", "", "newsecret");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::MissingField);

    auto weak = server_->resetPassword("alice@example.com", "123456", "x");
    ASSERT_TRUE(weak.hasError());
    EXPECT_EQ(weak.error().code(), ErrorCode::WeakPassword);

    auto noCode = server_->resetPassword("alice@example.com", "123456", "newsecret");
    ASSERT_TRUE(noCode.hasError());
    EXPECT_EQ(noCode.error().code(), ErrorCode::CodeNotFound);
}

// =============================================================================
// OAuth and settings
// =============================================================================

TEST_F(IdentityServerTest, OAuthLoginIssuesSession) {
    ExternalIdentity identity{"google", "g-77", "carol@example.com", "Carol", ""};
    auto session = server_->oauthLogin(identity);
    ASSERT_TRUE(session.hasValue());
    EXPECT_EQ(session.value().account.username, "carol");
    EXPECT_FALSE(session.value().tokens.accessToken.empty());

    // Password login is impossible for an OAuth-only account.
    auto login = server_->login("carol@example.com", "anything", false);
    ASSERT_TRUE(login.hasError());
    EXPECT_EQ(login.error().code(), ErrorCode::InvalidCredentials);
}

TEST_F(IdentityServerTest, OAuthLoginRejectsDisabledAccount) {
    ExternalIdentity identity{"google", "g-78", "dave@example.com", "Dave", ""};
    auto first = server_->oauthLogin(identity);
    ASSERT_TRUE(first.hasValue());

    auto account = first.value().account;
    account.active = false;
    ASSERT_TRUE(store_->updateAccount(account).hasValue());

    auto second = server_->oauthLogin(identity);
    ASSERT_TRUE(second.hasError());
    EXPECT_EQ(second.error().code(), ErrorCode::AccountDisabled);
}

TEST_F(IdentityServerTest, SettingsFlowThroughResolver) {
    auto session = registerUser("alice", "alice@example.com");
    auto id = session.account.id;

    ASSERT_TRUE(server_->settings().update(id, {{"max_image_workers", int64_t{4}}}).hasValue());
    auto settings = server_->settings().loadOrCreate(id);
    ASSERT_TRUE(settings.hasValue());
    EXPECT_EQ(server_->resolver().maxImageWorkers(&settings.value()), 4);
    EXPECT_EQ(server_->resolver().maxImageWorkers(nullptr), 8);
}
