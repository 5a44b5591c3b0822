#include <gtest/gtest.h>

#include "cis/foundation/error_code.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/oauth_identity_resolver.hpp"

#include "../support/manual_clock.hpp"

#include <memory>
#include <string>

using namespace cis::identity;
using cis::foundation::ErrorCode;
using cis::testing::ManualClock;

class OAuthIdentityResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<InMemoryIdentityStore>();
        resolver_ = std::make_unique<OAuthIdentityResolver>(store_, clock_.clock());
    }

    static ExternalIdentity google(std::string id, std::string email, std::string name) {
        ExternalIdentity identity;
        identity.provider = "google";
        identity.externalId = std::move(id);
        identity.email = std::move(email);
        identity.displayName = std::move(name);
        return identity;
    }

    Account createPasswordAccount(std::string username, std::string email) {
        Account account;
        account.username = std::move(username);
        account.email = std::move(email);
        account.passwordHash = "pbkdf2:sha256:1000$salt$abcdef";
        auto created = store_->createAccountWithSettings(account);
        EXPECT_TRUE(created.hasValue());
        return created.value();
    }

    ManualClock clock_;
    std::shared_ptr<InMemoryIdentityStore> store_;
    std::unique_ptr<OAuthIdentityResolver> resolver_;
};

// =============================================================================
// Resolution order
// =============================================================================

TEST_F(OAuthIdentityResolverTest, NewIdentityCreatesAccount) {
    auto identity = google("g-1", "Carol@Example.com", "Carol Smith");
    identity.avatarUrl = "https://img.example.com/carol.png";

    auto result = resolver_->resolve(identity);
    ASSERT_TRUE(result.hasValue());
    const auto& account = result.value();
    EXPECT_EQ(account.username, "carol_smith");
    EXPECT_EQ(account.email, "carol@example.com");
    EXPECT_FALSE(account.hasPassword());
    EXPECT_EQ(account.oauthProvider, "google");
    EXPECT_EQ(account.oauthId, "g-1");
    EXPECT_EQ(account.avatarUrl, "https://img.example.com/carol.png");
    EXPECT_TRUE(store_->findSettings(account.id).value().has_value());
}

TEST_F(OAuthIdentityResolverTest, RepeatedResolveIsIdempotent) {
    auto identity = google("g-1", "carol@example.com", "Carol");
    auto first = resolver_->resolve(identity);
    auto second = resolver_->resolve(identity);
    ASSERT_TRUE(first.hasValue());
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(first.value().id, second.value().id);
    EXPECT_EQ(store_->accountCount(), 1u);
}

TEST_F(OAuthIdentityResolverTest, LinkedAccountFollowsAvatarChanges) {
    auto identity = google("g-1", "carol@example.com", "Carol");
    identity.avatarUrl = "https://img/old.png";
    ASSERT_TRUE(resolver_->resolve(identity).hasValue());

    identity.avatarUrl = "https://img/new.png";
    identity.email = "changed@example.com";
    auto result = resolver_->resolve(identity);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().avatarUrl, "https://img/new.png");
    EXPECT_EQ(result.value().email, "carol@example.com");

    auto stored = store_->findAccountById(result.value().id).value();
    EXPECT_EQ(stored->avatarUrl, "https://img/new.png");
}

TEST_F(OAuthIdentityResolverTest, MatchingEmailLinksExistingAccount) {
    auto existing = createPasswordAccount("dave", "dave@example.com");

    auto identity = google("g-2", "DAVE@example.com", "Dave D");
    identity.avatarUrl = "https://img/dave.png";
    auto result = resolver_->resolve(identity);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().id, existing.id);
    EXPECT_EQ(result.value().username, "dave");
    EXPECT_EQ(result.value().passwordHash, existing.passwordHash);
    EXPECT_EQ(result.value().oauthProvider, "google");
    EXPECT_EQ(result.value().oauthId, "g-2");
    EXPECT_EQ(result.value().avatarUrl, "https://img/dave.png");
    EXPECT_EQ(store_->accountCount(), 1u);

    auto byOAuth = store_->findAccountByOAuth("google", "g-2").value();
    ASSERT_TRUE(byOAuth.has_value());
    EXPECT_EQ(byOAuth->id, existing.id);
}

TEST_F(OAuthIdentityResolverTest, LinkingKeepsExistingAvatar) {
    Account account;
    account.username = "erin";
    account.email = "erin@example.com";
    account.avatarUrl = "https://img/mine.png";
    ASSERT_TRUE(store_->createAccountWithSettings(account).hasValue());

    auto identity = google("g-3", "erin@example.com", "Erin");
    identity.avatarUrl = "https://img/google.png";
    auto result = resolver_->resolve(identity);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().avatarUrl, "https://img/mine.png");
}

// =============================================================================
// Username derivation
// =============================================================================

TEST_F(OAuthIdentityResolverTest, UsernameCollisionsGetSuffixes) {
    createPasswordAccount("frank", "frank1@example.com");
    createPasswordAccount("frank_1", "frank2@example.com");

    auto result = resolver_->resolve(google("g-4", "frank3@example.com", "Frank"));
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().username, "frank_2");
}

TEST(OAuthBaseUsernameTest, Derivation) {
    EXPECT_EQ(OAuthIdentityResolver::baseUsername("Grace Hopper", "g@x.com"), "grace_hopper");
    EXPECT_EQ(OAuthIdentityResolver::baseUsername("", "heidi.k@example.com"), "heidi.k");
    EXPECT_EQ(OAuthIdentityResolver::baseUsername("   ", "ivan@example.com"), "ivan");
    EXPECT_EQ(OAuthIdentityResolver::baseUsername("", "@example.com"), "user");

    auto longName = OAuthIdentityResolver::baseUsername(std::string(200, 'z'), "z@x.com");
    EXPECT_LT(longName.size(), 80u);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(OAuthIdentityResolverTest, MissingProviderOrIdIsRejected) {
    auto result = resolver_->resolve(google("", "a@x.com", "A"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::MissingField);
}

TEST_F(OAuthIdentityResolverTest, UnlinkedIdentityNeedsEmail) {
    auto result = resolver_->resolve(google("g-5", "", "No Email"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidEmail);
    EXPECT_EQ(store_->accountCount(), 0u);
}
