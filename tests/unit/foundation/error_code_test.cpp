#include <gtest/gtest.h>

#include "cis/foundation/error_code.hpp"
#include "cis/foundation/service_error.hpp"
#include "cis/foundation/service_result.hpp"

#include <string>

using namespace cis::foundation;

// ===========================================================================
// ErrorCode: subsystem lookup
// ===========================================================================

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::NotFound), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::QueryFailed), "Storage");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidCredentials), "Auth");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidEncryptionKey), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::WeakPassword), "Validation");
    EXPECT_EQ(errorSubsystem(ErrorCode::EmailTaken), "Conflict");
    EXPECT_EQ(errorSubsystem(ErrorCode::CodeMismatch), "Verification");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidSecret), "Secret");
    EXPECT_EQ(errorSubsystem(ErrorCode::MailSendFailed), "Mail");
}

TEST(ErrorCodeTest, StorageClassification) {
    EXPECT_TRUE(isStorageError(ErrorCode::DatabaseError));
    EXPECT_TRUE(isStorageError(ErrorCode::ConstraintViolation));
    EXPECT_FALSE(isStorageError(ErrorCode::UsernameTaken));
    EXPECT_FALSE(isStorageError(ErrorCode::NotFound));
}

TEST(ServiceErrorTest, CarriesCodeMessageAndSubsystem) {
    ServiceError err(ErrorCode::UsernameTaken, "username 'alice' taken");
    EXPECT_EQ(err.code(), ErrorCode::UsernameTaken);
    EXPECT_EQ(err.message(), "username 'alice' taken");
    EXPECT_EQ(err.subsystem(), "Conflict");
    EXPECT_FALSE(err.hasContext());
}

TEST(ServiceErrorTest, TypedContextAccess) {
    VerificationDetail detail;
    detail.attemptsRemaining = 3;
    ServiceError err(ErrorCode::CodeMismatch, "mismatch", detail);

    ASSERT_TRUE(err.hasContext());
    const auto* ctx = err.context<VerificationDetail>();
    ASSERT_NE(ctx, nullptr);
    EXPECT_EQ(ctx->attemptsRemaining, 3u);
    EXPECT_EQ(err.context<int>(), nullptr);
}

// ===========================================================================
// publicMessage: client-facing reasons
// ===========================================================================

TEST(PublicMessageTest, ValidationKeepsSpecificReason) {
    ServiceError err(ErrorCode::WeakPassword, "password must be at least 6 characters");
    EXPECT_EQ(publicMessage(err), "password must be at least 6 characters");
}

TEST(PublicMessageTest, StorageFailuresAreGeneric) {
    ServiceError err(ErrorCode::QueryFailed, "syntax error near \"accounts\"");
    EXPECT_EQ(publicMessage(err), "internal error");
}

TEST(PublicMessageTest, CredentialsFailureIsUniform) {
    EXPECT_EQ(publicMessage(ServiceError(ErrorCode::InvalidCredentials, "no such email")),
              publicMessage(ServiceError(ErrorCode::InvalidCredentials, "wrong password")));
}

TEST(PublicMessageTest, MismatchReportsRemainingAttempts) {
    VerificationDetail detail;
    detail.attemptsRemaining = 2;
    ServiceError err(ErrorCode::CodeMismatch, "mismatch", detail);
    EXPECT_EQ(publicMessage(err), "verification code is incorrect, 2 attempts remaining");
}

TEST(PublicMessageTest, CooldownReportsRetryAfter) {
    VerificationDetail detail;
    detail.retryAfterSeconds = 42;
    ServiceError err(ErrorCode::CodeCooldown, "too soon", detail);
    EXPECT_EQ(publicMessage(err), "codes are sent too frequently, retry in 42 seconds");
}

// ===========================================================================
// ServiceResult
// ===========================================================================

TEST(ServiceResultTest, ValueAndError) {
    auto good = ServiceResult<int>::ok(7);
    ASSERT_TRUE(good.hasValue());
    EXPECT_EQ(good.value(), 7);

    auto bad = ServiceResult<int>::err(ServiceError(ErrorCode::NotFound, "missing"));
    ASSERT_TRUE(bad.hasError());
    EXPECT_EQ(bad.error().code(), ErrorCode::NotFound);
    EXPECT_EQ(bad.valueOr(3), 3);
}

TEST(ServiceResultTest, PropagateKeepsError) {
    auto bad = ServiceResult<int>::err(ServiceError(ErrorCode::EmailTaken, "taken"));
    auto moved = bad.propagate<std::string>();
    ASSERT_TRUE(moved.hasError());
    EXPECT_EQ(moved.error().code(), ErrorCode::EmailTaken);

    auto voidBad = ServiceResult<void>::err(ServiceError(ErrorCode::InvalidSecret));
    EXPECT_FALSE(voidBad);
    EXPECT_EQ(voidBad.propagate<int>().error().code(), ErrorCode::InvalidSecret);
}
