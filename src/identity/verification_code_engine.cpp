/// @file verification_code_engine.cpp
/// @brief VerificationCodeEngine implementation.

#include "cis/identity/verification_code_engine.hpp"

#include "cis/foundation/service_logger.hpp"
#include "cis/identity/input_validator.hpp"

#include "crypto_utils.hpp"

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;
using foundation::VerificationDetail;

namespace {

ServiceResult<void> codeNotFound() {
    return ServiceResult<void>::err(
        ServiceError(ErrorCode::CodeNotFound, "no active verification code"));
}

}  // anonymous namespace

VerificationCodeEngine::VerificationCodeEngine(std::shared_ptr<IIdentityStore> store,
                                               VerificationConfig config,
                                               Clock clock)
    : store_(std::move(store)), config_(config), clock_(std::move(clock)) {}

ServiceResult<IssueDecision> VerificationCodeEngine::canIssue(std::string_view email,
                                                              CodePurpose purpose) const {
    auto latest = store_->findLatestCode(InputValidator::normalizeEmail(email), purpose);
    if (latest.hasError()) {
        return latest.propagate<IssueDecision>();
    }
    if (!latest.value()) {
        return ServiceResult<IssueDecision>::ok({true, 0});
    }

    auto elapsed = clock_() - latest.value()->createdAt;
    if (elapsed >= config_.cooldown) {
        return ServiceResult<IssueDecision>::ok({true, 0});
    }

    auto remaining = config_.cooldown - elapsed;
    // Round up so a caller never retries a fraction of a second early.
    auto seconds = std::chrono::ceil<std::chrono::seconds>(remaining).count();
    return ServiceResult<IssueDecision>::ok({false, seconds > 0 ? seconds : 1});
}

ServiceResult<VerificationCode> VerificationCodeEngine::issue(std::string_view email,
                                                              CodePurpose purpose) {
    auto digits = detail::secureRandomDigits(kVerificationCodeLength);
    if (digits.size() != kVerificationCodeLength) {
        return ServiceResult<VerificationCode>::err(
            ServiceError(ErrorCode::Unknown, "system RNG unavailable"));
    }

    auto now = clock_();
    VerificationCode code;
    code.email = InputValidator::normalizeEmail(email);
    code.code = std::move(digits);
    code.purpose = purpose;
    code.expiresAt = now + config_.ttl;
    code.used = false;
    code.attempts = 0;
    code.createdAt = now;

    auto stored = store_->supersedeAndInsertCode(std::move(code));
    if (stored.hasError() && stored.error().code() == ErrorCode::CodeCooldown) {
        // Lost a race with a concurrent issue; report the winner's cooldown.
        auto decision = canIssue(email, purpose);
        VerificationDetail detail;
        detail.retryAfterSeconds =
            decision.hasValue() && !decision.value().allowed ? decision.value().retryAfterSeconds : 1;
        CIS_LOG_WARN(LogCategory::Verification,
                     "concurrent " + std::string(codePurposeName(purpose)) + " code issue rejected");
        return ServiceResult<VerificationCode>::err(
            ServiceError(ErrorCode::CodeCooldown, "code requested too soon", detail));
    }
    if (stored.hasValue()) {
        CIS_LOG_INFO(LogCategory::Verification,
                     "issued " + std::string(codePurposeName(purpose)) + " code #" +
                         std::to_string(stored.value().id));
    }
    return stored;
}

ServiceResult<void> VerificationCodeEngine::verify(std::string_view email,
                                                   CodePurpose purpose,
                                                   std::string_view code) {
    auto active = store_->findActiveCode(InputValidator::normalizeEmail(email), purpose);
    if (active.hasError()) {
        return active.propagate<void>();
    }
    if (!active.value()) {
        return codeNotFound();
    }
    const auto& record = *active.value();

    if (clock_() > record.expiresAt) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::CodeExpired, "verification code has expired"));
    }

    auto tooMany = [] {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::TooManyAttempts, "verification attempts exhausted"));
    };

    if (record.attempts >= config_.maxAttempts) {
        return tooMany();
    }

    // The attempt is durably recorded before the comparison.
    auto attempt = store_->recordAttempt(record.id, config_.maxAttempts);
    if (attempt.hasError()) {
        return attempt.propagate<void>();
    }
    switch (attempt.value().status) {
        case AttemptStatus::AlreadyUsed:
            return codeNotFound();
        case AttemptStatus::CapReached:
            return tooMany();
        case AttemptStatus::Recorded:
            break;
    }

    if (!detail::constantTimeEqual(record.code, code)) {
        // A superseded or consumed code reads as absent, not as a wrong guess.
        auto retired = store_->isRetiredCode(record.email, purpose, code);
        if (retired.hasError()) {
            return retired.propagate<void>();
        }
        if (retired.value()) {
            return codeNotFound();
        }

        auto used = attempt.value().attempts;
        VerificationDetail remaining;
        remaining.attemptsRemaining = used >= config_.maxAttempts ? 0 : config_.maxAttempts - used;
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::CodeMismatch, "verification code mismatch", remaining));
    }

    auto consumed = store_->consumeCode(record.id);
    if (consumed.hasError()) {
        return consumed.propagate<void>();
    }
    if (!consumed.value()) {
        // Another caller consumed it between our attempt and now.
        return codeNotFound();
    }

    CIS_LOG_INFO(LogCategory::Verification,
                 "consumed " + std::string(codePurposeName(purpose)) + " code #" +
                     std::to_string(record.id));
    return ServiceResult<void>::ok();
}

ServiceResult<bool> VerificationCodeEngine::peek(std::string_view email,
                                                 CodePurpose purpose,
                                                 std::string_view code) {
    auto active = store_->findActiveCode(InputValidator::normalizeEmail(email), purpose);
    if (active.hasError()) {
        return active.propagate<bool>();
    }
    const auto& record = active.value();
    if (!record || clock_() > record->expiresAt || record->attempts >= config_.maxAttempts) {
        return ServiceResult<bool>::ok(false);
    }
    if (detail::constantTimeEqual(record->code, code)) {
        return ServiceResult<bool>::ok(true);
    }

    // A failed pre-check spends an attempt like a failed verify.
    auto attempt = store_->recordAttempt(record->id, config_.maxAttempts);
    if (attempt.hasError()) {
        return attempt.propagate<bool>();
    }
    return ServiceResult<bool>::ok(false);
}

}  // namespace cis::identity
