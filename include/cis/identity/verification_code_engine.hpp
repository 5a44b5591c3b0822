#pragma once

/// @file verification_code_engine.hpp
/// @brief One-time email verification codes: issue, rate-limit, verify.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/identity_types.hpp"

#include <memory>
#include <string_view>

namespace cis::identity {

/// Outcome of a cooldown check.
struct IssueDecision {
    bool allowed = true;
    int64_t retryAfterSeconds = 0;
};

/// Generates, rate-limits, expires and consumes 6-digit codes per
/// (email, purpose).
///
/// Verification errors carry ErrorCode::CodeNotFound, CodeExpired,
/// TooManyAttempts or CodeMismatch; a mismatch attaches a
/// foundation::VerificationDetail with the attempts remaining.
///
/// Example:
/// @code
///   VerificationCodeEngine engine(store, VerificationConfig{});
///   if (engine.canIssue(email, CodePurpose::Register).allowed) {
///       auto code = engine.issue(email, CodePurpose::Register);
///   }
///   auto ok = engine.verify(email, CodePurpose::Register, submitted);
/// @endcode
class VerificationCodeEngine {
public:
    VerificationCodeEngine(std::shared_ptr<IIdentityStore> store,
                           VerificationConfig config,
                           Clock clock = systemClock());

    /// Cooldown check against the most recent code for the pair, used or not.
    [[nodiscard]] foundation::ServiceResult<IssueDecision> canIssue(std::string_view email,
                                                                    CodePurpose purpose) const;

    /// Supersede all unused codes for the pair and store a fresh one.
    [[nodiscard]] foundation::ServiceResult<VerificationCode> issue(std::string_view email,
                                                                    CodePurpose purpose);

    /// Check @p code against the active code and consume it on success.
    [[nodiscard]] foundation::ServiceResult<void> verify(std::string_view email,
                                                         CodePurpose purpose,
                                                         std::string_view code);

    /// Report whether @p code matches the active, unexpired code without
    /// consuming it. A mismatch is recorded against the attempt cap; once the
    /// cap is reached every check reports false.
    [[nodiscard]] foundation::ServiceResult<bool> peek(std::string_view email,
                                                       CodePurpose purpose,
                                                       std::string_view code);

    [[nodiscard]] const VerificationConfig& config() const noexcept { return config_; }

private:
    std::shared_ptr<IIdentityStore> store_;
    VerificationConfig config_;
    Clock clock_;
};

}  // namespace cis::identity
