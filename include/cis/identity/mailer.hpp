#pragma once

/// @file mailer.hpp
/// @brief Outbound mail contract and the verification-code message template.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_types.hpp"

#include <string>
#include <string_view>

namespace cis::identity {

struct MailMessage {
    std::string to;
    std::string subject;
    std::string html;
    std::string text;
};

/// Mail transport.
///
/// send() reports success or failure once; callers never retry.
class IMailer {
public:
    virtual ~IMailer() = default;

    [[nodiscard]] virtual foundation::ServiceResult<void> send(const MailMessage& message) = 0;

    /// False when the transport lacks credentials or an endpoint.
    [[nodiscard]] virtual bool isConfigured() const = 0;
};

/// Development transport: records the delivery in the log (recipient and
/// subject only) instead of sending anything.
class LoggingMailer : public IMailer {
public:
    [[nodiscard]] foundation::ServiceResult<void> send(const MailMessage& message) override;

    [[nodiscard]] bool isConfigured() const override { return true; }
};

/// Build the verification-code mail for @p purpose.
[[nodiscard]] MailMessage buildVerificationMail(std::string_view to,
                                                std::string_view code,
                                                CodePurpose purpose,
                                                int expiresMinutes,
                                                std::string_view productName = "Identity Service");

}  // namespace cis::identity
