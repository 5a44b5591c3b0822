/// @file mailer.cpp
/// @brief LoggingMailer and verification mail template.

#include "cis/identity/mailer.hpp"

#include "cis/foundation/service_logger.hpp"

#include <sstream>

namespace cis::identity {

using foundation::LogCategory;
using foundation::ServiceResult;

namespace {

/// "alice@example.com" -> "a***@example.com"
std::string maskEmail(std::string_view email) {
    auto at = email.find('@');
    if (at == std::string_view::npos || at == 0) {
        return "***";
    }
    return std::string(email.substr(0, 1)) + "***" + std::string(email.substr(at));
}

std::string escapeHtml(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

}  // anonymous namespace

ServiceResult<void> LoggingMailer::send(const MailMessage& message) {
    CIS_LOG_INFO(LogCategory::Mail,
                 "mail to " + maskEmail(message.to) + " (" + message.subject + ") not sent: "
                 "development transport");
    return ServiceResult<void>::ok();
}

MailMessage buildVerificationMail(std::string_view to,
                                  std::string_view code,
                                  CodePurpose purpose,
                                  int expiresMinutes,
                                  std::string_view productName) {
    std::string title;
    std::string description;
    std::string subject;
    switch (purpose) {
        case CodePurpose::Register:
            subject = "[" + std::string(productName) + "] Registration code";
            title = "Welcome to " + std::string(productName);
            description = "Use the following code to finish creating your account:";
            break;
        case CodePurpose::ResetPassword:
            subject = "[" + std::string(productName) + "] Password reset code";
            title = "Reset your password";
            description = "Use the following code to reset your password:";
            break;
    }

    std::ostringstream text;
    text << description << "\n\n"
         << "Code: " << code << "\n\n"
         << "The code is valid for " << expiresMinutes
         << " minutes. Do not share it with anyone.\n\n"
         << "If you did not request this, ignore this email.";

    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html><head><meta charset=\"UTF-8\"><title>" << escapeHtml(title)
         << "</title></head>\n"
         << "<body style=\"font-family: Arial, sans-serif; background: #f8f9fa;\">\n"
         << "<div style=\"max-width: 480px; margin: 40px auto; background: #ffffff; "
            "border-radius: 16px; padding: 40px 32px;\">\n"
         << "<h1 style=\"text-align: center; color: #111827;\">" << escapeHtml(title)
         << "</h1>\n"
         << "<p style=\"text-align: center; color: #6b7280;\">" << description << "</p>\n"
         << "<div style=\"font-size: 36px; font-weight: 700; letter-spacing: 8px; "
            "text-align: center; font-family: 'Courier New', monospace;\">"
         << escapeHtml(code) << "</div>\n"
         << "<p style=\"text-align: center; color: #6b7280;\">The code is valid for <strong>"
         << expiresMinutes << " minutes</strong>. Do not share it with anyone.</p>\n"
         << "<p style=\"text-align: center; color: #9ca3af;\">"
            "If you did not request this, ignore this email.</p>\n"
         << "</div>\n</body></html>\n";

    return MailMessage{std::string(to), std::move(subject), html.str(), text.str()};
}

}  // namespace cis::identity
