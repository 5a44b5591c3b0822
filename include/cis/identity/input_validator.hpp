#pragma once

/// @file input_validator.hpp
/// @brief Input validation and normalization for account fields.

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cis::identity {

/// Result of a validation check.
struct ValidationResult {
    bool valid;
    std::string message;

    explicit operator bool() const noexcept { return valid; }

    static ValidationResult ok() { return {true, {}}; }
    static ValidationResult fail(std::string msg) {
        return {false, std::move(msg)};
    }
};

/// Stateless input validation utilities.
///
/// The rules are deliberately permissive (usernames derived from OAuth
/// display names may hold any printable text); length limits match the
/// storage column widths.
class InputValidator {
public:
    // -- Limits ---------------------------------------------------------------

    static constexpr std::size_t kMaxEmailLength = 120;
    static constexpr std::size_t kMaxUsernameLength = 80;
    static constexpr std::size_t kMaxPasswordLength = 128;

    // -- Email ----------------------------------------------------------------

    /// Trim surrounding whitespace and lowercase.
    [[nodiscard]] static inline std::string normalizeEmail(std::string_view email) {
        auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
        while (!email.empty() && isSpace(static_cast<unsigned char>(email.front()))) {
            email.remove_prefix(1);
        }
        while (!email.empty() && isSpace(static_cast<unsigned char>(email.back()))) {
            email.remove_suffix(1);
        }
        std::string lower(email.size(), '\0');
        std::transform(email.begin(), email.end(), lower.begin(),
                       [](unsigned char c) {
                           return static_cast<char>(std::tolower(c));
                       });
        return lower;
    }

    [[nodiscard]] static inline ValidationResult validateEmail(std::string_view email) {
        if (email.empty()) {
            return ValidationResult::fail("email must not be empty");
        }
        if (email.size() > kMaxEmailLength) {
            return ValidationResult::fail("email exceeds maximum length");
        }
        if (email.find('@') == std::string_view::npos) {
            return ValidationResult::fail("invalid email format");
        }
        return ValidationResult::ok();
    }

    // -- Password -------------------------------------------------------------

    [[nodiscard]] static inline ValidationResult validatePassword(
        std::string_view password, uint32_t minLength) {
        if (password.size() < static_cast<std::size_t>(minLength)) {
            return ValidationResult::fail(
                "password must be at least " + std::to_string(minLength) +
                " characters");
        }
        if (password.size() > kMaxPasswordLength) {
            return ValidationResult::fail(
                "password must not exceed " +
                std::to_string(kMaxPasswordLength) + " characters");
        }
        return ValidationResult::ok();
    }

    // -- Username -------------------------------------------------------------

    [[nodiscard]] static inline ValidationResult validateUsername(
        std::string_view username, uint32_t minLength) {
        if (username.size() < static_cast<std::size_t>(minLength)) {
            return ValidationResult::fail(
                "username must be at least " + std::to_string(minLength) +
                " characters");
        }
        if (username.size() > kMaxUsernameLength) {
            return ValidationResult::fail(
                "username must not exceed " +
                std::to_string(kMaxUsernameLength) + " characters");
        }
        return ValidationResult::ok();
    }
};

} // namespace cis::identity
