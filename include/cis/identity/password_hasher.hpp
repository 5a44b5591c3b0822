#pragma once

/// @file password_hasher.hpp
/// @brief Salted PBKDF2-HMAC-SHA256 password hashing.
///
/// Stored hashes are self-describing:
///   pbkdf2:sha256:<iterations>$<salt>$<hex digest>
/// so the iteration count can be raised without invalidating old hashes.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cis::identity {

/// Password hashing utility.
///
/// Example:
/// @code
///   PasswordHasher hasher(600000);
///   auto stored = hasher.hash("my_password");
///   bool ok = stored && hasher.verify("my_password", *stored);
/// @endcode
class PasswordHasher {
public:
    explicit PasswordHasher(uint32_t iterations = 600000);

    /// Hash a plaintext password with a newly generated random salt.
    /// @return std::nullopt if the system RNG or OpenSSL fails.
    [[nodiscard]] std::optional<std::string> hash(std::string_view password) const;

    /// Verify a plaintext password against a stored hash.
    /// Malformed stored hashes never verify.
    [[nodiscard]] bool verify(std::string_view password, std::string_view storedHash) const;

    [[nodiscard]] uint32_t iterations() const noexcept { return iterations_; }

    /// Generate a cryptographically random salt (hex-encoded).
    [[nodiscard]] static std::string generateSalt();

private:
    [[nodiscard]] static std::optional<std::string> derive(std::string_view password,
                                                           std::string_view salt,
                                                           uint32_t iterations);

    uint32_t iterations_;
};

}  // namespace cis::identity
