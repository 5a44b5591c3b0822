#pragma once

/// @file secret_cipher.hpp
/// @brief Symmetric authenticated encryption for small per-account secrets.
///
/// Tokens are base64url(version | nonce | ciphertext | tag) using
/// AES-256-GCM. Keys are 32 random bytes, base64url-encoded.

#include "cis/foundation/service_result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cis::identity {

/// Process-wide secret cipher.
///
/// Constructed once at startup and shared as `std::shared_ptr<const
/// SecretCipher>`. All methods are const and safe to call concurrently.
///
/// Example:
/// @code
///   auto cipher = SecretCipher::create(config.getOr<std::string>("identity.encryption_key", ""));
///   auto token = cipher.value()->encrypt("sk-123");
/// @endcode
class SecretCipher {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Use fromKey() or create(); the tag keeps construction inside the class.
    SecretCipher(PrivateTag, std::vector<uint8_t> key, bool ephemeral);

    /// Build a cipher from an encoded key.
    /// @return InvalidEncryptionKey if the key does not decode to 32 bytes.
    [[nodiscard]] static foundation::ServiceResult<std::shared_ptr<const SecretCipher>> fromKey(
        std::string_view encodedKey);

    /// Build a cipher from @p encodedKey, or from a freshly generated
    /// ephemeral key when it is empty. The ephemeral path logs a warning:
    /// secrets persisted by an earlier process will no longer decrypt.
    [[nodiscard]] static foundation::ServiceResult<std::shared_ptr<const SecretCipher>> create(
        std::string_view encodedKey);

    /// Generate a new random key in the encoding fromKey() accepts.
    [[nodiscard]] static foundation::ServiceResult<std::string> generateKey();

    /// Encrypt @p plaintext. Empty input yields std::nullopt.
    [[nodiscard]] foundation::ServiceResult<std::optional<std::string>> encrypt(
        std::string_view plaintext) const;

    /// Decrypt a token produced by encrypt() under the same key.
    /// Wrong key, truncation or tampering all fail with InvalidSecret.
    [[nodiscard]] foundation::ServiceResult<std::string> decrypt(std::string_view token) const;

    /// True when the key was generated for this process only.
    [[nodiscard]] bool isEphemeral() const noexcept { return ephemeral_; }

private:
    std::vector<uint8_t> key_;
    bool ephemeral_;
};

}  // namespace cis::identity
