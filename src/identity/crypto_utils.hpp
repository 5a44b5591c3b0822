#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic primitives on top of OpenSSL: HMAC-SHA256,
///        Base64URL, hex, CSPRNG bytes and constant-time comparison.
///
/// Used internally by PasswordHasher, TokenProvider, SecretCipher and the
/// verification code engine.

#include <array>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace cis::identity::detail {

// =============================================================================
// HMAC-SHA256 (RFC 2104)
// =============================================================================

/// Compute HMAC-SHA256(key, message).
/// Returns 32-byte raw MAC, or all zeros if OpenSSL fails.
[[nodiscard]] inline std::array<uint8_t, 32> hmacSha256(std::string_view key,
                                                        std::string_view message) {
    std::array<uint8_t, 32> mac{};
    unsigned int macLen = 0;
    auto* out = HMAC(EVP_sha256(),
                     key.data(),
                     static_cast<int>(key.size()),
                     reinterpret_cast<const unsigned char*>(message.data()),
                     message.size(),
                     mac.data(),
                     &macLen);
    if (out == nullptr || macLen != mac.size()) {
        return {};
    }
    return mac;
}

// =============================================================================
// Base64URL encoding/decoding (RFC 4648 §5)
// =============================================================================

/// Encode bytes to base64url (no padding).
[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

[[nodiscard]] inline std::string base64urlEncode(const std::vector<uint8_t>& input) {
    return base64urlEncode(input.data(), input.size());
}

/// Decode base64url to bytes. Padding is tolerated.
/// @return false on any character outside the alphabet.
[[nodiscard]] inline bool base64urlDecode(std::string_view input, std::vector<uint8_t>& out) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    out.clear();
    out.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        if (c == '=') {
            break;
        }
        int val = decodeChar(c);
        if (val < 0) {
            out.clear();
            return false;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    return true;
}

/// Decode base64url to string. Returns empty string on invalid input.
[[nodiscard]] inline std::string base64urlDecodeString(std::string_view input) {
    std::vector<uint8_t> bytes;
    if (!base64urlDecode(input, bytes)) {
        return {};
    }
    return {bytes.begin(), bytes.end()};
}

// =============================================================================
// Hex encoding
// =============================================================================

[[nodiscard]] inline std::string toHex(const uint8_t* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

[[nodiscard]] inline std::string toHex(const std::vector<uint8_t>& data) {
    return toHex(data.data(), data.size());
}

// =============================================================================
// Secure random generation
// =============================================================================

/// Fill @p out with CSPRNG bytes. Returns false if the RNG is unavailable.
[[nodiscard]] inline bool secureRandomBytes(std::vector<uint8_t>& out, std::size_t numBytes) {
    out.resize(numBytes);
    if (numBytes == 0) {
        return true;
    }
    return RAND_bytes(out.data(), static_cast<int>(numBytes)) == 1;
}

/// N random bytes, hex-encoded. Empty string if the RNG is unavailable.
[[nodiscard]] inline std::string secureRandomHex(std::size_t numBytes) {
    std::vector<uint8_t> buf;
    if (!secureRandomBytes(buf, numBytes)) {
        return {};
    }
    return toHex(buf);
}

/// @p count uniformly distributed decimal digits (leading zeros kept).
/// Empty string if the RNG is unavailable.
[[nodiscard]] inline std::string secureRandomDigits(std::size_t count) {
    std::string digits;
    digits.reserve(count);
    std::vector<uint8_t> buf;
    while (digits.size() < count) {
        if (!secureRandomBytes(buf, count)) {
            return {};
        }
        for (auto b : buf) {
            // Reject 250..255 so every digit is equally likely.
            if (b < 250 && digits.size() < count) {
                digits.push_back(static_cast<char>('0' + (b % 10)));
            }
        }
    }
    return digits;
}

// =============================================================================
// Constant-time comparison
// =============================================================================

/// Compare two strings in constant time to prevent timing attacks.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace cis::identity::detail
