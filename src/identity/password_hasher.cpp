/// @file password_hasher.cpp
/// @brief PasswordHasher implementation using OpenSSL PKCS5_PBKDF2_HMAC.

#include "cis/identity/password_hasher.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <vector>

#include <openssl/evp.h>

namespace cis::identity {

namespace {

constexpr std::string_view kMethodPrefix = "pbkdf2:sha256:";
constexpr std::size_t kDigestLength = 32;

}  // anonymous namespace

PasswordHasher::PasswordHasher(uint32_t iterations)
    : iterations_(iterations == 0 ? 1 : iterations) {}

std::optional<std::string> PasswordHasher::hash(std::string_view password) const {
    auto salt = generateSalt();
    if (salt.empty()) {
        return std::nullopt;
    }
    auto digest = derive(password, salt, iterations_);
    if (!digest) {
        return std::nullopt;
    }
    return std::string(kMethodPrefix) + std::to_string(iterations_) + "$" + salt + "$" + *digest;
}

bool PasswordHasher::verify(std::string_view password, std::string_view storedHash) const {
    if (storedHash.substr(0, kMethodPrefix.size()) != kMethodPrefix) {
        return false;
    }
    auto rest = storedHash.substr(kMethodPrefix.size());

    auto firstSep = rest.find('$');
    if (firstSep == std::string_view::npos) {
        return false;
    }
    auto secondSep = rest.find('$', firstSep + 1);
    if (secondSep == std::string_view::npos) {
        return false;
    }

    auto iterText = rest.substr(0, firstSep);
    uint32_t iterations = 0;
    auto [ptr, ec] = std::from_chars(iterText.data(), iterText.data() + iterText.size(), iterations);
    if (ec != std::errc{} || ptr != iterText.data() + iterText.size() || iterations == 0) {
        return false;
    }

    auto salt = rest.substr(firstSep + 1, secondSep - firstSep - 1);
    auto expected = rest.substr(secondSep + 1);

    auto computed = derive(password, salt, iterations);
    if (!computed) {
        return false;
    }
    return detail::constantTimeEqual(*computed, expected);
}

std::string PasswordHasher::generateSalt() {
    return detail::secureRandomHex(16);  // 16 bytes → 32 hex chars
}

std::optional<std::string> PasswordHasher::derive(std::string_view password,
                                                  std::string_view salt,
                                                  uint32_t iterations) {
    std::vector<uint8_t> out(kDigestLength);
    int rc = PKCS5_PBKDF2_HMAC(password.data(),
                               static_cast<int>(password.size()),
                               reinterpret_cast<const unsigned char*>(salt.data()),
                               static_cast<int>(salt.size()),
                               static_cast<int>(iterations),
                               EVP_sha256(),
                               static_cast<int>(out.size()),
                               out.data());
    if (rc != 1) {
        return std::nullopt;
    }
    return detail::toHex(out);
}

}  // namespace cis::identity
