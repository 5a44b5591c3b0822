/// @file secret_cipher.cpp
/// @brief SecretCipher implementation using the OpenSSL EVP AES-256-GCM API.

#include "cis/identity/secret_cipher.hpp"

#include "cis/foundation/service_logger.hpp"

#include "crypto_utils.hpp"

#include <openssl/evp.h>

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

constexpr uint8_t kTokenVersion = 0x01;
constexpr std::size_t kKeyLength = 32;
constexpr std::size_t kNonceLength = 12;
constexpr std::size_t kTagLength = 16;

/// Owns an EVP_CIPHER_CTX for the duration of one operation.
struct CipherCtx {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    ~CipherCtx() { EVP_CIPHER_CTX_free(ctx); }
    CipherCtx() = default;
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
};

ServiceResult<std::string> invalidSecret(std::string message) {
    return ServiceResult<std::string>::err(
        ServiceError(ErrorCode::InvalidSecret, std::move(message)));
}

}  // anonymous namespace

SecretCipher::SecretCipher(PrivateTag, std::vector<uint8_t> key, bool ephemeral)
    : key_(std::move(key)), ephemeral_(ephemeral) {}

ServiceResult<std::shared_ptr<const SecretCipher>> SecretCipher::fromKey(
    std::string_view encodedKey) {
    using R = ServiceResult<std::shared_ptr<const SecretCipher>>;

    std::vector<uint8_t> key;
    if (!detail::base64urlDecode(encodedKey, key) || key.size() != kKeyLength) {
        return R::err(ServiceError(ErrorCode::InvalidEncryptionKey,
                                   "encryption key must be 32 bytes, base64url-encoded"));
    }
    return R::ok(std::make_shared<const SecretCipher>(PrivateTag{}, std::move(key), false));
}

ServiceResult<std::shared_ptr<const SecretCipher>> SecretCipher::create(
    std::string_view encodedKey) {
    using R = ServiceResult<std::shared_ptr<const SecretCipher>>;

    if (!encodedKey.empty()) {
        return fromKey(encodedKey);
    }

    std::vector<uint8_t> key;
    if (!detail::secureRandomBytes(key, kKeyLength)) {
        return R::err(ServiceError(ErrorCode::EncryptionFailed,
                                   "system RNG unavailable for key generation"));
    }

    CIS_LOG_WARN(LogCategory::Cipher,
                 "no encryption key configured; generated an ephemeral key for this process. "
                 "Secrets stored by a previous process will NOT decrypt. "
                 "Set identity.encryption_key to a persistent key.");

    return R::ok(std::make_shared<const SecretCipher>(PrivateTag{}, std::move(key), true));
}

ServiceResult<std::string> SecretCipher::generateKey() {
    std::vector<uint8_t> key;
    if (!detail::secureRandomBytes(key, kKeyLength)) {
        return ServiceResult<std::string>::err(
            ServiceError(ErrorCode::EncryptionFailed, "system RNG unavailable"));
    }
    return ServiceResult<std::string>::ok(detail::base64urlEncode(key));
}

ServiceResult<std::optional<std::string>> SecretCipher::encrypt(std::string_view plaintext) const {
    using R = ServiceResult<std::optional<std::string>>;

    if (plaintext.empty()) {
        return R::ok(std::nullopt);
    }

    std::vector<uint8_t> nonce;
    if (!detail::secureRandomBytes(nonce, kNonceLength)) {
        return R::err(ServiceError(ErrorCode::EncryptionFailed, "system RNG unavailable"));
    }

    CipherCtx c;
    if (c.ctx == nullptr ||
        EVP_EncryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceLength),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(c.ctx, nullptr, nullptr, key_.data(), nonce.data()) != 1) {
        return R::err(ServiceError(ErrorCode::EncryptionFailed, "cipher initialisation failed"));
    }

    std::vector<uint8_t> out;
    out.reserve(1 + kNonceLength + plaintext.size() + kTagLength);
    out.push_back(kTokenVersion);
    out.insert(out.end(), nonce.begin(), nonce.end());

    std::size_t ctOffset = out.size();
    out.resize(ctOffset + plaintext.size());
    int len = 0;
    if (EVP_EncryptUpdate(c.ctx, out.data() + ctOffset, &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return R::err(ServiceError(ErrorCode::EncryptionFailed, "encryption failed"));
    }
    int finalLen = 0;
    if (EVP_EncryptFinal_ex(c.ctx, out.data() + ctOffset + len, &finalLen) != 1) {
        return R::err(ServiceError(ErrorCode::EncryptionFailed, "encryption failed"));
    }
    out.resize(ctOffset + static_cast<std::size_t>(len + finalLen));

    std::size_t tagOffset = out.size();
    out.resize(tagOffset + kTagLength);
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagLength),
                            out.data() + tagOffset) != 1) {
        return R::err(ServiceError(ErrorCode::EncryptionFailed, "failed to read GCM tag"));
    }

    return R::ok(detail::base64urlEncode(out));
}

ServiceResult<std::string> SecretCipher::decrypt(std::string_view token) const {
    std::vector<uint8_t> raw;
    if (!detail::base64urlDecode(token, raw)) {
        return invalidSecret("secret token is not valid base64url");
    }
    if (raw.size() < 1 + kNonceLength + kTagLength || raw[0] != kTokenVersion) {
        return invalidSecret("secret token is truncated or of unknown version");
    }

    const uint8_t* nonce = raw.data() + 1;
    const uint8_t* ct = nonce + kNonceLength;
    std::size_t ctLen = raw.size() - 1 - kNonceLength - kTagLength;
    std::vector<uint8_t> tag(raw.end() - static_cast<std::ptrdiff_t>(kTagLength), raw.end());

    CipherCtx c;
    if (c.ctx == nullptr ||
        EVP_DecryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceLength),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(c.ctx, nullptr, nullptr, key_.data(), nonce) != 1) {
        return invalidSecret("cipher initialisation failed");
    }

    std::string plaintext(ctLen, '\0');
    int len = 0;
    if (ctLen > 0 &&
        EVP_DecryptUpdate(c.ctx, reinterpret_cast<unsigned char*>(plaintext.data()), &len, ct,
                          static_cast<int>(ctLen)) != 1) {
        return invalidSecret("decryption failed");
    }

    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagLength),
                            tag.data()) != 1) {
        return invalidSecret("failed to set GCM tag");
    }

    int finalLen = 0;
    if (EVP_DecryptFinal_ex(c.ctx, reinterpret_cast<unsigned char*>(plaintext.data()) + len,
                            &finalLen) != 1) {
        return invalidSecret("secret token failed authentication");
    }
    plaintext.resize(static_cast<std::size_t>(len + finalLen));
    return ServiceResult<std::string>::ok(std::move(plaintext));
}

}  // namespace cis::identity
