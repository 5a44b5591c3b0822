/// @file token_provider.cpp
/// @brief TokenProvider implementation with HS256 JWT signing.
///
/// Token format (RFC 7519):
///   base64url(header) . base64url(payload) . base64url(signature)
///
/// Header:  {"alg":"HS256","typ":"JWT"}
/// Payload: {"sub":"...","usr":"...","role":"...","typ":"...","jti":"...","iat":N,"exp":N}

#include "cis/identity/token_provider.hpp"

#include "crypto_utils.hpp"

#include <charconv>
#include <sstream>
#include <string>
#include <vector>

namespace cis::identity {

using foundation::ErrorCode;
using foundation::ServiceError;
using foundation::ServiceResult;

// ---------------------------------------------------------------------------
// Minimal JSON helpers (flat objects only)
// ---------------------------------------------------------------------------
namespace {

constexpr std::string_view kHeader = R"({"alg":"HS256","typ":"JWT"})";

std::string jsonEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    out.push_back('"');
    return out;
}

int64_t toEpoch(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromEpoch(int64_t epoch) {
    return TimePoint(std::chrono::seconds(epoch));
}

std::vector<std::string> split(std::string_view s, char delim) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

/// Extract a JSON string value by key, undoing jsonEscape().
std::optional<std::string> extractJsonString(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":\"";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();

    std::string value;
    for (; pos < json.size(); ++pos) {
        char c = json[pos];
        if (c == '"') {
            return value;
        }
        if (c == '\\' && pos + 1 < json.size()) {
            char next = json[++pos];
            switch (next) {
                case 'n': value.push_back('\n'); break;
                case 'r': value.push_back('\r'); break;
                case 't': value.push_back('\t'); break;
                default: value.push_back(next); break;
            }
            continue;
        }
        value.push_back(c);
    }
    return std::nullopt;
}

std::optional<int64_t> extractJsonInt(std::string_view json, std::string_view key) {
    std::string needle = "\"" + std::string(key) + "\":";
    auto pos = json.find(needle);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    pos += needle.size();
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t')) {
        ++pos;
    }
    int64_t result = 0;
    auto [ptr, ec] = std::from_chars(json.data() + pos, json.data() + json.size(), result);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return result;
}

ServiceResult<TokenClaims> invalid(std::string message) {
    return ServiceResult<TokenClaims>::err(
        ServiceError(ErrorCode::InvalidToken, std::move(message)));
}

}  // anonymous namespace

// ---------------------------------------------------------------------------
// TokenProvider
// ---------------------------------------------------------------------------

TokenProvider::TokenProvider(const IdentityConfig& config, Clock clock)
    : signingKey_(config.signingKey), clock_(std::move(clock)) {}

std::string TokenProvider::generateToken(const TokenClaims& claims,
                                         std::chrono::seconds expiry) const {
    auto encodedHeader = detail::base64urlEncode(kHeader);

    auto now = clock_();
    auto issuedAt = claims.issuedAt.time_since_epoch().count() > 0 ? claims.issuedAt : now;
    auto iat = toEpoch(issuedAt);
    auto exp = toEpoch(issuedAt + expiry);

    auto jti = detail::secureRandomHex(16);  // 16 bytes -> 32 hex chars

    std::ostringstream payload;
    payload << "{\"sub\":" << jsonEscape(claims.subject)
            << ",\"usr\":" << jsonEscape(claims.username)
            << ",\"role\":" << jsonEscape(accountRoleName(claims.role))
            << ",\"typ\":" << jsonEscape(claims.tokenType)
            << ",\"jti\":" << jsonEscape(jti) << ",\"iat\":" << iat << ",\"exp\":" << exp << "}";

    auto encodedPayload = detail::base64urlEncode(payload.str());
    std::string signingInput = encodedHeader + "." + encodedPayload;

    auto mac = detail::hmacSha256(signingKey_, signingInput);
    return signingInput + "." + detail::base64urlEncode(mac.data(), mac.size());
}

ServiceResult<TokenClaims> TokenProvider::validate(std::string_view token,
                                                   std::string_view expectedType) const {
    auto parts = split(token, '.');
    if (parts.size() != 3) {
        return invalid("malformed JWT: expected 3 parts");
    }

    auto headerJson = detail::base64urlDecodeString(parts[0]);
    if (extractJsonString(headerJson, "alg").value_or("") != "HS256") {
        return invalid("unsupported JWT algorithm");
    }

    std::string signingInput = parts[0] + "." + parts[1];
    auto expectedMac = detail::hmacSha256(signingKey_, signingInput);
    auto expectedSig = detail::base64urlEncode(expectedMac.data(), expectedMac.size());
    if (!detail::constantTimeEqual(expectedSig, parts[2])) {
        return invalid("invalid HS256 signature");
    }

    auto payloadJson = detail::base64urlDecodeString(parts[1]);
    if (payloadJson.empty()) {
        return invalid("failed to decode payload");
    }

    auto subject = extractJsonString(payloadJson, "sub");
    auto type = extractJsonString(payloadJson, "typ");
    auto role = parseAccountRole(extractJsonString(payloadJson, "role").value_or(""));
    auto iat = extractJsonInt(payloadJson, "iat");
    auto exp = extractJsonInt(payloadJson, "exp");
    if (!subject || subject->empty() || !type || !role || !iat || !exp) {
        return invalid("missing required claims");
    }

    TokenClaims claims;
    claims.subject = std::move(*subject);
    claims.username = extractJsonString(payloadJson, "usr").value_or("");
    claims.role = *role;
    claims.tokenType = std::move(*type);
    claims.jti = extractJsonString(payloadJson, "jti").value_or("");
    claims.issuedAt = fromEpoch(*iat);
    claims.expiresAt = fromEpoch(*exp);

    if (clock_() >= claims.expiresAt) {
        return ServiceResult<TokenClaims>::err(
            ServiceError(ErrorCode::TokenExpired, "token has expired"));
    }

    if (claims.tokenType != expectedType) {
        return invalid("unexpected token type: " + claims.tokenType);
    }

    return ServiceResult<TokenClaims>::ok(std::move(claims));
}

}  // namespace cis::identity
