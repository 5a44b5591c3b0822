#pragma once

/// @file token_provider.hpp
/// @brief HS256 JWT generation and validation for access and refresh tokens.
///
/// Both token kinds are signed JWTs; the "typ" claim distinguishes them so a
/// refresh token is never accepted where an access token is expected.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_types.hpp"

#include <string>
#include <string_view>

namespace cis::identity {

/// JWT token provider.
///
/// Example:
/// @code
///   IdentityConfig config;
///   TokenProvider provider(config);
///   auto token = provider.generateToken(claims, std::chrono::seconds{900});
///   auto result = provider.validate(token, kAccessTokenType);
/// @endcode
class TokenProvider {
public:
    explicit TokenProvider(const IdentityConfig& config, Clock clock = systemClock());

    /// Sign a JWT from the given claims.
    ///
    /// issuedAt defaults to now; a fresh random "jti" is always assigned.
    [[nodiscard]] std::string generateToken(const TokenClaims& claims,
                                            std::chrono::seconds expiry) const;

    /// Validate signature, expiry and token type, returning the claims.
    ///
    /// Fails with InvalidToken (malformed, bad signature, wrong type) or
    /// TokenExpired.
    [[nodiscard]] foundation::ServiceResult<TokenClaims> validate(
        std::string_view token, std::string_view expectedType) const;

private:
    std::string signingKey_;
    Clock clock_;
};

}  // namespace cis::identity
