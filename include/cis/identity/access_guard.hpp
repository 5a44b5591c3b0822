#pragma once

/// @file access_guard.hpp
/// @brief Bearer-token access checks producing an explicit Identity.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/identity_types.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace cis::identity {

class CredentialManager;

/// The authenticated caller, resolved against the live account.
struct Identity {
    Account account;
    TokenClaims claims;

    [[nodiscard]] bool isAdmin() const noexcept { return account.role == AccountRole::Admin; }
};

/// Guard stage run before a handler.
///
/// Takes the raw Authorization header value ("Bearer <token>") and yields
/// the Identity the handler receives as an argument.
///
/// Example:
/// @code
///   auto identity = guard.requireIdentity(request.header("Authorization"));
///   if (!identity) {
///       return reject(publicMessage(identity.error()));
///   }
///   handleProfile(identity.value());
/// @endcode
class AccessGuard {
public:
    AccessGuard(std::shared_ptr<const CredentialManager> credentials,
                std::shared_ptr<IIdentityStore> store);

    /// Fails with AuthenticationFailed (no/malformed header, unknown
    /// account), InvalidToken, TokenExpired or AccountDisabled.
    [[nodiscard]] foundation::ServiceResult<Identity> requireIdentity(
        std::string_view authorization) const;

    /// Same checks, but any failure yields std::nullopt.
    [[nodiscard]] std::optional<Identity> optionalIdentity(std::string_view authorization) const;

    /// requireIdentity() plus PermissionDenied for non-admin accounts.
    [[nodiscard]] foundation::ServiceResult<Identity> requireAdmin(
        std::string_view authorization) const;

    /// Token part of a "Bearer <token>" header value.
    [[nodiscard]] static std::optional<std::string_view> extractBearer(
        std::string_view authorization);

private:
    std::shared_ptr<const CredentialManager> credentials_;
    std::shared_ptr<IIdentityStore> store_;
};

}  // namespace cis::identity
