#pragma once

/// @file oauth_identity_resolver.hpp
/// @brief Maps external identity-provider users onto local accounts.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/identity_types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace cis::identity {

/// Identity asserted by an external provider after a successful OAuth flow.
struct ExternalIdentity {
    std::string provider;     ///< e.g. "google"
    std::string externalId;   ///< Provider-scoped user id
    std::string email;
    std::string displayName;
    std::string avatarUrl;
};

/// Resolves an external identity to a local account.
///
/// Resolution order:
///  1. an account already linked to (provider, externalId);
///  2. an account with the same email, which gets the identity linked onto
///     it (the provider is trusted to have verified the email);
///  3. a new password-less account with a username derived from the
///     display name.
class OAuthIdentityResolver {
public:
    explicit OAuthIdentityResolver(std::shared_ptr<IIdentityStore> store,
                                   Clock clock = systemClock());

    [[nodiscard]] foundation::ServiceResult<Account> resolve(const ExternalIdentity& identity);

    /// Lowercased display name with spaces replaced by underscores.
    /// Falls back to the email local part when the name is blank.
    [[nodiscard]] static std::string baseUsername(std::string_view displayName,
                                                  std::string_view email);

private:
    [[nodiscard]] foundation::ServiceResult<std::string> uniqueUsername(
        const std::string& base) const;

    [[nodiscard]] foundation::ServiceResult<Account> createAccount(
        const ExternalIdentity& identity, const std::string& normalizedEmail);

    std::shared_ptr<IIdentityStore> store_;
    Clock clock_;
};

}  // namespace cis::identity
