/// @file access_guard.cpp
/// @brief AccessGuard implementation.

#include "cis/identity/access_guard.hpp"

#include "cis/foundation/service_logger.hpp"
#include "cis/identity/credential_manager.hpp"

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

AccessGuard::AccessGuard(std::shared_ptr<const CredentialManager> credentials,
                         std::shared_ptr<IIdentityStore> store)
    : credentials_(std::move(credentials)), store_(std::move(store)) {}

std::optional<std::string_view> AccessGuard::extractBearer(std::string_view authorization) {
    constexpr std::string_view kPrefix = "Bearer ";
    if (authorization.size() <= kPrefix.size() ||
        authorization.substr(0, kPrefix.size()) != kPrefix) {
        return std::nullopt;
    }
    auto token = authorization.substr(kPrefix.size());
    while (!token.empty() && token.front() == ' ') {
        token.remove_prefix(1);
    }
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

ServiceResult<Identity> AccessGuard::requireIdentity(std::string_view authorization) const {
    auto token = extractBearer(authorization);
    if (!token) {
        return ServiceResult<Identity>::err(
            ServiceError(ErrorCode::AuthenticationFailed, "missing bearer token"));
    }

    auto claims = credentials_->validateAccessToken(*token);
    if (claims.hasError()) {
        return claims.propagate<Identity>();
    }

    auto id = parseAccountId(claims.value().subject);
    if (!id) {
        return ServiceResult<Identity>::err(
            ServiceError(ErrorCode::InvalidToken, "token subject is not an account id"));
    }

    auto found = store_->findAccountById(*id);
    if (found.hasError()) {
        return found.propagate<Identity>();
    }
    if (!found.value()) {
        return ServiceResult<Identity>::err(
            ServiceError(ErrorCode::AuthenticationFailed, "account not found"));
    }
    if (!found.value()->active) {
        return ServiceResult<Identity>::err(
            ServiceError(ErrorCode::AccountDisabled, "account is disabled"));
    }

    return ServiceResult<Identity>::ok(
        Identity{std::move(*found.value()), std::move(claims).value()});
}

std::optional<Identity> AccessGuard::optionalIdentity(std::string_view authorization) const {
    if (!extractBearer(authorization)) {
        return std::nullopt;
    }
    auto identity = requireIdentity(authorization);
    if (identity.hasError()) {
        if (foundation::isStorageError(identity.error().code())) {
            CIS_LOG_WARN(LogCategory::Auth,
                         "optional identity lookup failed: " +
                             std::string(identity.error().message()));
        }
        return std::nullopt;
    }
    return std::move(identity).value();
}

ServiceResult<Identity> AccessGuard::requireAdmin(std::string_view authorization) const {
    auto identity = requireIdentity(authorization);
    if (identity.hasError()) {
        return identity;
    }
    if (!identity.value().isAdmin()) {
        return ServiceResult<Identity>::err(
            ServiceError(ErrorCode::PermissionDenied, "admin access required"));
    }
    return identity;
}

}  // namespace cis::identity
