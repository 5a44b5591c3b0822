#pragma once

/// @file account_views.hpp
/// @brief Outward projections of accounts and settings.
///
/// Projections never carry a password hash or a secret value, encrypted
/// or not.

#include "cis/identity/identity_types.hpp"

#include <optional>
#include <string>

namespace cis::identity {

/// What any caller may see about an account.
struct PublicAccountView {
    AccountId id = 0;
    std::string username;
    std::optional<std::string> avatarUrl;
    AccountRole role = AccountRole::User;
    std::optional<std::string> oauthProvider;
    TimePoint createdAt{};
};

/// What the account owner sees about themselves.
struct SelfAccountView {
    AccountId id = 0;
    std::string username;
    std::optional<std::string> avatarUrl;
    AccountRole role = AccountRole::User;
    std::optional<std::string> oauthProvider;
    TimePoint createdAt{};
    std::string email;
    bool active = true;
    TimePoint updatedAt{};
};

/// Stored overrides with secrets reduced to presence flags.
struct SettingsView {
    AccountId accountId = 0;
    bool hasGoogleApiKey = false;
    bool hasMineruToken = false;
    std::optional<std::string> googleApiBase;
    std::optional<std::string> mineruApiBase;
    std::optional<std::string> imageCaptionModel;
    std::optional<int> maxDescriptionWorkers;
    std::optional<int> maxImageWorkers;
    TimePoint createdAt{};
    TimePoint updatedAt{};
};

[[nodiscard]] PublicAccountView toPublicView(const Account& account);
[[nodiscard]] SelfAccountView toSelfView(const Account& account);
[[nodiscard]] SettingsView toSettingsView(const AccountSettings& settings);

}  // namespace cis::identity
