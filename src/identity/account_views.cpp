/// @file account_views.cpp
/// @brief Account and settings projections.

#include "cis/identity/account_views.hpp"

namespace cis::identity {

PublicAccountView toPublicView(const Account& account) {
    PublicAccountView view;
    view.id = account.id;
    view.username = account.username;
    view.avatarUrl = account.avatarUrl;
    view.role = account.role;
    view.oauthProvider = account.oauthProvider;
    view.createdAt = account.createdAt;
    return view;
}

SelfAccountView toSelfView(const Account& account) {
    SelfAccountView view;
    view.id = account.id;
    view.username = account.username;
    view.avatarUrl = account.avatarUrl;
    view.role = account.role;
    view.oauthProvider = account.oauthProvider;
    view.createdAt = account.createdAt;
    view.email = account.email;
    view.active = account.active;
    view.updatedAt = account.updatedAt;
    return view;
}

SettingsView toSettingsView(const AccountSettings& settings) {
    SettingsView view;
    view.accountId = settings.accountId;
    view.hasGoogleApiKey =
        settings.googleApiKeyEncrypted.has_value() && !settings.googleApiKeyEncrypted->empty();
    view.hasMineruToken =
        settings.mineruTokenEncrypted.has_value() && !settings.mineruTokenEncrypted->empty();
    view.googleApiBase = settings.googleApiBase;
    view.mineruApiBase = settings.mineruApiBase;
    view.imageCaptionModel = settings.imageCaptionModel;
    view.maxDescriptionWorkers = settings.maxDescriptionWorkers;
    view.maxImageWorkers = settings.maxImageWorkers;
    view.createdAt = settings.createdAt;
    view.updatedAt = settings.updatedAt;
    return view;
}

}  // namespace cis::identity
