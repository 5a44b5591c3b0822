/// @file main.cpp
/// @brief Identity service entry point.
///
/// Builds the cipher, store, mailer and IdentityServer once from the YAML
/// config and keeps them alive until SIGINT or SIGTERM. Mail delivery is
/// logged rather than sent.

#include "cis/foundation/config_manager.hpp"
#include "cis/foundation/service_logger.hpp"
#include "cis/identity/identity_server.hpp"
#include "cis/identity/mailer.hpp"
#include "cis/service/service_runner.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    using cis::foundation::LogCategory;

    cis::service::SignalHandler signals;

    // Resolve config path: --config flag > CIS_CONFIG_PATH env > default.
    auto configPath = cis::service::resolveConfigPath(cis::service::parseConfigArg(argc, argv));

    cis::foundation::ConfigManager config;
    auto loadResult = cis::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto cipher = cis::service::buildCipher(config);
    if (!cipher) {
        std::cerr << "Invalid encryption key: " << cipher.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto store = cis::service::buildStore(config);
    if (!store) {
        std::cerr << "Failed to open identity store: " << store.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto serverConfig = cis::service::buildServerConfig(config);
    if (serverConfig.identity.signingKey.empty()) {
        std::cerr << "identity.signing_key must be set\n";
        return EXIT_FAILURE;
    }

    cis::identity::IdentityServer server(std::move(serverConfig), std::move(store).value(),
                                         std::move(cipher).value(),
                                         std::make_shared<cis::identity::LoggingMailer>());

    CIS_LOG_INFO(LogCategory::Core, "identity service started (config: " + configPath.string() + ")");
    std::cout << "Identity service started (config: " << configPath.string() << ")\n";

    signals.waitForShutdown();

    CIS_LOG_INFO(LogCategory::Core, "identity service stopped");
    std::cout << "Identity service stopped\n";
    return EXIT_SUCCESS;
}
