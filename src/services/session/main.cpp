/// @file main.cpp
/// @brief Session service entry point.
///
/// `csync_session --config <path>`. The host role owns the session and
/// serves peers; the client role mirrors a host into a local board.

#include <cstdlib>
#include <iostream>

#include "csync/foundation/config_manager.hpp"
#include "csync/foundation/game_logger.hpp"
#include "csync/service/service_runner.hpp"
#include "csync/service/session_host.hpp"
#include "csync/service/session_settings.hpp"

namespace {

int runHost(const csync::service::SessionSettings& settings,
            csync::foundation::ConfigManager& config,
            const csync::service::SignalHandler& signals) {
    csync::service::SessionHost host(settings);
    host.watchConfig(config);

    auto started = host.start();
    if (!started) {
        std::cerr << "Failed to start session host: "
                  << started.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Session host listening on port " << settings.port
              << " (tick_rate: " << settings.tickRate << " Hz, autosave: "
              << (settings.autoSave.enabled ? "on" : "off") << ")\n";

    signals.waitForShutdown();

    std::cout << "Shutting down session host...\n";
    host.stop();
    std::cout << "Session host stopped\n";
    return EXIT_SUCCESS;
}

int runPeer(const csync::service::SessionSettings& settings,
            const csync::service::SignalHandler& signals) {
    csync::service::SessionPeer peer(settings);

    auto started = peer.start();
    if (!started) {
        std::cerr << "Failed to join session: " << started.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Connected to " << settings.host << ":" << settings.port << "\n";

    signals.waitForShutdown();

    std::cout << "Leaving session...\n";
    peer.stop();
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
    csync::service::SignalHandler signals;

    auto configPath = csync::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = csync::service::kDefaultConfigPath;
    }

    csync::foundation::ConfigManager config;
    auto loadResult = csync::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: "
                  << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = csync::service::SessionSettings::fromConfig(config);
    if (!settings) {
        std::cerr << "Invalid config: " << settings.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    settings.value().applyLogging(csync::foundation::GameLogger::instance());

    if (settings.value().role == csync::service::SessionRole::Host) {
        return runHost(settings.value(), config, signals);
    }
    return runPeer(settings.value(), signals);
}
