#include "app/config_writer.h"
#include "app/options.h"
#include "control/configuration_catalog.h"
#include "control/control_server.h"
#include "control/live_control.h"
#include "control/zmq_display.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "engine/zmq_engine_client.h"
#include "logging/logger.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>

using namespace camilla_remote;

namespace {

std::atomic_bool* gStopFlag = nullptr;

void handleSignal(int) {
    if (gStopFlag) {
        gStopFlag->store(true, std::memory_order_relaxed);
    }
}

void installSignalHandlers(std::atomic_bool& stopFlag) {
    gStopFlag = &stopFlag;

    struct sigaction sa {};
    sa.sa_handler = handleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace

int main(int argc, char** argv) {
    auto parsed = app::parseOptions(argc, argv, "camilla_remote");
    if (parsed.showHelp || parsed.showVersion) {
        return 0;
    }
    if (parsed.hasError || !parsed.options) {
        std::cerr << parsed.errorMessage << std::endl;
        app::printHelp("camilla_remote");
        return 1;
    }
    const app::Options options = *parsed.options;

    logging::initializeEarly();
    logging::initializeFromConfig(options.configPath);
    if (options.logLevel) {
        logging::setLevel(logging::stringToLevel(*options.logLevel));
    }

    RemoteConfig config;
    if (!loadRemoteConfig(options.configPath, config)) {
        if (std::filesystem::exists(options.configPath)) {
            LOG_CRITICAL("Invalid configuration in {}", options.configPath);
            logging::shutdown();
            return 1;
        }
        LOG_WARN("Config {} not found, running with built-in defaults", options.configPath);
    }

    engine::ZmqEngineClient engine(config.engineTimeoutMs);
    if (!engine.connect(config.engineEndpoint)) {
        LOG_CRITICAL("Cannot connect to DSP engine at {}", config.engineEndpoint);
        logging::shutdown();
        return 1;
    }

    // Every combination must validate before the control surface goes live
    std::optional<control::ConfigurationCatalog> catalog;
    try {
        catalog = control::ConfigurationCatalog::build(config.menu, config.hardware, engine);
    } catch (const RemoteError& e) {
        LOG_CRITICAL("Catalog build failed [{}]: {}", errorCodeToString(e.code()), e.what());
        logging::shutdown();
        return 1;
    }
    LOG_INFO("Catalog ready: {} combinations", catalog->size());

    if (options.writeConfigsDir) {
        try {
            auto count = app::writeCatalogFiles(*catalog, *options.writeConfigsDir);
            LOG_INFO("Wrote {} config files to {}", count, *options.writeConfigsDir);
        } catch (const std::filesystem::filesystem_error& e) {
            LOG_CRITICAL("Writing configs failed: {}", e.what());
            logging::shutdown();
            return 1;
        }
        logging::shutdown();
        return 0;
    }

    std::atomic_bool stopRequested{false};
    installSignalHandlers(stopRequested);

    control::ControlServer server(config.controlEndpoint);
    control::ZmqDisplay display(server.eventPublisher(), config.controls.blinkIntervalMs);

    control::LiveControlDependencies deps;
    deps.engine = &engine;
    deps.catalog = &*catalog;
    deps.display = &display;
    deps.settings = config.controls;
    deps.loadMode = config.loadMode;
    deps.configDir = config.configDir;
    control::LiveControl live(deps);
    server.setLiveControl(&live);

    if (!server.start()) {
        LOG_CRITICAL("Failed to bind control endpoint {}", config.controlEndpoint);
        logging::shutdown();
        return 1;
    }

    try {
        live.start();
    } catch (const EngineError& e) {
        LOG_CRITICAL("Initial configuration push failed [{}]: {}", errorCodeToString(e.code()),
                     e.what());
        display.stopMuteBlink();
        server.stop();
        logging::shutdown();
        return 1;
    }

    LOG_INFO("camilla_remote running: '{}' / '{}' (engine {}, control {}, load mode {})",
             live.activeTopology(), live.activeSource(), config.engineEndpoint,
             server.endpoint(), loadModeToString(config.loadMode));

    while (!stopRequested.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutdown requested");
    display.stopMuteBlink();
    server.stop();
    engine.disconnect();
    logging::shutdown();
    return 0;
}
