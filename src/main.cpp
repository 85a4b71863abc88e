#include "common/Config.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "core/state/EventJournalJsonl.h"
#include "engine/TradingEngine.h"
#include "exchange/BinanceGateway.h"
#include "execution/RateLimiter.h"
#include "network/BinanceHttpClient.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace spotbot;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested = true;
    }
}

std::filesystem::path resolvePath(const std::string& path) {
    std::filesystem::path p(path);
    return p.is_absolute() ? p : utils::PathUtils::resolveRelativePath(path);
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const std::string config_path = argc > 1 ? argv[1] : "config/config.json";

    auto& config = Config::getInstance();
    try {
        config.load(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    const auto engine_config = config.getEngineConfig();

    try {
        Logger::getInstance().initialize(engine_config.log_dir, engine_config.log_level);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    LOG_INFO("========================================");
    LOG_INFO("spotbot starting");
    LOG_INFO("========================================");

    try {
        auto rate_limiter = std::make_shared<execution::RateLimiter>();
        auto http_client = std::make_shared<network::BinanceHttpClient>(
            config.getApiKey(), config.getApiSecret(), engine_config.sandbox_mode, rate_limiter);
        auto gateway = std::make_shared<exchange::BinanceGateway>(http_client);
        auto journal = std::make_shared<core::EventJournalJsonl>(resolvePath(engine_config.journal_path));

        engine::TradingEngine engine(engine_config, gateway, journal);
        engine.recoverPositions();

        if (!engine.start()) {
            LOG_ERROR("Engine failed to start");
            return 1;
        }

        while (!g_shutdown_requested) {
            if (engine.allSuspended()) {
                LOG_ERROR("Every pair is suspended, shutting down");
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        if (g_shutdown_requested) {
            LOG_INFO("Shutdown signal received");
        }
        engine.stop();
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        Logger::getInstance().flush();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        Logger::getInstance().flush();
        return 1;
    }

    LOG_INFO("spotbot stopped");
    Logger::getInstance().flush();
    return 0;
}
