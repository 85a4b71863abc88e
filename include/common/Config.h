#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace spotbot {

class Config {
public:
    static Config& getInstance();

    // Optional JSON file supplies defaults, environment variables override.
    // Throws ConfigError when the merged settings are invalid.
    void load(const std::string& config_path);

    // Parse a flat key/value set (environment-style names). Throws ConfigError.
    static engine::EngineConfig parse(const std::map<std::string, std::string>& values);

    // Every key the bot understands.
    static const std::vector<std::string>& knownKeys();

    // Seconds for a Binance kline interval ("5m" -> 300), -1 if unknown.
    static int timeframeToSeconds(const std::string& timeframe);

    std::string getApiKey() const { return api_key_; }
    std::string getApiSecret() const { return api_secret_; }
    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    bool isLoaded() const { return loaded_; }

private:
    Config() = default;

    std::string api_key_;
    std::string api_secret_;
    engine::EngineConfig engine_config_;
    bool loaded_ = false;
};

} // namespace spotbot
