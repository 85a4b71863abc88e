#include "common/Config.h"
#include "common/Errors.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>

namespace spotbot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

// Flattens one JSON config value to its environment-style string form.
std::string jsonValueToString(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_array()) {
        std::ostringstream oss;
        bool first = true;
        for (const auto& item : value) {
            if (!first) oss << ",";
            oss << jsonValueToString(item);
            first = false;
        }
        return oss.str();
    }
    return value.dump();
}

class ValueReader {
public:
    explicit ValueReader(const std::map<std::string, std::string>& values)
        : values_(values) {}

    bool has(const std::string& key) const {
        auto it = values_.find(key);
        return it != values_.end() && !trimCopy(it->second).empty();
    }

    std::string str(const std::string& key, const std::string& def) const {
        auto it = values_.find(key);
        if (it == values_.end()) return def;
        const std::string v = trimCopy(it->second);
        return v.empty() ? def : v;
    }

    double number(const std::string& key, double def) const {
        if (!has(key)) return def;
        const std::string raw = str(key, "");
        try {
            size_t used = 0;
            const double v = std::stod(raw, &used);
            if (used != raw.size()) {
                throw ConfigError(key + " is not a number: '" + raw + "'");
            }
            return v;
        } catch (const std::invalid_argument&) {
            throw ConfigError(key + " is not a number: '" + raw + "'");
        } catch (const std::out_of_range&) {
            throw ConfigError(key + " is out of range: '" + raw + "'");
        }
    }

    int integer(const std::string& key, int def) const {
        const double v = number(key, static_cast<double>(def));
        if (v != static_cast<double>(static_cast<int>(v))) {
            throw ConfigError(key + " must be an integer");
        }
        return static_cast<int>(v);
    }

    bool flag(const std::string& key, bool def) const {
        if (!has(key)) return def;
        const std::string v = toLowerCopy(str(key, ""));
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
        throw ConfigError(key + " is not a boolean: '" + v + "'");
    }

private:
    const std::map<std::string, std::string>& values_;
};

void requireFraction(const std::string& key, double v) {
    if (!(v > 0.0 && v < 1.0)) {
        throw ConfigError(key + " must be within (0, 1), got " + std::to_string(v));
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

const std::vector<std::string>& Config::knownKeys() {
    static const std::vector<std::string> kKeys = {
        "API_KEY", "API_SECRET", "SANDBOX_MODE", "TRADING_PAIRS", "STRATEGY",
        "TRADE_INTERVAL", "STOP_LOSS_PERCENTAGE", "PROFIT_TARGET_PERCENTAGE",
        "PERCENTAGE_OF_BALANCE", "MM_SPREAD_PERCENTAGE", "MM_ORDER_SIZE",
        "MOVING_EMA_TIMEFRAME", "EMA_PERIOD", "DOWNTREND_PROTECT", "BUY_ONLY",
        "DOWNTREND_EXIT_POLICY", "TRADING_FEE", "MAX_CONSECUTIVE_FAILURES",
        "ENTRY_TIMEOUT_MULTIPLE", "REQUOTE_THRESHOLD_RATIO", "STARTUP_STAGGER_SECONDS",
        "CANCEL_QUOTES_ON_SHUTDOWN", "JOURNAL_PATH", "LOG_DIR", "LOG_LEVEL"
    };
    return kKeys;
}

int Config::timeframeToSeconds(const std::string& timeframe) {
    static const std::map<std::string, int> kIntervals = {
        {"1m", 60}, {"3m", 180}, {"5m", 300}, {"15m", 900}, {"30m", 1800},
        {"1h", 3600}, {"2h", 7200}, {"4h", 14400}, {"6h", 21600}, {"8h", 28800},
        {"12h", 43200}, {"1d", 86400}
    };
    auto it = kIntervals.find(timeframe);
    return it == kIntervals.end() ? -1 : it->second;
}

engine::EngineConfig Config::parse(const std::map<std::string, std::string>& values) {
    ValueReader r(values);
    engine::EngineConfig cfg;

    if (!r.has("API_KEY") || !r.has("API_SECRET")) {
        throw ConfigError("API_KEY and API_SECRET must be set");
    }

    cfg.sandbox_mode = r.flag("SANDBOX_MODE", true);

    // Pairs
    std::set<TradingPair> seen;
    std::stringstream pairs(r.str("TRADING_PAIRS", "ADA/USDT,CKB/USDT"));
    std::string token;
    while (std::getline(pairs, token, ',')) {
        token = trimCopy(token);
        if (token.empty()) continue;
        TradingPair pair;
        try {
            pair = TradingPair::parse(token);
        } catch (const std::invalid_argument& e) {
            throw ConfigError(std::string("TRADING_PAIRS: ") + e.what());
        }
        if (!seen.insert(pair).second) {
            throw ConfigError("TRADING_PAIRS lists " + pair.toString() + " twice");
        }
        cfg.trading_pairs.push_back(pair);
    }
    if (cfg.trading_pairs.empty()) {
        throw ConfigError("TRADING_PAIRS is empty");
    }

    // Strategy selection
    auto& s = cfg.strategy;
    const std::string strategy_name = toLowerCopy(r.str("STRATEGY", "scalping"));
    if (strategy_name == "scalping") {
        s.kind = strategy::StrategyKind::SCALPING;
    } else if (strategy_name == "market_making") {
        s.kind = strategy::StrategyKind::MARKET_MAKING;
    } else if (strategy_name == "trend_following") {
        s.kind = strategy::StrategyKind::TREND_FOLLOWING;
    } else {
        throw ConfigError("STRATEGY must be scalping|market_making|trend_following, got '" + strategy_name + "'");
    }

    s.trade_interval_seconds = r.integer("TRADE_INTERVAL", 30);
    if (s.trade_interval_seconds <= 0) {
        throw ConfigError("TRADE_INTERVAL must be positive");
    }
    s.entry_timeout_multiple = r.integer("ENTRY_TIMEOUT_MULTIPLE", 3);
    if (s.entry_timeout_multiple <= 0) {
        throw ConfigError("ENTRY_TIMEOUT_MULTIPLE must be positive");
    }

    s.stop_loss_pct = r.number("STOP_LOSS_PERCENTAGE", 0.015);
    s.profit_target_pct = r.number("PROFIT_TARGET_PERCENTAGE", 0.005);
    s.percentage_of_balance = r.number("PERCENTAGE_OF_BALANCE", 0.05);
    s.trading_fee = r.number("TRADING_FEE", 0.001);
    requireFraction("STOP_LOSS_PERCENTAGE", s.stop_loss_pct);
    requireFraction("PROFIT_TARGET_PERCENTAGE", s.profit_target_pct);
    if (!(s.percentage_of_balance > 0.0 && s.percentage_of_balance <= 1.0)) {
        throw ConfigError("PERCENTAGE_OF_BALANCE must be within (0, 1]");
    }
    if (s.trading_fee < 0.0 || s.trading_fee >= 1.0) {
        throw ConfigError("TRADING_FEE must be within [0, 1)");
    }

    s.mm_spread_pct = r.number("MM_SPREAD_PERCENTAGE", 0.025);
    s.mm_order_size = r.number("MM_ORDER_SIZE", 0.0);
    s.requote_threshold_ratio = r.number("REQUOTE_THRESHOLD_RATIO", 0.5);
    if (s.kind == strategy::StrategyKind::MARKET_MAKING) {
        requireFraction("MM_SPREAD_PERCENTAGE", s.mm_spread_pct);
        if (s.mm_spread_pct < 2.0 * s.trading_fee) {
            throw ConfigError("MM_SPREAD_PERCENTAGE (" + std::to_string(s.mm_spread_pct) +
                              ") is too low to cover round-trip fees (" +
                              std::to_string(2.0 * s.trading_fee) + ")");
        }
        if (!(s.mm_order_size > 0.0)) {
            throw ConfigError("MM_ORDER_SIZE must be set to a positive quantity for market_making");
        }
        if (!(s.requote_threshold_ratio > 0.0)) {
            throw ConfigError("REQUOTE_THRESHOLD_RATIO must be positive");
        }
    }

    s.ema_timeframe = toLowerCopy(r.str("MOVING_EMA_TIMEFRAME", "5m"));
    s.ema_timeframe_seconds = timeframeToSeconds(s.ema_timeframe);
    if (s.ema_timeframe_seconds < 0) {
        throw ConfigError("MOVING_EMA_TIMEFRAME '" + s.ema_timeframe + "' is not a supported kline interval");
    }
    s.ema_period = r.integer("EMA_PERIOD", 5);
    if (s.ema_period < 2) {
        throw ConfigError("EMA_PERIOD must be at least 2");
    }

    s.downtrend_protect = r.flag("DOWNTREND_PROTECT", false);
    s.buy_only = r.flag("BUY_ONLY", false);
    const std::string policy = toLowerCopy(r.str("DOWNTREND_EXIT_POLICY", ""));
    if (policy.empty()) {
        s.downtrend_exit_policy = strategy::DowntrendExitPolicy::UNSET;
    } else if (policy == "force_exit") {
        s.downtrend_exit_policy = strategy::DowntrendExitPolicy::FORCE_EXIT;
    } else if (policy == "hold") {
        s.downtrend_exit_policy = strategy::DowntrendExitPolicy::HOLD;
    } else {
        throw ConfigError("DOWNTREND_EXIT_POLICY must be force_exit|hold, got '" + policy + "'");
    }
    if (s.kind == strategy::StrategyKind::TREND_FOLLOWING && s.downtrend_protect && s.buy_only &&
        s.downtrend_exit_policy == strategy::DowntrendExitPolicy::UNSET) {
        throw ConfigError("DOWNTREND_PROTECT and BUY_ONLY are both enabled: set DOWNTREND_EXIT_POLICY "
                          "to force_exit or hold to decide what happens to an open position on a downtrend");
    }

    cfg.max_consecutive_failures = r.integer("MAX_CONSECUTIVE_FAILURES", 5);
    if (cfg.max_consecutive_failures <= 0) {
        throw ConfigError("MAX_CONSECUTIVE_FAILURES must be positive");
    }
    cfg.startup_stagger_seconds = r.integer("STARTUP_STAGGER_SECONDS", 5);
    if (cfg.startup_stagger_seconds < 0) {
        throw ConfigError("STARTUP_STAGGER_SECONDS must not be negative");
    }
    cfg.cancel_quotes_on_shutdown = r.flag("CANCEL_QUOTES_ON_SHUTDOWN", true);

    cfg.journal_path = r.str("JOURNAL_PATH", "logs/journal.jsonl");
    cfg.log_dir = r.str("LOG_DIR", "logs");
    cfg.log_level = toLowerCopy(r.str("LOG_LEVEL", "info"));
    static const std::set<std::string> kLevels = {"trace", "debug", "info", "warn", "error"};
    if (kLevels.count(cfg.log_level) == 0) {
        throw ConfigError("LOG_LEVEL must be trace|debug|info|warn|error");
    }

    return cfg;
}

void Config::load(const std::string& path) {
    std::map<std::string, std::string> values;

    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    if (std::filesystem::exists(config_path)) {
        std::ifstream file(config_path);
        if (!file.is_open()) {
            throw ConfigError("cannot open config file " + config_path.string());
        }
        nlohmann::json j;
        try {
            file >> j;
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("config file " + config_path.string() + " is not valid JSON: " + e.what());
        }
        if (!j.is_object()) {
            throw ConfigError("config file " + config_path.string() + " must hold a JSON object");
        }
        if (j.contains("API_KEY") || j.contains("API_SECRET")) {
            std::cout << "Warning: API credentials in the config file are ignored; use API_KEY/API_SECRET env vars"
                      << std::endl;
        }
        for (auto& [key, value] : j.items()) {
            if (key == "API_KEY" || key == "API_SECRET") continue;
            values[key] = jsonValueToString(value);
        }
        std::cout << "Config file: " << config_path << std::endl;
    } else {
        std::cout << "Config file not found (" << config_path << "), using environment and defaults" << std::endl;
    }

    for (const auto& key : knownKeys()) {
        const std::string env = readEnvVar(key.c_str());
        if (!env.empty()) {
            values[key] = env;
        }
    }

    engine_config_ = parse(values);
    api_key_ = trimCopy(values["API_KEY"]);
    api_secret_ = trimCopy(values["API_SECRET"]);
    loaded_ = true;
}

} // namespace spotbot
