#include "config_types.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <stdexcept>

namespace arbguard {

namespace {

// Fixed-point values travel as decimal strings so they survive JSON doubles
types::Amount fixed_or(const nlohmann::json& j, const char* key, const types::Amount& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return types::parse_fixed(j.at(key).get<std::string>());
}

// Raw integers may be given either as a number or as a decimal string
types::Amount raw_or(const nlohmann::json& j, const char* key, const types::Amount& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const auto& value = j.at(key);
    if (value.is_number_unsigned()) {
        return types::Amount(value.get<std::uint64_t>());
    }
    auto text = value.get<std::string>();
    if (text.find('.') != std::string::npos) {
        throw std::invalid_argument(std::string("Expected an integer for '") + key + "'");
    }
    return types::parse_fixed(text) / types::unit();
}

} // namespace

std::string get_env_var(const std::string& key) {
    char* val = getenv(key.c_str());
    return val == NULL ? std::string("") : std::string(val);
}

void from_json(const nlohmann::json& j, AppConfig& config) {
    AppConfig defaults;
    config.name = j.value("name", defaults.name);
    config.version = j.value("version", defaults.version);
    config.log_level = j.value("log_level", defaults.log_level);
}

void from_json(const nlohmann::json& j, LoggingConfig& config) {
    LoggingConfig defaults;
    config.file_path = j.value("file_path", defaults.file_path);
    config.max_file_size_mb = j.value("max_file_size_mb", defaults.max_file_size_mb);
    config.max_backup_files = j.value("max_backup_files", defaults.max_backup_files);
    config.console_output = j.value("console_output", defaults.console_output);
    config.file_output = j.value("file_output", defaults.file_output);
}

void from_json(const nlohmann::json& j, MonitorConfig& config) {
    MonitorConfig defaults;
    config.detector = j.value("detector", defaults.detector);
    config.history_capacity = j.value("history_capacity", defaults.history_capacity);
    config.cycle_interval_ms = j.value("cycle_interval_ms", defaults.cycle_interval_ms);
    config.max_cycles = j.value("max_cycles", defaults.max_cycles);
}

void from_json(const nlohmann::json& j, ValidationConfig& config) {
    ValidationConfig defaults;
    config.min_price_gap_bps = j.value("min_price_gap_bps", defaults.min_price_gap_bps);
    config.min_liquidity = fixed_or(j, "min_liquidity", defaults.min_liquidity);
    config.gas_units = j.value("gas_units", defaults.gas_units);
    config.assumed_asset_price = j.value("assumed_asset_price", defaults.assumed_asset_price);
    config.min_profit_floor = fixed_or(j, "min_profit_floor", defaults.min_profit_floor);
    config.min_reserve_ratio = j.value("min_reserve_ratio", defaults.min_reserve_ratio);
    config.max_reserve_ratio = j.value("max_reserve_ratio", defaults.max_reserve_ratio);
    config.persistence_window = j.value("persistence_window", defaults.persistence_window);
    config.tracker_max_entries = j.value("tracker_max_entries", defaults.tracker_max_entries);
}

void to_json(nlohmann::json& j, const ValidationConfig& config) {
    j = nlohmann::json{
        {"min_price_gap_bps", config.min_price_gap_bps},
        {"min_liquidity", types::format_fixed(config.min_liquidity)},
        {"gas_units", config.gas_units},
        {"assumed_asset_price", config.assumed_asset_price},
        {"min_profit_floor", types::format_fixed(config.min_profit_floor)},
        {"min_reserve_ratio", config.min_reserve_ratio},
        {"max_reserve_ratio", config.max_reserve_ratio},
        {"persistence_window", config.persistence_window},
        {"tracker_max_entries", config.tracker_max_entries}
    };
}

void from_json(const nlohmann::json& j, SourceDefinition& source) {
    j.at("source_id").get_to(source.source_id);
    source.display_name = j.value("display_name", source.source_id);
    source.base_price = types::parse_fixed(j.at("base_price").get<std::string>());
    source.volatility_bps = j.value("volatility_bps", 0u);
    source.liquidity = types::parse_fixed(j.at("liquidity").get<std::string>());
    source.reserve_base = raw_or(j, "reserve_base", types::Amount(0));
    source.reserve_quote = fixed_or(j, "reserve_quote", types::Amount(0));
}

void from_json(const nlohmann::json& j, PriceSourceConfig& config) {
    PriceSourceConfig defaults;
    config.seed = j.value("seed", defaults.seed);
    config.reference_asset = j.value("reference_asset", defaults.reference_asset);
    config.gas_price_hint = raw_or(j, "gas_price_hint", defaults.gas_price_hint);
    config.start_height = j.value("start_height", defaults.start_height);
    config.sources.clear();
    if (j.contains("sources")) {
        j.at("sources").get_to(config.sources);
    }
}

} // namespace arbguard
