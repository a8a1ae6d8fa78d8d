#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "types/common_types.hpp"

namespace arbguard {

std::string get_env_var(const std::string& key);

struct AppConfig {
    std::string name = "arbguard";
    std::string version = "1.0.0";
    std::string log_level = "INFO";
};

struct LoggingConfig {
    std::string file_path = "logs/arbguard.log";
    int max_file_size_mb = 10;
    int max_backup_files = 3;
    bool console_output = true;
    bool file_output = false;
};

// Thresholds for the five safety conditions
struct ValidationConfig {
    types::Bps min_price_gap_bps = 50;
    types::Amount min_liquidity = types::from_units(1000);
    std::uint64_t gas_units = 200000;
    std::uint64_t assumed_asset_price = 2000;
    types::Amount min_profit_floor = types::from_units(10);
    std::uint64_t min_reserve_ratio = 10;
    std::uint64_t max_reserve_ratio = 10000;
    types::Height persistence_window = 2;
    std::size_t tracker_max_entries = 0;   // 0 keeps every identity
};

struct MonitorConfig {
    std::string detector = "arbguard-monitor";
    std::size_t history_capacity = 16;
    int cycle_interval_ms = 1000;
    std::uint64_t max_cycles = 0;          // 0 runs until stopped
};

struct SourceDefinition {
    std::string source_id;
    std::string display_name;
    types::Amount base_price;
    std::uint32_t volatility_bps = 0;
    types::Amount liquidity;
    types::Amount reserve_base;
    types::Amount reserve_quote;
};

struct PriceSourceConfig {
    std::uint32_t seed = 42;
    std::string reference_asset = "WETH";
    types::Amount gas_price_hint = types::Amount(30000000000ULL);  // 30 gwei
    types::Height start_height = 1;
    std::vector<SourceDefinition> sources;
};

// Missing keys keep the member defaults above
void from_json(const nlohmann::json& j, AppConfig& config);
void from_json(const nlohmann::json& j, LoggingConfig& config);
void from_json(const nlohmann::json& j, MonitorConfig& config);
void from_json(const nlohmann::json& j, ValidationConfig& config);
void to_json(nlohmann::json& j, const ValidationConfig& config);
void from_json(const nlohmann::json& j, SourceDefinition& source);
void from_json(const nlohmann::json& j, PriceSourceConfig& config);

} // namespace arbguard
