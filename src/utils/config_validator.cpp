#include "config_validator.hpp"
#include <algorithm>
#include <numeric>
#include <set>
#include <stdexcept>
#include "../core/types.hpp"

namespace arbguard {

ConfigValidator::ValidationErrors ConfigValidator::errors_;

ConfigValidator::ValidationResult ConfigValidator::validate_config(const nlohmann::json& config) {
    clear_errors();

    if (!config.is_object()) {
        add_error("<root>", "Configuration must be a JSON object", config.dump());
        return Result<bool>::error("Configuration is not an object");
    }

    // Validate required top-level sections
    if (!config.contains("app")) {
        add_error("app", "Missing required app configuration section");
        return Result<bool>::error("Missing app configuration");
    }

    auto app_result = validate_app_config(config["app"]);
    if (app_result.is_error()) {
        return app_result;
    }

    if (config.contains("logging")) {
        auto logging_result = validate_logging_config(config["logging"]);
        if (logging_result.is_error()) {
            return logging_result;
        }
    }

    if (config.contains("validation")) {
        auto validation_result = validate_validation_config(config["validation"]);
        if (validation_result.is_error()) {
            return validation_result;
        }
    }

    if (config.contains("monitor")) {
        auto monitor_result = validate_monitor_config(config["monitor"]);
        if (monitor_result.is_error()) {
            return monitor_result;
        }
    }

    if (config.contains("price_source")) {
        auto source_result = validate_price_source_config(config["price_source"]);
        if (source_result.is_error()) {
            return source_result;
        }
    }

    return Result<bool>::success(true);
}

ConfigValidator::ValidationResult ConfigValidator::validate_app_config(const nlohmann::json& app_config) {
    validate_required_field(app_config, "name");
    validate_string_field(app_config, "name", 1, 100);

    validate_required_field(app_config, "version");
    validate_string_field(app_config, "version", 1, 20);

    if (app_config.contains("log_level")) {
        validate_enum_field(app_config, "log_level",
                            {"TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "CRITICAL"});
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("App configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_logging_config(const nlohmann::json& logging_config) {
    validate_required_field(logging_config, "file_path");
    validate_string_field(logging_config, "file_path", 1, 500);

    validate_integer_field(logging_config, "max_file_size_mb", 1);
    validate_integer_field(logging_config, "max_backup_files", 1);
    validate_boolean_field(logging_config, "console_output");
    validate_boolean_field(logging_config, "file_output");

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Logging configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_validation_config(const nlohmann::json& validation_config) {
    validate_integer_field(validation_config, "min_price_gap_bps", 0, 10000);
    validate_fixed_point_field(validation_config, "min_liquidity");
    validate_integer_field(validation_config, "gas_units");
    validate_integer_field(validation_config, "assumed_asset_price");
    validate_fixed_point_field(validation_config, "min_profit_floor");
    bool min_ok = validate_integer_field(validation_config, "min_reserve_ratio");
    bool max_ok = validate_integer_field(validation_config, "max_reserve_ratio");
    validate_integer_field(validation_config, "persistence_window", 1);
    validate_integer_field(validation_config, "tracker_max_entries");

    ValidationConfig defaults;
    if (min_ok && max_ok) {
        auto min_ratio = validation_config.value("min_reserve_ratio", defaults.min_reserve_ratio);
        auto max_ratio = validation_config.value("max_reserve_ratio", defaults.max_reserve_ratio);
        if (min_ratio > max_ratio) {
            add_error("min_reserve_ratio", "Must not exceed max_reserve_ratio",
                      std::to_string(min_ratio));
        }
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Validation configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_monitor_config(const nlohmann::json& monitor_config) {
    validate_required_field(monitor_config, "detector");
    validate_string_field(monitor_config, "detector", 1, 100);
    validate_integer_field(monitor_config, "history_capacity", 1);
    validate_integer_field(monitor_config, "cycle_interval_ms");
    validate_integer_field(monitor_config, "max_cycles");

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Monitor configuration validation failed");
}

ConfigValidator::ValidationResult ConfigValidator::validate_price_source_config(const nlohmann::json& price_source_config) {
    validate_integer_field(price_source_config, "seed", 0, std::numeric_limits<std::uint32_t>::max());
    validate_string_field(price_source_config, "reference_asset", 1, 20);
    validate_integer_field(price_source_config, "start_height");

    validate_required_field(price_source_config, "sources");
    if (validate_array_field(price_source_config, "sources", kSourceCount, kSourceCount) &&
        price_source_config.contains("sources")) {
        std::set<std::string> seen_ids;
        for (const auto& source : price_source_config["sources"]) {
            if (!source.is_object()) {
                add_error("sources", "Source entry must be an object", source.dump());
                continue;
            }
            if (validate_required_field(source, "source_id") &&
                validate_string_field(source, "source_id", 1, 64)) {
                auto id = source["source_id"].get<std::string>();
                if (!seen_ids.insert(id).second) {
                    add_error("source_id", "Duplicate source id", id);
                }
            }
            validate_required_field(source, "base_price");
            validate_fixed_point_field(source, "base_price");
            validate_required_field(source, "liquidity");
            validate_fixed_point_field(source, "liquidity");
            validate_fixed_point_field(source, "reserve_quote");
            validate_integer_field(source, "volatility_bps", 0, 10000);
        }
    }

    return errors_.empty() ? Result<bool>::success(true) :
                           Result<bool>::error("Price source configuration validation failed");
}

bool ConfigValidator::validate_required_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) {
        add_error(field, "Required field is missing");
        return false;
    }
    return true;
}

bool ConfigValidator::validate_string_field(const nlohmann::json& config, const std::string& field,
                                           size_t min_length, size_t max_length) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (value.length() < min_length) {
        add_error(field, "String too short (min: " + std::to_string(min_length) + ")", value);
        return false;
    }

    if (value.length() > max_length) {
        add_error(field, "String too long (max: " + std::to_string(max_length) + ")", value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_integer_field(const nlohmann::json& config, const std::string& field,
                                            std::uint64_t min_value, std::uint64_t max_value) {
    if (!config.contains(field)) return true;

    if (!config[field].is_number_unsigned()) {
        add_error(field, "Field must be a non-negative integer", config[field].dump());
        return false;
    }

    auto value = config[field].get<std::uint64_t>();
    if (value < min_value) {
        add_error(field, "Value too small (min: " + std::to_string(min_value) + ")",
                 std::to_string(value));
        return false;
    }

    if (value > max_value) {
        add_error(field, "Value too large (max: " + std::to_string(max_value) + ")",
                 std::to_string(value));
        return false;
    }

    return true;
}

bool ConfigValidator::validate_boolean_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) return true;

    if (!config[field].is_boolean()) {
        add_error(field, "Field must be a boolean", config[field].dump());
        return false;
    }

    return true;
}

bool ConfigValidator::validate_array_field(const nlohmann::json& config, const std::string& field,
                                          size_t min_size, size_t max_size) {
    if (!config.contains(field)) return true;

    if (!config[field].is_array()) {
        add_error(field, "Field must be an array", config[field].dump());
        return false;
    }

    size_t size = config[field].size();
    if (size < min_size) {
        add_error(field, "Array too small (min: " + std::to_string(min_size) + ")",
                 std::to_string(size));
        return false;
    }

    if (size > max_size) {
        add_error(field, "Array too large (max: " + std::to_string(max_size) + ")",
                 std::to_string(size));
        return false;
    }

    return true;
}

bool ConfigValidator::validate_enum_field(const nlohmann::json& config, const std::string& field,
                                         const std::vector<std::string>& valid_values) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Field must be a string", config[field].dump());
        return false;
    }

    std::string value = config[field].get<std::string>();
    if (std::find(valid_values.begin(), valid_values.end(), value) == valid_values.end()) {
        add_error(field, "Invalid value. Must be one of: " +
                 std::accumulate(valid_values.begin(), valid_values.end(), std::string(),
                                [](const std::string& a, const std::string& b) {
                                    return a.empty() ? b : a + ", " + b;
                                }), value);
        return false;
    }

    return true;
}

bool ConfigValidator::validate_fixed_point_field(const nlohmann::json& config, const std::string& field) {
    if (!config.contains(field)) return true;

    if (!config[field].is_string()) {
        add_error(field, "Fixed-point value must be a decimal string", config[field].dump());
        return false;
    }

    try {
        types::parse_fixed(config[field].get<std::string>());
    } catch (const std::invalid_argument& e) {
        add_error(field, e.what(), config[field].get<std::string>());
        return false;
    }

    return true;
}

void ConfigValidator::add_error(const std::string& field, const std::string& message,
                               const std::string& value) {
    errors_.push_back({field, message, value});
}

} // namespace arbguard
