#include "config_manager.hpp"
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "config_validator.hpp"
#include "utils/logger.hpp"

namespace arbguard {

bool ConfigManager::load(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        utils::Logger::error("Failed to open config file: " + file_path);
        return false;
    }
    nlohmann::json parsed;
    try {
        file >> parsed;
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Error parsing config file: " + std::string(e.what()));
        return false;
    }
    return apply(parsed);
}

bool ConfigManager::load_from_string(const std::string& content) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Error parsing config: " + std::string(e.what()));
        return false;
    }
    return apply(parsed);
}

bool ConfigManager::apply(const nlohmann::json& config_data) {
    auto validation = ConfigValidator::validate_config(config_data);
    if (validation.is_error()) {
        utils::Logger::error("Invalid configuration: " + validation.error());
        for (const auto& error : ConfigValidator::get_errors()) {
            utils::Logger::error("  " + error.field + ": " + error.message);
        }
        return false;
    }

    // Parse into temporaries so a failure leaves the previous settings intact
    AppConfig app_config = app_config_;
    LoggingConfig logging_config = logging_config_;
    ValidationConfig validation_config = validation_config_;
    MonitorConfig monitor_config = monitor_config_;
    PriceSourceConfig price_source_config = price_source_config_;

    try {
        if (config_data.contains("app")) {
            config_data["app"].get_to(app_config);
        }
        if (config_data.contains("logging")) {
            config_data["logging"].get_to(logging_config);
        }
        if (config_data.contains("validation")) {
            config_data["validation"].get_to(validation_config);
        }
        if (config_data.contains("monitor")) {
            config_data["monitor"].get_to(monitor_config);
        }
        if (config_data.contains("price_source")) {
            config_data["price_source"].get_to(price_source_config);
        }
    } catch (const nlohmann::json::exception& e) {
        utils::Logger::error("Error reading config values: " + std::string(e.what()));
        return false;
    } catch (const std::invalid_argument& e) {
        utils::Logger::error("Error reading fixed-point value: " + std::string(e.what()));
        return false;
    }

    app_config_ = app_config;
    logging_config_ = logging_config;
    validation_config_ = validation_config;
    monitor_config_ = monitor_config;
    price_source_config_ = price_source_config;
    return true;
}

AppConfig& ConfigManager::get_app_config() {
    return app_config_;
}

LoggingConfig& ConfigManager::get_logging_config() {
    return logging_config_;
}

ValidationConfig& ConfigManager::get_validation_config() {
    return validation_config_;
}

MonitorConfig& ConfigManager::get_monitor_config() {
    return monitor_config_;
}

PriceSourceConfig& ConfigManager::get_price_source_config() {
    return price_source_config_;
}

} // namespace arbguard
