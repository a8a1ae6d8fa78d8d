#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "config_types.hpp"

namespace arbguard {

class ConfigManager {
public:
    bool load(const std::string& file_path);
    bool load_from_string(const std::string& content);

    AppConfig& get_app_config();
    LoggingConfig& get_logging_config();
    ValidationConfig& get_validation_config();
    MonitorConfig& get_monitor_config();
    PriceSourceConfig& get_price_source_config();

private:
    bool apply(const nlohmann::json& config_data);

    AppConfig app_config_;
    LoggingConfig logging_config_;
    ValidationConfig validation_config_;
    MonitorConfig monitor_config_;
    PriceSourceConfig price_source_config_;
};

} // namespace arbguard
