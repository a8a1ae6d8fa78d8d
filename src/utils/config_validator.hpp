#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include "config_types.hpp"
#include "../core/result.hpp"

namespace arbguard {

struct ConfigFieldError {
    std::string field;
    std::string message;
    std::string value;
};

class ConfigValidator {
public:
    using ValidationResult = Result<bool>;
    using ValidationErrors = std::vector<ConfigFieldError>;

    // Validate complete configuration
    static ValidationResult validate_config(const nlohmann::json& config);

    // Validate specific sections
    static ValidationResult validate_app_config(const nlohmann::json& app_config);
    static ValidationResult validate_logging_config(const nlohmann::json& logging_config);
    static ValidationResult validate_validation_config(const nlohmann::json& validation_config);
    static ValidationResult validate_monitor_config(const nlohmann::json& monitor_config);
    static ValidationResult validate_price_source_config(const nlohmann::json& price_source_config);

    // Get all validation errors
    static const ValidationErrors& get_errors() { return errors_; }

    // Clear errors
    static void clear_errors() { errors_.clear(); }

private:
    static ValidationErrors errors_;

    // Validation helper functions
    static bool validate_required_field(const nlohmann::json& config, const std::string& field);
    static bool validate_string_field(const nlohmann::json& config, const std::string& field,
                                     size_t min_length = 0, size_t max_length = SIZE_MAX);
    static bool validate_integer_field(const nlohmann::json& config, const std::string& field,
                                      std::uint64_t min_value = 0,
                                      std::uint64_t max_value = std::numeric_limits<std::uint64_t>::max());
    static bool validate_boolean_field(const nlohmann::json& config, const std::string& field);
    static bool validate_array_field(const nlohmann::json& config, const std::string& field,
                                    size_t min_size = 0, size_t max_size = SIZE_MAX);
    static bool validate_enum_field(const nlohmann::json& config, const std::string& field,
                                   const std::vector<std::string>& valid_values);
    static bool validate_fixed_point_field(const nlohmann::json& config, const std::string& field);

    // Add error helper
    static void add_error(const std::string& field, const std::string& message,
                         const std::string& value = "");
};

} // namespace arbguard
