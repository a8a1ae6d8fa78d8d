#include <iostream>
#include <memory>
#include <csignal>
#include <string>

#include "utils/config_manager.hpp"
#include "utils/logger.hpp"
#include "core/app_state.hpp"
#include "core/exceptions.hpp"
#include "core/persistence_tracker.hpp"
#include "core/condition_evaluator.hpp"
#include "core/opportunity_ledger.hpp"
#include "core/synthetic_price_source.hpp"
#include "core/arbitrage_monitor.hpp"

// Global application state
arbguard::AppState app_state;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        app_state.shutdown();
    }
}

int main(int argc, char* argv[]) {
    // Register signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::string config_path = "config/settings.json";
    std::string env_path = arbguard::get_env_var("ARBGUARD_CONFIG");
    if (argc > 1) {
        config_path = argv[1];
    } else if (!env_path.empty()) {
        config_path = env_path;
    }

    // Load configuration
    arbguard::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        std::cerr << "Failed to load configuration from " << config_path << ". Exiting." << std::endl;
        return 1;
    }

    // Initialize logger
    const auto& logging = config_manager.get_logging_config();
    std::string level_name = arbguard::get_env_var("ARBGUARD_LOG_LEVEL");
    if (level_name.empty()) {
        level_name = config_manager.get_app_config().log_level;
    }
    arbguard::utils::Logger::initialize(logging.file_path,
                                        arbguard::utils::parse_log_level(level_name),
                                        static_cast<size_t>(logging.max_file_size_mb) * 1024 * 1024,
                                        static_cast<size_t>(logging.max_backup_files),
                                        logging.console_output,
                                        logging.file_output);
    ARBGUARD_LOG_INFO("Starting {} {}", config_manager.get_app_config().name,
                      config_manager.get_app_config().version);

    int exit_code = 0;
    try {
        const auto& validation = config_manager.get_validation_config();
        arbguard::PersistenceTracker tracker(validation.persistence_window, validation.tracker_max_entries);
        arbguard::ConditionEvaluator evaluator(validation, tracker);
        arbguard::OpportunityLedger ledger;
        arbguard::SyntheticPriceSource price_source(config_manager.get_price_source_config());
        arbguard::ArbitrageMonitor monitor(price_source, evaluator, ledger, config_manager.get_monitor_config());

        monitor.run(app_state);

        auto metrics = ledger.get_performance_metrics();
        ARBGUARD_LOG_INFO("Recorded {} opportunities, total profit potential {}, average {}, tracked pairs {}",
                          metrics.count,
                          arbguard::types::format_fixed(metrics.total_profit_potential),
                          arbguard::types::format_fixed(metrics.average_profit_potential),
                          tracker.size());
        std::cout << ledger.to_json().dump(2) << std::endl;

    } catch (const arbguard::ConfigurationError& e) {
        ARBGUARD_LOG_CRITICAL("{}", e.what());
        exit_code = 1;
    } catch (const arbguard::ArbGuardException& e) {
        ARBGUARD_LOG_CRITICAL("Monitor stopped: {}", e.what());
        exit_code = 1;
    }

    ARBGUARD_LOG_INFO("Shut down.");
    arbguard::utils::Logger::shutdown();
    return exit_code;
}
