#include "arbitrage_monitor.hpp"
#include <chrono>
#include <thread>
#include "exceptions.hpp"
#include "utils/logger.hpp"

namespace arbguard {

ArbitrageMonitor::ArbitrageMonitor(PriceSource& price_source,
                                   ConditionEvaluator& evaluator,
                                   OpportunityLedger& ledger,
                                   const MonitorConfig& config)
    : price_source_(price_source), evaluator_(evaluator), ledger_(ledger),
      config_(config), cycles_run_(0) {
    if (config_.history_capacity == 0) {
        throw ConfigurationError("history_capacity must be at least 1");
    }
    if (config_.history_capacity < evaluator_.config().persistence_window) {
        throw ConfigurationError("history_capacity " + std::to_string(config_.history_capacity) +
                                 " is shorter than the persistence window " +
                                 std::to_string(evaluator_.config().persistence_window));
    }
}

CycleOutcome ArbitrageMonitor::run_cycle() {
    ARBGUARD_SCOPED_TIMER("monitor_cycle");

    CycleOutcome outcome;
    push_observation(price_source_.collect());
    ++cycles_run_;

    const Observation& latest = history_.back();
    outcome.height = latest.logical_height;
    outcome.report = evaluator_.assess(history_);

    if (outcome.report.is_accepted) {
        outcome.recorded_id = record(latest, outcome.report, outcome.duplicate_height);
    }
    return outcome;
}

std::uint64_t ArbitrageMonitor::run(const AppState& app_state) {
    std::uint64_t executed = 0;
    utils::ValidationLogger::log_system_event("MONITOR_START", "detector " + config_.detector);

    while (app_state.is_running()) {
        run_cycle();
        ++executed;

        if (config_.max_cycles > 0 && executed >= config_.max_cycles) {
            break;
        }
        if (config_.cycle_interval_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(config_.cycle_interval_ms));
        }
    }

    utils::ValidationLogger::log_system_event("MONITOR_STOP", std::to_string(executed) + " cycles");
    return executed;
}

void ArbitrageMonitor::push_observation(Observation observation) {
    history_.push_back(std::move(observation));
    while (history_.size() > config_.history_capacity) {
        history_.pop_front();
    }
}

std::optional<OpportunityId> ArbitrageMonitor::record(const Observation& observation,
                                                      const EvaluationReport& report,
                                                      bool& duplicate_height) {
    try {
        return ledger_.append(report.buy_source,
                              report.sell_source,
                              observation.source(0).reference_asset,
                              report.price_gap_bps,
                              report.max_profit_estimate,
                              config_.detector,
                              observation.logical_height);
    } catch (const DuplicateHeightError& e) {
        ARBGUARD_LOG_WARN("Skipping record: {}", e.what());
        duplicate_height = true;
        return std::nullopt;
    }
}

} // namespace arbguard
