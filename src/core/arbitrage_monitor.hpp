#pragma once

#include <optional>
#include "types.hpp"
#include "app_state.hpp"
#include "price_source.hpp"
#include "condition_evaluator.hpp"
#include "opportunity_ledger.hpp"
#include "../utils/config_types.hpp"

namespace arbguard {

struct CycleOutcome {
    Height height = 0;
    EvaluationReport report;
    std::optional<OpportunityId> recorded_id;
    bool duplicate_height = false;
};

// Host scheduler: collect, keep a bounded history, evaluate, record
class ArbitrageMonitor {
public:
    ArbitrageMonitor(PriceSource& price_source,
                     ConditionEvaluator& evaluator,
                     OpportunityLedger& ledger,
                     const MonitorConfig& config);

    CycleOutcome run_cycle();

    // Runs cycles until app_state stops or max_cycles is reached.
    // Returns the number of cycles executed.
    std::uint64_t run(const AppState& app_state);

    const ObservationHistory& history() const { return history_; }
    std::uint64_t cycles_run() const { return cycles_run_; }

private:
    void push_observation(Observation observation);
    std::optional<OpportunityId> record(const Observation& observation, const EvaluationReport& report,
                                        bool& duplicate_height);

    PriceSource& price_source_;
    ConditionEvaluator& evaluator_;
    OpportunityLedger& ledger_;
    MonitorConfig config_;
    ObservationHistory history_;
    std::uint64_t cycles_run_;
};

} // namespace arbguard
