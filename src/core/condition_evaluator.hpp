#pragma once

#include <optional>
#include <string>
#include <utility>
#include "types.hpp"
#include "persistence_tracker.hpp"
#include "../utils/config_types.hpp"

namespace arbguard {

enum class RejectionReason {
    NONE,
    INSUFFICIENT_HISTORY,
    PRICE_GAP,
    LIQUIDITY,
    PROFITABILITY,
    BALANCE,
    PERSISTENCE,
    ARITHMETIC_OVERFLOW
};

std::string to_string(RejectionReason reason);

// Outcome of one evaluation. Estimates are filled in as far as evaluation got.
struct EvaluationReport {
    bool is_accepted = false;
    RejectionReason reason = RejectionReason::NONE;
    Height height = 0;
    Bps price_gap_bps = 0;
    Amount max_profit_estimate;
    Amount gas_cost_estimate;
    std::optional<PairIdentity> pair_identity;
    SourceId buy_source;    // lowest priced
    SourceId sell_source;   // highest priced
    std::string detail;
};

class ConditionEvaluator {
public:
    ConditionEvaluator(const ValidationConfig& config, PersistenceTracker& tracker);

    // Accept/reject for the most recent observation. Not idempotent: the
    // persistence condition records first sightings in the tracker.
    bool evaluate(const ObservationHistory& history);
    EvaluationReport assess(const ObservationHistory& history);

    const ValidationConfig& config() const { return config_; }

    // Indices of the (lowest, highest) priced sources; ties go to the lower index
    static std::pair<std::size_t, std::size_t> extreme_indices(const Observation& observation);
    static PairIdentity pair_identity(const Observation& observation);

    // (max - min) * 10000 / min, floor. Zero when the minimum price is zero.
    static Bps price_gap_bps(const Observation& observation);

    // min(liqA, liqB) * |pA - pB| / (min(pA, pB) * 10)
    static Amount pair_profit(const PriceSnapshot& a, const PriceSnapshot& b);
    static Amount max_pair_profit(const Observation& observation);

    // (reserve_base * 1000) / (reserve_quote / 10^18); nullopt on a zero denominator
    static std::optional<Amount> reserve_ratio(const PriceSnapshot& snapshot);

    Amount gas_cost(const Observation& observation) const;

private:
    bool check_price_gap(const Observation& observation, EvaluationReport& report) const;
    bool check_liquidity(const Observation& observation, EvaluationReport& report) const;
    bool check_profitability(const Observation& observation, EvaluationReport& report) const;
    bool check_balance(const Observation& observation, EvaluationReport& report) const;
    bool check_persistence(const Observation& observation, EvaluationReport& report);

    EvaluationReport& reject(EvaluationReport& report, RejectionReason reason, const std::string& detail) const;

    ValidationConfig config_;
    PersistenceTracker& tracker_;
};

} // namespace arbguard
