#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "types.hpp"

namespace arbguard {

// Append-only store of accepted opportunities. At most one record per
// logical height; ids are dense and start at 0.
class OpportunityLedger {
public:
    OpportunityLedger() = default;

    // Throws DuplicateHeightError if height equals the last recorded height
    OpportunityId append(const SourceId& buy_source,
                         const SourceId& sell_source,
                         const std::string& token,
                         Bps price_difference_bps,
                         const Amount& profit_potential,
                         const std::string& detector,
                         Height height);

    // Throws InvalidIdError. actual_profit is logged, never aggregated.
    void mark_executed(OpportunityId id, const Amount& actual_profit);

    // Throws InvalidIdError
    const OpportunityRecord& get_opportunity(OpportunityId id) const;

    // Last min(n, size()) records, oldest first
    std::vector<OpportunityRecord> get_recent_opportunities(std::size_t n) const;

    PerformanceMetrics get_performance_metrics() const;

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }
    const Amount& total_profit_potential() const { return total_profit_potential_; }
    std::optional<Height> last_recorded_height() const { return last_recorded_height_; }

    nlohmann::json to_json() const;

private:
    std::vector<OpportunityRecord> records_;
    Amount total_profit_potential_{0};
    std::optional<Height> last_recorded_height_;
    std::string last_detector_;
};

} // namespace arbguard
