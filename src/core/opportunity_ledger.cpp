#include "opportunity_ledger.hpp"
#include <algorithm>
#include "exceptions.hpp"
#include "utils/logger.hpp"

namespace arbguard {

OpportunityId OpportunityLedger::append(const SourceId& buy_source,
                                        const SourceId& sell_source,
                                        const std::string& token,
                                        Bps price_difference_bps,
                                        const Amount& profit_potential,
                                        const std::string& detector,
                                        Height height) {
    if (last_recorded_height_ && *last_recorded_height_ == height) {
        throw DuplicateHeightError(height);
    }

    // Everything that can throw happens before the first mutation
    Amount new_total = total_profit_potential_ + profit_potential;

    OpportunityRecord record;
    record.id = records_.size();
    record.buy_source = buy_source;
    record.sell_source = sell_source;
    record.token = token;
    record.price_difference_bps = price_difference_bps;
    record.profit_potential = profit_potential;
    record.detected_height = height;
    record.detector = detector;
    record.executed = false;

    records_.push_back(std::move(record));
    total_profit_potential_ = new_total;
    last_recorded_height_ = height;
    last_detector_ = detector;

    const auto& stored = records_.back();
    utils::ValidationLogger::log_opportunity_recorded(stored.id, height, detector,
                                                      types::format_fixed(total_profit_potential_));
    return stored.id;
}

void OpportunityLedger::mark_executed(OpportunityId id, const Amount& actual_profit) {
    if (id >= records_.size()) {
        throw InvalidIdError(id, records_.size());
    }

    auto& record = records_[id];
    if (record.executed) {
        ARBGUARD_LOG_WARN("Opportunity {} already marked executed; ignoring actual profit {}",
                          id, types::format_fixed(actual_profit));
        return;
    }
    record.executed = true;
    utils::ValidationLogger::log_opportunity_executed(id, types::format_fixed(actual_profit));
}

const OpportunityRecord& OpportunityLedger::get_opportunity(OpportunityId id) const {
    if (id >= records_.size()) {
        throw InvalidIdError(id, records_.size());
    }
    return records_[id];
}

std::vector<OpportunityRecord> OpportunityLedger::get_recent_opportunities(std::size_t n) const {
    std::size_t count = std::min(n, records_.size());
    return std::vector<OpportunityRecord>(records_.end() - static_cast<std::ptrdiff_t>(count), records_.end());
}

PerformanceMetrics OpportunityLedger::get_performance_metrics() const {
    PerformanceMetrics metrics;
    metrics.count = records_.size();
    metrics.total_profit_potential = total_profit_potential_;
    metrics.average_profit_potential = records_.empty()
        ? Amount(0)
        : Amount(total_profit_potential_ / records_.size());
    metrics.last_recorded_height = last_recorded_height_;
    metrics.last_detector = last_detector_;
    return metrics;
}

nlohmann::json OpportunityLedger::to_json() const {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& record : records_) {
        records.push_back(nlohmann::json(record));
    }
    return nlohmann::json{
        {"records", records},
        {"metrics", nlohmann::json(get_performance_metrics())}
    };
}

} // namespace arbguard
