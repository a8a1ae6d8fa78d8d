#include "types.hpp"
#include "exceptions.hpp"

namespace arbguard {

const PriceSnapshot& Observation::source(std::size_t index) const {
    if (index >= sources.size()) {
        throw InvalidIndexError(index);
    }
    return sources[index];
}

PairIdentity::PairIdentity(SourceId a, SourceId b) {
    if (b < a) {
        std::swap(a, b);
    }
    first_ = std::move(a);
    second_ = std::move(b);
}

std::string PairIdentity::to_string() const {
    return first_ + "/" + second_;
}

void to_json(nlohmann::json& j, const PriceSnapshot& snapshot) {
    j = nlohmann::json{
        {"source_id", snapshot.source_id},
        {"display_name", snapshot.display_name},
        {"reference_asset", snapshot.reference_asset},
        {"price", types::format_fixed(snapshot.price)},
        {"reserve_base", types::to_raw_string(snapshot.reserve_base)},
        {"reserve_quote", types::format_fixed(snapshot.reserve_quote)},
        {"total_liquidity", types::format_fixed(snapshot.total_liquidity)},
        {"last_update_height", snapshot.last_update_height},
        {"volatility_factor", snapshot.volatility_factor}
    };
}

void to_json(nlohmann::json& j, const OpportunityRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"buy_source", record.buy_source},
        {"sell_source", record.sell_source},
        {"token", record.token},
        {"price_difference_bps", record.price_difference_bps},
        {"profit_potential", types::format_fixed(record.profit_potential)},
        {"detected_height", record.detected_height},
        {"detector", record.detector},
        {"executed", record.executed}
    };
}

void to_json(nlohmann::json& j, const PerformanceMetrics& metrics) {
    j = nlohmann::json{
        {"count", metrics.count},
        {"total_profit_potential", types::format_fixed(metrics.total_profit_potential)},
        {"average_profit_potential", types::format_fixed(metrics.average_profit_potential)},
        {"last_detector", metrics.last_detector}
    };
    if (metrics.last_recorded_height) {
        j["last_recorded_height"] = *metrics.last_recorded_height;
    } else {
        j["last_recorded_height"] = nullptr;
    }
}

} // namespace arbguard
