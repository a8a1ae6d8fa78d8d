#pragma once

#include <array>
#include <deque>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <nlohmann/json.hpp>
#include "types/common_types.hpp"

namespace arbguard {

using types::Amount;
using types::Bps;
using types::Height;
using types::OpportunityId;
using types::SourceId;

constexpr std::size_t kSourceCount = 3;

// One source's market state at a logical height
struct PriceSnapshot {
    SourceId source_id;
    std::string display_name;
    std::string reference_asset;
    Amount price;                 // 18-decimal fixed point
    Amount reserve_base;          // raw base-asset amount
    Amount reserve_quote;         // 18-decimal fixed point
    Amount total_liquidity;       // 18-decimal fixed point
    Height last_update_height = 0;
    std::uint32_t volatility_factor = 0;  // bps, informational
};

struct Observation {
    std::array<PriceSnapshot, kSourceCount> sources;
    Height logical_height = 0;
    Amount gas_price_hint;

    // Throws InvalidIndexError for index >= kSourceCount
    const PriceSnapshot& source(std::size_t index) const;
};

// Most recent observation last
using ObservationHistory = std::deque<Observation>;

// Unordered pair of source ids, stored with the smaller id first
class PairIdentity {
public:
    PairIdentity(SourceId a, SourceId b);

    const SourceId& first() const { return first_; }
    const SourceId& second() const { return second_; }
    std::string to_string() const;

    bool operator==(const PairIdentity& other) const {
        return first_ == other.first_ && second_ == other.second_;
    }
    bool operator!=(const PairIdentity& other) const { return !(*this == other); }
    bool operator<(const PairIdentity& other) const {
        return std::tie(first_, second_) < std::tie(other.first_, other.second_);
    }

private:
    SourceId first_;
    SourceId second_;
};

struct OpportunityRecord {
    OpportunityId id = 0;
    SourceId buy_source;
    SourceId sell_source;
    std::string token;
    Bps price_difference_bps = 0;
    Amount profit_potential;
    Height detected_height = 0;
    std::string detector;
    bool executed = false;
};

struct PerformanceMetrics {
    std::size_t count = 0;
    Amount total_profit_potential;
    Amount average_profit_potential;
    std::optional<Height> last_recorded_height;
    std::string last_detector;
};

void to_json(nlohmann::json& j, const PriceSnapshot& snapshot);
void to_json(nlohmann::json& j, const OpportunityRecord& record);
void to_json(nlohmann::json& j, const PerformanceMetrics& metrics);

} // namespace arbguard
