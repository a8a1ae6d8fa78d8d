#include "condition_evaluator.hpp"
#include <limits>
#include <sstream>
#include <stdexcept>
#include "utils/logger.hpp"

namespace arbguard {

namespace {

const Amount& min_of(const Amount& a, const Amount& b) {
    return b < a ? b : a;
}

Bps clamp_to_bps(const Amount& value) {
    static const Amount bps_max(std::numeric_limits<Bps>::max());
    if (value > bps_max) {
        return std::numeric_limits<Bps>::max();
    }
    return value.convert_to<Bps>();
}

} // namespace

std::string to_string(RejectionReason reason) {
    switch (reason) {
        case RejectionReason::NONE: return "NONE";
        case RejectionReason::INSUFFICIENT_HISTORY: return "INSUFFICIENT_HISTORY";
        case RejectionReason::PRICE_GAP: return "PRICE_GAP";
        case RejectionReason::LIQUIDITY: return "LIQUIDITY";
        case RejectionReason::PROFITABILITY: return "PROFITABILITY";
        case RejectionReason::BALANCE: return "BALANCE";
        case RejectionReason::PERSISTENCE: return "PERSISTENCE";
        case RejectionReason::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        default: return "UNKNOWN";
    }
}

ConditionEvaluator::ConditionEvaluator(const ValidationConfig& config, PersistenceTracker& tracker)
    : config_(config), tracker_(tracker) {}

bool ConditionEvaluator::evaluate(const ObservationHistory& history) {
    return assess(history).is_accepted;
}

EvaluationReport ConditionEvaluator::assess(const ObservationHistory& history) {
    EvaluationReport report;

    if (history.empty() || history.size() < config_.persistence_window) {
        std::stringstream ss;
        ss << history.size() << " observation(s), " << config_.persistence_window << " required";
        if (!history.empty()) {
            report.height = history.back().logical_height;
        }
        return reject(report, RejectionReason::INSUFFICIENT_HISTORY, ss.str());
    }

    const Observation& latest = history.back();
    report.height = latest.logical_height;

    try {
        // Checked arithmetic throws before the tracker is touched, since the
        // persistence condition runs last
        if (!check_price_gap(latest, report) ||
            !check_liquidity(latest, report) ||
            !check_profitability(latest, report) ||
            !check_balance(latest, report) ||
            !check_persistence(latest, report)) {
            return report;
        }
    } catch (const std::overflow_error& e) {
        ARBGUARD_LOG_ERROR("Arithmetic overflow evaluating height {}: {}", latest.logical_height, e.what());
        return reject(report, RejectionReason::ARITHMETIC_OVERFLOW, e.what());
    } catch (const std::range_error& e) {
        ARBGUARD_LOG_ERROR("Arithmetic underflow evaluating height {}: {}", latest.logical_height, e.what());
        return reject(report, RejectionReason::ARITHMETIC_OVERFLOW, e.what());
    }

    report.is_accepted = true;
    utils::ValidationLogger::log_opportunity_accepted(report.height, report.buy_source,
                                                      report.sell_source, report.price_gap_bps,
                                                      types::format_fixed(report.max_profit_estimate));
    return report;
}

std::pair<std::size_t, std::size_t> ConditionEvaluator::extreme_indices(const Observation& observation) {
    std::size_t low = 0;
    std::size_t high = 0;
    for (std::size_t i = 1; i < observation.sources.size(); ++i) {
        const auto& price = observation.sources[i].price;
        if (price < observation.sources[low].price) {
            low = i;
        }
        if (price > observation.sources[high].price) {
            high = i;
        }
    }
    return {low, high};
}

PairIdentity ConditionEvaluator::pair_identity(const Observation& observation) {
    auto [low, high] = extreme_indices(observation);
    if (low == high) {
        // All prices equal: fall back to the first two sources
        low = 0;
        high = 1;
    }
    return PairIdentity(observation.source(low).source_id, observation.source(high).source_id);
}

Bps ConditionEvaluator::price_gap_bps(const Observation& observation) {
    auto [low, high] = extreme_indices(observation);
    const Amount& min_price = observation.sources[low].price;
    const Amount& max_price = observation.sources[high].price;
    if (min_price == 0) {
        return 0;
    }
    return clamp_to_bps((max_price - min_price) * types::kBpsDenominator / min_price);
}

Amount ConditionEvaluator::pair_profit(const PriceSnapshot& a, const PriceSnapshot& b) {
    const Amount& reference_price = min_of(a.price, b.price);
    if (reference_price == 0) {
        return Amount(0);
    }
    const Amount& liquidity = min_of(a.total_liquidity, b.total_liquidity);
    return liquidity * types::abs_diff(a.price, b.price) / (reference_price * 10);
}

Amount ConditionEvaluator::max_pair_profit(const Observation& observation) {
    Amount best(0);
    const auto& sources = observation.sources;
    for (std::size_t i = 0; i < sources.size(); ++i) {
        for (std::size_t j = i + 1; j < sources.size(); ++j) {
            Amount profit = pair_profit(sources[i], sources[j]);
            if (profit > best) {
                best = profit;
            }
        }
    }
    return best;
}

std::optional<Amount> ConditionEvaluator::reserve_ratio(const PriceSnapshot& snapshot) {
    Amount quote_units = snapshot.reserve_quote / types::unit();
    if (quote_units == 0) {
        return std::nullopt;
    }
    return snapshot.reserve_base * 1000 / quote_units;
}

Amount ConditionEvaluator::gas_cost(const Observation& observation) const {
    return observation.gas_price_hint * Amount(config_.gas_units) * Amount(config_.assumed_asset_price);
}

bool ConditionEvaluator::check_price_gap(const Observation& observation, EvaluationReport& report) const {
    auto [low, high] = extreme_indices(observation);
    report.buy_source = observation.sources[low].source_id;
    report.sell_source = observation.sources[high].source_id;

    if (observation.sources[low].price == 0) {
        reject(report, RejectionReason::PRICE_GAP, "zero price from " + report.buy_source);
        return false;
    }

    report.price_gap_bps = price_gap_bps(observation);
    if (report.price_gap_bps < config_.min_price_gap_bps) {
        reject(report, RejectionReason::PRICE_GAP,
               std::to_string(report.price_gap_bps) + "bps < " + std::to_string(config_.min_price_gap_bps) + "bps");
        return false;
    }
    return true;
}

bool ConditionEvaluator::check_liquidity(const Observation& observation, EvaluationReport& report) const {
    for (const auto& source : observation.sources) {
        if (source.total_liquidity < config_.min_liquidity) {
            reject(report, RejectionReason::LIQUIDITY,
                   source.source_id + " liquidity " + types::format_fixed(source.total_liquidity) +
                   " < " + types::format_fixed(config_.min_liquidity));
            return false;
        }
    }
    return true;
}

bool ConditionEvaluator::check_profitability(const Observation& observation, EvaluationReport& report) const {
    report.max_profit_estimate = max_pair_profit(observation);
    report.gas_cost_estimate = gas_cost(observation);

    if (report.max_profit_estimate <= report.gas_cost_estimate) {
        reject(report, RejectionReason::PROFITABILITY,
               "profit " + types::format_fixed(report.max_profit_estimate) +
               " <= gas " + types::format_fixed(report.gas_cost_estimate));
        return false;
    }
    if (report.max_profit_estimate <= config_.min_profit_floor) {
        reject(report, RejectionReason::PROFITABILITY,
               "profit " + types::format_fixed(report.max_profit_estimate) +
               " <= floor " + types::format_fixed(config_.min_profit_floor));
        return false;
    }
    return true;
}

bool ConditionEvaluator::check_balance(const Observation& observation, EvaluationReport& report) const {
    const Amount min_ratio(config_.min_reserve_ratio);
    const Amount max_ratio(config_.max_reserve_ratio);

    for (const auto& source : observation.sources) {
        auto ratio = reserve_ratio(source);
        if (!ratio) {
            reject(report, RejectionReason::BALANCE, source.source_id + " has no quote reserve");
            return false;
        }
        if (*ratio < min_ratio || *ratio > max_ratio) {
            reject(report, RejectionReason::BALANCE,
                   source.source_id + " reserve ratio " + types::to_raw_string(*ratio) + " outside [" +
                   std::to_string(config_.min_reserve_ratio) + ", " +
                   std::to_string(config_.max_reserve_ratio) + "]");
            return false;
        }
    }
    return true;
}

bool ConditionEvaluator::check_persistence(const Observation& observation, EvaluationReport& report) {
    PairIdentity identity = pair_identity(observation);
    report.pair_identity = identity;

    if (!tracker_.observe(identity, observation.logical_height)) {
        auto first_seen = tracker_.first_seen(identity);
        std::string detail = identity.to_string();
        if (first_seen && *first_seen == observation.logical_height) {
            detail += " first seen";
        } else if (first_seen) {
            detail += " seen since " + std::to_string(*first_seen);
        }
        reject(report, RejectionReason::PERSISTENCE, detail);
        return false;
    }
    return true;
}

EvaluationReport& ConditionEvaluator::reject(EvaluationReport& report, RejectionReason reason,
                                             const std::string& detail) const {
    report.is_accepted = false;
    report.reason = reason;
    report.detail = detail;
    utils::ValidationLogger::log_condition_rejected(report.height, to_string(reason), detail);
    return report;
}

} // namespace arbguard
