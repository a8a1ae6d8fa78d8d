#include "synthetic_price_source.hpp"
#include <cstdint>
#include <stdexcept>
#include "exceptions.hpp"
#include "utils/logger.hpp"

namespace arbguard {

SyntheticPriceSource::SyntheticPriceSource(const PriceSourceConfig& config)
    : config_(config), rng_(config.seed), next_height_(config.start_height) {
    if (config_.sources.size() != kSourceCount) {
        throw ConfigurationError("price source needs exactly " + std::to_string(kSourceCount) +
                                 " sources, got " + std::to_string(config_.sources.size()));
    }
    for (const auto& definition : config_.sources) {
        if (definition.volatility_bps > types::kBpsDenominator) {
            throw ConfigurationError("volatility of " + definition.source_id + " exceeds 10000 bps");
        }
        // perturb() scales by up to 2 * 10000 before dividing
        try {
            Amount ceiling = definition.base_price * (2 * types::kBpsDenominator);
            (void)ceiling;
        } catch (const std::overflow_error&) {
            throw ConfigurationError("base price of " + definition.source_id + " is out of range");
        }
    }
    ARBGUARD_LOG_INFO("Synthetic price source ready: seed {}, asset {}, start height {}",
                      config_.seed, config_.reference_asset, config_.start_height);
}

Observation SyntheticPriceSource::collect() {
    Observation observation;
    observation.logical_height = next_height_;
    observation.gas_price_hint = config_.gas_price_hint;

    for (std::size_t i = 0; i < kSourceCount; ++i) {
        const auto& definition = config_.sources[i];
        auto& snapshot = observation.sources[i];
        snapshot.source_id = definition.source_id;
        snapshot.display_name = definition.display_name;
        snapshot.reference_asset = config_.reference_asset;
        snapshot.price = perturb(definition.base_price, definition.volatility_bps);
        snapshot.reserve_base = definition.reserve_base;
        snapshot.reserve_quote = definition.reserve_quote;
        snapshot.total_liquidity = definition.liquidity;
        snapshot.last_update_height = next_height_;
        snapshot.volatility_factor = definition.volatility_bps;
    }

    ++next_height_;
    return observation;
}

const SourceDefinition& SyntheticPriceSource::source_definition(std::size_t index) const {
    if (index >= config_.sources.size()) {
        throw InvalidIndexError(index);
    }
    return config_.sources[index];
}

Amount SyntheticPriceSource::perturb(const Amount& base_price, std::uint32_t volatility_bps) {
    if (volatility_bps == 0) {
        return base_price;
    }
    const auto span = static_cast<std::int64_t>(volatility_bps);
    std::uniform_int_distribution<std::int64_t> distribution(-span, span);
    std::int64_t delta_bps = distribution(rng_);

    Amount scaled = base_price * static_cast<std::uint64_t>(types::kBpsDenominator + delta_bps);
    return scaled / types::kBpsDenominator;
}

} // namespace arbguard
