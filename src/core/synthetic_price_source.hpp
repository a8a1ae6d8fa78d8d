#pragma once

#include <random>
#include "price_source.hpp"
#include "../utils/config_types.hpp"

namespace arbguard {

// Seeded stand-in for a market-data feed. Identical configuration yields an
// identical observation series.
class SyntheticPriceSource : public PriceSource {
public:
    // Throws ConfigurationError unless exactly three sources are configured
    explicit SyntheticPriceSource(const PriceSourceConfig& config);

    Observation collect() override;

    // Throws InvalidIndexError
    const SourceDefinition& source_definition(std::size_t index) const;
    Height next_height() const { return next_height_; }

private:
    Amount perturb(const Amount& base_price, std::uint32_t volatility_bps);

    PriceSourceConfig config_;
    std::mt19937 rng_;
    Height next_height_;
};

} // namespace arbguard
