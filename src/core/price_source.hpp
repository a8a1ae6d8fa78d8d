#pragma once

#include "types.hpp"

namespace arbguard {

// Market-data provider injected into the monitor. Each call yields the
// next observation cycle.
class PriceSource {
public:
    virtual ~PriceSource() = default;
    virtual Observation collect() = 0;
};

} // namespace arbguard
