#pragma once

#include <map>
#include <optional>
#include <cstddef>
#include "types.hpp"

namespace arbguard {

// First-seen heights keyed by pair identity. Single writer: the
// ConditionEvaluator.
class PersistenceTracker {
public:
    // max_entries == 0 keeps every identity ever observed
    explicit PersistenceTracker(Height threshold, std::size_t max_entries = 0);

    // Records the identity on first sighting and returns false. Otherwise
    // returns whether height - first_seen >= threshold.
    bool observe(const PairIdentity& identity, Height height);

    // Pure form of observe(): maturity without inserting
    bool is_mature(const PairIdentity& identity, Height height) const;

    std::optional<Height> first_seen(const PairIdentity& identity) const;
    bool contains(const PairIdentity& identity) const;
    std::size_t size() const { return entries_.size(); }
    Height threshold() const { return threshold_; }
    std::size_t max_entries() const { return max_entries_; }

private:
    void evict_oldest();

    Height threshold_;
    std::size_t max_entries_;
    std::map<PairIdentity, Height> entries_;
};

} // namespace arbguard
