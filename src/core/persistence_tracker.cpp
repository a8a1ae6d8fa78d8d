#include "persistence_tracker.hpp"
#include <algorithm>
#include "utils/logger.hpp"

namespace arbguard {

PersistenceTracker::PersistenceTracker(Height threshold, std::size_t max_entries)
    : threshold_(threshold), max_entries_(max_entries) {}

bool PersistenceTracker::observe(const PairIdentity& identity, Height height) {
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        if (max_entries_ > 0 && entries_.size() >= max_entries_) {
            evict_oldest();
        }
        entries_.emplace(identity, height);
        ARBGUARD_LOG_DEBUG("Persistence: first sighting of {} at height {}",
                           identity.to_string(), height);
        return false;
    }
    return height >= it->second && height - it->second >= threshold_;
}

bool PersistenceTracker::is_mature(const PairIdentity& identity, Height height) const {
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return false;
    }
    return height >= it->second && height - it->second >= threshold_;
}

std::optional<Height> PersistenceTracker::first_seen(const PairIdentity& identity) const {
    auto it = entries_.find(identity);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool PersistenceTracker::contains(const PairIdentity& identity) const {
    return entries_.find(identity) != entries_.end();
}

void PersistenceTracker::evict_oldest() {
    auto oldest = std::min_element(entries_.begin(), entries_.end(),
        [](const auto& a, const auto& b) { return a.second < b.second; });
    if (oldest != entries_.end()) {
        ARBGUARD_LOG_DEBUG("Persistence: evicting {} (first seen {})",
                           oldest->first.to_string(), oldest->second);
        entries_.erase(oldest);
    }
}

} // namespace arbguard
