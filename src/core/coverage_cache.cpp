#include "scoreflow/core/coverage_cache.h"
#include <algorithm>
#include <functional>

namespace scoreflow {
namespace core {

namespace {
    void combine(std::size_t& seed, std::size_t value) {
        seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
}

CoverageKey CoverageKey::make(Level level,
                              const Coverage& coverage,
                              const std::optional<std::string>& scope,
                              std::uint64_t catalogVersion) {
    CoverageKey key;
    key.level = level;
    key.scope = scope;
    key.kind = coverage.selection.index();
    key.catalogVersion = catalogVersion;
    if (const auto* include = std::get_if<Coverage::Include>(&coverage.selection)) {
        key.ids = include->ids;
    } else if (const auto* exclude = std::get_if<Coverage::Exclude>(&coverage.selection)) {
        key.ids = exclude->ids;
    }
    std::sort(key.ids.begin(), key.ids.end());
    key.ids.erase(std::unique(key.ids.begin(), key.ids.end()), key.ids.end());
    return key;
}

std::size_t CoverageKeyHash::operator()(const CoverageKey& key) const {
    std::hash<std::string> hashString;
    std::size_t seed = std::hash<int>()(static_cast<int>(key.level));
    combine(seed, key.scope ? hashString(*key.scope) : 0);
    combine(seed, key.kind);
    combine(seed, std::hash<std::uint64_t>()(key.catalogVersion));
    combine(seed, key.ids.size());
    for (const auto& id : key.ids) {
        combine(seed, hashString(id));
    }
    return seed;
}

CoverageCache::CoverageCache(const CacheConfig& config)
    : config_(config) {}

std::optional<CoverageCache::ItemSet> CoverageCache::get(const CoverageKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto found = index_.find(key);
    if (found != index_.end() && std::chrono::steady_clock::now() > found->second->expiry) {
        drop(found->second);
        found = index_.end();
    }
    if (found == index_.end()) {
        if (config_.track_stats) {
            stats_.misses++;
        }
        return std::nullopt;
    }

    entries_.splice(entries_.begin(), entries_, found->second);
    if (config_.track_stats) {
        stats_.hits++;
    }
    return found->second->items;
}

void CoverageCache::put(const CoverageKey& key, ItemSet items) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();

    auto found = index_.find(key);
    if (found != index_.end()) {
        found->second->items = std::move(items);
        found->second->expiry = now + config_.ttl;
        entries_.splice(entries_.begin(), entries_, found->second);
        return;
    }

    dropExpired(now);
    while (!entries_.empty() && entries_.size() >= config_.max_entries) {
        drop(std::prev(entries_.end()));
    }

    entries_.push_front(Entry{key, std::move(items), now + config_.ttl});
    index_.emplace(key, entries_.begin());
    if (config_.track_stats) {
        stats_.insertions++;
    }
}

bool CoverageCache::remove(const CoverageKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = index_.find(key);
    if (found == index_.end()) {
        return false;
    }
    entries_.erase(found->second);
    index_.erase(found);
    return true;
}

void CoverageCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.track_stats) {
        stats_.evictions += entries_.size();
    }
    index_.clear();
    entries_.clear();
}

CacheStats CoverageCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::size_t CoverageCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void CoverageCache::drop(EntryList::iterator entry) {
    index_.erase(entry->key);
    entries_.erase(entry);
    if (config_.track_stats) {
        stats_.evictions++;
    }
}

void CoverageCache::dropExpired(std::chrono::steady_clock::time_point now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto next = std::next(it);
        if (now > it->expiry) {
            drop(it);
        }
        it = next;
    }
}

} // namespace core
} // namespace scoreflow
