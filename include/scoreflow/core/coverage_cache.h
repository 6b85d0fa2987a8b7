#pragma once

#include "scoreflow/core/metric_types.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace scoreflow {
namespace core {

/**
 * @brief Statistics about cache performance.
 */
struct CacheStats {
    size_t hits{0};           ///< Number of cache hits
    size_t misses{0};         ///< Number of cache misses
    size_t evictions{0};      ///< Entries dropped for size, age or clear()
    size_t insertions{0};     ///< Number of entries inserted
};

/**
 * @brief Configuration for coverage caching behavior.
 */
struct CacheConfig {
    /**
     * @brief Maximum number of entries to store in the cache.
     */
    std::size_t max_entries{1000};

    /**
     * @brief Time-to-live for cache entries.
     */
    std::chrono::seconds ttl{300}; // 5 minutes default

    /**
     * @brief Whether to enable cache statistics tracking.
     */
    bool track_stats{false};
};

/**
 * @brief Identity of one coverage resolution.
 *
 * Two keys are equal only if level, scope, coverage kind, id set and catalog
 * version all match. Ids are kept sorted and deduplicated, so the order in
 * which a definition lists them does not matter.
 */
struct CoverageKey {
    Level level{Level::Component};
    std::optional<std::string> scope;
    std::size_t kind{0};                 ///< Index of the Coverage::selection alternative
    std::vector<std::string> ids;
    std::uint64_t catalogVersion{0};

    static CoverageKey make(Level level,
                            const Coverage& coverage,
                            const std::optional<std::string>& scope,
                            std::uint64_t catalogVersion);

    bool operator==(const CoverageKey& other) const {
        return level == other.level && scope == other.scope && kind == other.kind &&
               catalogVersion == other.catalogVersion && ids == other.ids;
    }
    bool operator!=(const CoverageKey& other) const { return !(*this == other); }
};

struct CoverageKeyHash {
    std::size_t operator()(const CoverageKey& key) const;
};

/**
 * @brief LRU cache of resolved coverage sets with a per-entry TTL.
 *
 * A catalog change never hits a stale entry because the catalog version is
 * part of the key; the TTL only bounds memory held by old versions.
 * Thread-safe.
 */
class CoverageCache {
public:
    using ItemSet = std::vector<std::string>;

    explicit CoverageCache(const CacheConfig& config);

    // Prevent copying
    CoverageCache(const CoverageCache&) = delete;
    CoverageCache& operator=(const CoverageCache&) = delete;

    /**
     * @brief Looks up a resolved item set and marks it most recently used.
     *
     * An expired entry is dropped and reported as a miss.
     */
    std::optional<ItemSet> get(const CoverageKey& key);

    void put(const CoverageKey& key, ItemSet items);

    /**
     * @return true if the key was present
     */
    bool remove(const CoverageKey& key);

    void clear();

    /**
     * @brief Counters, all zero unless track_stats is set.
     */
    CacheStats get_stats() const;

    std::size_t size() const;

private:
    struct Entry {
        CoverageKey key;
        ItemSet items;
        std::chrono::steady_clock::time_point expiry;
    };

    // Front is the most recently used entry
    using EntryList = std::list<Entry>;

    CacheConfig config_;
    CacheStats stats_;
    EntryList entries_;
    std::unordered_map<CoverageKey, EntryList::iterator, CoverageKeyHash> index_;
    mutable std::mutex mutex_;

    // Helpers assume mutex_ is held
    void drop(EntryList::iterator entry);
    void dropExpired(std::chrono::steady_clock::time_point now);
};

} // namespace core
} // namespace scoreflow
