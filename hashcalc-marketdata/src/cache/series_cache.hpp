#pragma once

#include "market_history.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace hashcalc {
namespace marketdata {

/**
 * Series cache statistics
 */
struct SeriesCacheStats {
    size_t hits;
    size_t misses;
    size_t stale_refreshes;
    size_t entries;
};

/**
 * Freshness-window cache of dated series, keyed by series name
 *
 * Features:
 * - Memory map backed by "<key>.series" files (date,value CSV) in cache_dir
 * - clear() removes only ".series" files, so the directory can be shared
 * - Entries older than the TTL are refetched; disk entries age from file mtime
 * - get_or_fetch holds the lock across the fetch, so concurrent callers never
 *   fetch the same series twice
 * - Empty cache_dir keeps the cache in memory only
 * - Disk errors degrade to a memory-only cache
 */
class SeriesCache {
public:
    using Fetcher = std::function<HistoricalSeries()>;

    /**
     * @param cache_dir Directory of the cache files ("" for memory only)
     * @param ttl_hours Freshness window (default: 24)
     */
    explicit SeriesCache(const std::string& cache_dir = "", double ttl_hours = 24.0);

    /**
     * Fresh entry if present, otherwise the result of `fetch`, which is stored
     * @param cache_hit Set to whether the value came from the cache
     * @throws whatever `fetch` throws; nothing is stored in that case
     */
    HistoricalSeries get_or_fetch(const std::string& key, const Fetcher& fetch,
                                  bool* cache_hit = nullptr);

    /**
     * Look up a fresh entry
     * @return true on hit
     */
    bool get(const std::string& key, HistoricalSeries& series);

    /**
     * Store an entry stamped with the current time
     */
    void put(const std::string& key, const HistoricalSeries& series);

    SeriesCacheStats get_stats() const;

    /**
     * Drop every entry, in memory and on disk
     */
    void clear();

    double ttl_hours() const { return ttl_hours_; }
    const std::filesystem::path& cache_dir() const { return cache_dir_; }

private:
    struct Entry {
        HistoricalSeries series;
        std::chrono::system_clock::time_point fetch_time;
    };

    enum class Lookup { HIT, MISS, STALE };

    std::filesystem::path cache_dir_;
    double ttl_hours_;
    bool persistent_;
    mutable std::mutex mutex_;

    std::map<std::string, Entry> entries_;

    size_t hits_;
    size_t misses_;
    size_t stale_refreshes_;

    // Callers hold mutex_
    Lookup lookup(const std::string& key, HistoricalSeries& series);
    void store(const std::string& key, const HistoricalSeries& series);
    bool is_fresh(const Entry& entry) const;
    std::filesystem::path get_cache_path(const std::string& key) const;
    void load_from_disk(const std::string& key);
    void save_to_disk(const std::string& key, const HistoricalSeries& series);
};

} // namespace marketdata
} // namespace hashcalc
