#include "cache/series_cache.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>

namespace hashcalc {
namespace marketdata {

namespace {

// Dedicated extension so clear() never touches other CSV files in the directory
const char* const CACHE_EXTENSION = ".series";

} // anonymous namespace

SeriesCache::SeriesCache(const std::string& cache_dir, double ttl_hours)
    : cache_dir_(cache_dir)
    , ttl_hours_(ttl_hours)
    , persistent_(!cache_dir.empty())
    , hits_(0)
    , misses_(0)
    , stale_refreshes_(0)
{
    if (persistent_) {
        std::error_code ec;
        std::filesystem::create_directories(cache_dir_, ec);
        if (ec) {
            // Read-only or invalid location: keep working from memory
            persistent_ = false;
        }
    }
}

std::filesystem::path SeriesCache::get_cache_path(const std::string& key) const {
    std::string filename = key;
    for (char& c : filename) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            c = '_';
        }
    }
    return cache_dir_ / (filename + CACHE_EXTENSION);
}

bool SeriesCache::is_fresh(const Entry& entry) const {
    auto age = std::chrono::system_clock::now() - entry.fetch_time;
    return std::chrono::duration<double, std::ratio<3600>>(age).count() < ttl_hours_;
}

void SeriesCache::load_from_disk(const std::string& key) {
    if (!persistent_) {
        return;
    }
    auto path = get_cache_path(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }

    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return;
    }
    auto age = std::filesystem::file_time_type::clock::now() - mtime;

    try {
        Entry entry;
        entry.series = load_series_csv(path.string());
        entry.fetch_time = std::chrono::system_clock::now() -
            std::chrono::duration_cast<std::chrono::system_clock::duration>(age);
        entries_[key] = std::move(entry);
    } catch (const std::exception&) {
        // Corrupt file: treat as a miss, the next store overwrites it
    }
}

void SeriesCache::save_to_disk(const std::string& key, const HistoricalSeries& series) {
    if (!persistent_) {
        return;
    }
    std::ofstream file(get_cache_path(key));
    if (!file.is_open()) {
        return;
    }
    file << "date,value\n";
    file << std::setprecision(std::numeric_limits<double>::max_digits10);
    for (const auto& point : series) {
        file << point.date << ',' << point.value << '\n';
    }
}

SeriesCache::Lookup SeriesCache::lookup(const std::string& key, HistoricalSeries& series) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        load_from_disk(key);
        it = entries_.find(key);
    }
    if (it == entries_.end()) {
        return Lookup::MISS;
    }
    if (!is_fresh(it->second)) {
        return Lookup::STALE;
    }
    series = it->second.series;
    return Lookup::HIT;
}

void SeriesCache::store(const std::string& key, const HistoricalSeries& series) {
    Entry entry;
    entry.series = series;
    entry.fetch_time = std::chrono::system_clock::now();
    entries_[key] = std::move(entry);
    save_to_disk(key, series);
}

HistoricalSeries SeriesCache::get_or_fetch(const std::string& key, const Fetcher& fetch,
                                           bool* cache_hit) {
    std::lock_guard<std::mutex> lock(mutex_);

    HistoricalSeries series;
    Lookup found = lookup(key, series);
    if (found == Lookup::HIT) {
        hits_++;
        if (cache_hit) *cache_hit = true;
        return series;
    }

    if (found == Lookup::STALE) {
        stale_refreshes_++;
    } else {
        misses_++;
    }

    series = fetch();
    store(key, series);
    if (cache_hit) *cache_hit = false;
    return series;
}

bool SeriesCache::get(const std::string& key, HistoricalSeries& series) {
    std::lock_guard<std::mutex> lock(mutex_);

    Lookup found = lookup(key, series);
    if (found == Lookup::HIT) {
        hits_++;
        return true;
    }
    misses_++;
    return false;
}

void SeriesCache::put(const std::string& key, const HistoricalSeries& series) {
    std::lock_guard<std::mutex> lock(mutex_);
    store(key, series);
}

SeriesCacheStats SeriesCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SeriesCacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.stale_refreshes = stale_refreshes_;
    stats.entries = entries_.size();
    return stats;
}

void SeriesCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    entries_.clear();
    if (!persistent_) {
        return;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(cache_dir_, ec)) {
        if (entry.path().extension() == CACHE_EXTENSION) {
            std::filesystem::remove(entry.path(), ec);
        }
    }
}

} // namespace marketdata
} // namespace hashcalc
