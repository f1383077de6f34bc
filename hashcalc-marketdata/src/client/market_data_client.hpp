#pragma once

#include "api/http_client.hpp"
#include "cache/series_cache.hpp"
#include "logger.hpp"
#include "market_history.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace hashcalc {
namespace marketdata {

/**
 * Endpoints and caching for MarketDataClient
 */
struct MarketDataClientConfig {
    std::string cache_dir;             ///< "" keeps the cache in memory only
    double ttl_hours;                  ///< Freshness window of cached series
    long timeout_ms;                   ///< Per-request HTTP timeout
    std::string price_base_url;        ///< Yahoo Finance chart API
    std::string network_base_url;      ///< blockchain.info charts API
    std::string price_symbol;          ///< Yahoo ticker

    MarketDataClientConfig();
};

/**
 * @brief Historical market data for forecast mode
 *
 * Fetches daily BTC/USD closes from the Yahoo Finance chart API and network
 * hashrate, difficulty and transaction fees from the blockchain.info charts
 * API, caches each daily series by name and resamples to months. Fetch and
 * parse failures surface as DataUnavailableError.
 *
 * Thread-safe: the cache serializes refreshes and each HttpClient guards its
 * handle.
 */
class MarketDataClient : public MarketHistorySource {
public:
    /**
     * @param logger Optional sink for series_fetched events (not owned)
     */
    explicit MarketDataClient(const MarketDataClientConfig& config,
                              Logger* logger = nullptr,
                              const RunContext& ctx = RunContext());

    /// Month-end closes, "YYYY-MM"
    HistoricalSeries monthly_btc_prices() override;

    /// Monthly means of hashrate (EH/s), difficulty and fees per block (BTC)
    NetworkHistory monthly_network_history() override;

    HistoricalSeries daily_btc_prices();
    HistoricalSeries daily_hashrate_eh();
    HistoricalSeries daily_difficulty();
    HistoricalSeries daily_fees_per_block();

    SeriesCacheStats cache_stats() const;

    /**
     * @brief Parses a Yahoo chart response into daily closes
     *
     * Null closes are skipped; a repeated date keeps its first value.
     * @throws DataUnavailableError on a malformed body or an API error object
     */
    static HistoricalSeries parse_yahoo_chart(const std::string& body);

    /**
     * @brief Parses a blockchain.info chart response ({"values": [{"x", "y"}]})
     * @throws DataUnavailableError on a malformed body or an empty series
     */
    static HistoricalSeries parse_blockchain_chart(const std::string& body,
                                                   const std::string& chart_name);

    /**
     * @brief Rescales a hashrate series to EH/s
     *
     * The unit is inferred from the latest value: above 1e15 H/s, above 1e9
     * TH/s, above 1e3 PH/s, otherwise already EH/s.
     */
    static HistoricalSeries to_exahash(const HistoricalSeries& raw);

    /// Daily total fees divided by 144 blocks per day
    static HistoricalSeries to_fees_per_block(const HistoricalSeries& daily_total_btc);

    /// Unix seconds to a UTC "YYYY-MM-DD" date
    static std::string unix_to_date(int64_t seconds);

private:
    MarketDataClientConfig config_;
    Logger* logger_;
    RunContext ctx_;

    std::unique_ptr<HttpClient> price_http_;
    std::unique_ptr<HttpClient> network_http_;
    std::unique_ptr<SeriesCache> cache_;

    HistoricalSeries cached(const std::string& key, const SeriesCache::Fetcher& fetch);
    HistoricalSeries fetch_chart(const std::string& chart_name);
};

} // namespace marketdata
} // namespace hashcalc
