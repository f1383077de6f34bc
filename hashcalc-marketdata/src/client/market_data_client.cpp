#include "client/market_data_client.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <set>

using json = nlohmann::json;

namespace hashcalc {
namespace marketdata {

namespace {

constexpr double BLOCKS_PER_DAY = 144.0;
constexpr size_t MIN_PRICE_DAYS = 30;

void sort_by_date(HistoricalSeries& series) {
    std::stable_sort(series.begin(), series.end(),
                     [](const DatedValue& a, const DatedValue& b) { return a.date < b.date; });
}

} // anonymous namespace

MarketDataClientConfig::MarketDataClientConfig()
    : ttl_hours(24.0)
    , timeout_ms(60000)
    , price_base_url("https://query1.finance.yahoo.com")
    , network_base_url("https://api.blockchain.info")
    , price_symbol("BTC-USD") {}

MarketDataClient::MarketDataClient(const MarketDataClientConfig& config,
                                   Logger* logger,
                                   const RunContext& ctx)
    : config_(config)
    , logger_(logger)
    , ctx_(ctx)
    , price_http_(std::make_unique<HttpClient>(config.price_base_url, config.timeout_ms))
    , network_http_(std::make_unique<HttpClient>(config.network_base_url, config.timeout_ms))
    , cache_(std::make_unique<SeriesCache>(config.cache_dir, config.ttl_hours)) {}

// ============================================================================
// Parsing
// ============================================================================

std::string MarketDataClient::unix_to_date(int64_t seconds) {
    std::time_t t = static_cast<std::time_t>(seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return buf;
}

HistoricalSeries MarketDataClient::parse_yahoo_chart(const std::string& body) {
    try {
        json doc = json::parse(body);
        const json& chart = doc.at("chart");
        if (chart.contains("error") && !chart["error"].is_null()) {
            std::string description = chart["error"].value("description", "unknown error");
            throw DataUnavailableError("Price API error: " + description);
        }
        const json& results = chart.at("result");
        if (!results.is_array() || results.empty()) {
            throw DataUnavailableError("Price API returned no result");
        }
        const json& result = results.at(0);
        const json& timestamps = result.at("timestamp");
        const json& closes = result.at("indicators").at("quote").at(0).at("close");

        HistoricalSeries series;
        std::set<std::string> seen;
        size_t n = std::min(timestamps.size(), closes.size());
        for (size_t i = 0; i < n; ++i) {
            if (closes[i].is_null()) {
                continue;
            }
            std::string date = unix_to_date(timestamps[i].get<int64_t>());
            if (!seen.insert(date).second) {
                continue;
            }
            series.push_back({date, closes[i].get<double>()});
        }
        sort_by_date(series);
        return series;
    } catch (const json::exception& e) {
        throw DataUnavailableError(std::string("Malformed price response: ") + e.what());
    }
}

HistoricalSeries MarketDataClient::parse_blockchain_chart(const std::string& body,
                                                          const std::string& chart_name) {
    HistoricalSeries series;
    try {
        json doc = json::parse(body);
        const json& values = doc.at("values");
        for (const auto& point : values) {
            if (point.at("y").is_null()) {
                continue;
            }
            series.push_back({unix_to_date(point.at("x").get<int64_t>()),
                              point.at("y").get<double>()});
        }
    } catch (const json::exception& e) {
        throw DataUnavailableError("Malformed " + chart_name + " response: " + e.what());
    }
    if (series.empty()) {
        throw DataUnavailableError("No " + chart_name + " data returned");
    }
    sort_by_date(series);
    return series;
}

HistoricalSeries MarketDataClient::to_exahash(const HistoricalSeries& raw) {
    if (raw.empty()) {
        return raw;
    }
    double recent = raw.back().value;
    double divisor = 1.0;
    if (recent > 1e15) {
        divisor = 1e18;      // H/s
    } else if (recent > 1e9) {
        divisor = 1e6;       // TH/s
    } else if (recent > 1e3) {
        divisor = 1e3;       // PH/s
    }

    HistoricalSeries out;
    out.reserve(raw.size());
    for (const auto& point : raw) {
        out.push_back({point.date, point.value / divisor});
    }
    return out;
}

HistoricalSeries MarketDataClient::to_fees_per_block(const HistoricalSeries& daily_total_btc) {
    HistoricalSeries out;
    out.reserve(daily_total_btc.size());
    for (const auto& point : daily_total_btc) {
        out.push_back({point.date, point.value / BLOCKS_PER_DAY});
    }
    return out;
}

// ============================================================================
// Fetching
// ============================================================================

HistoricalSeries MarketDataClient::cached(const std::string& key,
                                          const SeriesCache::Fetcher& fetch) {
    bool hit = false;
    HistoricalSeries series = cache_->get_or_fetch(key, fetch, &hit);
    if (logger_) {
        logger_->log_series_fetched(ctx_, key, series.size(), hit);
    }
    return series;
}

HistoricalSeries MarketDataClient::fetch_chart(const std::string& chart_name) {
    try {
        HttpResponse response = network_http_->get(
            "/charts/" + chart_name,
            {{"timespan", "all"}, {"format", "json"}, {"cors", "true"}});
        return parse_blockchain_chart(response.body, chart_name);
    } catch (const HttpClientError& e) {
        throw DataUnavailableError("Failed to fetch " + chart_name + " data: " + e.what());
    }
}

HistoricalSeries MarketDataClient::daily_btc_prices() {
    return cached("btc_daily_prices", [this]() {
        HistoricalSeries series;
        try {
            HttpResponse response = price_http_->get(
                "/v8/finance/chart/" + config_.price_symbol,
                {{"range", "max"}, {"interval", "1d"}});
            series = parse_yahoo_chart(response.body);
        } catch (const HttpClientError& e) {
            throw DataUnavailableError(std::string("Failed to fetch BTC prices: ") + e.what());
        }
        if (series.size() < MIN_PRICE_DAYS) {
            throw DataUnavailableError("Insufficient BTC price data: only " +
                                       std::to_string(series.size()) + " days returned");
        }
        return series;
    });
}

HistoricalSeries MarketDataClient::daily_hashrate_eh() {
    return cached("network_hashrate", [this]() { return to_exahash(fetch_chart("hash-rate")); });
}

HistoricalSeries MarketDataClient::daily_difficulty() {
    return cached("network_difficulty", [this]() { return fetch_chart("difficulty"); });
}

HistoricalSeries MarketDataClient::daily_fees_per_block() {
    return cached("network_fees", [this]() {
        return to_fees_per_block(fetch_chart("transaction-fees"));
    });
}

HistoricalSeries MarketDataClient::monthly_btc_prices() {
    return resample_monthly(daily_btc_prices(), MonthlyAggregation::LAST);
}

NetworkHistory MarketDataClient::monthly_network_history() {
    return align_network_history(
        resample_monthly(daily_hashrate_eh(), MonthlyAggregation::MEAN),
        resample_monthly(daily_difficulty(), MonthlyAggregation::MEAN),
        resample_monthly(daily_fees_per_block(), MonthlyAggregation::MEAN));
}

SeriesCacheStats MarketDataClient::cache_stats() const {
    return cache_->get_stats();
}

} // namespace marketdata
} // namespace hashcalc
