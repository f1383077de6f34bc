#ifndef HASHCALC_MARKET_HISTORY_HPP
#define HASHCALC_MARKET_HISTORY_HPP

#include <istream>
#include <string>
#include <vector>

namespace hashcalc {

// One observation of a historical series. Dates are ISO "YYYY-MM-DD" for
// daily data and "YYYY-MM" once resampled to months.
struct DatedValue {
    std::string date;
    double value;
};

using HistoricalSeries = std::vector<DatedValue>;

// Monthly network history, all vectors aligned on `months`
struct NetworkHistory {
    std::vector<std::string> months;
    std::vector<double> hashrate_eh;
    std::vector<double> difficulty;
    std::vector<double> fees_per_block_btc;

    size_t size() const { return months.size(); }
};

enum class MonthlyAggregation {
    LAST,   // month-end value (prices)
    MEAN    // monthly average (network statistics)
};

// Collapse a dated series into one value per calendar month. Input must be
// sorted by date. MEAN drops non-positive observations before averaging;
// months left without observations are omitted.
HistoricalSeries resample_monthly(const HistoricalSeries& series,
                                  MonthlyAggregation aggregation);

// Values of a series in order
std::vector<double> series_values(const HistoricalSeries& series);

// Inner-join three monthly series on their month label
NetworkHistory align_network_history(const HistoricalSeries& hashrate_eh,
                                     const HistoricalSeries& difficulty,
                                     const HistoricalSeries& fees_per_block);

// Read a "date,value" CSV (header row optional)
HistoricalSeries load_series_csv(std::istream& is);
HistoricalSeries load_series_csv(const std::string& filepath);

// Source of monthly history for forecast mode. Implementations may hit the
// network; failures surface as DataUnavailableError.
class MarketHistorySource {
public:
    virtual ~MarketHistorySource() = default;

    virtual HistoricalSeries monthly_btc_prices() = 0;
    virtual NetworkHistory monthly_network_history() = 0;
};

// Offline source backed by CSV files in one directory:
// btc_price.csv, hashrate.csv (EH/s), difficulty.csv, fees.csv (BTC per block).
// Daily files are resampled; monthly files pass through unchanged.
class CsvHistorySource : public MarketHistorySource {
public:
    explicit CsvHistorySource(const std::string& directory);

    HistoricalSeries monthly_btc_prices() override;
    NetworkHistory monthly_network_history() override;

private:
    std::string directory_;

    HistoricalSeries load(const std::string& filename) const;
};

} // namespace hashcalc

#endif // HASHCALC_MARKET_HISTORY_HPP
