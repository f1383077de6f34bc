#include "market_history.hpp"
#include "errors.hpp"
#include "io/csv_reader.hpp"
#include <filesystem>
#include <fstream>
#include <map>

namespace hashcalc {

namespace {

std::string month_of(const std::string& date) {
    if (date.size() < 7) {
        throw DataUnavailableError("Malformed date in series: '" + date + "'");
    }
    return date.substr(0, 7);
}

} // anonymous namespace

HistoricalSeries resample_monthly(const HistoricalSeries& series,
                                  MonthlyAggregation aggregation) {
    HistoricalSeries monthly;
    std::string current;
    double sum = 0.0;
    size_t count = 0;
    double last = 0.0;
    bool have_last = false;

    auto close_month = [&]() {
        if (current.empty()) return;
        if (aggregation == MonthlyAggregation::MEAN) {
            if (count > 0) {
                monthly.push_back({current, sum / static_cast<double>(count)});
            }
        } else if (have_last) {
            monthly.push_back({current, last});
        }
    };

    for (const auto& obs : series) {
        std::string month = month_of(obs.date);
        if (month != current) {
            close_month();
            current = month;
            sum = 0.0;
            count = 0;
            have_last = false;
        }
        if (aggregation == MonthlyAggregation::MEAN) {
            if (obs.value > 0.0) {
                sum += obs.value;
                ++count;
            }
        } else {
            last = obs.value;
            have_last = true;
        }
    }
    close_month();

    return monthly;
}

std::vector<double> series_values(const HistoricalSeries& series) {
    std::vector<double> values;
    values.reserve(series.size());
    for (const auto& obs : series) {
        values.push_back(obs.value);
    }
    return values;
}

NetworkHistory align_network_history(const HistoricalSeries& hashrate_eh,
                                     const HistoricalSeries& difficulty,
                                     const HistoricalSeries& fees_per_block) {
    std::map<std::string, double> diff_by_month;
    std::map<std::string, double> fee_by_month;
    for (const auto& obs : difficulty) diff_by_month[obs.date] = obs.value;
    for (const auto& obs : fees_per_block) fee_by_month[obs.date] = obs.value;

    NetworkHistory history;
    for (const auto& obs : hashrate_eh) {
        auto d = diff_by_month.find(obs.date);
        auto f = fee_by_month.find(obs.date);
        if (d == diff_by_month.end() || f == fee_by_month.end()) {
            continue;
        }
        history.months.push_back(obs.date);
        history.hashrate_eh.push_back(obs.value);
        history.difficulty.push_back(d->second);
        history.fees_per_block_btc.push_back(f->second);
    }
    return history;
}

HistoricalSeries load_series_csv(std::istream& is) {
    CsvReader reader(is);
    HistoricalSeries series;
    bool first = true;

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty() || (row.size() == 1 && row[0].empty())) {
            continue;
        }
        if (row.size() < 2) {
            throw DataUnavailableError("Series row has fewer than 2 columns");
        }
        try {
            series.push_back({row[0], std::stod(row[1])});
        } catch (const std::invalid_argument&) {
            if (!first) {
                throw DataUnavailableError("Non-numeric value in series row: " + row[1]);
            }
            // header row
        }
        first = false;
    }
    return series;
}

HistoricalSeries load_series_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw DataUnavailableError("Cannot open series file: " + filepath);
    }
    return load_series_csv(file);
}

// ============================================================================
// CsvHistorySource
// ============================================================================

CsvHistorySource::CsvHistorySource(const std::string& directory)
    : directory_(directory) {}

HistoricalSeries CsvHistorySource::load(const std::string& filename) const {
    auto path = std::filesystem::path(directory_) / filename;
    return load_series_csv(path.string());
}

HistoricalSeries CsvHistorySource::monthly_btc_prices() {
    return resample_monthly(load("btc_price.csv"), MonthlyAggregation::LAST);
}

NetworkHistory CsvHistorySource::monthly_network_history() {
    return align_network_history(
        resample_monthly(load("hashrate.csv"), MonthlyAggregation::MEAN),
        resample_monthly(load("difficulty.csv"), MonthlyAggregation::MEAN),
        resample_monthly(load("fees.csv"), MonthlyAggregation::MEAN));
}

} // namespace hashcalc
