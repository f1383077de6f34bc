#include "parquet_writer.hpp"
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#include <memory>
#include <utility>
#include <vector>
#endif

namespace hashcalc {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error("Failed to " + what + ": " + status.ToString());
    }
}

template <typename Builder>
std::shared_ptr<arrow::Array> finish(Builder& builder, const std::string& column) {
    std::shared_ptr<arrow::Array> array;
    check(builder.Finish(&array), "finish " + column + " array");
    return array;
}

// Accumulates float64 columns keyed by position in the schema
class DoubleColumns {
public:
    explicit DoubleColumns(std::vector<std::string> names)
        : names_(std::move(names)) {
        for (size_t i = 0; i < names_.size(); ++i) {
            builders_.push_back(std::make_unique<arrow::DoubleBuilder>());
        }
    }

    void append(size_t column, double value) {
        check(builders_[column]->Append(value), "append " + names_[column]);
    }

    void finish_into(std::vector<std::shared_ptr<arrow::Field>>& fields,
                     std::vector<std::shared_ptr<arrow::Array>>& arrays) {
        for (size_t i = 0; i < names_.size(); ++i) {
            fields.push_back(arrow::field(names_[i], arrow::float64()));
            arrays.push_back(finish(*builders_[i], names_[i]));
        }
    }

private:
    std::vector<std::string> names_;
    std::vector<std::unique_ptr<arrow::DoubleBuilder>> builders_;
};

void write_table(const std::shared_ptr<arrow::Table>& table, const std::string& filepath) {
    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *opened;

    check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                     1024 * 1024),
          "write Parquet table");
    check(outfile->Close(), "close Parquet file");
}

} // anonymous namespace

void ParquetWriter::write_waterfall(const ProductScenarioResults& results,
                                    const std::string& filepath) {
    if (results.empty()) {
        throw std::runtime_error("No scenario results to write");
    }

    arrow::StringBuilder scenario_builder;
    arrow::Int32Builder month_builder;
    arrow::StringBuilder flag_builder;
    DoubleColumns values({"btc_price_usd", "btc_produced", "btc_sell_opex", "btc_for_yield",
                          "btc_to_capitalization", "opex_usd", "yield_paid_usd",
                          "capitalization_btc", "capitalization_usd", "health_score"});

    for (const auto& outcome : results) {
        for (const auto& m : outcome.result.mining_bucket.monthly) {
            check(scenario_builder.Append(outcome.scenario), "append scenario");
            check(month_builder.Append(m.month), "append month");
            check(flag_builder.Append(to_string(m.flag)), "append flag");
            values.append(0, m.btc_price_usd);
            values.append(1, m.btc_produced);
            values.append(2, m.btc_sell_opex);
            values.append(3, m.btc_for_yield);
            values.append(4, m.btc_to_capitalization);
            values.append(5, m.opex_usd);
            values.append(6, m.yield_paid_usd);
            values.append(7, m.capitalization_btc);
            values.append(8, m.capitalization_usd);
            values.append(9, m.health_score);
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("scenario", arrow::utf8()),
        arrow::field("month", arrow::int32()),
    };
    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        finish(scenario_builder, "scenario"),
        finish(month_builder, "month"),
    };
    values.finish_into(fields, arrays);
    fields.push_back(arrow::field("flag", arrow::utf8()));
    arrays.push_back(finish(flag_builder, "flag"));

    write_table(arrow::Table::Make(arrow::schema(fields), arrays), filepath);
}

void ParquetWriter::write_collateral(const CollateralScenarioResults& results,
                                     const std::string& filepath) {
    if (results.empty()) {
        throw std::runtime_error("No scenario results to write");
    }

    arrow::StringBuilder scenario_builder;
    arrow::Int32Builder month_builder;
    arrow::BooleanBuilder risk_builder;
    DoubleColumns values({"btc_price_usd", "btc_collateral", "stablecoin_reserve",
                          "stablecoin_debt", "yield_paid_usd", "opex_usd", "ltv_pct",
                          "net_equity_usd"});

    for (const auto& outcome : results) {
        for (const auto& m : outcome.result.monthly) {
            check(scenario_builder.Append(outcome.scenario), "append scenario");
            check(month_builder.Append(m.month), "append month");
            check(risk_builder.Append(m.liquidation_risk), "append liquidation_risk");
            values.append(0, m.btc_price_usd);
            values.append(1, m.btc_collateral);
            values.append(2, m.stablecoin_reserve);
            values.append(3, m.stablecoin_debt);
            values.append(4, m.yield_paid_usd);
            values.append(5, m.opex_usd);
            values.append(6, m.ltv_pct);
            values.append(7, m.net_equity_usd);
        }
    }

    std::vector<std::shared_ptr<arrow::Field>> fields = {
        arrow::field("scenario", arrow::utf8()),
        arrow::field("month", arrow::int32()),
    };
    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        finish(scenario_builder, "scenario"),
        finish(month_builder, "month"),
    };
    values.finish_into(fields, arrays);
    fields.push_back(arrow::field("liquidation_risk", arrow::boolean()));
    arrays.push_back(finish(risk_builder, "liquidation_risk"));

    write_table(arrow::Table::Make(arrow::schema(fields), arrays), filepath);
}

#else // !HAVE_ARROW

void ParquetWriter::write_waterfall(const ProductScenarioResults& /* results */,
                                    const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

void ParquetWriter::write_collateral(const CollateralScenarioResults& /* results */,
                                     const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

#endif // HAVE_ARROW

} // namespace hashcalc
