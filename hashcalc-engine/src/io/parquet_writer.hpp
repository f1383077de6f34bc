#ifndef HASHCALC_PARQUET_WRITER_HPP
#define HASHCALC_PARQUET_WRITER_HPP

#include "../scenario.hpp"
#include <string>

namespace hashcalc {

class ParquetWriter {
public:
    /**
     * Write the monthly mining waterfall of every scenario to a Parquet file,
     * one row per (scenario, month).
     *
     * Output schema:
     *   - scenario: utf8
     *   - month: int32 (1-indexed)
     *   - btc_price_usd, btc_produced, btc_sell_opex, btc_for_yield,
     *     btc_to_capitalization, opex_usd, yield_paid_usd,
     *     capitalization_btc, capitalization_usd, health_score: float64
     *   - flag: utf8 (GREEN/RED)
     *
     * @param results Product results in run order
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if there is nothing to write or the file cannot be written
     */
    static void write_waterfall(const ProductScenarioResults& results, const std::string& filepath);

    /**
     * Write the monthly collateral ledger of every scenario.
     *
     * Output schema:
     *   - scenario: utf8
     *   - month: int32
     *   - btc_price_usd, btc_collateral, stablecoin_reserve, stablecoin_debt,
     *     yield_paid_usd, opex_usd, ltv_pct, net_equity_usd: float64
     *   - liquidation_risk: bool
     */
    static void write_collateral(const CollateralScenarioResults& results,
                                 const std::string& filepath);
};

} // namespace hashcalc

#endif // HASHCALC_PARQUET_WRITER_HPP
