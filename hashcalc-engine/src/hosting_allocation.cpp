#include "hosting_allocation.hpp"
#include "rounding.hpp"

namespace hashcalc {

HostingAllocationResult validate_hosting_allocation(
    const std::vector<Allocation>& allocations,
    const std::map<std::string, HostingSiteSpec>& sites,
    const std::map<std::string, MinerSpec>& miners) {

    HostingAllocationResult result;
    std::map<std::string, SiteBreakdown> by_site;

    double total_power = 0.0;
    double weighted_rate = 0.0;
    double weighted_uptime = 0.0;
    double weighted_fee = 0.0;
    double weighted_curtailment = 0.0;

    for (const auto& alloc : allocations) {
        auto site_it = sites.find(alloc.site_id);
        auto miner_it = miners.find(alloc.miner_id);
        if (site_it == sites.end() || miner_it == miners.end()) {
            result.warnings.push_back("Missing site " + alloc.site_id +
                                      " or miner " + alloc.miner_id);
            continue;
        }
        const HostingSiteSpec& site = site_it->second;
        const MinerSpec& miner = miner_it->second;

        double power_kw = miner.power_w * alloc.count / 1000.0;

        auto [entry, inserted] = by_site.try_emplace(alloc.site_id);
        SiteBreakdown& breakdown = entry->second;
        if (inserted) {
            breakdown.site_id = alloc.site_id;
            breakdown.site_name = site.name;
            breakdown.allocated_power_kw = 0.0;
            breakdown.capacity_kw = site.capacity_mw * 1000.0;
            breakdown.electricity_rate = site.electricity_rate;
            breakdown.uptime_expectation = site.uptime_expectation;
        }
        breakdown.allocated_power_kw += power_kw;
        breakdown.miners.push_back({alloc.miner_id, miner.name, alloc.count, power_kw});

        total_power += power_kw;
        weighted_rate += site.electricity_rate * power_kw;
        weighted_uptime += site.uptime_expectation * power_kw;
        weighted_fee += site.hosting_fee_per_kw_month * power_kw;
        weighted_curtailment += site.curtailment_pct * power_kw;
    }

    for (auto& [site_id, breakdown] : by_site) {
        if (breakdown.allocated_power_kw > breakdown.capacity_kw) {
            result.warnings.push_back(
                "CAPACITY EXCEEDED at " + breakdown.site_name + ": " +
                format_fixed(breakdown.allocated_power_kw, 0) + " kW allocated vs " +
                format_fixed(breakdown.capacity_kw, 0) + " kW available");
        }
        if (breakdown.uptime_expectation < LOW_UPTIME_THRESHOLD) {
            result.warnings.push_back(
                "Low uptime at " + breakdown.site_name + ": " +
                format_fixed(breakdown.uptime_expectation * 100.0, 0) + "%");
        }
        breakdown.allocated_power_kw = round_to(breakdown.allocated_power_kw, 2);
        result.sites.push_back(breakdown);
    }

    if (by_site.size() == 1 && total_power > 0.0) {
        result.warnings.push_back("Single-site concentration risk: all miners at one location");
    }

    result.total_power_kw = round_to(total_power, 2);
    if (total_power > 0.0) {
        result.blended_electricity_rate = round_ratio(weighted_rate / total_power);
        result.blended_uptime = round_ratio(weighted_uptime / total_power);
        result.blended_hosting_fee_per_kw_month = round_usd(weighted_fee / total_power);
        result.blended_curtailment_pct = round_ratio(weighted_curtailment / total_power);
    } else {
        result.blended_electricity_rate = 0.0;
        result.blended_uptime = 0.0;
        result.blended_hosting_fee_per_kw_month = 0.0;
        result.blended_curtailment_pct = 0.0;
    }

    return result;
}

} // namespace hashcalc
