#ifndef HASHCALC_HOSTING_ALLOCATION_HPP
#define HASHCALC_HOSTING_ALLOCATION_HPP

#include "miner.hpp"
#include <map>
#include <string>
#include <vector>

namespace hashcalc {

struct Allocation {
    std::string site_id;
    std::string miner_id;
    int count;
};

struct SiteMinerAllocation {
    std::string miner_id;
    std::string miner_name;
    int count;
    double power_kw;
};

struct SiteBreakdown {
    std::string site_id;
    std::string site_name;
    double allocated_power_kw;
    double capacity_kw;
    double electricity_rate;
    double uptime_expectation;
    std::vector<SiteMinerAllocation> miners;
};

struct HostingAllocationResult {
    double total_power_kw;
    double blended_electricity_rate;   // power-weighted
    double blended_uptime;             // power-weighted
    double blended_hosting_fee_per_kw_month;
    double blended_curtailment_pct;
    std::vector<SiteBreakdown> sites;  // ordered by site id
    std::vector<std::string> warnings;
};

constexpr double LOW_UPTIME_THRESHOLD = 0.90;

// Blend a multi-site allocation. Unknown site or miner references are
// reported as warnings and skipped.
HostingAllocationResult validate_hosting_allocation(
    const std::vector<Allocation>& allocations,
    const std::map<std::string, HostingSiteSpec>& sites,
    const std::map<std::string, MinerSpec>& miners);

} // namespace hashcalc

#endif // HASHCALC_HOSTING_ALLOCATION_HPP
