#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "hosting_allocation.hpp"
#include <algorithm>

using namespace hashcalc;
using Catch::Matchers::WithinAbs;

namespace {

HostingSiteSpec make_site(const std::string& name, double rate, double uptime, double capacity_mw) {
    HostingSiteSpec site;
    site.name = name;
    site.electricity_rate = rate;
    site.uptime_expectation = uptime;
    site.capacity_mw = capacity_mw;
    site.hosting_fee_per_kw_month = 10.0;
    return site;
}

MinerSpec make_miner(const std::string& name, double power_w) {
    MinerSpec miner;
    miner.name = name;
    miner.hashrate_th = 200.0;
    miner.power_w = power_w;
    return miner;
}

bool has_warning(const HostingAllocationResult& result, const std::string& text) {
    return std::find(result.warnings.begin(), result.warnings.end(), text) != result.warnings.end();
}

} // anonymous namespace

TEST_CASE("Two-site allocation blends by power", "[hosting]") {
    std::map<std::string, HostingSiteSpec> sites{
        {"tx", make_site("Texas", 0.04, 0.95, 1.0)},
        {"no", make_site("Norway", 0.06, 0.97, 1.0)},
    };
    std::map<std::string, MinerSpec> miners{{"s21", make_miner("S21", 3500.0)}};

    // 105 kW in Texas, 35 kW in Norway
    auto result = validate_hosting_allocation({{"tx", "s21", 30}, {"no", "s21", 10}}, sites, miners);

    REQUIRE_THAT(result.total_power_kw, WithinAbs(140.0, 1e-9));
    REQUIRE_THAT(result.blended_electricity_rate, WithinAbs(0.045, 1e-9));
    REQUIRE_THAT(result.blended_uptime, WithinAbs(0.955, 1e-9));
    REQUIRE_THAT(result.blended_hosting_fee_per_kw_month, WithinAbs(10.0, 1e-9));
    REQUIRE(result.warnings.empty());

    REQUIRE(result.sites.size() == 2);
    REQUIRE(result.sites[0].site_id == "no");
    REQUIRE(result.sites[1].site_id == "tx");
    REQUIRE_THAT(result.sites[1].allocated_power_kw, WithinAbs(105.0, 1e-9));
    REQUIRE(result.sites[1].capacity_kw == 1000.0);
    REQUIRE(result.sites[1].miners[0].miner_name == "S21");
}

TEST_CASE("Over-capacity site is reported", "[hosting][warning]") {
    std::map<std::string, HostingSiteSpec> sites{
        {"a", make_site("Alpha", 0.05, 0.95, 0.1)},
        {"b", make_site("Beta", 0.05, 0.95, 1.0)},
    };
    std::map<std::string, MinerSpec> miners{{"m", make_miner("M", 3500.0)}};

    auto result = validate_hosting_allocation({{"a", "m", 40}, {"b", "m", 1}}, sites, miners);

    REQUIRE(has_warning(result, "CAPACITY EXCEEDED at Alpha: 140 kW allocated vs 100 kW available"));
}

TEST_CASE("Low-uptime site is reported", "[hosting][warning]") {
    std::map<std::string, HostingSiteSpec> sites{
        {"a", make_site("Alpha", 0.05, 0.85, 1.0)},
        {"b", make_site("Beta", 0.05, 0.95, 1.0)},
    };
    std::map<std::string, MinerSpec> miners{{"m", make_miner("M", 3500.0)}};

    auto result = validate_hosting_allocation({{"a", "m", 1}, {"b", "m", 1}}, sites, miners);

    REQUIRE(has_warning(result, "Low uptime at Alpha: 85%"));
    REQUIRE(result.warnings.size() == 1);
}

TEST_CASE("Single site raises concentration risk", "[hosting][warning]") {
    std::map<std::string, HostingSiteSpec> sites{{"a", make_site("Alpha", 0.05, 0.95, 1.0)}};
    std::map<std::string, MinerSpec> miners{{"m", make_miner("M", 3500.0)}};

    auto result = validate_hosting_allocation({{"a", "m", 10}}, sites, miners);

    REQUIRE(has_warning(result, "Single-site concentration risk: all miners at one location"));
}

TEST_CASE("Unknown references are skipped with a warning", "[hosting][warning]") {
    std::map<std::string, HostingSiteSpec> sites{{"a", make_site("Alpha", 0.05, 0.95, 1.0)}};
    std::map<std::string, MinerSpec> miners{{"m", make_miner("M", 3500.0)}};

    auto result = validate_hosting_allocation({{"zz", "m", 10}, {"a", "xx", 5}}, sites, miners);

    REQUIRE(has_warning(result, "Missing site zz or miner m"));
    REQUIRE(has_warning(result, "Missing site a or miner xx"));
    REQUIRE(result.sites.empty());
    REQUIRE(result.total_power_kw == 0.0);
    REQUIRE(result.blended_electricity_rate == 0.0);
}
