#include <vmplace/io/scenario_generation.hpp>

#include <vmplace/algo/objective_evaluator.hpp>
#include <vmplace/algo/placement_engine.hpp>

#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace vmplace::io;
using namespace vmplace::core;

class ScenarioGenerationTest : public ::testing::Test {
protected:
    std::mt19937 rng{42}; // Fixed seed for reproducibility
};

namespace {

bool has_at_most_decimals(double value, int decimals) {
    double scaled = value * std::pow(10.0, decimals);
    return std::abs(scaled - std::round(scaled)) < 1e-6;
}

bool is_integer(double value) {
    return value == std::floor(value);
}

} // anonymous namespace

// =============================================================================
// Fixed scenario
// =============================================================================

TEST_F(ScenarioGenerationTest, FixedHostsMatchDemoData) {
    auto hosts = fixed_hosts();
    ASSERT_EQ(hosts.size(), 5U);
    EXPECT_EQ(hosts[0].host_id, "H1");
    EXPECT_DOUBLE_EQ(hosts[0].cpu_capacity, 92.0);
    EXPECT_DOUBLE_EQ(hosts[1].ram_capacity, 102.0);
    EXPECT_DOUBLE_EQ(hosts[2].energy, 0.532);
    EXPECT_DOUBLE_EQ(hosts[4].cost, 0.2744);
    EXPECT_EQ(hosts[4].host_id, "H5");
}

TEST_F(ScenarioGenerationTest, FixedVmsMatchDemoData) {
    auto vms = fixed_vms();
    ASSERT_EQ(vms.size(), 3U);
    EXPECT_EQ(vms[1].vm_id, "VM2");
    EXPECT_DOUBLE_EQ(vms[1].cpu_demand, 16.0);
    EXPECT_DOUBLE_EQ(vms[2].ram_demand, 22.0);
}

TEST_F(ScenarioGenerationTest, FixedTruncates) {
    EXPECT_EQ(fixed_hosts(2).size(), 2U);
    EXPECT_EQ(fixed_vms(0).size(), 0U);
}

TEST_F(ScenarioGenerationTest, FixedTooManyThrows) {
    EXPECT_THROW((void)fixed_hosts(6), std::invalid_argument);
    EXPECT_THROW((void)fixed_vms(4), std::invalid_argument);
}

TEST_F(ScenarioGenerationTest, FixedScenarioPlacesAllVms) {
    auto scenario = fixed_scenario();
    auto pool = scenario.make_pool();
    vmplace::algo::PlacementEngine engine;

    auto placements = engine.place_all(pool, scenario.vms, PlacementWeights{});
    ASSERT_EQ(placements.size(), 3U);
    for (const auto& p : placements) {
        EXPECT_TRUE(p.result.feasible()) << p.vm_id;
    }
    EXPECT_EQ(placements[0].result.host_id, "H1");
}

// =============================================================================
// Random generation
// =============================================================================

TEST_F(ScenarioGenerationTest, GeneratedHostsWithinRanges) {
    auto hosts = generate_hosts(200, rng);
    ASSERT_EQ(hosts.size(), 200U);
    EXPECT_EQ(hosts[0].host_id, "H1");
    EXPECT_EQ(hosts[199].host_id, "H200");

    for (const auto& host : hosts) {
        EXPECT_GE(host.cpu_capacity, 50.0);
        EXPECT_LE(host.cpu_capacity, 120.0);
        EXPECT_TRUE(is_integer(host.cpu_capacity));
        EXPECT_GE(host.ram_capacity, 64.0);
        EXPECT_LE(host.ram_capacity, 128.0);
        EXPECT_GE(host.energy, 0.3);
        EXPECT_LE(host.energy, 1.5);
        EXPECT_TRUE(has_at_most_decimals(host.energy, 4));
        EXPECT_GE(host.cost, 0.2);
        EXPECT_LE(host.cost, 0.8);
        EXPECT_TRUE(has_at_most_decimals(host.cost, 4));
        // Already the shortest four-decimal form, so rounding again is a no-op
        EXPECT_EQ(vmplace::algo::round_to(host.energy, 4), host.energy);
        EXPECT_EQ(vmplace::algo::round_to(host.cost, 4), host.cost);
        EXPECT_NO_THROW(validate_host(host));
    }
}

TEST_F(ScenarioGenerationTest, GeneratedVmsWithinRanges) {
    auto vms = generate_vms(200, rng);
    ASSERT_EQ(vms.size(), 200U);
    for (const auto& vm : vms) {
        EXPECT_GE(vm.cpu_demand, 4.0);
        EXPECT_LE(vm.cpu_demand, 20.0);
        EXPECT_GE(vm.ram_demand, 8.0);
        EXPECT_LE(vm.ram_demand, 32.0);
        EXPECT_TRUE(is_integer(vm.ram_demand));
    }
}

TEST_F(ScenarioGenerationTest, SameSeedSameScenario) {
    std::mt19937 a{7};
    std::mt19937 b{7};
    auto first = generate_scenario(10, 20, a);
    auto second = generate_scenario(10, 20, b);

    ASSERT_EQ(first.hosts.size(), second.hosts.size());
    for (std::size_t i = 0; i < first.hosts.size(); ++i) {
        EXPECT_EQ(first.hosts[i].cpu_capacity, second.hosts[i].cpu_capacity);
        EXPECT_EQ(first.hosts[i].energy, second.hosts[i].energy);
    }
    ASSERT_EQ(first.vms.size(), 20U);
    for (std::size_t i = 0; i < first.vms.size(); ++i) {
        EXPECT_EQ(first.vms[i].cpu_demand, second.vms[i].cpu_demand);
    }
}

// =============================================================================
// Telemetry
// =============================================================================

TEST_F(ScenarioGenerationTest, ReferenceHostLabel) {
    EXPECT_EQ(reference_host_label(33.0, 11.0), "Host1");
    EXPECT_EQ(reference_host_label(10.0, 12.0), "Host2");
    EXPECT_EQ(reference_host_label(66.0, 22.0), "Host2");
    EXPECT_EQ(reference_host_label(67.0, 5.0), "Host3");
    EXPECT_EQ(reference_host_label(20.0, 23.0), "Host3");
}

TEST_F(ScenarioGenerationTest, TelemetryCyclesVmsAndIsLabelled) {
    auto records = generate_telemetry(25, rng);
    ASSERT_EQ(records.size(), 25U);
    EXPECT_EQ(records[0].sample.vm, "VM1");
    EXPECT_EQ(records[9].sample.vm, "VM10");
    EXPECT_EQ(records[10].sample.vm, "VM1");

    for (const auto& record : records) {
        const auto& s = record.sample;
        EXPECT_GE(s.cpu, 10.0);
        EXPECT_LE(s.cpu, 90.0);
        EXPECT_GE(s.memory, 1.0);
        EXPECT_LE(s.memory, 32.0);
        EXPECT_GE(s.network_io, 0.1);
        EXPECT_LE(s.network_io, 5.0);
        EXPECT_GE(s.power, 100.0);
        EXPECT_LE(s.power, 300.0);
        EXPECT_EQ(record.host, reference_host_label(s.cpu, s.memory));
    }
}

TEST_F(ScenarioGenerationTest, WriteTelemetry) {
    auto records = generate_telemetry(3, rng);

    std::ostringstream oss;
    write_telemetry_to_stream(records, oss);

    rapidjson::Document doc;
    doc.Parse(oss.str().c_str());
    ASSERT_FALSE(doc.HasParseError());
    ASSERT_EQ(doc["records"].Size(), 3U);
    EXPECT_STREQ(doc["records"][2]["vm"].GetString(), "VM3");
    EXPECT_EQ(std::string(doc["records"][0]["host"].GetString()), records[0].host);
    EXPECT_DOUBLE_EQ(doc["records"][1]["power"].GetDouble(), records[1].sample.power);
}
