#include <vmplace/io/report_writer.hpp>
#include <vmplace/io/scenario_generation.hpp>

#include <vmplace/algo/objective_evaluator.hpp>
#include <vmplace/algo/placement_engine.hpp>

#include <gtest/gtest.h>

#include <rapidjson/document.h>

#include <sstream>
#include <string>

using namespace vmplace::io;
using namespace vmplace::algo;
using namespace vmplace::core;

class ReportWriterTest : public ::testing::Test {
protected:
    static rapidjson::Document parse(const std::string& text) {
        rapidjson::Document doc;
        doc.Parse(text.c_str());
        EXPECT_FALSE(doc.HasParseError());
        return doc;
    }
};

TEST_F(ReportWriterTest, PlacementReport) {
    auto scenario = fixed_scenario();
    scenario.vms.push_back(make_vm_demand("VM4", 500.0, 1.0));
    auto pool = scenario.make_pool();

    PlacementEngine engine;
    PlacementWeights weights;
    auto placements = engine.place_all(pool, scenario.vms, weights);

    std::ostringstream oss;
    write_placement_report(placements, pool, weights, oss);
    auto doc = parse(oss.str());

    ASSERT_TRUE(doc.IsObject());
    EXPECT_DOUBLE_EQ(doc["weights"]["cpu"].GetDouble(), 0.4);
    EXPECT_EQ(doc["placed"].GetUint64(), 3U);
    EXPECT_EQ(doc["rejected"].GetUint64(), 1U);

    const auto& list = doc["placements"];
    ASSERT_EQ(list.Size(), 4U);
    EXPECT_STREQ(list[0]["vm_id"].GetString(), "VM1");
    EXPECT_STREQ(list[0]["host_id"].GetString(), "H1");
    EXPECT_TRUE(list[0].HasMember("score"));
    EXPECT_EQ(list[0]["feasible_hosts"].GetUint64(), 5U);

    EXPECT_TRUE(list[3]["host_id"].IsNull());
    EXPECT_FALSE(list[3].HasMember("score"));
    EXPECT_EQ(list[3]["feasible_hosts"].GetUint64(), 0U);

    const auto& hosts = doc["hosts"];
    ASSERT_EQ(hosts.Size(), 5U);
    EXPECT_STREQ(hosts[0]["host_id"].GetString(), "H1");
    EXPECT_DOUBLE_EQ(hosts[0]["cpu_remaining"].GetDouble(), pool.host(std::size_t{0}).cpu_capacity);
}

TEST_F(ReportWriterTest, ObjectivesReport) {
    auto sample = make_telemetry_sample("VM1", 50.0, 16.0, 1.0, 150.0);
    auto objectives = ObjectiveEvaluator::evaluate(sample);

    std::ostringstream oss;
    write_objectives(sample, objectives, oss);
    auto doc = parse(oss.str());

    EXPECT_STREQ(doc["vm"].GetString(), "VM1");
    const auto& o = doc["objectives"];
    EXPECT_DOUBLE_EQ(o["proxy_cost"].GetDouble(), 20.5);
    EXPECT_DOUBLE_EQ(o["proxy_energy"].GetDouble(), 145.0);
    EXPECT_DOUBLE_EQ(o["proxy_load_balance"].GetDouble(), 66.0);
    EXPECT_DOUBLE_EQ(o["weighted_score"].GetDouble(), 0.307);
    EXPECT_DOUBLE_EQ(o["weights"]["cost"].GetDouble(), 0.34);
    EXPECT_DOUBLE_EQ(o["normalized"]["cost"].GetDouble(), 0.1025);
}

TEST_F(ReportWriterTest, RecommendationReport) {
    auto sample = make_telemetry_sample("VM1", 50.0, 16.0, 1.0, 150.0);

    Recommendation rec;
    rec.host = "Host2";
    rec.model = "random_forest";
    rec.confidence = 0.95;
    rec.features = FeatureVector{0.0, 50.0, 16.0, 1.0, 150.0, 3.125, 3.0};
    rec.objectives = ObjectiveEvaluator::evaluate(sample);
    rec.feature_importance = {{"cpu", 0.61}, {"power", 0.2}};

    std::vector<CandidatePrediction> predictions{{"random_forest", "Host2"}, {"decision_tree", "Host3"}};

    std::ostringstream oss;
    write_recommendation(sample, rec, predictions, oss);
    auto doc = parse(oss.str());

    EXPECT_STREQ(doc["recommended_host"].GetString(), "Host2");
    EXPECT_STREQ(doc["model"].GetString(), "random_forest");
    EXPECT_DOUBLE_EQ(doc["confidence"].GetDouble(), 0.95);
    EXPECT_DOUBLE_EQ(doc["features"]["cpu_mem_ratio"].GetDouble(), 3.125);
    EXPECT_DOUBLE_EQ(doc["features"]["vm"].GetDouble(), 0.0);
    ASSERT_EQ(doc["feature_importance"].Size(), 2U);
    EXPECT_STREQ(doc["feature_importance"][0]["feature"].GetString(), "cpu");
    EXPECT_DOUBLE_EQ(doc["feature_importance"][0]["importance"].GetDouble(), 0.61);
    EXPECT_STREQ(doc["feature_importance"][1]["feature"].GetString(), "power");
    ASSERT_EQ(doc["predictions"].Size(), 2U);
    EXPECT_STREQ(doc["predictions"][1]["host"].GetString(), "Host3");
}

TEST_F(ReportWriterTest, RecommendationWithoutPredictions) {
    auto sample = make_telemetry_sample("VM1", 50.0, 16.0, 1.0, 150.0);
    Recommendation rec;
    rec.host = "Host2";
    rec.model = "m";
    rec.objectives = ObjectiveEvaluator::evaluate(sample);

    std::ostringstream oss;
    write_recommendation(sample, rec, {}, oss);
    auto doc = parse(oss.str());
    EXPECT_FALSE(doc.HasMember("predictions"));
    EXPECT_FALSE(doc.HasMember("feature_importance"));
}
