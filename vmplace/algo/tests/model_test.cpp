#include <vmplace/algo/feature_builder.hpp>
#include <vmplace/algo/feature_scaler.hpp>
#include <vmplace/algo/label_vocabulary.hpp>
#include <vmplace/algo/tree_ensemble_predictor.hpp>

#include <vmplace/core/error.hpp>
#include <vmplace/core/types.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <string>
#include <vector>

using namespace vmplace::algo;
using namespace vmplace::core;

namespace {

TreeNode split(int feature, double threshold, std::size_t left, std::size_t right) {
    TreeNode node;
    node.feature = feature;
    node.threshold = threshold;
    node.left = left;
    node.right = right;
    return node;
}

TreeNode leaf(std::string label) {
    TreeNode node;
    node.label = std::move(label);
    return node;
}

// cpu <= 33 -> Host1, cpu <= 66 -> Host2, else Host3
DecisionTree cpu_tree() {
    return {
        split(Cpu, 33.0, 1, 2),
        leaf("Host1"),
        split(Cpu, 66.0, 3, 4),
        leaf("Host2"),
        leaf("Host3"),
    };
}

DecisionTree constant_tree(const std::string& label) {
    return {leaf(label)};
}

FeatureVector with_cpu(double cpu) {
    FeatureVector f{};
    f[Cpu] = cpu;
    return f;
}

} // anonymous namespace

// ============================================================
// LabelVocabulary
// ============================================================

TEST(LabelVocabularyTest, SortsAndDeduplicates) {
    LabelVocabulary vocab({"VM3", "VM1", "VM2", "VM1"});
    ASSERT_EQ(vocab.size(), 3U);
    EXPECT_EQ(vocab.classes()[0], "VM1");
    EXPECT_EQ(vocab.classes()[1], "VM2");
    EXPECT_EQ(vocab.classes()[2], "VM3");
}

TEST(LabelVocabularyTest, CodesFollowSortedOrder) {
    // Lexicographic: VM10 sorts before VM2
    LabelVocabulary vocab({"VM1", "VM2", "VM10"});
    EXPECT_EQ(vocab.transform("VM1"), 0);
    EXPECT_EQ(vocab.transform("VM10"), 1);
    EXPECT_EQ(vocab.transform("VM2"), 2);
    EXPECT_EQ(vocab.inverse_transform(1), "VM10");
}

TEST(LabelVocabularyTest, UnknownLabelThrows) {
    LabelVocabulary vocab({"VM1", "VM2"});
    EXPECT_FALSE(vocab.contains("VM9"));
    try {
        (void)vocab.transform("VM9");
        FAIL() << "expected UnknownCategoryError";
    } catch (const UnknownCategoryError& e) {
        EXPECT_EQ(e.label(), "VM9");
    }
}

TEST(LabelVocabularyTest, InvalidCodeThrows) {
    LabelVocabulary vocab({"VM1"});
    EXPECT_THROW((void)vocab.inverse_transform(-1), UnknownCategoryError);
    EXPECT_THROW((void)vocab.inverse_transform(1), UnknownCategoryError);
}

TEST(LabelVocabularyTest, DefaultIsEmpty) {
    LabelVocabulary vocab;
    EXPECT_TRUE(vocab.empty());
    EXPECT_THROW((void)vocab.transform("VM1"), UnknownCategoryError);
}

// ============================================================
// FeatureBuilder
// ============================================================

TEST(FeatureBuilderTest, BuildsFixedOrder) {
    LabelVocabulary vocab({"VM1", "VM2", "VM3"});
    FeatureBuilder builder(vocab);

    auto f = builder.build(make_telemetry_sample("VM2", 50.0, 20.0, 1.5, 150.0));
    EXPECT_DOUBLE_EQ(f[VmEncoded], 1.0);
    EXPECT_DOUBLE_EQ(f[Cpu], 50.0);
    EXPECT_DOUBLE_EQ(f[Memory], 20.0);
    EXPECT_DOUBLE_EQ(f[NetworkIo], 1.5);
    EXPECT_DOUBLE_EQ(f[Power], 150.0);
    EXPECT_DOUBLE_EQ(f[CpuMemRatio], 2.5);
    EXPECT_DOUBLE_EQ(f[PowerPerCpu], 3.0);
}

TEST(FeatureBuilderTest, ZeroDenominatorsYieldZero) {
    LabelVocabulary vocab({"VM1"});
    FeatureBuilder builder(vocab);

    auto f = builder.build(make_telemetry_sample("VM1", 0.0, 0.0, 0.0, 120.0));
    EXPECT_EQ(f[CpuMemRatio], 0.0);
    EXPECT_EQ(f[PowerPerCpu], 0.0);
}

TEST(FeatureBuilderTest, UnknownVmRejected) {
    LabelVocabulary vocab({"VM1"});
    FeatureBuilder builder(vocab);
    EXPECT_THROW((void)builder.build(make_telemetry_sample("VM42", 1.0, 1.0, 1.0, 1.0)),
                 UnknownCategoryError);
}

TEST(FeatureBuilderTest, FeatureNames) {
    const auto& names = FeatureBuilder::feature_names();
    ASSERT_EQ(names.size(), FEATURE_COUNT);
    EXPECT_EQ(names[VmEncoded], "vm");
    EXPECT_EQ(names[PowerPerCpu], "power_per_cpu");
}

// ============================================================
// Scalers
// ============================================================

TEST(StandardScalerTest, TransformAndInverse) {
    FeatureVector mean{1.0, 50.0, 16.0, 2.5, 200.0, 3.0, 4.0};
    FeatureVector scale{2.0, 25.0, 8.0, 0.5, 50.0, 1.0, 2.0};
    StandardScaler scaler(mean, scale);

    FeatureVector raw{3.0, 75.0, 8.0, 2.5, 300.0, 3.0, 0.0};
    auto z = scaler.transform(raw);
    EXPECT_DOUBLE_EQ(z[0], 1.0);
    EXPECT_DOUBLE_EQ(z[1], 1.0);
    EXPECT_DOUBLE_EQ(z[2], -1.0);
    EXPECT_DOUBLE_EQ(z[3], 0.0);
    EXPECT_DOUBLE_EQ(z[4], 2.0);
    EXPECT_DOUBLE_EQ(z[6], -2.0);

    auto back = scaler.inverse_transform(z);
    for (std::size_t i = 0; i < FEATURE_COUNT; ++i) {
        EXPECT_NEAR(back[i], raw[i], 1e-12);
    }
}

TEST(StandardScalerTest, ZeroScaleTreatedAsOne) {
    FeatureVector mean{};
    FeatureVector scale{0.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
    StandardScaler scaler(mean, scale);

    EXPECT_DOUBLE_EQ(scaler.scale()[0], 1.0);
    FeatureVector raw{5.0, 0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    EXPECT_DOUBLE_EQ(scaler.transform(raw)[0], 5.0);
}

TEST(StandardScalerTest, NonFiniteRejected) {
    FeatureVector mean{};
    mean[2] = std::numeric_limits<double>::quiet_NaN();
    FeatureVector scale{1.0, 1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
    EXPECT_THROW((void)StandardScaler(mean, scale), InvalidInputError);
}

TEST(MinMaxScalerTest, MapsFittedRangeToUnit) {
    FeatureVector data_min{0.0, 10.0, 1.0, 0.1, 100.0, 0.0, 0.0};
    FeatureVector scale{1.0 / 9.0, 1.0 / 80.0, 1.0 / 31.0, 1.0 / 4.9, 1.0 / 200.0, 1.0, 1.0};
    MinMaxScaler scaler(data_min, scale);

    FeatureVector raw{9.0, 90.0, 32.0, 5.0, 300.0, 0.5, 0.25};
    auto s = scaler.transform(raw);
    EXPECT_NEAR(s[0], 1.0, 1e-12);
    EXPECT_NEAR(s[1], 1.0, 1e-12);
    EXPECT_NEAR(s[2], 1.0, 1e-12);
    EXPECT_NEAR(s[3], 1.0, 1e-12);
    EXPECT_NEAR(s[4], 1.0, 1e-12);

    auto back = scaler.inverse_transform(s);
    for (std::size_t i = 0; i < FEATURE_COUNT; ++i) {
        EXPECT_NEAR(back[i], raw[i], 1e-9);
    }
}

TEST(MinMaxScalerTest, NonPositiveScaleRejected) {
    FeatureVector data_min{};
    FeatureVector scale{1.0, 1.0, 0.0, 1.0, 1.0, 1.0, 1.0};
    EXPECT_THROW((void)MinMaxScaler(data_min, scale), InvalidInputError);
}

// ============================================================
// TreeEnsemblePredictor
// ============================================================

TEST(TreeEnsemblePredictorTest, SingleTreeRoutesOnThreshold) {
    TreeEnsemblePredictor model("tree", {}, {cpu_tree()});

    EXPECT_EQ(model.predict(with_cpu(10.0)), "Host1");
    EXPECT_EQ(model.predict(with_cpu(33.0)), "Host1");
    EXPECT_EQ(model.predict(with_cpu(33.5)), "Host2");
    EXPECT_EQ(model.predict(with_cpu(66.0)), "Host2");
    EXPECT_EQ(model.predict(with_cpu(90.0)), "Host3");
    EXPECT_EQ(model.name(), "tree");
    EXPECT_EQ(model.tree_count(), 1U);
}

TEST(TreeEnsemblePredictorTest, ClassesCollectedInLeafOrder) {
    TreeEnsemblePredictor model("tree", {}, {cpu_tree()});
    ASSERT_EQ(model.classes().size(), 3U);
    EXPECT_EQ(model.classes()[0], "Host1");
    EXPECT_EQ(model.classes()[1], "Host2");
    EXPECT_EQ(model.classes()[2], "Host3");
}

TEST(TreeEnsemblePredictorTest, MajorityVote) {
    TreeEnsemblePredictor model("forest", {"Host1", "Host2", "Host3"},
                                {cpu_tree(), constant_tree("Host3"), constant_tree("Host3")});

    // cpu_tree says Host1 but two trees vote Host3
    EXPECT_EQ(model.predict(with_cpu(10.0)), "Host3");
}

TEST(TreeEnsemblePredictorTest, TieGoesToFirstClass) {
    TreeEnsemblePredictor model("forest", {"Host2", "Host1"},
                                {constant_tree("Host1"), constant_tree("Host2")});
    EXPECT_EQ(model.predict(with_cpu(0.0)), "Host2");
}

TEST(TreeEnsemblePredictorTest, Deterministic) {
    TreeEnsemblePredictor model("forest", {},
                                {cpu_tree(), cpu_tree(), constant_tree("Host2")});
    for (double cpu : {5.0, 40.0, 80.0}) {
        EXPECT_EQ(model.predict(with_cpu(cpu)), model.predict(with_cpu(cpu)));
    }
}

TEST(TreeEnsemblePredictorTest, RejectsNoTrees) {
    EXPECT_THROW(TreeEnsemblePredictor("empty", {}, {}), InvalidInputError);
}

TEST(TreeEnsemblePredictorTest, RejectsEmptyTree) {
    EXPECT_THROW(TreeEnsemblePredictor("empty", {}, {DecisionTree{}}), InvalidInputError);
}

TEST(TreeEnsemblePredictorTest, RejectsBackwardChild) {
    DecisionTree loop{
        split(Cpu, 1.0, 1, 2),
        split(Cpu, 2.0, 0, 2),
        leaf("Host1"),
    };
    EXPECT_THROW(TreeEnsemblePredictor("loop", {}, {loop}), InvalidInputError);
}

TEST(TreeEnsemblePredictorTest, RejectsChildOutOfRange) {
    DecisionTree bad{split(Cpu, 1.0, 1, 5), leaf("Host1")};
    EXPECT_THROW(TreeEnsemblePredictor("bad", {}, {bad}), InvalidInputError);
}

TEST(TreeEnsemblePredictorTest, RejectsInvalidFeature) {
    DecisionTree bad{split(static_cast<int>(FEATURE_COUNT), 1.0, 1, 2), leaf("A"), leaf("B")};
    EXPECT_THROW(TreeEnsemblePredictor("bad", {}, {bad}), InvalidInputError);
}

TEST(TreeEnsemblePredictorTest, RejectsNonFiniteThreshold) {
    DecisionTree bad{split(Cpu, std::numeric_limits<double>::infinity(), 1, 2), leaf("A"), leaf("B")};
    EXPECT_THROW(TreeEnsemblePredictor("bad", {}, {bad}), InvalidInputError);
}

TEST(TreeEnsemblePredictorTest, RejectsUnknownLeafLabel) {
    EXPECT_THROW(TreeEnsemblePredictor("bad", {"Host1"}, {constant_tree("Host9")}),
                 InvalidInputError);
}
