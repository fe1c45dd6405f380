#include <vmplace/io/model_loader.hpp>
#include <vmplace/io/error.hpp>

#include "json_helpers.hpp"

#include <vmplace/algo/feature_scaler.hpp>
#include <vmplace/algo/tree_ensemble_predictor.hpp>

#include <vmplace/core/error.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace vmplace::io {

namespace {

using namespace vmplace::algo;
using namespace vmplace::io::detail;

std::vector<std::string> parse_labels(const rapidjson::Value& array, const std::string& ctx) {
    std::vector<std::string> labels;
    labels.reserve(array.Size());
    for (rapidjson::SizeType idx = 0; idx < array.Size(); ++idx) {
        if (!array[idx].IsString()) {
            throw LoaderError("labels must be strings", ctx + "[" + std::to_string(idx) + "]");
        }
        labels.emplace_back(array[idx].GetString(), array[idx].GetStringLength());
    }
    return labels;
}

FeatureVector parse_feature_vector(const rapidjson::Value& obj, const char* name, const std::string& ctx) {
    const auto& array = require_array(obj, name, ctx);
    if (array.Size() != FEATURE_COUNT) {
        throw LoaderError(std::string("field '") + name + "' must have " +
                              std::to_string(FEATURE_COUNT) + " entries",
                          ctx);
    }

    FeatureVector out{};
    for (rapidjson::SizeType idx = 0; idx < array.Size(); ++idx) {
        if (!array[idx].IsNumber()) {
            throw LoaderError(std::string("field '") + name + "' must contain numbers", ctx);
        }
        out[idx] = array[idx].GetDouble();
    }
    return out;
}

std::shared_ptr<const FeatureScaler> parse_scaler(const rapidjson::Value& obj) {
    const std::string ctx = "scaler";
    std::string kind = require<std::string>(obj, "kind", ctx);

    if (kind == "standard") {
        return std::make_shared<StandardScaler>(parse_feature_vector(obj, "mean", ctx),
                                                parse_feature_vector(obj, "scale", ctx));
    }
    if (kind == "minmax") {
        return std::make_shared<MinMaxScaler>(parse_feature_vector(obj, "min", ctx),
                                              parse_feature_vector(obj, "scale", ctx));
    }
    throw LoaderError("unknown scaler kind '" + kind + "'", ctx);
}

TreeNode parse_node(const rapidjson::Value& obj, const std::string& ctx) {
    TreeNode node;
    if (obj.IsObject() && obj.HasMember("leaf")) {
        node.label = require<std::string>(obj, "leaf", ctx);
        return node;
    }

    node.feature = require<int>(obj, "feature", ctx);
    node.threshold = require<double>(obj, "threshold", ctx);
    node.left = static_cast<std::size_t>(require<uint64_t>(obj, "left", ctx));
    node.right = static_cast<std::size_t>(require<uint64_t>(obj, "right", ctx));
    return node;
}

ModelCandidate parse_model(const rapidjson::Value& obj, const std::string& ctx) {
    ModelCandidate candidate;
    candidate.name = require<std::string>(obj, "name", ctx);
    candidate.scaled_input = optional_field<bool>(obj, "scaled", false, ctx);

    const auto& quality = require_object(obj, "quality", ctx);
    const std::string qctx = ctx + ".quality";
    candidate.quality.r2 = require<double>(quality, "r2", qctx);
    candidate.quality.mse = optional_field<double>(quality, "mse", 0.0, qctx);
    candidate.quality.mae = optional_field<double>(quality, "mae", 0.0, qctx);

    if (obj.HasMember("feature_importance")) {
        auto importance = parse_feature_vector(obj, "feature_importance", ctx);
        for (double value : importance) {
            if (value < 0.0) {
                throw LoaderError("field 'feature_importance' must not contain negative values", ctx);
            }
        }
        candidate.feature_importance = importance;
    }

    std::vector<std::string> classes;
    if (obj.HasMember("classes")) {
        classes = parse_labels(require_array(obj, "classes", ctx), ctx + ".classes");
    }

    const auto& trees = require_array(obj, "trees", ctx);
    std::vector<DecisionTree> parsed;
    parsed.reserve(trees.Size());
    for (rapidjson::SizeType t = 0; t < trees.Size(); ++t) {
        std::string tctx = index_context(ctx, "trees", t);
        const auto& nodes = require_array(trees[t], "nodes", tctx);

        DecisionTree tree;
        tree.reserve(nodes.Size());
        for (rapidjson::SizeType n = 0; n < nodes.Size(); ++n) {
            tree.push_back(parse_node(nodes[n], index_context(tctx, "nodes", n)));
        }
        parsed.push_back(std::move(tree));
    }

    try {
        candidate.predictor = std::make_shared<TreeEnsemblePredictor>(candidate.name, std::move(classes),
                                                                      std::move(parsed));
    } catch (const core::InvalidInputError& e) {
        throw LoaderError(e.what(), ctx);
    }
    return candidate;
}

void parse_bundle_impl(ModelAssets& result, const rapidjson::Document& doc) {
    result.vocabulary = LabelVocabulary(parse_labels(require_array(doc, "vocabulary", "bundle"), "vocabulary"));
    if (result.vocabulary.empty()) {
        throw LoaderError("vocabulary must not be empty", "bundle");
    }

    if (doc.HasMember("scaler")) {
        try {
            result.scaler = parse_scaler(require_object(doc, "scaler", "bundle"));
        } catch (const core::InvalidInputError& e) {
            throw LoaderError(e.what(), "scaler");
        }
    }

    const auto& models = require_array(doc, "models", "bundle");
    if (models.Empty()) {
        throw LoaderError("at least one model is required", "models");
    }
    for (rapidjson::SizeType idx = 0; idx < models.Size(); ++idx) {
        auto candidate = parse_model(models[idx], index_context("", "models", idx));
        if (candidate.scaled_input && !result.scaler) {
            throw LoaderError("model '" + candidate.name + "' needs a scaler but the bundle has none",
                              index_context("", "models", idx));
        }
        result.candidates.push_back(std::move(candidate));
    }
}

} // anonymous namespace

algo::ModelAssets load_model_bundle(const std::filesystem::path& path) {
    return load_model_bundle_from_string(slurp(path));
}

algo::ModelAssets load_model_bundle_from_string(std::string_view json) {
    rapidjson::Document doc;
    parse_root_object(doc, json, "bundle");

    algo::ModelAssets result;
    parse_bundle_impl(result, doc);
    return result;
}

TelemetryRequest load_telemetry_request(const std::filesystem::path& path) {
    return load_telemetry_request_from_string(slurp(path));
}

TelemetryRequest load_telemetry_request_from_string(std::string_view json) {
    rapidjson::Document doc;
    parse_root_object(doc, json, "request");

    const std::string ctx = "request";
    std::string vm = require<std::string>(doc, "vm", ctx);
    double cpu = require<double>(doc, "cpu", ctx);
    double memory = require<double>(doc, "memory", ctx);
    double network_io = require<double>(doc, "network_io", ctx);
    double power = require<double>(doc, "power", ctx);

    TelemetryRequest request;
    try {
        request.sample = core::make_telemetry_sample(std::move(vm), cpu, memory, network_io, power);
    } catch (const core::InvalidInputError& e) {
        throw LoaderError(e.what(), ctx);
    }

    if (doc.HasMember("weights")) {
        const auto& weights = require_object(doc, "weights", ctx);
        const std::string wctx = "request.weights";
        const core::ObjectiveWeights defaults;
        request.weights.cost = optional_field<double>(weights, "cost", defaults.cost, wctx);
        request.weights.energy = optional_field<double>(weights, "energy", defaults.energy, wctx);
        request.weights.load = optional_field<double>(weights, "load", defaults.load, wctx);

        if (!(request.weights.cost >= 0.0) || !(request.weights.energy >= 0.0) ||
            !(request.weights.load >= 0.0)) {
            throw LoaderError("weights must be >= 0", wctx);
        }
    }
    return request;
}

} // namespace vmplace::io
