#include <vmplace/io/report_writer.hpp>

#include <vmplace/algo/feature_builder.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace vmplace::io {

namespace {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(Writer& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_objectives_object(Writer& writer, const algo::ObjectiveBreakdown& o) {
    writer.StartObject();

    writer.Key("proxy_cost");
    writer.Double(o.proxy_cost);
    writer.Key("proxy_energy");
    writer.Double(o.proxy_energy);
    writer.Key("proxy_load_balance");
    writer.Double(o.proxy_load_balance);

    writer.Key("normalized");
    writer.StartObject();
    writer.Key("cost");
    writer.Double(o.norm_cost);
    writer.Key("energy");
    writer.Double(o.norm_energy);
    writer.Key("load");
    writer.Double(o.norm_load);
    writer.EndObject();

    writer.Key("weights");
    writer.StartObject();
    writer.Key("cost");
    writer.Double(o.weights.cost);
    writer.Key("energy");
    writer.Double(o.weights.energy);
    writer.Key("load");
    writer.Double(o.weights.load);
    writer.EndObject();

    writer.Key("weighted_score");
    writer.Double(o.weighted_score);

    writer.Key("cpu_mem_ratio");
    writer.Double(o.derived.cpu_mem_ratio);
    writer.Key("power_per_cpu");
    writer.Double(o.derived.power_per_cpu);

    writer.EndObject();
}

} // anonymous namespace

void write_placement_report(std::span<const algo::Placement> placements, const core::HostPool& pool,
                            const core::PlacementWeights& weights, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();

    writer.Key("weights");
    writer.StartObject();
    writer.Key("cpu");
    writer.Double(weights.cpu);
    writer.Key("energy");
    writer.Double(weights.energy);
    writer.Key("cost");
    writer.Double(weights.cost);
    writer.EndObject();

    uint64_t placed = 0;
    writer.Key("placements");
    writer.StartArray();
    for (const auto& placement : placements) {
        const auto& result = placement.result;
        writer.StartObject();
        writer.Key("vm_id");
        write_string(writer, placement.vm_id);
        writer.Key("host_id");
        if (result.feasible()) {
            write_string(writer, result.host_id);
        } else {
            writer.Null();
        }
        writer.Key("feasible_hosts");
        writer.Uint64(result.feasible_hosts);
        if (result.feasible()) {
            ++placed;
            writer.Key("score");
            writer.StartObject();
            writer.Key("cpu");
            writer.Double(result.score.cpu_score);
            writer.Key("energy");
            writer.Double(result.score.energy_score);
            writer.Key("cost");
            writer.Double(result.score.cost_score);
            writer.Key("total");
            writer.Double(result.score.total);
            writer.EndObject();
        }
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("placed");
    writer.Uint64(placed);
    writer.Key("rejected");
    writer.Uint64(static_cast<uint64_t>(placements.size()) - placed);

    writer.Key("hosts");
    writer.StartArray();
    for (const auto& host : pool.list_candidates()) {
        writer.StartObject();
        writer.Key("host_id");
        write_string(writer, host.host_id);
        writer.Key("cpu_remaining");
        writer.Double(host.cpu_capacity);
        writer.Key("ram_remaining");
        writer.Double(host.ram_capacity);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString() << "\n";
}

void write_objectives(const core::TelemetrySample& sample, const algo::ObjectiveBreakdown& objectives,
                      std::ostream& out) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();
    writer.Key("vm");
    write_string(writer, sample.vm);
    writer.Key("objectives");
    write_objectives_object(writer, objectives);
    writer.EndObject();

    out << buffer.GetString() << "\n";
}

void write_recommendation(const core::TelemetrySample& sample, const algo::Recommendation& recommendation,
                          std::span<const algo::CandidatePrediction> predictions, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);

    writer.StartObject();

    writer.Key("vm");
    write_string(writer, sample.vm);
    writer.Key("recommended_host");
    write_string(writer, recommendation.host);
    writer.Key("model");
    write_string(writer, recommendation.model);
    writer.Key("confidence");
    writer.Double(recommendation.confidence);

    writer.Key("features");
    writer.StartObject();
    const auto& names = algo::FeatureBuilder::feature_names();
    for (std::size_t i = 0; i < algo::FEATURE_COUNT; ++i) {
        writer.Key(names[i].data(), static_cast<rapidjson::SizeType>(names[i].size()));
        writer.Double(recommendation.features[i]);
    }
    writer.EndObject();

    writer.Key("objectives");
    write_objectives_object(writer, recommendation.objectives);

    if (!recommendation.feature_importance.empty()) {
        writer.Key("feature_importance");
        writer.StartArray();
        for (const auto& entry : recommendation.feature_importance) {
            writer.StartObject();
            writer.Key("feature");
            write_string(writer, entry.feature);
            writer.Key("importance");
            writer.Double(entry.importance);
            writer.EndObject();
        }
        writer.EndArray();
    }

    if (!predictions.empty()) {
        writer.Key("predictions");
        writer.StartArray();
        for (const auto& prediction : predictions) {
            writer.StartObject();
            writer.Key("model");
            write_string(writer, prediction.model);
            writer.Key("host");
            write_string(writer, prediction.host);
            writer.EndObject();
        }
        writer.EndArray();
    }

    writer.EndObject();

    out << buffer.GetString() << "\n";
}

} // namespace vmplace::io
