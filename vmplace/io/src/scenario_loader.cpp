#include <vmplace/io/scenario_loader.hpp>
#include <vmplace/io/error.hpp>

#include "json_helpers.hpp"

#include <vmplace/core/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <string>
#include <unordered_set>
#include <utility>

namespace vmplace::io {

namespace {

using namespace vmplace::core;
using namespace vmplace::io::detail;

void parse_scenario_impl(ScenarioData& result, const rapidjson::Document& doc) {
    const auto& hosts = require_array(doc, "hosts", "scenario");
    std::unordered_set<std::string> seen;

    for (rapidjson::SizeType idx = 0; idx < hosts.Size(); ++idx) {
        const auto& host_obj = hosts[idx];
        std::string ctx = index_context("", "hosts", idx);

        Host host{
            require<std::string>(host_obj, "host_id", ctx),
            require<double>(host_obj, "cpu_capacity", ctx),
            require<double>(host_obj, "ram_capacity", ctx),
            require<double>(host_obj, "energy", ctx),
            require<double>(host_obj, "cost", ctx),
        };

        try {
            validate_host(host);
        } catch (const InvalidInputError& e) {
            throw LoaderError(e.what(), ctx);
        }
        if (!seen.insert(host.host_id).second) {
            throw LoaderError("duplicate host id '" + host.host_id + "'", ctx);
        }
        result.hosts.push_back(std::move(host));
    }

    // No VMs is a valid (empty) workload
    if (!doc.HasMember("vms")) {
        return;
    }

    const auto& vms = require_array(doc, "vms", "scenario");
    for (rapidjson::SizeType idx = 0; idx < vms.Size(); ++idx) {
        const auto& vm_obj = vms[idx];
        std::string ctx = index_context("", "vms", idx);

        std::string vm_id = require<std::string>(vm_obj, "vm_id", ctx);
        double cpu = require<double>(vm_obj, "cpu_demand", ctx);
        double ram = require<double>(vm_obj, "ram_demand", ctx);

        try {
            result.vms.push_back(make_vm_demand(std::move(vm_id), cpu, ram));
        } catch (const InvalidInputError& e) {
            throw LoaderError(e.what(), ctx);
        }
    }
}

} // anonymous namespace

ScenarioData load_scenario(const std::filesystem::path& path) {
    return load_scenario_from_string(slurp(path));
}

ScenarioData load_scenario_from_string(std::string_view json) {
    rapidjson::Document doc;
    parse_root_object(doc, json, "scenario");

    ScenarioData result;
    parse_scenario_impl(result, doc);
    return result;
}

void write_scenario_to_stream(const ScenarioData& scenario, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("hosts");
    writer.StartArray();
    for (const auto& host : scenario.hosts) {
        writer.StartObject();
        writer.Key("host_id");
        writer.String(host.host_id.c_str(), static_cast<rapidjson::SizeType>(host.host_id.size()));
        writer.Key("cpu_capacity");
        writer.Double(host.cpu_capacity);
        writer.Key("ram_capacity");
        writer.Double(host.ram_capacity);
        writer.Key("energy");
        writer.Double(host.energy);
        writer.Key("cost");
        writer.Double(host.cost);
        writer.EndObject();
    }
    writer.EndArray();

    writer.Key("vms");
    writer.StartArray();
    for (const auto& vm : scenario.vms) {
        writer.StartObject();
        writer.Key("vm_id");
        writer.String(vm.vm_id.c_str(), static_cast<rapidjson::SizeType>(vm.vm_id.size()));
        writer.Key("cpu_demand");
        writer.Double(vm.cpu_demand);
        writer.Key("ram_demand");
        writer.Double(vm.ram_demand);
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString();
}

void write_scenario(const ScenarioData& scenario, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_scenario_to_stream(scenario, file);
}

} // namespace vmplace::io
