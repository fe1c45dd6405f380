#include <vmplace/io/scenario_generation.hpp>
#include <vmplace/io/error.hpp>

#include <vmplace/algo/objective_evaluator.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <array>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace vmplace::io {

using namespace vmplace::core;

namespace {

constexpr std::array<double, FIXED_HOST_COUNT> FIXED_HOST_CPU{92, 63, 79, 78, 98};
constexpr std::array<double, FIXED_HOST_COUNT> FIXED_HOST_RAM{114, 102, 116, 100, 116};
constexpr std::array<double, FIXED_HOST_COUNT> FIXED_HOST_ENERGY{0.5986, 0.635, 0.532, 1.0421, 1.4076};
constexpr std::array<double, FIXED_HOST_COUNT> FIXED_HOST_COST{0.3664, 0.3325, 0.7336, 0.3826, 0.2744};

constexpr std::array<double, FIXED_VM_COUNT> FIXED_VM_CPU{8, 16, 15};
constexpr std::array<double, FIXED_VM_COUNT> FIXED_VM_RAM{24, 20, 22};

double round4(double value) {
    return algo::round_to(value, 4);
}

double uniform_int(std::mt19937& rng, int lo, int hi) {
    std::uniform_int_distribution<int> dist(lo, hi);
    return static_cast<double>(dist(rng));
}

double uniform_real(std::mt19937& rng, double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return dist(rng);
}

} // anonymous namespace

std::vector<Host> fixed_hosts(std::size_t n) {
    if (n > FIXED_HOST_COUNT) {
        throw std::invalid_argument("fixed scenario has only " + std::to_string(FIXED_HOST_COUNT) + " hosts");
    }

    std::vector<Host> hosts;
    hosts.reserve(n);
    for (std::size_t idx = 0; idx < n; ++idx) {
        hosts.push_back(Host{"H" + std::to_string(idx + 1), FIXED_HOST_CPU[idx], FIXED_HOST_RAM[idx],
                             FIXED_HOST_ENERGY[idx], FIXED_HOST_COST[idx]});
    }
    return hosts;
}

std::vector<VmDemand> fixed_vms(std::size_t n) {
    if (n > FIXED_VM_COUNT) {
        throw std::invalid_argument("fixed scenario has only " + std::to_string(FIXED_VM_COUNT) + " VMs");
    }

    std::vector<VmDemand> vms;
    vms.reserve(n);
    for (std::size_t idx = 0; idx < n; ++idx) {
        vms.push_back(make_vm_demand("VM" + std::to_string(idx + 1), FIXED_VM_CPU[idx], FIXED_VM_RAM[idx]));
    }
    return vms;
}

ScenarioData fixed_scenario() {
    return ScenarioData{fixed_hosts(), fixed_vms()};
}

std::vector<Host> generate_hosts(std::size_t n, std::mt19937& rng) {
    std::vector<Host> hosts;
    hosts.reserve(n);
    for (std::size_t idx = 0; idx < n; ++idx) {
        Host host;
        host.host_id = "H" + std::to_string(idx + 1);
        host.cpu_capacity = uniform_int(rng, 50, 120);
        host.ram_capacity = uniform_int(rng, 64, 128);
        host.energy = round4(uniform_real(rng, 0.3, 1.5));
        host.cost = round4(uniform_real(rng, 0.2, 0.8));
        hosts.push_back(std::move(host));
    }
    return hosts;
}

std::vector<VmDemand> generate_vms(std::size_t n, std::mt19937& rng) {
    std::vector<VmDemand> vms;
    vms.reserve(n);
    for (std::size_t idx = 0; idx < n; ++idx) {
        double cpu = uniform_int(rng, 4, 20);
        double ram = uniform_int(rng, 8, 32);
        vms.push_back(make_vm_demand("VM" + std::to_string(idx + 1), cpu, ram));
    }
    return vms;
}

ScenarioData generate_scenario(std::size_t num_hosts, std::size_t num_vms, std::mt19937& rng) {
    ScenarioData scenario;
    scenario.hosts = generate_hosts(num_hosts, rng);
    scenario.vms = generate_vms(num_vms, rng);
    return scenario;
}

std::string_view reference_host_label(double cpu, double memory) noexcept {
    if (cpu <= 33.0 && memory <= 11.0) {
        return "Host1";
    }
    if (cpu <= 66.0 && memory <= 22.0) {
        return "Host2";
    }
    return "Host3";
}

std::vector<TelemetryRecord> generate_telemetry(std::size_t n, std::mt19937& rng) {
    std::vector<TelemetryRecord> records;
    records.reserve(n);
    for (std::size_t idx = 0; idx < n; ++idx) {
        std::string vm = "VM" + std::to_string(idx % TELEMETRY_VM_COUNT + 1);
        double cpu = uniform_int(rng, 10, 90);
        double memory = uniform_int(rng, 1, 32);
        double network_io = uniform_real(rng, 0.1, 5.0);
        double power = uniform_int(rng, 100, 300);

        TelemetryRecord record;
        record.host = std::string(reference_host_label(cpu, memory));
        record.sample = make_telemetry_sample(std::move(vm), cpu, memory, network_io, power);
        records.push_back(std::move(record));
    }
    return records;
}

void write_telemetry_to_stream(const std::vector<TelemetryRecord>& records, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    writer.Key("records");
    writer.StartArray();
    for (const auto& record : records) {
        const auto& s = record.sample;
        writer.StartObject();
        writer.Key("vm");
        writer.String(s.vm.c_str(), static_cast<rapidjson::SizeType>(s.vm.size()));
        writer.Key("host");
        writer.String(record.host.c_str(), static_cast<rapidjson::SizeType>(record.host.size()));
        writer.Key("cpu");
        writer.Double(s.cpu);
        writer.Key("memory");
        writer.Double(s.memory);
        writer.Key("network_io");
        writer.Double(s.network_io);
        writer.Key("power");
        writer.Double(s.power);
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString();
}

void write_telemetry(const std::vector<TelemetryRecord>& records, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_telemetry_to_stream(records, file);
}

} // namespace vmplace::io
