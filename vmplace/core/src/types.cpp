#include <vmplace/core/types.hpp>
#include <vmplace/core/error.hpp>

#include <cmath>
#include <utility>

namespace vmplace::core {

namespace {

void require_finite(double value, const char* field, const std::string& context) {
    if (!std::isfinite(value)) {
        throw InvalidInputError(context + ": " + field + " must be finite");
    }
}

void require_non_negative(double value, const char* field, const std::string& context) {
    require_finite(value, field, context);
    if (value < 0.0) {
        throw InvalidInputError(context + ": " + field + " must be >= 0");
    }
}

void require_positive(double value, const char* field, const std::string& context) {
    require_finite(value, field, context);
    if (value <= 0.0) {
        throw InvalidInputError(context + ": " + field + " must be > 0");
    }
}

} // anonymous namespace

VmDemand make_vm_demand(std::string vm_id, double cpu_demand, double ram_demand) {
    const std::string ctx = "vm '" + vm_id + "'";
    require_positive(cpu_demand, "cpu_demand", ctx);
    require_positive(ram_demand, "ram_demand", ctx);
    return VmDemand{std::move(vm_id), cpu_demand, ram_demand};
}

TelemetrySample make_telemetry_sample(std::string vm, double cpu, double memory,
                                      double network_io, double power) {
    const std::string ctx = "telemetry '" + vm + "'";
    require_non_negative(cpu, "cpu", ctx);
    require_non_negative(memory, "memory", ctx);
    require_non_negative(network_io, "network_io", ctx);
    require_non_negative(power, "power", ctx);
    return TelemetrySample{std::move(vm), cpu, memory, network_io, power};
}

void validate_host(const Host& host) {
    if (host.host_id.empty()) {
        throw InvalidInputError("host: host_id must not be empty");
    }
    const std::string ctx = "host '" + host.host_id + "'";
    require_non_negative(host.cpu_capacity, "cpu_capacity", ctx);
    require_non_negative(host.ram_capacity, "ram_capacity", ctx);
    require_positive(host.energy, "energy", ctx);
    require_positive(host.cost, "cost", ctx);
}

} // namespace vmplace::core
