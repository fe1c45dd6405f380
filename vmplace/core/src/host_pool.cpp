#include <vmplace/core/host_pool.hpp>
#include <vmplace/core/error.hpp>

#include <utility>

namespace vmplace::core {

HostPool::HostPool(std::vector<Host> hosts) {
    hosts_.reserve(hosts.size());
    for (auto& host : hosts) {
        add_host(std::move(host));
    }
}

std::size_t HostPool::add_host(Host host) {
    validate_host(host);
    if (index_.contains(host.host_id)) {
        throw DuplicateHostError(host.host_id);
    }

    std::size_t idx = hosts_.size();
    index_.emplace(host.host_id, idx);
    hosts_.push_back(std::move(host));
    return idx;
}

std::optional<std::size_t> HostPool::find(std::string_view host_id) const {
    auto it = index_.find(host_id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const Host& HostPool::host(std::size_t idx) const {
    if (idx >= hosts_.size()) {
        throw OutOfRangeError("host index " + std::to_string(idx) + " out of range (size " +
                              std::to_string(hosts_.size()) + ")");
    }
    return hosts_[idx];
}

const Host& HostPool::host(std::string_view host_id) const {
    auto idx = find(host_id);
    if (!idx) {
        throw UnknownHostError("unknown host '" + std::string(host_id) + "'");
    }
    return hosts_[*idx];
}

void HostPool::debit(std::string_view host_id, double cpu_amount, double ram_amount) {
    auto idx = find(host_id);
    if (!idx) {
        throw UnknownHostError("unknown host '" + std::string(host_id) + "'");
    }
    debit_at(*idx, cpu_amount, ram_amount);
}

void HostPool::debit_at(std::size_t idx, double cpu_amount, double ram_amount) {
    if (idx >= hosts_.size()) {
        throw OutOfRangeError("host index " + std::to_string(idx) + " out of range (size " +
                              std::to_string(hosts_.size()) + ")");
    }
    Host& host = hosts_[idx];

    // Capacities never increase during a run
    if (!(cpu_amount >= 0.0) || !(ram_amount >= 0.0)) {
        throw InvalidInputError("debit of host '" + host.host_id + "': amounts must be >= 0");
    }

    // Check both resources before touching either
    if (cpu_amount > host.cpu_capacity) {
        throw CapacityError(host.host_id, "cpu", cpu_amount, host.cpu_capacity);
    }
    if (ram_amount > host.ram_capacity) {
        throw CapacityError(host.host_id, "ram", ram_amount, host.ram_capacity);
    }

    host.cpu_capacity -= cpu_amount;
    host.ram_capacity -= ram_amount;
}

double HostPool::total_cpu_capacity() const noexcept {
    double total = 0.0;
    for (const auto& host : hosts_) {
        total += host.cpu_capacity;
    }
    return total;
}

double HostPool::total_ram_capacity() const noexcept {
    double total = 0.0;
    for (const auto& host : hosts_) {
        total += host.ram_capacity;
    }
    return total;
}

} // namespace vmplace::core
