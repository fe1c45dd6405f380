#pragma once

#include <vmplace/core/types.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vmplace::core {

/// @brief Ordered, capacity-tracked set of hosts for one placement run.
///
/// Hosts are stored by value in a contiguous vector (insertion order is the
/// candidate order used for tie-breaking) with an id -> index map for
/// lookups. Capacities only decrease, through debit() / debit_at().
///
/// The pool is not internally synchronized. Callers placing VMs from
/// several threads must serialize access to a given pool: debits are
/// order-sensitive.
///
/// @see algo::PlacementEngine
/// @ingroup core_hosts
class HostPool {
public:
    HostPool() = default;

    /// @brief Build a pool from a list of hosts, in order.
    /// @throws InvalidInputError, DuplicateHostError
    explicit HostPool(std::vector<Host> hosts);

    /// @brief Append a host.
    /// @param host Host record; validated with validate_host().
    /// @return Index of the new host.
    /// @throws InvalidInputError if the host record is invalid.
    /// @throws DuplicateHostError if the id is already present.
    std::size_t add_host(Host host);

    /// @brief Hosts in insertion order.
    [[nodiscard]] std::span<const Host> list_candidates() const noexcept { return hosts_; }

    /// @brief Index of a host, if present.
    [[nodiscard]] std::optional<std::size_t> find(std::string_view host_id) const;

    /// @brief Access a host by index.
    /// @throws OutOfRangeError if @p idx >= size().
    [[nodiscard]] const Host& host(std::size_t idx) const;

    /// @brief Access a host by id.
    /// @throws UnknownHostError if the id is not in the pool.
    [[nodiscard]] const Host& host(std::string_view host_id) const;

    /// @brief Subtract a VM's demand from a host's remaining capacity.
    ///
    /// Either both capacities are debited or neither is.
    ///
    /// @throws UnknownHostError if the id is not in the pool.
    /// @throws CapacityError if either capacity would become negative.
    void debit(std::string_view host_id, double cpu_amount, double ram_amount);

    /// @brief Index-based variant of debit().
    /// @throws OutOfRangeError, CapacityError
    void debit_at(std::size_t idx, double cpu_amount, double ram_amount);

    [[nodiscard]] std::size_t size() const noexcept { return hosts_.size(); }
    [[nodiscard]] bool empty() const noexcept { return hosts_.empty(); }

    /// @brief Sum of remaining CPU capacity across all hosts.
    [[nodiscard]] double total_cpu_capacity() const noexcept;

    /// @brief Sum of remaining RAM capacity across all hosts.
    [[nodiscard]] double total_ram_capacity() const noexcept;

private:
    // Lets find() look up a std::string_view without building a std::string
    struct HostIdHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view id) const noexcept { return std::hash<std::string_view>{}(id); }
    };

    std::vector<Host> hosts_;
    std::unordered_map<std::string, std::size_t, HostIdHash, std::equal_to<>> index_;
};

} // namespace vmplace::core
