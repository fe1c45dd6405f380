#pragma once

#include <vmplace/core/host_pool.hpp>
#include <vmplace/core/trace_writer.hpp>
#include <vmplace/core/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace vmplace::algo {

/// @brief Score components of one (host, VM) pairing.
/// @ingroup algo_placement
struct HostScore {
    double cpu_score{0.0};    ///< vm.cpu_demand / host.cpu_capacity (lower is better).
    double energy_score{0.0}; ///< host.energy.
    double cost_score{0.0};   ///< host.cost.
    double total{0.0};        ///< Weighted sum of the three components.
};

/// @brief Outcome of a single placement decision.
///
/// Infeasibility is a normal value: when no host can take the VM,
/// @c host_index is empty and feasible() returns false.
///
/// @ingroup algo_placement
struct PlacementResult {
    std::optional<std::size_t> host_index; ///< Index of the chosen host in the pool.
    std::string host_id;                   ///< Id of the chosen host (empty if infeasible).
    HostScore score;                       ///< Score of the chosen host.
    std::size_t feasible_hosts{0};         ///< Hosts that passed the capacity filter and got a score.

    [[nodiscard]] bool feasible() const noexcept { return host_index.has_value(); }
};

/// @brief A VM and the decision made for it in a batch run.
/// @ingroup algo_placement
struct Placement {
    std::string vm_id;
    PlacementResult result;
};

/// @brief Greedy weighted placement of VMs onto a HostPool.
/// @ingroup algo_placement
///
/// For each VM the engine scans the pool in order, skips hosts that cannot
/// hold the demand, scores the rest with
/// `w.cpu * demand/capacity + w.energy * energy + w.cost * cost` and keeps
/// the first host reaching the minimum (a later host must be strictly
/// better to displace an earlier one). The scan is O(hosts).
///
/// The engine holds no placement state: weights are passed per call and
/// the only side effect of place() is the debit of the chosen host. An
/// optional TraceWriter receives one record per decision.
///
/// @see core::HostPool
class PlacementEngine {
public:
    PlacementEngine() = default;

    /// @brief Install a trace writer (nullptr disables tracing).
    /// @param writer Non-owning; must outlive the engine or be reset.
    void set_trace_writer(core::TraceWriter* writer) noexcept { trace_writer_ = writer; }

    /// @brief Emit one `host_scored` record per feasible host.
    void set_trace_scores(bool enabled) noexcept { trace_scores_ = enabled; }

    /// @brief True if @p host has room for @p vm.
    [[nodiscard]] static bool is_feasible(const core::Host& host, const core::VmDemand& vm) noexcept;

    /// @brief Score a (host, VM) pairing. Does not check feasibility.
    ///
    /// Expects a demand built by core::make_vm_demand. A demand of 0 CPU on
    /// a host with 0 CPU left gives a NaN total.
    [[nodiscard]] static HostScore score(const core::Host& host, const core::VmDemand& vm,
                                         const core::PlacementWeights& weights) noexcept;

    /// @brief Choose a host without modifying the pool.
    ///
    /// Hosts whose score is NaN (see score()) are neither counted in
    /// PlacementResult::feasible_hosts nor chosen.
    ///
    /// @return The best feasible host, or an infeasible result.
    [[nodiscard]] PlacementResult select(const core::HostPool& pool, const core::VmDemand& vm,
                                         const core::PlacementWeights& weights) const;

    /// @brief Choose a host and debit it by the VM's demand.
    ///
    /// Never throws for infeasibility. A CapacityError escaping from here
    /// means the pool was modified concurrently.
    ///
    /// @return The decision; the pool is unchanged if it is infeasible.
    PlacementResult place(core::HostPool& pool, const core::VmDemand& vm,
                          const core::PlacementWeights& weights);

    /// @brief Place VMs one after the other, in order.
    ///
    /// Later VMs see the capacity consumed by earlier ones.
    std::vector<Placement> place_all(core::HostPool& pool, std::span<const core::VmDemand> vms,
                                     const core::PlacementWeights& weights);

    /// @brief Number of decisions taken by place() so far (trace sequence).
    [[nodiscard]] uint64_t decision_count() const noexcept { return decisions_; }

private:
    PlacementResult scan(const core::HostPool& pool, const core::VmDemand& vm,
                         const core::PlacementWeights& weights, bool trace) const;

    core::TraceWriter* trace_writer_{nullptr};
    bool trace_scores_{false};
    uint64_t decisions_{0};
};

} // namespace vmplace::algo
