#include <vmplace/algo/placement_engine.hpp>

#include <cmath>
#include <limits>

namespace vmplace::algo {

bool PlacementEngine::is_feasible(const core::Host& host, const core::VmDemand& vm) noexcept {
    return host.cpu_capacity >= vm.cpu_demand && host.ram_capacity >= vm.ram_demand;
}

HostScore PlacementEngine::score(const core::Host& host, const core::VmDemand& vm,
                                 const core::PlacementWeights& weights) noexcept {
    HostScore s;
    s.cpu_score = vm.cpu_demand / host.cpu_capacity;
    s.energy_score = host.energy;
    s.cost_score = host.cost;
    s.total = weights.cpu * s.cpu_score + weights.energy * s.energy_score +
              weights.cost * s.cost_score;
    return s;
}

PlacementResult PlacementEngine::select(const core::HostPool& pool, const core::VmDemand& vm,
                                        const core::PlacementWeights& weights) const {
    return scan(pool, vm, weights, false);
}

PlacementResult PlacementEngine::scan(const core::HostPool& pool, const core::VmDemand& vm,
                                      const core::PlacementWeights& weights, bool trace) const {
    PlacementResult result;
    double best_total = std::numeric_limits<double>::infinity();

    auto hosts = pool.list_candidates();
    for (std::size_t idx = 0; idx < hosts.size(); ++idx) {
        const auto& host = hosts[idx];
        if (!is_feasible(host, vm)) {
            continue;
        }

        // Only an unvalidated demand (0 CPU on a 0 CPU host) scores NaN; it
        // cannot be ranked, so the host is left out
        HostScore s = score(host, vm, weights);
        if (std::isnan(s.total)) {
            continue;
        }
        ++result.feasible_hosts;

        if (trace && trace_scores_) {
            trace_writer_->begin(decisions_);
            trace_writer_->type("host_scored");
            trace_writer_->field("vm_id", std::string_view{vm.vm_id});
            trace_writer_->field("host_id", std::string_view{host.host_id});
            trace_writer_->field("cpu_score", s.cpu_score);
            trace_writer_->field("energy_score", s.energy_score);
            trace_writer_->field("cost_score", s.cost_score);
            trace_writer_->field("total", s.total);
            trace_writer_->end();
        }

        // Strict comparison: on equal totals the earlier host stays
        if (!result.host_index || s.total < best_total) {
            best_total = s.total;
            result.host_index = idx;
            result.score = s;
        }
    }

    if (result.host_index) {
        result.host_id = hosts[*result.host_index].host_id;
    }
    return result;
}

PlacementResult PlacementEngine::place(core::HostPool& pool, const core::VmDemand& vm,
                                       const core::PlacementWeights& weights) {
    bool trace = trace_writer_ != nullptr;
    PlacementResult result = scan(pool, vm, weights, trace);

    if (result.host_index) {
        pool.debit_at(*result.host_index, vm.cpu_demand, vm.ram_demand);
    }

    if (trace) {
        trace_writer_->begin(decisions_);
        if (result.feasible()) {
            const auto& host = pool.host(*result.host_index);
            trace_writer_->type("vm_placed");
            trace_writer_->field("vm_id", std::string_view{vm.vm_id});
            trace_writer_->field("host_id", std::string_view{result.host_id});
            trace_writer_->field("total", result.score.total);
            trace_writer_->field("cpu_remaining", host.cpu_capacity);
            trace_writer_->field("ram_remaining", host.ram_capacity);
        } else {
            trace_writer_->type("vm_rejected");
            trace_writer_->field("vm_id", std::string_view{vm.vm_id});
            trace_writer_->field("cpu_demand", vm.cpu_demand);
            trace_writer_->field("ram_demand", vm.ram_demand);
        }
        trace_writer_->field("feasible_hosts", static_cast<uint64_t>(result.feasible_hosts));
        trace_writer_->end();
    }

    ++decisions_;
    return result;
}

std::vector<Placement> PlacementEngine::place_all(core::HostPool& pool,
                                                  std::span<const core::VmDemand> vms,
                                                  const core::PlacementWeights& weights) {
    std::vector<Placement> placements;
    placements.reserve(vms.size());
    for (const auto& vm : vms) {
        placements.push_back(Placement{vm.vm_id, place(pool, vm, weights)});
    }
    return placements;
}

} // namespace vmplace::algo
