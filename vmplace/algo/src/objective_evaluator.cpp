#include <vmplace/algo/objective_evaluator.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <system_error>

namespace vmplace::algo {

using namespace objective_calibration;

// Rounds the exact binary value, so 12.625 (stored just below) goes down and
// an exact tie such as 2.5 goes to the even neighbour.
double round_to(double value, int decimals) noexcept {
    if (!std::isfinite(value) || decimals < 0) {
        return value;
    }
    std::array<char, 512> buf{};
    auto printed = std::to_chars(buf.data(), buf.data() + buf.size(), value, std::chars_format::fixed, decimals);
    if (printed.ec != std::errc{}) {
        return value;
    }
    double rounded = value;
    auto parsed = std::from_chars(buf.data(), printed.ptr, rounded);
    if (parsed.ec != std::errc{}) {
        return value;
    }
    return rounded;
}

ObjectiveBreakdown ObjectiveEvaluator::evaluate(const core::TelemetrySample& sample,
                                                const core::ObjectiveWeights& weights) noexcept {
    ObjectiveBreakdown out;
    out.weights = weights;
    out.derived = derive_features(sample);

    double network_excess = std::max(0.0, sample.network_io - NETWORK_BASELINE_GBPS);
    out.proxy_cost = round_to(sample.power * COST_PER_WATT + sample.cpu * COST_PER_CPU +
                                  network_excess * COST_PER_NETWORK_EXCESS,
                              2);
    out.proxy_energy = round_to(sample.power * ENERGY_PER_WATT + sample.cpu * ENERGY_PER_CPU, 2);

    double capped_memory = std::min(sample.memory, LOAD_BALANCE_MAX);
    out.proxy_load_balance = round_to(
        LOAD_BALANCE_MAX - std::min(LOAD_BALANCE_MAX, std::abs(sample.cpu - capped_memory)), 2);

    out.norm_cost = std::min(1.0, out.proxy_cost / COST_NORMALIZER);
    out.norm_energy = std::min(1.0, out.proxy_energy / ENERGY_NORMALIZER);
    out.norm_load = 1.0 - std::min(1.0, out.proxy_load_balance / LOAD_BALANCE_MAX);

    out.weighted_score = round_to(weights.cost * out.norm_cost + weights.energy * out.norm_energy +
                                      weights.load * out.norm_load,
                                  3);
    return out;
}

} // namespace vmplace::algo
