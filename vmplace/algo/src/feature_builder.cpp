#include <vmplace/algo/feature_builder.hpp>

namespace vmplace::algo {

DerivedFeatures derive_features(const core::TelemetrySample& sample) noexcept {
    DerivedFeatures derived;
    derived.cpu_mem_ratio = sample.memory != 0.0 ? sample.cpu / sample.memory : 0.0;
    derived.power_per_cpu = sample.cpu != 0.0 ? sample.power / sample.cpu : 0.0;
    return derived;
}

FeatureVector FeatureBuilder::build(const core::TelemetrySample& sample) const {
    int vm_code = vocabulary_.transform(sample.vm);
    DerivedFeatures derived = derive_features(sample);

    FeatureVector features{};
    features[VmEncoded] = static_cast<double>(vm_code);
    features[Cpu] = sample.cpu;
    features[Memory] = sample.memory;
    features[NetworkIo] = sample.network_io;
    features[Power] = sample.power;
    features[CpuMemRatio] = derived.cpu_mem_ratio;
    features[PowerPerCpu] = derived.power_per_cpu;
    return features;
}

} // namespace vmplace::algo
