#include "src/tasks/RadixSort.h"

namespace droplet {

uint32_t bindRadixHistogram(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.hash()};
    out[1] = {1, particles.histograms()};
    return 2;
}

uint32_t bindRadixPrefixSum(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.histograms()};
    out[1] = {1, particles.prefixSums()};
    return 2;
}

uint32_t bindRadixScatter(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.hash()};
    out[1] = {1, particles.index()};
    out[2] = {2, particles.prefixSums()};
    out[3] = {3, particles.hashTemp()};
    out[4] = {4, particles.indexTemp()};
    return 5;
}

RadixSortSystem::RadixSortSystem()
    : histogram(StageId::RadixHistogram, "radix_histogram", bindRadixHistogram),
      prefixSum(StageId::RadixPrefixSum, "radix_prefix_sum", bindRadixPrefixSum),
      scatter(StageId::RadixScatter, "radix_scatter", bindRadixScatter),
      workGroups(0) {}

SimError RadixSortSystem::init(ComputeDevice& device) {
    SimError err = histogram.init(device);
    if (err == SimError::None) err = prefixSum.init(device);
    if (err == SimError::None) err = scatter.init(device);
    return err;
}

SimError RadixSortSystem::sort(ParticleStore& particles) {
    const uint32_t n = particles.count();
    if (n == 0) {
        return SimError::None;
    }

    workGroups = kernel::sortWorkGroups(n, particles.maxSortWorkGroups());

    RadixSortConstants c = {};
    c.particleCount = n;
    c.workGroups = workGroups;
    c.elementsPerGroup = kernel::sortElementsPerGroup(n, workGroups);

    for (uint32_t pass = 0; pass < kPasses; pass++) {
        c.shift = pass * kRadixBits;
        histogram.setConstants(c);
        prefixSum.setConstants(c);
        scatter.setConstants(c);

        SimError err = histogram.execute(particles, workGroups);
        if (err == SimError::None) err = prefixSum.execute(particles, 1);
        if (err == SimError::None) err = scatter.execute(particles, workGroups);
        if (err != SimError::None) {
            fprintf(stderr, "sim: radix sort pass %u of %u keys failed (%s)\n", pass, n, simErrorName(err));
            return err;
        }

        // Scatter wrote the temp buffers; they become the input of the next pass
        particles.swapSortBuffers();
    }
    return SimError::None;
}

} // namespace droplet
