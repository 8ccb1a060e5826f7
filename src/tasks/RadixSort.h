#ifndef DROPLET_RADIX_SORT_H
#define DROPLET_RADIX_SORT_H

#include <stdint.h>
#include "src/tasks/ComputeTask.h"

namespace droplet {

// Shared by radix_histogram.comp, radix_prefix_sum.comp and radix_scatter.comp
struct RadixSortConstants {
    uint32_t particleCount;
    uint32_t shift;             // 0, 8, 16, 24
    uint32_t workGroups;
    uint32_t elementsPerGroup;  // contiguous keys owned by one work group
};

// hash(0), histograms(1)
uint32_t bindRadixHistogram(const ParticleStore& particles, BufferBinding* out);
// histograms(0), prefix_sums(1)
uint32_t bindRadixPrefixSum(const ParticleStore& particles, BufferBinding* out);
// hash(0), index(1), prefix_sums(2), hash_temp(3), index_temp(4)
uint32_t bindRadixScatter(const ParticleStore& particles, BufferBinding* out);

// Stable LSD radix sort of (hash, index) by hash: 4 passes of 8 bits.
// Each pass ping-pongs the sort buffers, so after the even number of passes the
// sorted keys are back in hash()/index().
class RadixSortSystem {
public:
    static constexpr uint32_t kPasses = 4;
    static constexpr uint32_t kRadixBits = 8;

    RadixSortSystem();

    SimError init(ComputeDevice& device);
    SimError sort(ParticleStore& particles);

    // Work groups used by the most recent sort
    uint32_t lastWorkGroups() const { return workGroups; }

private:
    ComputeTask<RadixSortConstants> histogram;
    ComputeTask<RadixSortConstants> prefixSum;
    ComputeTask<RadixSortConstants> scatter;
    uint32_t workGroups;
};

} // namespace droplet

#endif
