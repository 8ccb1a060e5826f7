#ifndef DROPLET_STAGE_ID_H
#define DROPLET_STAGE_ID_H

#include <stdint.h>

namespace droplet {

// Every compute stage of the pipeline. Indexes the descriptor cache.
enum class StageId : uint32_t {
    ApplyGravity,
    PredictPosition,
    MortonHash,
    RadixHistogram,
    RadixPrefixSum,
    RadixScatter,
    BuildCellIndex,
    NeighborSearch,
    DensityEstimate,
    PbdLambda,
    PbdDisplacement,
    PbdApply,
    CommitPosition,
    Count
};

static constexpr uint32_t kStageCount = (uint32_t)StageId::Count;

const char* stageName(StageId stage);

} // namespace droplet

#endif
