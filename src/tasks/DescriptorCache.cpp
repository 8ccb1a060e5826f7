#include "src/tasks/DescriptorCache.h"

namespace droplet {

const char* stageName(StageId stage) {
    switch (stage) {
        case StageId::ApplyGravity: return "apply_gravity";
        case StageId::PredictPosition: return "predict_position";
        case StageId::MortonHash: return "morton_hash";
        case StageId::RadixHistogram: return "radix_histogram";
        case StageId::RadixPrefixSum: return "radix_prefix_sum";
        case StageId::RadixScatter: return "radix_scatter";
        case StageId::BuildCellIndex: return "build_cell_index";
        case StageId::NeighborSearch: return "neighbor_search";
        case StageId::DensityEstimate: return "density_estimate";
        case StageId::PbdLambda: return "pbd_lambda";
        case StageId::PbdDisplacement: return "pbd_displacement";
        case StageId::PbdApply: return "pbd_apply";
        case StageId::CommitPosition: return "commit_position";
        case StageId::Count: break;
    }
    return "unknown";
}

DescriptorCache::DescriptorCache() : invalidations(0) {
    for (uint32_t i = 0; i < kStageCount; i++) {
        valid[i] = false;
    }
}

const BindingSet* DescriptorCache::find(StageId stage) const {
    uint32_t i = (uint32_t)stage;
    if (i >= kStageCount || !valid[i]) return nullptr;
    return &sets[i];
}

const BindingSet& DescriptorCache::store(StageId stage, const BindingSet& set) {
    uint32_t i = (uint32_t)stage;
    sets[i] = set;
    valid[i] = true;
    return sets[i];
}

void DescriptorCache::invalidate(StageId stage) {
    uint32_t i = (uint32_t)stage;
    if (i < kStageCount) valid[i] = false;
}

void DescriptorCache::invalidate() {
    for (uint32_t i = 0; i < kStageCount; i++) {
        valid[i] = false;
    }
    invalidations++;
}

uint32_t DescriptorCache::size() const {
    uint32_t n = 0;
    for (uint32_t i = 0; i < kStageCount; i++) {
        if (valid[i]) n++;
    }
    return n;
}

} // namespace droplet
