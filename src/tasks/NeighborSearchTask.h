#ifndef DROPLET_NEIGHBOR_SEARCH_TASK_H
#define DROPLET_NEIGHBOR_SEARCH_TASK_H

#include <stdint.h>
#include "src/config/SimulationConfig.h"
#include "src/tasks/ComputeTask.h"

namespace droplet {

// neighbor_search.comp: up to maxNeighbors indices within h of each particle,
// found by scanning the 27 surrounding cells of the sorted table
struct NeighborSearchConstants {
    uint32_t particleCount;
    float gridSize;
    float smoothingRadiusSq;
    uint32_t maxNeighbors;   // accepted neighbors per particle
    uint32_t rowStride;      // row width of the contacts buffer
    uint32_t pad0;
    uint32_t pad1;
    uint32_t pad2;
};

NeighborSearchConstants makeNeighborSearchConstants(const SimulationConfig& cfg, uint32_t particleCount,
                                                    uint32_t rowWidth);

// predicted_position(0), hash(1), index(2), cell_start(3), cell_end(4),
// contacts(5), contact_counts(6)
uint32_t bindNeighborSearch(const ParticleStore& particles, BufferBinding* out);

typedef ComputeTask<NeighborSearchConstants> NeighborSearchTask;

inline NeighborSearchTask makeNeighborSearchTask() {
    return NeighborSearchTask(StageId::NeighborSearch, "neighbor_search", bindNeighborSearch);
}

} // namespace droplet

#endif
