#include "src/tasks/NeighborSearchTask.h"

namespace droplet {

NeighborSearchConstants makeNeighborSearchConstants(const SimulationConfig& cfg, uint32_t particleCount,
                                                    uint32_t rowWidth) {
    NeighborSearchConstants c = {};
    c.particleCount = particleCount;
    c.gridSize = cfg.gridSize;
    c.smoothingRadiusSq = cfg.smoothingRadius * cfg.smoothingRadius;
    // Rows of the contacts buffer are sized by the store, never wider
    c.maxNeighbors = cfg.maxNeighbors < rowWidth ? cfg.maxNeighbors : rowWidth;
    c.rowStride = rowWidth;
    return c;
}

uint32_t bindNeighborSearch(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.predictedPosition()};
    out[1] = {1, particles.hash()};
    out[2] = {2, particles.index()};
    out[3] = {3, particles.cellStart()};
    out[4] = {4, particles.cellEnd()};
    out[5] = {5, particles.contacts()};
    out[6] = {6, particles.contactCounts()};
    return 7;
}

} // namespace droplet
