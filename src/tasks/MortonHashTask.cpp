#include "src/tasks/MortonHashTask.h"

namespace droplet {

MortonHashConstants makeMortonHashConstants(const SimulationConfig& cfg, uint32_t particleCount) {
    MortonHashConstants c = {};
    c.particleCount = particleCount;
    c.gridSize = cfg.gridSize;
    return c;
}

uint32_t bindMortonHash(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.predictedPosition()};
    out[1] = {1, particles.hash()};
    out[2] = {2, particles.index()};
    return 3;
}

} // namespace droplet
