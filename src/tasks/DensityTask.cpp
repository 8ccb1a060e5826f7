#include "src/tasks/DensityTask.h"

namespace droplet {

DensityConstants makeDensityConstants(const SimulationConfig& cfg, uint32_t particleCount, uint32_t rowWidth) {
    DensityConstants c = {};
    c.particleCount = particleCount;
    c.mass = cfg.particleMass;
    c.smoothingRadiusSq = cfg.smoothingRadius * cfg.smoothingRadius;
    c.poly6Factor = kernel::poly6Factor(cfg.smoothingRadius);
    c.spikyFactor = kernel::spikyFactor(cfg.smoothingRadius);
    c.rowStride = rowWidth;
    return c;
}

uint32_t bindDensityEstimate(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.predictedPosition()};
    out[1] = {1, particles.contacts()};
    out[2] = {2, particles.contactCounts()};
    out[3] = {3, particles.density()};
    return 4;
}

} // namespace droplet
