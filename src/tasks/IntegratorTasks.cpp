#include "src/tasks/IntegratorTasks.h"

namespace droplet {

GravityConstants makeGravityConstants(const SimulationConfig& cfg, uint32_t particleCount, float dt) {
    GravityConstants c = {};
    cfg.gravity.store(c.gravity);
    c.particleCount = particleCount;
    c.dt = dt;
    return c;
}

IntegrateConstants makeIntegrateConstants(const SimulationConfig& cfg, uint32_t particleCount, float dt) {
    IntegrateConstants c = {};
    cfg.aabbMin.store(c.aabbMin);
    cfg.aabbMax.store(c.aabbMax);
    c.particleCount = particleCount;
    c.dt = dt;
    return c;
}

uint32_t bindApplyGravity(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.velocity()};
    return 1;
}

uint32_t bindPredictPosition(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.position()};
    out[1] = {1, particles.velocity()};
    out[2] = {2, particles.predictedPosition()};
    return 3;
}

uint32_t bindCommitPosition(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.velocity()};
    out[1] = {1, particles.position()};
    out[2] = {2, particles.predictedPosition()};
    return 3;
}

} // namespace droplet
