#include "src/tasks/PbdSolver.h"

namespace droplet {

PbdConstants makePbdConstants(const SimulationConfig& cfg, uint32_t particleCount, uint32_t rowWidth) {
    PbdConstants c = {};
    cfg.aabbMin.store(c.aabbMin);
    cfg.aabbMax.store(c.aabbMax);
    c.particleCount = particleCount;
    c.mass = cfg.particleMass;
    c.restDensity = cfg.restDensity;
    c.smoothingRadius = cfg.smoothingRadius;
    c.smoothingRadiusSq = cfg.smoothingRadius * cfg.smoothingRadius;
    c.poly6Factor = kernel::poly6Factor(cfg.smoothingRadius);
    c.spikyGradFactor = kernel::spikyGradFactor(cfg.smoothingRadius);
    c.constraintEpsilon = cfg.constraintEpsilon;
    c.relaxationFactor = cfg.relaxationFactor;
    c.surfaceTension = cfg.surfaceTension;

    float q = 0.2f * cfg.smoothingRadius;
    c.tensileReference = kernel::poly6(q * q, c.smoothingRadiusSq, c.poly6Factor);
    c.rowStride = rowWidth;
    return c;
}

uint32_t bindPbdLambda(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.predictedPosition()};
    out[1] = {1, particles.density()};
    out[2] = {2, particles.contacts()};
    out[3] = {3, particles.contactCounts()};
    out[4] = {4, particles.lambda()};
    return 5;
}

uint32_t bindPbdDisplacement(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.predictedPosition()};
    out[1] = {1, particles.lambda()};
    out[2] = {2, particles.contacts()};
    out[3] = {3, particles.contactCounts()};
    out[4] = {4, particles.deltaPosition()};
    return 5;
}

uint32_t bindPbdApply(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.predictedPosition()};
    out[1] = {1, particles.deltaPosition()};
    return 2;
}

PbdSolver::PbdSolver()
    : lambdaTask(StageId::PbdLambda, "pbd_lambda", bindPbdLambda),
      displacementTask(StageId::PbdDisplacement, "pbd_displacement", bindPbdDisplacement),
      applyTask(StageId::PbdApply, "pbd_apply", bindPbdApply),
      completed(0) {}

SimError PbdSolver::init(ComputeDevice& device) {
    SimError err = lambdaTask.init(device);
    if (err == SimError::None) err = displacementTask.init(device);
    if (err == SimError::None) err = applyTask.init(device);
    return err;
}

void PbdSolver::setConstants(const PbdConstants& constants) {
    lambdaTask.setConstants(constants);
    displacementTask.setConstants(constants);
    applyTask.setConstants(constants);
}

SimError PbdSolver::iterate(ParticleStore& particles) {
    const uint32_t n = particles.count();
    SimError err = lambdaTask.dispatch(particles, n);
    if (err == SimError::None) err = displacementTask.dispatch(particles, n);
    if (err == SimError::None) err = applyTask.dispatch(particles, n);
    return err;
}

SimError PbdSolver::solve(ParticleStore& particles, int iterations) {
    completed = 0;
    for (int k = 0; k < iterations; k++) {
        SimError err = iterate(particles);
        if (err != SimError::None) {
            fprintf(stderr, "sim: pbd iteration %d of %d failed (%s)\n", k + 1, iterations, simErrorName(err));
            return err;
        }
        completed++;
    }
    return SimError::None;
}

} // namespace droplet
