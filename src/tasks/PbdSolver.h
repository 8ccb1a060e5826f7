#ifndef DROPLET_PBD_SOLVER_H
#define DROPLET_PBD_SOLVER_H

#include <stdint.h>
#include "src/config/SimulationConfig.h"
#include "src/tasks/ComputeTask.h"

namespace droplet {

// Shared by pbd_lambda.comp, pbd_displacement.comp and pbd_apply.comp
struct PbdConstants {
    float aabbMin[4];
    float aabbMax[4];
    uint32_t particleCount;
    float mass;
    float restDensity;
    float smoothingRadius;
    float smoothingRadiusSq;
    float poly6Factor;
    float spikyGradFactor;     // -45 / (pi h^6)
    float constraintEpsilon;
    float relaxationFactor;
    float surfaceTension;
    float tensileReference;    // W_poly6(0.2 h), denominator of the tensile term
    uint32_t rowStride;        // row width of the contacts buffer
};

PbdConstants makePbdConstants(const SimulationConfig& cfg, uint32_t particleCount, uint32_t rowWidth);

// predicted_position(0), density(1), contacts(2), contact_counts(3), lambda(4)
uint32_t bindPbdLambda(const ParticleStore& particles, BufferBinding* out);
// predicted_position(0), lambda(1), contacts(2), contact_counts(3), delta_position(4)
uint32_t bindPbdDisplacement(const ParticleStore& particles, BufferBinding* out);
// predicted_position(0), delta_position(1)
uint32_t bindPbdApply(const ParticleStore& particles, BufferBinding* out);

// Incompressibility solve over the neighbor lists of the current frame.
// Density is estimated once before the loop and not refreshed between passes.
class PbdSolver {
public:
    PbdSolver();

    SimError init(ComputeDevice& device);

    void setConstants(const PbdConstants& constants);

    // One lambda -> displacement -> apply pass
    SimError iterate(ParticleStore& particles);

    // Runs `iterations` passes; 0 leaves predicted_position untouched
    SimError solve(ParticleStore& particles, int iterations);

    // Passes completed by the current or last solve()
    int completedIterations() const { return completed; }

private:
    ComputeTask<PbdConstants> lambdaTask;
    ComputeTask<PbdConstants> displacementTask;
    ComputeTask<PbdConstants> applyTask;
    int completed;
};

} // namespace droplet

#endif
