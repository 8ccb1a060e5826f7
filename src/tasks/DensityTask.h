#ifndef DROPLET_DENSITY_TASK_H
#define DROPLET_DENSITY_TASK_H

#include <stdint.h>
#include "src/config/SimulationConfig.h"
#include "src/tasks/ComputeTask.h"

namespace droplet {

// density_estimate.comp: rho_i = mass * (W(0) + sum_j W(r_ij)), Poly6 kernel
struct DensityConstants {
    uint32_t particleCount;
    float mass;
    float smoothingRadiusSq;
    float poly6Factor;
    float spikyFactor;
    uint32_t rowStride;      // row width of the contacts buffer
    uint32_t pad0;
    uint32_t pad1;
};

DensityConstants makeDensityConstants(const SimulationConfig& cfg, uint32_t particleCount, uint32_t rowWidth);

// predicted_position(0), contacts(1), contact_counts(2), density(3)
uint32_t bindDensityEstimate(const ParticleStore& particles, BufferBinding* out);

typedef ComputeTask<DensityConstants> DensityEstimateTask;

inline DensityEstimateTask makeDensityEstimateTask() {
    return DensityEstimateTask(StageId::DensityEstimate, "density_estimate", bindDensityEstimate);
}

} // namespace droplet

#endif
