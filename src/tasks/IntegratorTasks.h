#ifndef DROPLET_INTEGRATOR_TASKS_H
#define DROPLET_INTEGRATOR_TASKS_H

#include <stdint.h>
#include "src/config/SimulationConfig.h"
#include "src/tasks/ComputeTask.h"

namespace droplet {

// apply_gravity.comp: velocity += gravity * dt
struct GravityConstants {
    float gravity[4];
    uint32_t particleCount;
    float dt;
    uint32_t pad0;
    uint32_t pad1;
};

// predict_position.comp and commit_position.comp share the AABB layout
struct IntegrateConstants {
    float aabbMin[4];
    float aabbMax[4];
    uint32_t particleCount;
    float dt;
    uint32_t pad0;
    uint32_t pad1;
};

GravityConstants makeGravityConstants(const SimulationConfig& cfg, uint32_t particleCount, float dt);
IntegrateConstants makeIntegrateConstants(const SimulationConfig& cfg, uint32_t particleCount, float dt);

// velocity(0)
uint32_t bindApplyGravity(const ParticleStore& particles, BufferBinding* out);
// position(0), velocity(1), predicted_position(2)
uint32_t bindPredictPosition(const ParticleStore& particles, BufferBinding* out);
// velocity(0), position(1), predicted_position(2)
uint32_t bindCommitPosition(const ParticleStore& particles, BufferBinding* out);

typedef ComputeTask<GravityConstants> ApplyGravityTask;
typedef ComputeTask<IntegrateConstants> PredictPositionTask;
typedef ComputeTask<IntegrateConstants> CommitPositionTask;

inline ApplyGravityTask makeApplyGravityTask() {
    return ApplyGravityTask(StageId::ApplyGravity, "apply_gravity", bindApplyGravity);
}

inline PredictPositionTask makePredictPositionTask() {
    return PredictPositionTask(StageId::PredictPosition, "predict_position", bindPredictPosition);
}

inline CommitPositionTask makeCommitPositionTask() {
    return CommitPositionTask(StageId::CommitPosition, "commit_position", bindCommitPosition);
}

} // namespace droplet

#endif
