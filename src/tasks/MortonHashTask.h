#ifndef DROPLET_MORTON_HASH_TASK_H
#define DROPLET_MORTON_HASH_TASK_H

#include <stdint.h>
#include "src/config/SimulationConfig.h"
#include "src/tasks/ComputeTask.h"

namespace droplet {

// morton_hash.comp: hash[i] = morton(floor(predicted[i] / grid)), index[i] = i
struct MortonHashConstants {
    uint32_t particleCount;
    float gridSize;
    uint32_t pad0;
    uint32_t pad1;
};

MortonHashConstants makeMortonHashConstants(const SimulationConfig& cfg, uint32_t particleCount);

// predicted_position(0), hash(1), index(2)
uint32_t bindMortonHash(const ParticleStore& particles, BufferBinding* out);

typedef ComputeTask<MortonHashConstants> MortonHashTask;

inline MortonHashTask makeMortonHashTask() {
    return MortonHashTask(StageId::MortonHash, "morton_hash", bindMortonHash);
}

} // namespace droplet

#endif
