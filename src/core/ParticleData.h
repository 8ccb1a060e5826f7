#ifndef DROPLET_PARTICLE_DATA_H
#define DROPLET_PARTICLE_DATA_H

#include <stdint.h>
#include "src/math/Vec3.h"

namespace droplet {

#define DROPLET_PARTICLE_MAX_COUNT 0x10000u    // default ring capacity; 64-wide contacts fill the 16 MiB SSBO minimum
#define DROPLET_CELL_COUNT 65536u              // cell index table entries (hash >> 16)
#define DROPLET_EMPTY_CELL 0xFFFFFFFFu
#define DROPLET_WORKGROUP_SIZE 256u
#define DROPLET_MAX_SORT_WORK_GROUPS 1024u

// One per-slot vector (GPU layout, 16 bytes). w is padding.
typedef struct {
    float v[4];
} GpuVec4;

// Host-side spawn record for ParticleStore::addParticles
struct ParticleInitData {
    math::Vec3 position;
    math::Vec3 velocity;
};

} // namespace droplet

#endif
