#ifndef DROPLET_FLUID_COMPONENTS_H
#define DROPLET_FLUID_COMPONENTS_H

#include <stdint.h>
#include "engine/util/rng.h"
#include "src/core/SimError.h"
#include "src/math/Vec3.h"

namespace droplet {
class ParticlePingPong;
class SimulationSystem;
}

namespace components {

// Fountain source: every `interval` frames pushes `batchSize` particles into the back store
struct Emitter {
    droplet::math::Vec3 position{0.0f, 0.0f, 0.0f};
    droplet::math::Vec3 velocity{1.0f, 0.0f, 0.0f};
    uint32_t interval{10};
    uint32_t batchSize{1};
    float jitter{0.0f};          // max per-axis offset applied to position and velocity
    bool enabled{true};

    uint32_t frameCounter{0};
    uint64_t emitted{0};
    Rng rng{0x5EEDu};
};

// Singleton - particle sets and solver shared by the fluid systems
struct FluidState {
    droplet::ParticlePingPong* particles{nullptr};
    droplet::SimulationSystem* simulation{nullptr};
    droplet::SimError lastError{droplet::SimError::None};
    bool halted{false};          // set on the first fatal error
    uint64_t frames{0};
};

} // namespace components

#endif
