#ifndef DROPLET_EMITTER_SYSTEM_H
#define DROPLET_EMITTER_SYSTEM_H

#include <flecs.h>
#include "src/components/Fluid.h"
#include "src/core/ParticleStore.h"

namespace droplet {

// EmitterSystem - feeds new particles into the back store (OnUpdate, before the step)
class EmitterSystem {
public:
    static void registerSystem(flecs::world& world);

    // Advances the emitter by one frame and writes a batch when it is due.
    // CapacityExceeded is passed through; the batch was still written.
    static SimError tick(components::Emitter& emitter, ParticleStore& store);
};

} // namespace droplet

#endif
