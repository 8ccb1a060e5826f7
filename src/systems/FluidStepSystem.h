#ifndef DROPLET_FLUID_STEP_SYSTEM_H
#define DROPLET_FLUID_STEP_SYSTEM_H

#include <flecs.h>

namespace droplet {

// FluidStepSystem - advances the back store (OnUpdate) and swaps the
// ping-pong pair at the frame boundary (OnStore)
class FluidStepSystem {
public:
    static void registerSystem(flecs::world& world);
};

} // namespace droplet

#endif
