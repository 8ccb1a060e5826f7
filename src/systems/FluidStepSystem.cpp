#include "src/systems/FluidStepSystem.h"
#include "src/components/Fluid.h"
#include "src/core/ParticlePingPong.h"
#include "src/systems/SimulationSystem.h"
#include <stdio.h>

namespace droplet {

static void record(components::FluidState* fluid, SimError err, const char* what) {
    fluid->lastError = err;
    if (isFatal(err)) {
        fprintf(stderr, "sim: %s halted the fluid (%s)\n", what, simErrorName(err));
        fluid->halted = true;
    }
}

void FluidStepSystem::registerSystem(flecs::world& world) {
    world.system("FluidStepSystem")
        .kind(flecs::OnUpdate)
        .run([](flecs::iter& it) {
            auto fluid = it.world().get_mut<components::FluidState>();
            if (!fluid || !fluid->particles || !fluid->simulation || fluid->halted) {
                return;
            }

            SimError err = fluid->simulation->step(fluid->particles->back(), it.delta_time());
            if (err != SimError::None) {
                record(fluid, err, "step");
            }
        });

    world.system("FluidSwapSystem")
        .kind(flecs::OnStore)
        .run([](flecs::iter& it) {
            auto fluid = it.world().get_mut<components::FluidState>();
            if (!fluid || !fluid->particles || fluid->halted) {
                return;
            }

            SimError err = fluid->particles->swap();
            if (err != SimError::None) {
                record(fluid, err, "swap");
                return;
            }
            fluid->frames++;
        });
}

} // namespace droplet
