#include "src/systems/EmitterSystem.h"
#include "src/core/ParticlePingPong.h"
#include <stdio.h>
#include <vector>

namespace droplet {

SimError EmitterSystem::tick(components::Emitter& emitter, ParticleStore& store) {
    if (!emitter.enabled || emitter.interval == 0 || emitter.batchSize == 0) {
        return SimError::None;
    }
    emitter.frameCounter++;
    if (emitter.frameCounter % emitter.interval != 0) {
        return SimError::None;
    }

    std::vector<ParticleInitData> batch(emitter.batchSize);
    for (ParticleInitData& p : batch) {
        p.position = emitter.position;
        p.velocity = emitter.velocity;
        if (emitter.jitter > 0.0f) {
            float j = emitter.jitter;
            Rng* rng = &emitter.rng;
            p.position += math::Vec3(rng_signed(rng, j), rng_signed(rng, j), rng_signed(rng, j));
            p.velocity += math::Vec3(rng_signed(rng, j), rng_signed(rng, j), rng_signed(rng, j));
        }
    }

    SimError err = store.addParticles(batch.data(), (uint32_t)batch.size());
    if (err == SimError::None || err == SimError::CapacityExceeded) {
        emitter.emitted += batch.size();
    }
    return err;
}

void EmitterSystem::registerSystem(flecs::world& world) {
    world.system<components::Emitter>("EmitterSystem")
        .kind(flecs::OnUpdate)
        .each([](flecs::entity e, components::Emitter& emitter) {
            auto fluid = e.world().get_mut<components::FluidState>();
            if (!fluid || !fluid->particles || fluid->halted) {
                return;
            }

            SimError err = tick(emitter, fluid->particles->back());
            if (err == SimError::None) {
                return;
            }
            fluid->lastError = err;
            if (isFatal(err)) {
                fprintf(stderr, "sim: emitter halted the fluid (%s)\n", simErrorName(err));
                fluid->halted = true;
            }
        });
}

} // namespace droplet
