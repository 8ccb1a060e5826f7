#ifndef DROPLET_WORLD_H
#define DROPLET_WORLD_H

#include <flecs.h>
#include "engine/gpu/ComputeDevice.h"
#include "src/components/Fluid.h"
#include "src/config/SimulationConfig.h"
#include "src/core/ParticlePingPong.h"
#include "src/systems/SimulationSystem.h"

namespace droplet {

struct WorldDesc {
    SimulationConfig config = SimulationConfig::fountainSpray();
    ParticleStoreDesc store;
};

// FLECS world hosting the fluid: emitters feed the back store, the step system
// simulates it and the swap system publishes it as the front store.
class World {
public:
    World();
    ~World();

    // Builds both particle stores and the solver on `device`; the device must outlive the world
    SimError init(ComputeDevice& device, const WorldDesc& desc);

    // One frame: OnUpdate (emit, step) then OnStore (swap).
    // Returns the first fatal error, once halted every later call returns it too.
    SimError update(float dt);

    flecs::entity createEmitter(const components::Emitter& emitter);

    // Stable state for drawing; nullptr before init()
    const ParticleStore* renderStore() const;

    ParticlePingPong* particles() { return pingPong; }
    SimulationSystem* simulation() { return sim; }
    const components::FluidState* fluidState() const;

    // Access to underlying FLECS world
    flecs::world& getWorld() { return world; }

private:
    flecs::world world;
    ParticlePingPong* pingPong;
    SimulationSystem* sim;

    flecs::entity onUpdatePipeline;
    flecs::entity onStorePipeline;

    void registerComponents();
    void registerSystems();
};

} // namespace droplet

#endif
