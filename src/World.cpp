#include "World.h"
#include "systems/EmitterSystem.h"
#include "systems/FluidStepSystem.h"
#include <stdio.h>

namespace droplet {

World::World() : pingPong(nullptr), sim(nullptr) {
    registerComponents();
    registerSystems();

    // Create singletons
    world.set<components::FluidState>({});
}

World::~World() {
    if (sim) {
        sim->destroy();
    }
    if (pingPong) {
        pingPong->destroy();
    }
}

void World::registerComponents() {
    world.component<components::Emitter>();
    world.component<components::FluidState>();
}

void World::registerSystems() {
    // 1. EmitterSystem (OnUpdate - new particles land in the back store)
    EmitterSystem::registerSystem(world);

    // 2. FluidStepSystem (OnUpdate step, OnStore swap)
    FluidStepSystem::registerSystem(world);

    onUpdatePipeline = world.pipeline()
        .with(flecs::System)
        .with(flecs::OnUpdate)
        .without(flecs::Disabled)
        .build();

    onStorePipeline = world.pipeline()
        .with(flecs::System)
        .with(flecs::OnStore)
        .without(flecs::Disabled)
        .build();
}

SimError World::init(ComputeDevice& device, const WorldDesc& desc) {
    if (pingPong || sim) {
        fprintf(stderr, "sim: world already initialized\n");
        return SimError::InvalidArgument;
    }

    SimError err = SimError::None;
    sim = SimulationSystem::create(device, desc.config, &err);
    if (!sim) {
        return err;
    }

    ParticleStoreDesc storeDesc = desc.store;
    if (storeDesc.maxNeighbors < desc.config.maxNeighbors) {
        storeDesc.maxNeighbors = desc.config.maxNeighbors;
    }
    pingPong = ParticlePingPong::create(device, storeDesc, &err);
    if (!pingPong) {
        sim->destroy();
        sim = nullptr;
        return err;
    }

    auto fluid = world.get_mut<components::FluidState>();
    fluid->particles = pingPong;
    fluid->simulation = sim;
    fluid->lastError = SimError::None;
    fluid->halted = false;
    return SimError::None;
}

SimError World::update(float dt) {
    if (onUpdatePipeline.is_valid()) {
        world.run_pipeline(onUpdatePipeline, dt);
    }
    if (onStorePipeline.is_valid()) {
        world.run_pipeline(onStorePipeline, dt);
    }

    const components::FluidState* fluid = world.get<components::FluidState>();
    if (fluid && fluid->halted) {
        return fluid->lastError;
    }
    return SimError::None;
}

flecs::entity World::createEmitter(const components::Emitter& emitter) {
    auto entity = world.entity();
    entity.set<components::Emitter>(emitter);
    return entity;
}

const ParticleStore* World::renderStore() const {
    return pingPong ? &pingPong->front() : nullptr;
}

const components::FluidState* World::fluidState() const {
    return world.get<components::FluidState>();
}

} // namespace droplet
