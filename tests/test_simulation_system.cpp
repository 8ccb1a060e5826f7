#include <catch2/catch_test_macros.hpp>
#include <string>
#include <utility>
#include <vector>
#include "src/systems/SimulationSystem.h"
#include "tests/support/Fixtures.h"

using namespace droplet;

namespace {

typedef std::vector<std::pair<SimState, int>> Trace;

void recordState(SimState state, int iteration, void* user) {
    static_cast<Trace*>(user)->push_back(std::make_pair(state, iteration));
}

SimulationSystem* makeSystem(test::ReferenceDevice& device, const SimulationConfig& cfg) {
    SimError err = SimError::None;
    SimulationSystem* sim = SimulationSystem::create(device, cfg, &err);
    REQUIRE(err == SimError::None);
    REQUIRE(sim != nullptr);
    return sim;
}

} // namespace

TEST_CASE("Simulation - one step walks every stage in order", "[sim]") {
    test::StoreFixture fx(256);
    REQUIRE(fx.add(test::cloud(50, -0.3f, 0.3f)) == SimError::None);

    SimulationConfig cfg;
    cfg.pbdIterations = 3;
    SimulationSystem* sim = makeSystem(fx.device, cfg);

    Trace trace;
    sim->setObserver(recordState, &trace);
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);

    Trace expected = {
        {SimState::GravityApplied, 0}, {SimState::Predicted, 0}, {SimState::Hashed, 0},
        {SimState::Sorted, 0}, {SimState::CellIndexed, 0}, {SimState::NeighborsFound, 0},
        {SimState::DensityComputed, 0}, {SimState::Solving, 1}, {SimState::Solving, 2},
        {SimState::Solving, 3}, {SimState::Committed, 0}, {SimState::Idle, 0},
    };
    REQUIRE(trace == expected);
    REQUIRE(sim->state() == SimState::Idle);
    REQUIRE(sim->frameCount() == 1u);
    REQUIRE(sim->lastStepSorted());
    REQUIRE(fx.device.dispatchCount("pbd_lambda") == 3u);
    REQUIRE(fx.device.dispatchCount("commit_position") == 1u);
    sim->destroy();
}

TEST_CASE("Simulation - failure leaves the last completed stage", "[sim]") {
    test::StoreFixture fx(256);
    REQUIRE(fx.add(test::cloud(50, -0.3f, 0.3f)) == SimError::None);

    SimulationSystem* sim = makeSystem(fx.device, SimulationConfig());
    fx.device.failSyncOn("neighbor_search");

    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::SyncTimeout);
    REQUIRE(sim->state() == SimState::CellIndexed);
    REQUIRE(sim->frameCount() == 0u);
    REQUIRE(fx.device.dispatchCount("density_estimate") == 0u);

    // The next frame runs normally once the fault is gone
    fx.device.clearFaults();
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(sim->state() == SimState::Idle);
    sim->destroy();
}

TEST_CASE("Simulation - failure inside the solver reports the pass", "[sim]") {
    test::StoreFixture fx(256);
    REQUIRE(fx.add(test::cloud(50, -0.3f, 0.3f)) == SimError::None);

    SimulationConfig cfg;
    cfg.pbdIterations = 4;
    SimulationSystem* sim = makeSystem(fx.device, cfg);
    fx.device.failSyncOn("pbd_apply", 3);

    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::SyncTimeout);
    REQUIRE(sim->state() == SimState::Solving);
    REQUIRE(sim->iteration() == 2);
    sim->destroy();
}

TEST_CASE("Simulation - empty store is a no-op", "[sim]") {
    test::StoreFixture fx(64);
    SimulationSystem* sim = makeSystem(fx.device, SimulationConfig());

    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(fx.device.totalDispatches() == 0u);
    REQUIRE(sim->state() == SimState::Idle);
    REQUIRE(sim->frameCount() == 0u);
    sim->destroy();
}

TEST_CASE("Simulation - adaptive sort interval", "[sim]") {
    test::StoreFixture fx(256);
    REQUIRE(fx.add(test::cloud(50, -0.3f, 0.3f)) == SimError::None);

    SimulationConfig cfg;
    cfg.sortInterval = 3;
    SimulationSystem* sim = makeSystem(fx.device, cfg);

    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(sim->lastStepSorted());
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE_FALSE(sim->lastStepSorted());
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(fx.device.dispatchCount("radix_histogram") == 4u);
    REQUIRE(fx.device.dispatchCount("morton_hash") == 1u);
    REQUIRE(fx.device.dispatchCount("neighbor_search") == 3u);

    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(sim->lastStepSorted());
    REQUIRE(fx.device.dispatchCount("radix_histogram") == 8u);
    REQUIRE(sim->sortCount() == 2u);

    // New particles invalidate the table immediately
    REQUIRE(fx.add({test::at(0.9f, 0.9f, 0.9f)}) == SimError::None);
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(sim->lastStepSorted());
    REQUIRE(sim->sortCount() == 3u);

    // So does a forced rebuild
    sim->forceSort();
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(sim->sortCount() == 4u);
    sim->destroy();
}

TEST_CASE("Simulation - swapped store keeps its sort schedule", "[sim]") {
    test::ReferenceDevice device;
    ParticleStoreDesc desc;
    desc.capacity = 256;
    SimError err = SimError::None;
    ParticleStore* front = ParticleStore::create(device, desc, &err);
    ParticleStore* back = ParticleStore::create(device, desc, &err);
    REQUIRE(front != nullptr);
    REQUIRE(back != nullptr);

    std::vector<ParticleInitData> cloud = test::cloud(40, -0.3f, 0.3f);
    REQUIRE(front->addParticles(cloud.data(), (uint32_t)cloud.size()) == SimError::None);

    SimulationConfig cfg;
    cfg.sortInterval = 4;
    SimulationSystem* sim = makeSystem(device, cfg);
    REQUIRE(sim->step(*front, 1.0f / 60.0f) == SimError::None);
    REQUIRE(sim->lastStepSorted());

    // The sorted table travels with the slots
    REQUIRE(back->swapFrom(*front) == SimError::None);
    REQUIRE(back->contentId() == front->contentId());
    REQUIRE(back->spatialTableId() == front->contentId());
    REQUIRE(device.read<uint32_t>(back->hash(), 40) == device.read<uint32_t>(front->hash(), 40));
    REQUIRE(device.read<uint32_t>(back->cellStart(), DROPLET_CELL_COUNT) ==
            device.read<uint32_t>(front->cellStart(), DROPLET_CELL_COUNT));

    REQUIRE(sim->step(*back, 1.0f / 60.0f) == SimError::None);
    REQUIRE_FALSE(sim->lastStepSorted());
    REQUIRE(front->swapFrom(*back) == SimError::None);
    REQUIRE(sim->step(*front, 1.0f / 60.0f) == SimError::None);
    REQUIRE_FALSE(sim->lastStepSorted());
    REQUIRE(sim->sortCount() == 1u);

    // New particles leave the table stale, and a stale table is not carried
    REQUIRE(front->addParticles(cloud.data(), 1) == SimError::None);
    REQUIRE(back->swapFrom(*front) == SimError::None);
    REQUIRE(back->spatialTableId() == 0u);
    REQUIRE(sim->step(*back, 1.0f / 60.0f) == SimError::None);
    REQUIRE(sim->lastStepSorted());
    REQUIRE(sim->sortCount() == 2u);

    sim->destroy();
    back->destroy();
    front->destroy();
}

TEST_CASE("Simulation - recreated store sorts on its first step", "[sim]") {
    test::ReferenceDevice device;
    SimulationConfig cfg;
    cfg.sortInterval = 100;
    SimulationSystem* sim = makeSystem(device, cfg);

    ParticleStoreDesc desc;
    desc.capacity = 64;
    std::vector<ParticleInitData> cloud = test::cloud(20, -0.2f, 0.2f);
    for (int round = 0; round < 3; round++) {
        SimError err = SimError::None;
        ParticleStore* store = ParticleStore::create(device, desc, &err);
        REQUIRE(store != nullptr);
        REQUIRE(store->spatialTableId() == 0u);
        REQUIRE(store->addParticles(cloud.data(), (uint32_t)cloud.size()) == SimError::None);
        REQUIRE(sim->step(*store, 1.0f / 60.0f) == SimError::None);
        REQUIRE(sim->lastStepSorted());
        store->destroy();
    }
    REQUIRE(sim->sortCount() == 3u);
    sim->destroy();
}

TEST_CASE("Simulation - skipped sort still reports spatial states", "[sim]") {
    test::StoreFixture fx(256);
    REQUIRE(fx.add(test::cloud(10, -0.3f, 0.3f)) == SimError::None);

    SimulationConfig cfg;
    cfg.sortInterval = 2;
    cfg.pbdIterations = 1;
    SimulationSystem* sim = makeSystem(fx.device, cfg);
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);

    Trace trace;
    sim->setObserver(recordState, &trace);
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE_FALSE(sim->lastStepSorted());
    REQUIRE(trace.size() == 10u);
    REQUIRE(trace[2].first == SimState::Hashed);
    REQUIRE(trace[3].first == SimState::Sorted);
    REQUIRE(trace[4].first == SimState::CellIndexed);
    sim->destroy();
}

TEST_CASE("Simulation - missing kernel fails construction", "[sim]") {
    test::ReferenceDevice device;
    device.removeKernel("pbd_displacement");

    SimError err = SimError::None;
    REQUIRE(SimulationSystem::create(device, SimulationConfig(), &err) == nullptr);
    REQUIRE(err == SimError::KernelBuildError);
}

TEST_CASE("Simulation - invalid config fails construction", "[sim]") {
    test::ReferenceDevice device;
    SimulationConfig cfg;
    cfg.gridSize = cfg.smoothingRadius * 2.0f;

    SimError err = SimError::None;
    REQUIRE(SimulationSystem::create(device, cfg, &err) == nullptr);
    REQUIRE(err == SimError::InvalidConfig);
    REQUIRE(device.totalDispatches() == 0u);
}

TEST_CASE("Simulation - rejected config keeps the previous one", "[sim]") {
    test::StoreFixture fx(64);
    SimulationConfig cfg;
    cfg.pbdIterations = 2;
    SimulationSystem* sim = makeSystem(fx.device, cfg);

    SimulationConfig bad = cfg;
    bad.restDensity = -1.0f;
    REQUIRE(sim->setConfig(bad) == SimError::InvalidConfig);
    REQUIRE(sim->getConfig().restDensity == cfg.restDensity);

    SimulationConfig next = cfg;
    next.pbdIterations = 5;
    REQUIRE(sim->setConfig(next) == SimError::None);
    REQUIRE(sim->getConfig().pbdIterations == 5);

    REQUIRE(fx.add({test::at(0.0f, 0.0f, 0.0f)}) == SimError::None);
    REQUIRE(sim->step(*fx.store, 1.0f / 60.0f) == SimError::None);
    REQUIRE(fx.device.dispatchCount("pbd_apply") == 5u);
    sim->destroy();
}

TEST_CASE("Simulation - state names", "[sim]") {
    REQUIRE(std::string(simStateName(SimState::CellIndexed)) == "CellIndexed");
    REQUIRE(std::string(simStateName(SimState::Solving)) == "Solving");
}
