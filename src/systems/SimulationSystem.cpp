#include "src/systems/SimulationSystem.h"
#include <stdio.h>

namespace droplet {

const char* simStateName(SimState state) {
    switch (state) {
        case SimState::Idle: return "Idle";
        case SimState::GravityApplied: return "GravityApplied";
        case SimState::Predicted: return "Predicted";
        case SimState::Hashed: return "Hashed";
        case SimState::Sorted: return "Sorted";
        case SimState::CellIndexed: return "CellIndexed";
        case SimState::NeighborsFound: return "NeighborsFound";
        case SimState::DensityComputed: return "DensityComputed";
        case SimState::Solving: return "Solving";
        case SimState::Committed: return "Committed";
    }
    return "Unknown";
}

SimulationSystem::SimulationSystem(ComputeDevice& device, const SimulationConfig& config)
    : device(&device), config(config),
      gravityTask(makeApplyGravityTask()),
      predictTask(makePredictPositionTask()),
      hashTask(makeMortonHashTask()),
      neighborTask(makeNeighborSearchTask()),
      densityTask(makeDensityEstimateTask()),
      commitTask(makeCommitPositionTask()),
      currentState(SimState::Idle), currentIteration(0), lastDt(0.0f),
      frames(0), sorts(0), framesSinceSort(0), sortForced(true), sortedThisStep(false),
      observer(nullptr), observerUser(nullptr) {}

SimulationSystem::~SimulationSystem() {}

SimulationSystem* SimulationSystem::create(ComputeDevice& device, const SimulationConfig& config, SimError* error) {
    SimError err = config.validate();
    if (err != SimError::None) {
        if (error) *error = err;
        return nullptr;
    }

    SimulationSystem* sim = new SimulationSystem(device, config);
    err = sim->init();
    if (err != SimError::None) {
        sim->destroy();
        if (error) *error = err;
        return nullptr;
    }
    if (error) *error = SimError::None;
    return sim;
}

void SimulationSystem::destroy() {
    delete this;
}

SimError SimulationSystem::init() {
    SimError err = gravityTask.init(*device);
    if (err == SimError::None) err = predictTask.init(*device);
    if (err == SimError::None) err = hashTask.init(*device);
    if (err == SimError::None) err = sorter.init(*device);
    if (err == SimError::None) err = cellIndex.init(*device);
    if (err == SimError::None) err = neighborTask.init(*device);
    if (err == SimError::None) err = densityTask.init(*device);
    if (err == SimError::None) err = solver.init(*device);
    if (err == SimError::None) err = commitTask.init(*device);
    if (err != SimError::None) {
        fprintf(stderr, "sim: pipeline setup failed (%s)\n", simErrorName(err));
    }
    return err;
}

SimError SimulationSystem::setConfig(const SimulationConfig& next) {
    SimError err = next.validate();
    if (err != SimError::None) {
        return err;
    }
    config = next;
    // Grid size may have changed, so the cell table is stale
    sortForced = true;
    return SimError::None;
}

void SimulationSystem::setObserver(SimStateObserver fn, void* user) {
    observer = fn;
    observerUser = user;
}

void SimulationSystem::enter(SimState state, int iteration) {
    currentState = state;
    currentIteration = iteration;
    if (observer) {
        observer(state, iteration, observerUser);
    }
}

SimError SimulationSystem::fail(SimError error, const char* stage, const ParticleStore& particles) {
    fprintf(stderr, "sim: step stopped in %s after %s (%s, %u particles)\n",
            stage, simStateName(currentState), simErrorName(error), particles.count());
    return error;
}

bool SimulationSystem::sortDue(const ParticleStore& particles) const {
    if (sortForced || particles.spatialTableId() != particles.contentId()) {
        return true;
    }
    return framesSinceSort + 1 >= config.sortInterval;
}

SimError SimulationSystem::step(ParticleStore& particles, float rawDt) {
    const float dt = config.clampTimeStep(rawDt);
    const uint32_t n = particles.count();
    const uint32_t rowWidth = particles.maxNeighbors();

    sortedThisStep = false;
    currentState = SimState::Idle;
    currentIteration = 0;
    if (n == 0) {
        return SimError::None;
    }
    lastDt = dt;

    SimError err;

    gravityTask.setConstants(makeGravityConstants(config, n, dt));
    err = gravityTask.dispatch(particles, n);
    if (err != SimError::None) return fail(err, "apply_gravity", particles);
    enter(SimState::GravityApplied);

    predictTask.setConstants(makeIntegrateConstants(config, n, dt));
    err = predictTask.dispatch(particles, n);
    if (err != SimError::None) return fail(err, "predict_position", particles);
    enter(SimState::Predicted);

    if (sortDue(particles)) {
        hashTask.setConstants(makeMortonHashConstants(config, n));
        err = hashTask.dispatch(particles, n);
        if (err != SimError::None) return fail(err, "morton_hash", particles);
        enter(SimState::Hashed);

        err = sorter.sort(particles);
        if (err != SimError::None) return fail(err, "radix_sort", particles);
        enter(SimState::Sorted);

        err = cellIndex.build(particles);
        if (err != SimError::None) return fail(err, "build_cell_index", particles);
        enter(SimState::CellIndexed);

        sortedThisStep = true;
        particles.markSpatialTable();
        sortForced = false;
        framesSinceSort = 0;
        sorts++;
    } else {
        // Previous table is reused against this frame's predictions
        enter(SimState::Hashed);
        enter(SimState::Sorted);
        enter(SimState::CellIndexed);
        framesSinceSort++;
    }

    neighborTask.setConstants(makeNeighborSearchConstants(config, n, rowWidth));
    err = neighborTask.dispatch(particles, n);
    if (err != SimError::None) return fail(err, "neighbor_search", particles);
    enter(SimState::NeighborsFound);

    densityTask.setConstants(makeDensityConstants(config, n, rowWidth));
    err = densityTask.dispatch(particles, n);
    if (err != SimError::None) return fail(err, "density_estimate", particles);
    enter(SimState::DensityComputed);

    solver.setConstants(makePbdConstants(config, n, rowWidth));
    for (int k = 0; k < config.pbdIterations; k++) {
        err = solver.iterate(particles);
        if (err != SimError::None) return fail(err, "pbd_solve", particles);
        enter(SimState::Solving, k + 1);
    }

    commitTask.setConstants(makeIntegrateConstants(config, n, dt));
    err = commitTask.dispatch(particles, n);
    if (err != SimError::None) return fail(err, "commit_position", particles);
    enter(SimState::Committed);

    frames++;
    enter(SimState::Idle);
    return SimError::None;
}

} // namespace droplet
