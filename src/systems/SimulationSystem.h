#ifndef DROPLET_SIMULATION_SYSTEM_H
#define DROPLET_SIMULATION_SYSTEM_H

#include <stdint.h>
#include "engine/gpu/ComputeDevice.h"
#include "src/config/SimulationConfig.h"
#include "src/core/ParticleStore.h"
#include "src/tasks/CellIndexTask.h"
#include "src/tasks/DensityTask.h"
#include "src/tasks/IntegratorTasks.h"
#include "src/tasks/MortonHashTask.h"
#include "src/tasks/NeighborSearchTask.h"
#include "src/tasks/PbdSolver.h"
#include "src/tasks/RadixSort.h"

namespace droplet {

// Last completed stage of a frame
enum class SimState {
    Idle,
    GravityApplied,
    Predicted,
    Hashed,
    Sorted,
    CellIndexed,
    NeighborsFound,
    DensityComputed,
    Solving,            // see SimulationSystem::iteration()
    Committed
};

const char* simStateName(SimState state);

// Called on every transition with the new state and, while solving, the pass number
typedef void (*SimStateObserver)(SimState state, int iteration, void* user);

// Owns every compute stage and drives one particle store through a frame.
// The store itself is borrowed per step, so one system can serve both sides
// of a ParticlePingPong.
class SimulationSystem {
public:
    // Factory method - validates the config and builds every kernel
    static SimulationSystem* create(ComputeDevice& device, const SimulationConfig& config, SimError* error);

    void destroy();

    /**
     * Advances the store by one clamped timestep:
     * gravity, predict, [hash, sort, cell index], neighbors, density,
     * pbdIterations solver passes, commit.
     * On failure the state stays at the last completed stage.
     */
    SimError step(ParticleStore& particles, float rawDt);

    // Rejects invalid configs and keeps the previous one
    SimError setConfig(const SimulationConfig& config);
    const SimulationConfig& getConfig() const { return config; }

    // Rebuild hash, sort and cell index on the next step regardless of interval
    void forceSort() { sortForced = true; }

    void setObserver(SimStateObserver observer, void* user);

    SimState state() const { return currentState; }
    int iteration() const { return currentIteration; }
    float lastTimeStep() const { return lastDt; }
    uint64_t frameCount() const { return frames; }
    uint64_t sortCount() const { return sorts; }
    bool lastStepSorted() const { return sortedThisStep; }

private:
    SimulationSystem(ComputeDevice& device, const SimulationConfig& config);
    ~SimulationSystem();

    SimError init();
    bool sortDue(const ParticleStore& particles) const;
    void enter(SimState state, int iteration = 0);
    SimError fail(SimError error, const char* stage, const ParticleStore& particles);

    ComputeDevice* device;
    SimulationConfig config;

    ApplyGravityTask gravityTask;
    PredictPositionTask predictTask;
    MortonHashTask hashTask;
    RadixSortSystem sorter;
    CellIndexBuilder cellIndex;
    NeighborSearchTask neighborTask;
    DensityEstimateTask densityTask;
    PbdSolver solver;
    CommitPositionTask commitTask;

    SimState currentState;
    int currentIteration;
    float lastDt;

    // Adaptive sort bookkeeping
    uint64_t frames;
    uint64_t sorts;
    uint32_t framesSinceSort;
    bool sortForced;
    bool sortedThisStep;

    SimStateObserver observer;
    void* observerUser;
};

} // namespace droplet

#endif
