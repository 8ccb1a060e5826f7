#ifndef DROPLET_SIMULATION_CONFIG_H
#define DROPLET_SIMULATION_CONFIG_H

#include <stdint.h>
#include "src/core/SimError.h"
#include "src/math/Vec3.h"

namespace droplet {

// Simulation parameters consumed by SimulationSystem on construction and on
// every setConfig(). Values are validated before any dispatch.
struct SimulationConfig {
    math::Vec3 gravity{0.0f, -9.81f, 0.0f};
    math::Vec3 aabbMin{-1.0f, -1.0f, -1.0f};
    math::Vec3 aabbMax{1.0f, 1.0f, 1.0f};

    float minTimeStep{1.0f / 240.0f};
    float maxTimeStep{1.0f / 30.0f};

    float gridSize{0.1f};            // must not exceed smoothingRadius

    // SPH / PBF parameters
    float particleMass{1.0f};
    float smoothingRadius{0.1f};
    float restDensity{1000.0f};
    float viscosity{0.0f};           // reserved, not applied by any kernel
    float surfaceTension{0.0f};      // tensile correction strength, 0 disables it
    int pbdIterations{3};
    float constraintEpsilon{100.0f};
    float relaxationFactor{1.0f};
    uint32_t maxNeighbors{64};

    // Frames between full hash/sort/cell-index rebuilds (1 = every frame)
    uint32_t sortInterval{1};

    static SimulationConfig defaults();
    static SimulationConfig fountainSpray();

    /**
     * Rejects parameter combinations the pipeline cannot run with.
     * Prints the offending field to stderr.
     * @return SimError::None or SimError::InvalidConfig
     */
    SimError validate() const;

    // Maps any raw frame delta into [minTimeStep, maxTimeStep]; NaN maps to minTimeStep
    float clampTimeStep(float dt) const;
};

// Overrides selected fields from DROPLET_* environment variables.
// Unparsable values are reported and left untouched.
void applyEnvironmentOverrides(SimulationConfig* cfg);

// Reads an unsigned integer from the environment, returning fallback when unset or invalid
uint32_t envUint(const char* name, uint32_t fallback);

} // namespace droplet

#endif
