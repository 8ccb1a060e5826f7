#include "src/config/SimulationConfig.h"
#include <errno.h>
#include <cmath>
#include <stdio.h>
#include <stdlib.h>

namespace droplet {

SimulationConfig SimulationConfig::defaults() {
    return SimulationConfig{};
}

SimulationConfig SimulationConfig::fountainSpray() {
    SimulationConfig cfg;
    cfg.gravity = {0.0f, -9.81f, 0.0f};
    cfg.aabbMin = {-2.0f, -0.5f, -2.0f};
    cfg.aabbMax = {2.0f, 3.0f, 2.0f};
    cfg.gridSize = 0.2f;
    cfg.particleMass = 1.0f;
    cfg.smoothingRadius = 0.2f;
    cfg.restDensity = 1000.0f;
    cfg.viscosity = 0.01f;
    cfg.surfaceTension = 0.1f;
    cfg.pbdIterations = 4;
    cfg.constraintEpsilon = 100.0f;
    cfg.relaxationFactor = 1.0f;
    cfg.maxNeighbors = 64;
    cfg.sortInterval = 4;
    return cfg;
}

static bool reject(const char* field, const char* reason) {
    fprintf(stderr, "config: invalid %s (%s)\n", field, reason);
    return false;
}

SimError SimulationConfig::validate() const {
    bool ok = true;

    if (!(minTimeStep > 0.0f)) {
        ok = reject("min_time_step", "must be > 0");
    }
    if (!(minTimeStep < maxTimeStep)) {
        ok = reject("min_time_step", "must be < max_time_step");
    }
    if (!(gridSize > 0.0f)) {
        ok = reject("grid_size", "must be > 0");
    }
    if (!(smoothingRadius > 0.0f)) {
        ok = reject("smoothing_radius", "must be > 0");
    }
    if (gridSize > smoothingRadius) {
        ok = reject("grid_size", "must not exceed smoothing_radius");
    }
    if (!(particleMass > 0.0f)) {
        ok = reject("particle_mass", "must be > 0");
    }
    if (!(restDensity > 0.0f)) {
        ok = reject("rest_density", "must be > 0");
    }
    if (pbdIterations < 0) {
        ok = reject("pbd_iterations", "must be >= 0");
    }
    if (constraintEpsilon < 0.0f) {
        ok = reject("constraint_epsilon", "must be >= 0");
    }
    if (maxNeighbors == 0) {
        ok = reject("max_neighbors", "must be > 0");
    }
    if (sortInterval == 0) {
        ok = reject("sort_interval", "must be > 0");
    }
    if (!(aabbMin.x < aabbMax.x) || !(aabbMin.y < aabbMax.y) || !(aabbMin.z < aabbMax.z)) {
        ok = reject("simulation_aabb", "min corner must be below max corner on every axis");
    }

    return ok ? SimError::None : SimError::InvalidConfig;
}

float SimulationConfig::clampTimeStep(float dt) const {
    if (std::isnan(dt) || dt < minTimeStep) {
        return minTimeStep;
    }
    if (dt > maxTimeStep) {
        return maxTimeStep;
    }
    return dt;
}

uint32_t envUint(const char* name, uint32_t fallback) {
    const char* value = getenv(name);
    if (!value || !value[0]) {
        return fallback;
    }
    char* end = NULL;
    errno = 0;
    unsigned long parsed = strtoul(value, &end, 10);
    if (errno != 0 || !end || *end != '\0' || value[0] == '-' || parsed > 0xFFFFFFFFul) {
        fprintf(stderr, "config: ignoring %s=%s (expected unsigned integer)\n", name, value);
        return fallback;
    }
    return (uint32_t)parsed;
}

void applyEnvironmentOverrides(SimulationConfig* cfg) {
    if (!cfg) return;
    cfg->pbdIterations = (int)envUint("DROPLET_PBD_ITERATIONS", (uint32_t)cfg->pbdIterations);
    cfg->maxNeighbors = envUint("DROPLET_MAX_NEIGHBORS", cfg->maxNeighbors);
    cfg->sortInterval = envUint("DROPLET_SORT_INTERVAL", cfg->sortInterval);
}

} // namespace droplet
