#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include "src/systems/SimulationSystem.h"
#include "src/tasks/IntegratorTasks.h"
#include "tests/support/Fixtures.h"

using namespace droplet;

namespace {

bool close(const math::Vec3& a, const math::Vec3& b, float eps = 1e-4f) {
    return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps && std::fabs(a.z - b.z) <= eps;
}

} // namespace

TEST_CASE("Integrator - gravity then commit through a full step", "[integrator]") {
    test::StoreFixture fx(64);
    REQUIRE(fx.add({
        ParticleInitData{math::Vec3(0.0f, 0.0f, 0.0f), math::Vec3(1.0f, 0.0f, 0.0f)},
        ParticleInitData{math::Vec3(-0.5f, -0.5f, -0.5f), math::Vec3(0.0f, 1.0f, 0.0f)},
        ParticleInitData{math::Vec3(0.5f, 0.5f, -0.5f), math::Vec3(0.0f, 0.0f, 1.0f)},
    }) == SimError::None);

    // Particles are isolated, so the solver leaves predictions alone
    SimulationConfig cfg;
    cfg.gravity = math::Vec3(1.0f, 2.0f, 3.0f);
    cfg.maxTimeStep = 0.2f;

    SimError err = SimError::None;
    SimulationSystem* sim = SimulationSystem::create(fx.device, cfg, &err);
    REQUIRE(sim != nullptr);
    REQUIRE(sim->step(*fx.store, 0.1f) == SimError::None);
    REQUIRE(sim->lastTimeStep() == 0.1f);

    std::vector<math::Vec3> v = fx.readVec3(fx.store->velocity(), 3);
    std::vector<math::Vec3> p = fx.readVec3(fx.store->position(), 3);
    REQUIRE(close(v[0], math::Vec3(1.1f, 0.2f, 0.3f)));
    REQUIRE(close(v[1], math::Vec3(0.1f, 1.2f, 0.3f)));
    REQUIRE(close(v[2], math::Vec3(0.1f, 0.2f, 1.3f)));
    REQUIRE(close(p[0], math::Vec3(0.11f, 0.02f, 0.03f)));
    REQUIRE(close(p[1], math::Vec3(-0.49f, -0.38f, -0.47f)));
    REQUIRE(close(p[2], math::Vec3(0.51f, 0.52f, -0.37f)));
    sim->destroy();
}

TEST_CASE("Integrator - commit derives velocity from the prediction", "[integrator]") {
    test::StoreFixture fx(64);
    REQUIRE(fx.add({test::at(0.0f, 0.0f, 0.0f)}) == SimError::None);
    fx.writeVec3(fx.store->predictedPosition(), {math::Vec3(0.1f, 0.0f, -0.2f)});

    SimulationConfig cfg;
    CommitPositionTask commit = makeCommitPositionTask();
    REQUIRE(commit.init(fx.device) == SimError::None);
    commit.setConstants(makeIntegrateConstants(cfg, 1, 0.1f));
    REQUIRE(commit.dispatch(*fx.store, 1) == SimError::None);

    REQUIRE(close(fx.readVec3(fx.store->position(), 1)[0], math::Vec3(0.1f, 0.0f, -0.2f), 1e-6f));
    REQUIRE(close(fx.readVec3(fx.store->velocity(), 1)[0], math::Vec3(1.0f, 0.0f, -2.0f)));
}

TEST_CASE("Integrator - prediction is clamped to the bounds", "[integrator]") {
    test::StoreFixture fx(64);
    REQUIRE(fx.add({
        ParticleInitData{math::Vec3(0.9f, 0.0f, 0.0f), math::Vec3(5.0f, 0.0f, 0.0f)},
        ParticleInitData{math::Vec3(0.0f, -0.95f, 0.0f), math::Vec3(0.0f, -2.0f, 0.0f)},
    }) == SimError::None);

    SimulationConfig cfg;
    PredictPositionTask predict = makePredictPositionTask();
    REQUIRE(predict.init(fx.device) == SimError::None);
    predict.setConstants(makeIntegrateConstants(cfg, 2, 0.1f));
    REQUIRE(predict.dispatch(*fx.store, 2) == SimError::None);

    std::vector<math::Vec3> pred = fx.readVec3(fx.store->predictedPosition(), 2);
    REQUIRE(pred[0].x == 1.0f);
    REQUIRE(pred[1].y == -1.0f);
    // Velocity is only rewritten on commit
    REQUIRE(fx.readVec3(fx.store->velocity(), 1)[0] == math::Vec3(5.0f, 0.0f, 0.0f));
}

TEST_CASE("Integrator - gravity constants carry the clamped step", "[integrator]") {
    SimulationConfig cfg;
    GravityConstants g = makeGravityConstants(cfg, 42, cfg.clampTimeStep(1.0f));
    REQUIRE(g.particleCount == 42u);
    REQUIRE(g.dt == cfg.maxTimeStep);
    REQUIRE(g.gravity[1] == cfg.gravity.y);
}
