#include "engine/platform/engine.h"
#include <catch2/catch_test_macros.hpp>
#include <cmath>

static EngineConfig demo_config(bool dev_mode) {
    EngineConfig cfg = {
        .window_w = 640,
        .window_h = 360,
        .target_fps = 60,
        .tick_hz = 60,
        .vsync = false,
        .dev_mode = dev_mode
    };
    return cfg;
}

TEST_CASE("Engine - fixed tick drives the simulation step", "[engine]") {
    EngineContext ctx = {};
    engine_init(&ctx, demo_config(false));

    REQUIRE(engine_time_update(&ctx, 1.0 / 60.0) == 1);
    REQUIRE(std::fabs(engine_tick_dt(&ctx) - 1.0f / 60.0f) < 1e-7f);

    float alpha = engine_time_alpha(&ctx);
    REQUIRE(alpha >= 0.0f);
    REQUIRE(alpha <= 1.0f);
}

TEST_CASE("Engine - stall drops ticks once", "[engine]") {
    EngineContext ctx = {};
    engine_init(&ctx, demo_config(true));

    int steps = engine_time_update(&ctx, 0.5);
    REQUIRE(steps == TIME_MAX_STEPS_PER_UPDATE);
    REQUIRE(ctx.time.dropped_ticks > 0u);
    REQUIRE(ctx.reported_drops == ctx.time.dropped_ticks);

    // Normal frames afterwards run without a backlog
    REQUIRE(engine_time_update(&ctx, 1.0 / 60.0) == 1);
    REQUIRE(ctx.reported_drops == ctx.time.dropped_ticks);
}

TEST_CASE("Engine - invalid tick rate falls back to 60 Hz", "[engine]") {
    EngineContext ctx = {};
    EngineConfig cfg = demo_config(false);
    cfg.tick_hz = 0;
    engine_init(&ctx, cfg);
    REQUIRE(std::fabs(engine_tick_dt(&ctx) - 1.0f / 60.0f) < 1e-7f);
}
