#include "engine/platform/engine.h"
#include "engine/platform/time.h"
#include <stdio.h>

void engine_init(EngineContext *ctx, EngineConfig cfg) {
    ctx->cfg = cfg;
    ctx->reported_drops = 0;
    time_init(&ctx->time, cfg.tick_hz);
}

int engine_time_update(EngineContext *ctx, double real_dt) {
    int steps = time_update(&ctx->time, real_dt);
    if (ctx->cfg.dev_mode && ctx->time.dropped_ticks != ctx->reported_drops) {
        fprintf(stderr, "engine: frame of %.3fs dropped %llu simulation ticks\n", real_dt,
                (unsigned long long)(ctx->time.dropped_ticks - ctx->reported_drops));
        ctx->reported_drops = ctx->time.dropped_ticks;
    }
    return steps;
}

float engine_time_alpha(const EngineContext *ctx) {
    return time_alpha(&ctx->time);
}

float engine_tick_dt(const EngineContext *ctx) {
    return (float)ctx->time.tick_dt;
}
