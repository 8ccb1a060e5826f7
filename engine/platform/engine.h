#ifndef DROPLET_ENGINE_H
#define DROPLET_ENGINE_H

#include <stdbool.h>
#include <stdint.h>
#include "engine/platform/time.h"

typedef struct EngineConfig {
    int window_w;
    int window_h;
    int target_fps;
    int tick_hz;        // fixed simulation rate
    bool vsync;
    bool dev_mode;      // log stalls that drop simulation ticks
} EngineConfig;

typedef struct EngineContext {
    EngineConfig cfg;
    TimeState time;
    uint64_t reported_drops;
} EngineContext;

void engine_init(EngineContext *ctx, EngineConfig cfg);
// Number of fixed ticks to simulate for this frame
int engine_time_update(EngineContext *ctx, double real_dt);
float engine_time_alpha(const EngineContext *ctx);
// Timestep handed to every fixed tick, in seconds
float engine_tick_dt(const EngineContext *ctx);

#endif
