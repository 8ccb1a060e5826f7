#include "engine/platform/time.h"

void time_init(TimeState *state, int tick_hz) {
    state->real_dt = 0.0;
    state->accumulator = 0.0;
    state->tick_dt = tick_hz > 0 ? 1.0 / (double)tick_hz : 1.0 / 60.0;
    state->tick = 0;
    state->dropped_ticks = 0;
}

int time_update(TimeState *state, double real_dt) {
    if (!(real_dt > 0.0)) {
        real_dt = 0.0;
    }
    state->real_dt = real_dt;
    if (state->tick_dt <= 0.0) {
        return 0;
    }

    // Small epsilon so an exact 1/hz frame yields one tick
    const double eps = state->tick_dt * 1e-6;
    state->accumulator += real_dt;

    int steps = 0;
    while (state->accumulator + eps >= state->tick_dt && steps < TIME_MAX_STEPS_PER_UPDATE) {
        state->accumulator -= state->tick_dt;
        state->tick++;
        steps++;
    }
    if (state->accumulator < 0.0) {
        state->accumulator = 0.0;
    }
    // Drop the backlog after a stall instead of spiralling
    if (state->accumulator >= state->tick_dt) {
        state->dropped_ticks += (uint64_t)((state->accumulator + eps) / state->tick_dt);
        state->accumulator = 0.0;
    }
    return steps;
}

float time_alpha(const TimeState *state) {
    if (state->tick_dt <= 0.0) {
        return 0.0f;
    }
    double alpha = state->accumulator / state->tick_dt;
    if (alpha < 0.0) alpha = 0.0;
    if (alpha > 1.0) alpha = 1.0;
    return (float)alpha;
}
