#ifndef DROPLET_TIME_H
#define DROPLET_TIME_H

#include <stdint.h>

// Fixed-tick accumulator; the simulation advances in tick_dt steps
typedef struct TimeState {
    double real_dt;
    double accumulator;
    double tick_dt;
    uint64_t tick;
    uint64_t dropped_ticks;   // whole ticks discarded after a stall
} TimeState;

#define TIME_MAX_STEPS_PER_UPDATE 9

void time_init(TimeState *state, int tick_hz);
// Returns the number of fixed ticks to run for this frame
int time_update(TimeState *state, double real_dt);
// Fraction of a tick left in the accumulator, in [0, 1]
float time_alpha(const TimeState *state);

#endif
