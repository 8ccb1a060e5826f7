#include "engine/util/rng.h"

static const uint64_t kDefaultSeed = 0x9E3779B97F4A7C15ull;

void rng_seed(Rng *rng, uint64_t seed) {
    rng->state = seed ? seed : kDefaultSeed;
}

// xorshift64*
uint32_t rng_next_u32(Rng *rng) {
    uint64_t x = rng->state;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    rng->state = x;
    return (uint32_t)((x * 0x2545F4914F6CDD1Dull) >> 32);
}

float rng_next_f01(Rng *rng) {
    // 24 bits keeps the result strictly below 1
    return (float)(rng_next_u32(rng) >> 8) * (1.0f / 16777216.0f);
}

float rng_range(Rng *rng, float min, float max) {
    return min + (max - min) * rng_next_f01(rng);
}

int rng_range_i(Rng *rng, int min, int max_inclusive) {
    if (max_inclusive <= min) {
        return min;
    }
    uint32_t span = (uint32_t)((int64_t)max_inclusive - (int64_t)min + 1);
    return (int)((int64_t)min + (int64_t)(rng_next_u32(rng) % span));
}

float rng_signed(Rng *rng, float magnitude) {
    return rng_range(rng, -magnitude, magnitude);
}
