#ifndef DROPLET_KERNEL_MATH_H
#define DROPLET_KERNEL_MATH_H

#include <stdint.h>
#include <cmath>
#include "src/core/ParticleData.h"
#include "src/math/Vec3.h"

// Host-side mirror of the helpers repeated in data/shaders/*.comp.
// Constants builders use it for kernel factors; tests use it for expectations.

namespace droplet {
namespace kernel {

static constexpr float kPi = 3.14159265358979323846f;
static constexpr float kMaxCellCoord = 1048576.0f;   // 2^20 cells per axis before wrap
static constexpr int32_t kMaxCellIndex = 1048576;
static constexpr uint32_t kSortThreshold = 25000;    // below: 1 element per thread
static constexpr uint32_t kElementsPerThread = 4;    // at or above the threshold

// floor(pos / grid) as a wrapped 32-bit lattice coordinate
inline uint32_t cellCoord(float pos, float gridSize) {
    float c = std::floor(pos / gridSize);
    if (c > kMaxCellCoord) c = kMaxCellCoord;
    if (c < -kMaxCellCoord) c = -kMaxCellCoord;
    return (uint32_t)(int32_t)c;
}

// Neighbor lattice coordinate, held to the range cellCoord produces
inline uint32_t offsetCellCoord(uint32_t base, int delta) {
    int64_t c = (int64_t)(int32_t)base + delta;
    if (c > kMaxCellIndex) c = kMaxCellIndex;
    if (c < -kMaxCellIndex) c = -kMaxCellIndex;
    return (uint32_t)(int32_t)c;
}

// x bit i -> bit 3i, y -> 3i+1, z -> 3i+2; bits past 31 are dropped
inline uint32_t mortonEncode(uint32_t x, uint32_t y, uint32_t z) {
    uint32_t code = 0;
    for (uint32_t i = 0; i < 11; ++i) {
        uint32_t b = 3 * i;
        code |= ((x >> i) & 1u) << b;
        if (b + 1 < 32) code |= ((y >> i) & 1u) << (b + 1);
        if (b + 2 < 32) code |= ((z >> i) & 1u) << (b + 2);
    }
    return code;
}

inline uint32_t mortonHash(const math::Vec3& p, float gridSize) {
    return mortonEncode(cellCoord(p.x, gridSize), cellCoord(p.y, gridSize), cellCoord(p.z, gridSize));
}

// Cell table slot for a Morton code; monotonic in the code
inline uint32_t cellId(uint32_t hash) {
    return hash >> 16;
}

inline float poly6Factor(float h) {
    return 315.0f / (64.0f * kPi * std::pow(h, 9.0f));
}

inline float spikyFactor(float h) {
    return 15.0f / (kPi * std::pow(h, 6.0f));
}

inline float spikyGradFactor(float h) {
    return -45.0f / (kPi * std::pow(h, 6.0f));
}

// W_poly6 for a squared distance; zero outside the support
inline float poly6(float r2, float h2, float factor) {
    if (r2 > h2) return 0.0f;
    float d = h2 - r2;
    return factor * d * d * d;
}

// Work groups the radix sort uses for n keys, capped at maxGroups
inline uint32_t sortWorkGroups(uint32_t n, uint32_t maxGroups) {
    if (n == 0) return 1;
    uint32_t perGroup = n < kSortThreshold ? DROPLET_WORKGROUP_SIZE
                                           : DROPLET_WORKGROUP_SIZE * kElementsPerThread;
    uint32_t groups = (n + perGroup - 1) / perGroup;
    if (groups > maxGroups) groups = maxGroups;
    return groups > 0 ? groups : 1;
}

// Contiguous chunk of keys owned by each sort work group
inline uint32_t sortElementsPerGroup(uint32_t n, uint32_t groups) {
    return groups > 0 ? (n + groups - 1) / groups : n;
}

inline uint32_t dispatchGroups(uint32_t invocations) {
    return (invocations + DROPLET_WORKGROUP_SIZE - 1) / DROPLET_WORKGROUP_SIZE;
}

} // namespace kernel
} // namespace droplet

#endif
