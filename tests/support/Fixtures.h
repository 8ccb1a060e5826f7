#ifndef DROPLET_TESTS_FIXTURES_H
#define DROPLET_TESTS_FIXTURES_H

#include <stdint.h>
#include <vector>
#include "src/core/ParticleStore.h"
#include "src/math/Vec3.h"
#include "tests/support/ReferenceDevice.h"

namespace droplet {
namespace test {

// One store on a fresh reference device; the store goes before the device
struct StoreFixture {
    ReferenceDevice device;
    ParticleStore* store;
    SimError createError;

    explicit StoreFixture(uint32_t capacity = 1024, uint32_t maxNeighbors = 64)
        : store(nullptr), createError(SimError::None) {
        ParticleStoreDesc desc;
        desc.capacity = capacity;
        desc.maxNeighbors = maxNeighbors;
        store = ParticleStore::create(device, desc, &createError);
    }

    ~StoreFixture() {
        if (store) store->destroy();
    }

    SimError add(const std::vector<ParticleInitData>& particles) {
        return store->addParticles(particles.data(), (uint32_t)particles.size());
    }

    std::vector<math::Vec3> readVec3(BufferHandle buffer, uint32_t count) {
        std::vector<GpuVec4> raw = device.read<GpuVec4>(buffer, count);
        std::vector<math::Vec3> out;
        for (const GpuVec4& v : raw) out.push_back(math::Vec3::load(v.v));
        return out;
    }

    std::vector<uint32_t> readWords(BufferHandle buffer, uint32_t count) {
        return device.read<uint32_t>(buffer, count);
    }

    void writeVec3(BufferHandle buffer, const std::vector<math::Vec3>& values) {
        std::vector<GpuVec4> raw(values.size());
        for (size_t i = 0; i < values.size(); i++) values[i].store(raw[i].v, 1.0f);
        device.writeBuffer(buffer, 0, raw.data(), raw.size() * sizeof(GpuVec4));
    }
};

inline ParticleInitData at(float x, float y, float z) {
    return ParticleInitData{math::Vec3(x, y, z), math::Vec3::zero()};
}

// nx * nz points on the y = 0 plane, row-major in x
inline std::vector<ParticleInitData> planeLattice(uint32_t nx, uint32_t nz, float spacing) {
    std::vector<ParticleInitData> out;
    for (uint32_t z = 0; z < nz; z++) {
        for (uint32_t x = 0; x < nx; x++) {
            out.push_back(at(x * spacing, 0.0f, z * spacing));
        }
    }
    return out;
}

// Deterministic pseudo-random cloud inside [lo, hi)^3
inline std::vector<ParticleInitData> cloud(uint32_t n, float lo, float hi, uint32_t seed = 7u) {
    std::vector<ParticleInitData> out;
    uint32_t s = seed ? seed : 1u;
    auto next = [&s]() {
        s ^= s << 13;
        s ^= s >> 17;
        s ^= s << 5;
        return (float)(s >> 8) * (1.0f / 16777216.0f);
    };
    for (uint32_t i = 0; i < n; i++) {
        float x = lo + (hi - lo) * next();
        float y = lo + (hi - lo) * next();
        float z = lo + (hi - lo) * next();
        out.push_back(at(x, y, z));
    }
    return out;
}

} // namespace test
} // namespace droplet

#endif
