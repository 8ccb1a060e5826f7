#ifndef DROPLET_TESTS_GL_CONTEXT_H
#define DROPLET_TESTS_GL_CONTEXT_H

#include <stddef.h>
#include <vector>
#include "engine/gpu/ComputeDevice.h"
#include "engine/gpu/GlComputeDevice.h"
#include "src/core/ParticleStore.h"

namespace droplet {
namespace test {

// Hidden raylib window plus one GL compute device shared by every GL case.
// nullptr when no OpenGL 4.3 context can be made, or DROPLET_GL_TESTS=0.
GlComputeDevice* sharedGlDevice();

// Destroys the shared device and closes the window; called once after the run
void releaseGlDevice();

template <typename T>
std::vector<T> readBack(ComputeDevice& device, BufferHandle buffer, size_t count) {
    std::vector<T> out(count);
    if (count > 0 && device.readBuffer(buffer, 0, out.data(), count * sizeof(T)) != SimError::None) {
        out.clear();
    }
    return out;
}

// Store on an arbitrary device, destroyed with the scope
struct DeviceStore {
    ParticleStore* store;
    SimError createError;

    DeviceStore(ComputeDevice& device, uint32_t capacity) : store(nullptr), createError(SimError::None) {
        ParticleStoreDesc desc;
        desc.capacity = capacity;
        store = ParticleStore::create(device, desc, &createError);
    }

    ~DeviceStore() {
        if (store) store->destroy();
    }
};

} // namespace test
} // namespace droplet

#endif
