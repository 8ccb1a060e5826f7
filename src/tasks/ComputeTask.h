#ifndef DROPLET_COMPUTE_TASK_H
#define DROPLET_COMPUTE_TASK_H

#include <stdio.h>
#include <stdint.h>
#include <type_traits>
#include "engine/gpu/ComputeDevice.h"
#include "src/core/ParticleStore.h"
#include "src/tasks/KernelMath.h"
#include "src/tasks/StageId.h"

namespace droplet {

// Fills `out` with the stage's buffers in slot order, returns the count
typedef uint32_t (*BindingBuilder)(const ParticleStore& particles, BufferBinding* out);

// One pipeline stage: a kernel, its constants block and its binding layout.
// Binding sets live in the store's DescriptorCache under the stage id, so a
// task can be shared between the two stores of a ping-pong pair.
template <typename Constants>
class ComputeTask {
    static_assert(std::is_trivially_copyable<Constants>::value, "constants are uploaded as raw bytes");
    static_assert(sizeof(Constants) % 16 == 0, "constants must fill whole std140 rows");

public:
    ComputeTask(StageId stage, const char* kernelName, BindingBuilder builder)
        : stageId(stage), name(kernelName), builder(builder), kernel(0), constants() {}

    SimError init(ComputeDevice& device) {
        kernel = device.loadKernel(name);
        if (!kernel) {
            fprintf(stderr, "sim: kernel %s unavailable\n", name);
            return SimError::KernelBuildError;
        }
        return SimError::None;
    }

    void setConstants(const Constants& value) { constants = value; }
    const Constants& getConstants() const { return constants; }

    StageId stage() const { return stageId; }
    const char* kernelName() const { return name; }
    bool ready() const { return kernel != 0; }

    // Binds (through the cache) and runs `groups` work groups, blocking
    SimError execute(ParticleStore& particles, uint32_t groups) {
        if (!kernel) {
            return SimError::KernelBuildError;
        }
        ComputeDevice& device = particles.device();
        DescriptorCache& cache = particles.descriptorCache();

        const BindingSet* set = cache.find(stageId);
        if (!set) {
            BufferBinding bindings[BindingSet::kMaxBindings];
            uint32_t count = builder(particles, bindings);
            BindingSet created;
            SimError err = device.createBindingSet(kernel, bindings, count, &created);
            if (err != SimError::None) {
                fprintf(stderr, "sim: binding set for %s failed (%s)\n", name, simErrorName(err));
                return err;
            }
            set = &cache.store(stageId, created);
        }

        SimError err = device.execute(*set, &constants, sizeof(Constants), groups);
        if (err != SimError::None) {
            fprintf(stderr, "sim: %s failed over %u particles, %u groups (%s)\n",
                    name, particles.count(), groups, simErrorName(err));
        }
        return err;
    }

    // One invocation per particle slot in [0, invocations)
    SimError dispatch(ParticleStore& particles, uint32_t invocations) {
        if (invocations == 0) {
            return SimError::None;
        }
        return execute(particles, kernel::dispatchGroups(invocations));
    }

private:
    StageId stageId;
    const char* name;
    BindingBuilder builder;
    KernelHandle kernel;
    Constants constants;
};

} // namespace droplet

#endif
