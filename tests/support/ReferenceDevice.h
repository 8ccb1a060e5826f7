#ifndef DROPLET_TESTS_REFERENCE_DEVICE_H
#define DROPLET_TESTS_REFERENCE_DEVICE_H

#include <stdint.h>
#include <string>
#include <vector>
#include "engine/gpu/ComputeDevice.h"

namespace droplet {
namespace test {

// Host implementation of ComputeDevice for tests. Every kernel the pipeline
// loads is executed on the CPU with the same bindings, constants and work
// group split the GL shaders use, so stages can be checked without a GPU.
class ReferenceDevice : public ComputeDevice {
public:
    ReferenceDevice();
    ~ReferenceDevice() override;

    BufferHandle createBuffer(const BufferDesc& desc) override;
    void destroyBuffer(BufferHandle buffer) override;
    size_t bufferSize(BufferHandle buffer) const override;

    SimError writeBuffer(BufferHandle buffer, size_t offset, const void* data, size_t size) override;
    SimError readBuffer(BufferHandle buffer, size_t offset, void* out, size_t size) override;
    SimError copyBuffer(BufferHandle src, BufferHandle dst,
                        const CopyRegion* regions, uint32_t regionCount) override;
    SimError fillBuffer(BufferHandle buffer, uint32_t value) override;

    KernelHandle loadKernel(const char* name) override;
    SimError createBindingSet(KernelHandle kernel, const BufferBinding* bindings,
                              uint32_t count, BindingSet* out) override;
    SimError execute(const BindingSet& set, const void* constants, size_t constantsSize,
                     uint32_t groupsX) override;

    // Storage buffers above `bytes` are refused, like GL_MAX_SHADER_STORAGE_BLOCK_SIZE; 0 = no limit
    void limitStorageBlock(size_t bytes) { storageLimit = bytes; }

    // Fault injection
    void failAllocationsAfter(uint32_t successfulAllocations);
    void failSyncOn(const char* kernelName, uint32_t occurrence = 1);
    void removeKernel(const char* kernelName);
    void clearFaults();

    // Introspection
    uint32_t dispatchCount(const char* kernelName) const;
    uint32_t totalDispatches() const { return dispatches; }
    uint32_t lastGroups(const char* kernelName) const;
    uint32_t bindingSetsCreated() const { return bindingSets; }
    uint32_t liveBuffers() const;

    // Typed readback of the first `count` elements
    template <typename T>
    std::vector<T> read(BufferHandle buffer, size_t count) {
        std::vector<T> out(count);
        if (count > 0 && readBuffer(buffer, 0, out.data(), count * sizeof(T)) != SimError::None) {
            out.clear();
        }
        return out;
    }

private:
    struct Buffer {
        std::vector<uint8_t> bytes;
        std::string label;
        bool live;
    };

    struct Kernel {
        std::string name;
        uint32_t dispatches;
        uint32_t lastGroups;
    };

    Buffer* findBuffer(BufferHandle buffer);
    const Buffer* findBuffer(BufferHandle buffer) const;
    const Kernel* findKernel(const char* name) const;

    template <typename T>
    T* slot(const BindingSet& set, uint32_t binding);

    void run(const std::string& name, const BindingSet& set, const void* constants, uint32_t groups);

    std::vector<Buffer> buffers;   // handle = index + 1
    std::vector<Kernel> kernels;   // handle = index + 1
    uint32_t dispatches;
    uint32_t bindingSets;
    uint32_t allocations;
    size_t storageLimit;

    // Faults
    int64_t allocationBudget;      // < 0 = unlimited
    std::string syncFaultKernel;
    uint32_t syncFaultOccurrence;
    std::vector<std::string> removedKernels;
};

} // namespace test
} // namespace droplet

#endif
