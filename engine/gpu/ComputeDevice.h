#ifndef DROPLET_COMPUTE_DEVICE_H
#define DROPLET_COMPUTE_DEVICE_H

#include <stddef.h>
#include <stdint.h>
#include "src/core/SimError.h"

namespace droplet {

typedef uint32_t BufferHandle;   // 0 = invalid
typedef uint32_t KernelHandle;   // 0 = invalid

enum BufferUsage : uint32_t {
    BufferUsageStorage     = 1u << 0,
    BufferUsageVertex      = 1u << 1,
    BufferUsageTransferSrc = 1u << 2,
    BufferUsageTransferDst = 1u << 3,
    BufferUsageHostVisible = 1u << 4
};

struct BufferDesc {
    uint32_t usage;
    size_t elementSize;
    size_t capacity;
    const char* label;
};

// Byte ranges for copyBuffer
struct CopyRegion {
    size_t srcOffset;
    size_t dstOffset;
    size_t size;
};

struct BufferBinding {
    uint32_t slot;
    BufferHandle buffer;
};

// Kernel plus the buffers it reads and writes, in slot order.
// Plain value: cached per pipeline stage and reused until invalidated.
struct BindingSet {
    static constexpr uint32_t kMaxBindings = 8;

    KernelHandle kernel = 0;
    uint32_t count = 0;
    BufferBinding bindings[kMaxBindings] = {};
};

// Buffer allocator + descriptor allocator + blocking compute executor.
// All calls happen on the single control thread that owns the context.
class ComputeDevice {
public:
    virtual ~ComputeDevice() = default;

    // Returns 0 when the allocation fails or exceeds device limits
    virtual BufferHandle createBuffer(const BufferDesc& desc) = 0;
    virtual void destroyBuffer(BufferHandle buffer) = 0;
    virtual size_t bufferSize(BufferHandle buffer) const = 0;

    virtual SimError writeBuffer(BufferHandle buffer, size_t offset, const void* data, size_t size) = 0;
    virtual SimError readBuffer(BufferHandle buffer, size_t offset, void* out, size_t size) = 0;
    virtual SimError copyBuffer(BufferHandle src, BufferHandle dst,
                                const CopyRegion* regions, uint32_t regionCount) = 0;
    // Sets every 32-bit word of the buffer to value
    virtual SimError fillBuffer(BufferHandle buffer, uint32_t value) = 0;

    // Kernels are looked up by name (e.g. "morton_hash"); 0 on failure
    virtual KernelHandle loadKernel(const char* name) = 0;

    virtual SimError createBindingSet(KernelHandle kernel, const BufferBinding* bindings,
                                      uint32_t count, BindingSet* out) = 0;

    /**
     * Runs the kernel over groupsX work groups of 256 invocations and blocks
     * until the device has finished.
     * @param constants POD block uploaded as the kernel's uniform constants
     */
    virtual SimError execute(const BindingSet& set, const void* constants, size_t constantsSize,
                             uint32_t groupsX) = 0;
};

} // namespace droplet

#endif
