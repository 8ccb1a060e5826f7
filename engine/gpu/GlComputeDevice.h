#ifndef DROPLET_GL_COMPUTE_DEVICE_H
#define DROPLET_GL_COMPUTE_DEVICE_H

#include <stdint.h>
#include <string>
#include <vector>
#include "engine/gpu/ComputeDevice.h"

namespace droplet {

struct GlDeviceConfig {
    uint64_t syncTimeoutNs = 2000000000ull;  // per glClientWaitSync attempt
    uint32_t syncRetries = 3;
    bool allowSoftwareRenderer = false;      // llvmpipe & co. are rejected by default
};

// OpenGL 4.3 compute backend. Requires a current GL context (raylib InitWindow)
// on the calling thread for its whole lifetime.
class GlComputeDevice : public ComputeDevice {
public:
    // Factory method - checks GL version and limits; returns nullptr on failure
    static GlComputeDevice* create(const GlDeviceConfig& cfg, SimError* error);

    void destroy();

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

    // GL buffer name behind a handle, for the draw path
    unsigned int glBufferName(BufferHandle buffer) const;

private:
    GlComputeDevice();
    ~GlComputeDevice();

    bool init(const GlDeviceConfig& cfg);
    SimError waitIdle(const char* stage);

    struct GlBuffer {
        unsigned int id;
        size_t size;
        uint32_t usage;
        std::string label;
    };

    struct GlKernel {
        std::string name;
        unsigned int program;
    };

    const GlBuffer* findBuffer(BufferHandle buffer) const;
    const GlKernel* findKernel(KernelHandle kernel) const;

    GlDeviceConfig config;
    std::vector<GlBuffer> buffers;   // handle = index + 1
    std::vector<GlKernel> kernels;   // handle = index + 1
    unsigned int constantsUbo;
    size_t maxStorageBlockSize;
    uint32_t maxWorkGroupsX;
};

} // namespace droplet

#endif
