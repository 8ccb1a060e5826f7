#include "engine/gpu/GlComputeDevice.h"
#include "raylib.h"
#include "external/glad.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

namespace droplet {

static const char *kShaderRoots[] = {"data/shaders", "../data/shaders", "../../data/shaders"};
static const size_t kMaxConstantsBytes = 256;
static const uint32_t kRequiredStorageBindings = BindingSet::kMaxBindings;

static bool gl_compute_supported(bool allowSoftware) {
    GLint major = 0;
    GLint minor = 0;
    glGetIntegerv(GL_MAJOR_VERSION, &major);
    glGetIntegerv(GL_MINOR_VERSION, &minor);
    if (!((major > 4) || (major == 4 && minor >= 3))) {
        fprintf(stderr, "gl_device: OpenGL 4.3+ required for compute path (have %d.%d)\n", major, minor);
        return false;
    }
    const char *renderer = (const char *)glGetString(GL_RENDERER);
    bool soft = renderer && (strstr(renderer, "llvmpipe") || strstr(renderer, "Software"));
    if (soft && !allowSoftware) {
        fprintf(stderr, "gl_device: software renderer detected (%s); GPU mode required.\n", renderer);
        return false;
    }
    fprintf(stderr, "gl_device: OpenGL %d.%d on %s\n", major, minor, renderer ? renderer : "unknown");
    return true;
}

static char *load_shader_source(const char *file_name, char *resolved, size_t resolved_size) {
    char path[512];
    for (size_t i = 0; i < sizeof(kShaderRoots) / sizeof(kShaderRoots[0]); i++) {
        int written = snprintf(path, sizeof(path), "%s/%s", kShaderRoots[i], file_name);
        if (written <= 0 || (size_t)written >= sizeof(path)) continue;
        if (!FileExists(path)) continue;
        char *text = LoadFileText(path);
        if (text) {
            snprintf(resolved, resolved_size, "%s", path);
            return text;
        }
    }
    fprintf(stderr, "gl_device: failed to load shader source %s\n", file_name);
    return NULL;
}

static unsigned int compile_compute_shader(const char *file_name) {
    char resolved[512] = {0};
    char *source = load_shader_source(file_name, resolved, sizeof(resolved));
    if (!source) {
        return 0;
    }

    unsigned int shader = glCreateShader(GL_COMPUTE_SHADER);
    if (!shader) {
        UnloadFileText(source);
        return 0;
    }

    const char *src_ptr = source;
    glShaderSource(shader, 1, &src_ptr, NULL);
    glCompileShader(shader);
    UnloadFileText(source);

    GLint compiled = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &compiled);
    if (!compiled) {
        GLint length = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &length);
        if (length > 1) {
            char *log = (char *)malloc((size_t)length);
            if (log) {
                glGetShaderInfoLog(shader, length, NULL, log);
                fprintf(stderr, "gl_device: shader compile failed (%s): %s\n", resolved, log);
                free(log);
            }
        }
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

static unsigned int link_program_single(unsigned int shader, const char *name) {
    unsigned int program = glCreateProgram();
    if (!program) {
        return 0;
    }
    glAttachShader(program, shader);
    glLinkProgram(program);
    GLint linked = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &linked);
    if (!linked) {
        GLint length = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &length);
        if (length > 1) {
            char *log = (char *)malloc((size_t)length);
            if (log) {
                glGetProgramInfoLog(program, length, NULL, log);
                fprintf(stderr, "gl_device: program link failed (%s): %s\n", name, log);
                free(log);
            }
        }
        glDeleteProgram(program);
        return 0;
    }
    return program;
}

static unsigned int compile_compute_program(const char *name) {
    char file_name[256];
    snprintf(file_name, sizeof(file_name), "%s.comp", name);
    unsigned int shader = compile_compute_shader(file_name);
    if (!shader) {
        return 0;
    }
    unsigned int program = link_program_single(shader, name);
    glDeleteShader(shader);
    return program;
}

GlComputeDevice::GlComputeDevice()
    : constantsUbo(0), maxStorageBlockSize(0), maxWorkGroupsX(0) {}

GlComputeDevice::~GlComputeDevice() {
    for (GlBuffer& buffer : buffers) {
        if (buffer.id) glDeleteBuffers(1, &buffer.id);
    }
    for (GlKernel& kernel : kernels) {
        if (kernel.program) glDeleteProgram(kernel.program);
    }
    if (constantsUbo) glDeleteBuffers(1, &constantsUbo);
}

GlComputeDevice* GlComputeDevice::create(const GlDeviceConfig& cfg, SimError* error) {
    GlComputeDevice* device = new GlComputeDevice();
    if (!device->init(cfg)) {
        device->destroy();
        if (error) *error = SimError::AllocationError;
        return nullptr;
    }
    if (error) *error = SimError::None;
    return device;
}

void GlComputeDevice::destroy() {
    delete this;
}

bool GlComputeDevice::init(const GlDeviceConfig& cfg) {
    config = cfg;
    if (!gl_compute_supported(cfg.allowSoftwareRenderer)) {
        return false;
    }

    GLint max_storage = 0;
    GLint max_bindings = 0;
    GLint max_groups = 0;
    glGetIntegerv(GL_MAX_SHADER_STORAGE_BLOCK_SIZE, &max_storage);
    glGetIntegerv(GL_MAX_SHADER_STORAGE_BUFFER_BINDINGS, &max_bindings);
    glGetIntegeri_v(GL_MAX_COMPUTE_WORK_GROUP_COUNT, 0, &max_groups);
    if (max_storage <= 0 || max_bindings < (GLint)kRequiredStorageBindings || max_groups <= 0) {
        fprintf(stderr, "gl_device: insufficient SSBO limits (block %d bytes, %d bindings)\n",
                max_storage, max_bindings);
        return false;
    }
    maxStorageBlockSize = (size_t)max_storage;
    maxWorkGroupsX = (uint32_t)max_groups;

    glGenBuffers(1, &constantsUbo);
    glBindBuffer(GL_UNIFORM_BUFFER, constantsUbo);
    glBufferData(GL_UNIFORM_BUFFER, kMaxConstantsBytes, NULL, GL_DYNAMIC_DRAW);
    glBindBuffer(GL_UNIFORM_BUFFER, 0);
    if (!constantsUbo) {
        fprintf(stderr, "gl_device: failed to create constants buffer\n");
        return false;
    }
    return true;
}

const GlComputeDevice::GlBuffer* GlComputeDevice::findBuffer(BufferHandle buffer) const {
    if (buffer == 0 || buffer > buffers.size()) return nullptr;
    const GlBuffer& entry = buffers[buffer - 1];
    return entry.id ? &entry : nullptr;
}

const GlComputeDevice::GlKernel* GlComputeDevice::findKernel(KernelHandle kernel) const {
    if (kernel == 0 || kernel > kernels.size()) return nullptr;
    return &kernels[kernel - 1];
}

BufferHandle GlComputeDevice::createBuffer(const BufferDesc& desc) {
    const char* label = desc.label ? desc.label : "buffer";
    size_t size = desc.elementSize * desc.capacity;
    if (size == 0 || (desc.capacity != 0 && size / desc.capacity != desc.elementSize)) {
        fprintf(stderr, "gl_device: invalid size for %s (%zu x %zu)\n", label, desc.capacity, desc.elementSize);
        return 0;
    }
    if ((desc.usage & BufferUsageStorage) && size > maxStorageBlockSize) {
        fprintf(stderr, "gl_device: %s needs %zu bytes, SSBO limit is %zu\n", label, size, maxStorageBlockSize);
        return 0;
    }

    GlBuffer buffer;
    buffer.id = 0;
    buffer.size = size;
    buffer.usage = desc.usage;
    buffer.label = label;

    GLenum hint = (desc.usage & BufferUsageHostVisible) ? GL_STREAM_DRAW : GL_DYNAMIC_DRAW;
    while (glGetError() != GL_NO_ERROR) {}
    glGenBuffers(1, &buffer.id);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, buffer.id);
    glBufferData(GL_SHADER_STORAGE_BUFFER, (GLsizeiptr)size, NULL, hint);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
    GLenum err = glGetError();
    if (!buffer.id || err != GL_NO_ERROR) {
        fprintf(stderr, "gl_device: failed to allocate %s (%zu bytes, GL error 0x%x)\n", label, size, err);
        if (buffer.id) glDeleteBuffers(1, &buffer.id);
        return 0;
    }

    buffers.push_back(buffer);
    return (BufferHandle)buffers.size();
}

void GlComputeDevice::destroyBuffer(BufferHandle handle) {
    if (handle == 0 || handle > buffers.size()) return;
    GlBuffer& buffer = buffers[handle - 1];
    if (buffer.id) {
        glDeleteBuffers(1, &buffer.id);
        buffer.id = 0;
        buffer.size = 0;
    }
}

size_t GlComputeDevice::bufferSize(BufferHandle handle) const {
    const GlBuffer* buffer = findBuffer(handle);
    return buffer ? buffer->size : 0;
}

unsigned int GlComputeDevice::glBufferName(BufferHandle handle) const {
    const GlBuffer* buffer = findBuffer(handle);
    return buffer ? buffer->id : 0;
}

SimError GlComputeDevice::writeBuffer(BufferHandle handle, size_t offset, const void* data, size_t size) {
    const GlBuffer* buffer = findBuffer(handle);
    if (!buffer || !data || offset + size > buffer->size) {
        fprintf(stderr, "gl_device: write out of range (%zu+%zu)\n", offset, size);
        return SimError::InvalidArgument;
    }
    if (size == 0) return SimError::None;
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, buffer->id);
    glBufferSubData(GL_SHADER_STORAGE_BUFFER, (GLintptr)offset, (GLsizeiptr)size, data);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
    return SimError::None;
}

SimError GlComputeDevice::readBuffer(BufferHandle handle, size_t offset, void* out, size_t size) {
    const GlBuffer* buffer = findBuffer(handle);
    if (!buffer || !out || offset + size > buffer->size) {
        fprintf(stderr, "gl_device: read out of range (%zu+%zu)\n", offset, size);
        return SimError::InvalidArgument;
    }
    if (size == 0) return SimError::None;
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, buffer->id);
    glGetBufferSubData(GL_SHADER_STORAGE_BUFFER, (GLintptr)offset, (GLsizeiptr)size, out);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
    return SimError::None;
}

SimError GlComputeDevice::copyBuffer(BufferHandle srcHandle, BufferHandle dstHandle,
                                     const CopyRegion* regions, uint32_t regionCount) {
    const GlBuffer* src = findBuffer(srcHandle);
    const GlBuffer* dst = findBuffer(dstHandle);
    if (!src || !dst || (regionCount > 0 && !regions)) {
        return SimError::InvalidArgument;
    }
    for (uint32_t i = 0; i < regionCount; i++) {
        if (regions[i].srcOffset + regions[i].size > src->size ||
            regions[i].dstOffset + regions[i].size > dst->size) {
            fprintf(stderr, "gl_device: copy %s -> %s out of range (region %u, %zu bytes)\n",
                    src->label.c_str(), dst->label.c_str(), i, regions[i].size);
            return SimError::InvalidArgument;
        }
    }

    glBindBuffer(GL_COPY_READ_BUFFER, src->id);
    glBindBuffer(GL_COPY_WRITE_BUFFER, dst->id);
    for (uint32_t i = 0; i < regionCount; i++) {
        if (regions[i].size == 0) continue;
        glCopyBufferSubData(GL_COPY_READ_BUFFER, GL_COPY_WRITE_BUFFER,
                            (GLintptr)regions[i].srcOffset, (GLintptr)regions[i].dstOffset,
                            (GLsizeiptr)regions[i].size);
    }
    glBindBuffer(GL_COPY_READ_BUFFER, 0);
    glBindBuffer(GL_COPY_WRITE_BUFFER, 0);
    return waitIdle("copy");
}

SimError GlComputeDevice::fillBuffer(BufferHandle handle, uint32_t value) {
    const GlBuffer* buffer = findBuffer(handle);
    if (!buffer || buffer->size % sizeof(uint32_t) != 0) {
        return SimError::InvalidArgument;
    }
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, buffer->id);
    glClearBufferData(GL_SHADER_STORAGE_BUFFER, GL_R32UI, GL_RED_INTEGER, GL_UNSIGNED_INT, &value);
    glBindBuffer(GL_SHADER_STORAGE_BUFFER, 0);
    return SimError::None;
}

KernelHandle GlComputeDevice::loadKernel(const char* name) {
    if (!name) return 0;
    for (size_t i = 0; i < kernels.size(); i++) {
        if (kernels[i].name == name) return (KernelHandle)(i + 1);
    }

    unsigned int program = compile_compute_program(name);
    if (!program) {
        fprintf(stderr, "gl_device: failed to build compute kernel %s\n", name);
        return 0;
    }
    kernels.push_back(GlKernel{name, program});
    return (KernelHandle)kernels.size();
}

SimError GlComputeDevice::createBindingSet(KernelHandle kernel, const BufferBinding* bindings,
                                           uint32_t count, BindingSet* out) {
    if (!out || !findKernel(kernel) || count > BindingSet::kMaxBindings || (count > 0 && !bindings)) {
        return SimError::InvalidArgument;
    }
    for (uint32_t i = 0; i < count; i++) {
        if (!findBuffer(bindings[i].buffer)) {
            fprintf(stderr, "gl_device: binding slot %u of %s references a missing buffer\n",
                    bindings[i].slot, findKernel(kernel)->name.c_str());
            return SimError::AllocationError;
        }
    }
    out->kernel = kernel;
    out->count = count;
    for (uint32_t i = 0; i < count; i++) {
        out->bindings[i] = bindings[i];
    }
    return SimError::None;
}

SimError GlComputeDevice::execute(const BindingSet& set, const void* constants, size_t constantsSize,
                                  uint32_t groupsX) {
    const GlKernel* kernel = findKernel(set.kernel);
    if (!kernel || constantsSize > kMaxConstantsBytes || (constantsSize > 0 && !constants)) {
        return SimError::InvalidArgument;
    }
    if (groupsX == 0) {
        return SimError::None;
    }
    if (groupsX > maxWorkGroupsX) {
        fprintf(stderr, "gl_device: %s dispatch of %u groups exceeds limit %u\n",
                kernel->name.c_str(), groupsX, maxWorkGroupsX);
        return SimError::InvalidArgument;
    }

    glUseProgram(kernel->program);
    if (constantsSize > 0) {
        glBindBuffer(GL_UNIFORM_BUFFER, constantsUbo);
        glBufferSubData(GL_UNIFORM_BUFFER, 0, (GLsizeiptr)constantsSize, constants);
        glBindBuffer(GL_UNIFORM_BUFFER, 0);
        glBindBufferBase(GL_UNIFORM_BUFFER, 0, constantsUbo);
    }
    for (uint32_t i = 0; i < set.count; i++) {
        const GlBuffer* buffer = findBuffer(set.bindings[i].buffer);
        if (!buffer) {
            glUseProgram(0);
            fprintf(stderr, "gl_device: stale binding in slot %u of %s\n", set.bindings[i].slot, kernel->name.c_str());
            return SimError::InvalidArgument;
        }
        glBindBufferBase(GL_SHADER_STORAGE_BUFFER, set.bindings[i].slot, buffer->id);
    }
    glDispatchCompute(groupsX, 1, 1);
    glMemoryBarrier(GL_SHADER_STORAGE_BARRIER_BIT | GL_BUFFER_UPDATE_BARRIER_BIT);
    glUseProgram(0);

    return waitIdle(kernel->name.c_str());
}

SimError GlComputeDevice::waitIdle(const char* stage) {
    GLsync fence = glFenceSync(GL_SYNC_GPU_COMMANDS_COMPLETE, 0);
    if (!fence) {
        fprintf(stderr, "gl_device: failed to create fence after %s\n", stage);
        return SimError::SyncTimeout;
    }

    uint32_t attempts = config.syncRetries > 0 ? config.syncRetries : 1;
    for (uint32_t attempt = 1; attempt <= attempts; attempt++) {
        GLenum result = glClientWaitSync(fence, GL_SYNC_FLUSH_COMMANDS_BIT, (GLuint64)config.syncTimeoutNs);
        if (result == GL_ALREADY_SIGNALED || result == GL_CONDITION_SATISFIED) {
            glDeleteSync(fence);
            return SimError::None;
        }
        if (result == GL_WAIT_FAILED) {
            fprintf(stderr, "gl_device: wait failed after %s\n", stage);
            break;
        }
        fprintf(stderr, "gl_device: %s still running after %.1f ms (attempt %u/%u)\n",
                stage, (double)config.syncTimeoutNs / 1.0e6, attempt, attempts);
    }

    glDeleteSync(fence);
    fprintf(stderr, "gl_device: device stalled in %s\n", stage);
    return SimError::SyncTimeout;
}

} // namespace droplet
