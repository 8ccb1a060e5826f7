#include "src/core/ParticleStore.h"
#include <stdio.h>
#include <atomic>
#include <utility>
#include <vector>

namespace droplet {

static const uint32_t kDeviceUsage = BufferUsageStorage | BufferUsageTransferSrc | BufferUsageTransferDst;

static uint64_t nextContentTag() {
    static std::atomic<uint64_t> counter{0};
    return ++counter;
}

ParticleStore::ParticleStore(ComputeDevice& device, const ParticleStoreDesc& desc)
    : owner(&device), desc(desc), particleCount(0), writeCursor(0),
      contentTag(nextContentTag()), tableTag(0), wrapReported(false),
      positionBuffer(0), velocityBuffer(0), predictedBuffer(0), densityBuffer(0),
      hashBuffer(0), hashTempBuffer(0), indexBuffer(0), indexTempBuffer(0),
      cellStartBuffer(0), cellEndBuffer(0), contactsBuffer(0), contactCountsBuffer(0),
      lambdaBuffer(0), deltaBuffer(0), histogramsBuffer(0), prefixSumsBuffer(0),
      stagingPositionBuffer(0), stagingVelocityBuffer(0) {}

ParticleStore::~ParticleStore() {
    BufferHandle* handles[] = {
        &positionBuffer, &velocityBuffer, &predictedBuffer, &densityBuffer,
        &hashBuffer, &hashTempBuffer, &indexBuffer, &indexTempBuffer,
        &cellStartBuffer, &cellEndBuffer, &contactsBuffer, &contactCountsBuffer,
        &lambdaBuffer, &deltaBuffer, &histogramsBuffer, &prefixSumsBuffer,
        &stagingPositionBuffer, &stagingVelocityBuffer
    };
    for (BufferHandle* handle : handles) {
        if (*handle) {
            owner->destroyBuffer(*handle);
            *handle = 0;
        }
    }
}

ParticleStore* ParticleStore::create(ComputeDevice& device, const ParticleStoreDesc& desc, SimError* error) {
    if (desc.capacity == 0 || desc.maxNeighbors == 0 || desc.maxSortWorkGroups == 0) {
        fprintf(stderr, "particles: invalid store description (capacity %u, max_neighbors %u)\n",
                desc.capacity, desc.maxNeighbors);
        if (error) *error = SimError::InvalidArgument;
        return nullptr;
    }

    ParticleStore* store = new ParticleStore(device, desc);
    if (!store->init()) {
        store->destroy();
        if (error) *error = SimError::AllocationError;
        return nullptr;
    }
    if (error) *error = SimError::None;
    return store;
}

void ParticleStore::destroy() {
    delete this;
}

bool ParticleStore::allocate(BufferHandle* out, uint32_t usage, size_t elementSize, size_t capacity,
                             const char* label) {
    BufferDesc bufferDesc = {usage, elementSize, capacity, label};
    *out = owner->createBuffer(bufferDesc);
    if (!*out) {
        fprintf(stderr, "particles: failed to allocate %s (%zu x %zu bytes)\n", label, capacity, elementSize);
        return false;
    }
    return true;
}

bool ParticleStore::init() {
    const size_t n = desc.capacity;
    const size_t vec4 = sizeof(GpuVec4);
    const size_t word = sizeof(uint32_t);
    const size_t sortScratch = (size_t)DROPLET_WORKGROUP_SIZE * desc.maxSortWorkGroups;

    if (!allocate(&positionBuffer, kDeviceUsage | BufferUsageVertex, vec4, n, "position") ||
        !allocate(&velocityBuffer, kDeviceUsage, vec4, n, "velocity") ||
        !allocate(&predictedBuffer, kDeviceUsage, vec4, n, "predicted_position") ||
        !allocate(&densityBuffer, kDeviceUsage, word, n, "density") ||
        !allocate(&hashBuffer, kDeviceUsage, word, n, "hash") ||
        !allocate(&hashTempBuffer, kDeviceUsage, word, n, "hash_temp") ||
        !allocate(&indexBuffer, kDeviceUsage, word, n, "index") ||
        !allocate(&indexTempBuffer, kDeviceUsage, word, n, "index_temp") ||
        !allocate(&cellStartBuffer, kDeviceUsage, word, DROPLET_CELL_COUNT, "cell_start") ||
        !allocate(&cellEndBuffer, kDeviceUsage, word, DROPLET_CELL_COUNT, "cell_end") ||
        !allocate(&contactsBuffer, kDeviceUsage, word, n * desc.maxNeighbors, "contacts") ||
        !allocate(&contactCountsBuffer, kDeviceUsage, word, n, "contact_counts") ||
        !allocate(&lambdaBuffer, kDeviceUsage, word, n, "lambda") ||
        !allocate(&deltaBuffer, kDeviceUsage, vec4, n, "delta_position") ||
        !allocate(&histogramsBuffer, kDeviceUsage, word, sortScratch, "histograms") ||
        !allocate(&prefixSumsBuffer, kDeviceUsage, word, sortScratch, "prefix_sums") ||
        !allocate(&stagingPositionBuffer, BufferUsageHostVisible | BufferUsageTransferSrc, vec4, n, "staging_position") ||
        !allocate(&stagingVelocityBuffer, BufferUsageHostVisible | BufferUsageTransferSrc, vec4, n, "staging_velocity")) {
        return false;
    }

    if (owner->fillBuffer(cellStartBuffer, DROPLET_EMPTY_CELL) != SimError::None ||
        owner->fillBuffer(cellEndBuffer, DROPLET_EMPTY_CELL) != SimError::None ||
        owner->fillBuffer(contactCountsBuffer, 0u) != SimError::None) {
        fprintf(stderr, "particles: failed to clear cell table\n");
        return false;
    }
    return true;
}

SimError ParticleStore::addParticles(const ParticleInitData* data, uint32_t len) {
    if (len == 0) {
        return SimError::None;
    }
    if (!data) {
        return SimError::InvalidArgument;
    }

    const uint32_t cap = desc.capacity;
    bool exceeded = (uint64_t)writeCursor + len > cap || (uint64_t)particleCount + len > cap;

    // Only the newest `cap` entries of an oversized batch survive the wrap
    uint32_t skip = len > cap ? len - cap : 0;
    uint32_t n = len - skip;
    uint32_t start = (uint32_t)(((uint64_t)writeCursor + skip) % cap);

    std::vector<GpuVec4> positions(n);
    std::vector<GpuVec4> velocities(n);
    for (uint32_t i = 0; i < n; i++) {
        data[skip + i].position.store(positions[i].v, 1.0f);
        data[skip + i].velocity.store(velocities[i].v);
    }

    const size_t stride = sizeof(GpuVec4);
    SimError err = owner->writeBuffer(stagingPositionBuffer, 0, positions.data(), n * stride);
    if (err == SimError::None) {
        err = owner->writeBuffer(stagingVelocityBuffer, 0, velocities.data(), n * stride);
    }
    if (err != SimError::None) {
        fprintf(stderr, "particles: staging upload of %u particles failed (%s)\n", n, simErrorName(err));
        return err;
    }

    CopyRegion regions[2];
    uint32_t regionCount = 0;
    if ((uint64_t)start + n <= cap) {
        regions[regionCount++] = {0, (size_t)start * stride, (size_t)n * stride};
    } else {
        uint32_t tail = cap - start;
        regions[regionCount++] = {0, (size_t)start * stride, (size_t)tail * stride};
        regions[regionCount++] = {(size_t)tail * stride, 0, (size_t)(n - tail) * stride};
    }

    err = owner->copyBuffer(stagingPositionBuffer, positionBuffer, regions, regionCount);
    if (err == SimError::None) {
        err = owner->copyBuffer(stagingPositionBuffer, predictedBuffer, regions, regionCount);
    }
    if (err == SimError::None) {
        err = owner->copyBuffer(stagingVelocityBuffer, velocityBuffer, regions, regionCount);
    }
    if (err != SimError::None) {
        fprintf(stderr, "particles: copy of %u particles into ring at %u failed (%s)\n",
                n, start, simErrorName(err));
        return err;
    }

    writeCursor = (uint32_t)(((uint64_t)writeCursor + len) % cap);
    particleCount = (uint64_t)particleCount + len > cap ? cap : particleCount + len;
    contentTag = nextContentTag();

    if (exceeded) {
        if (!wrapReported) {
            fprintf(stderr, "particles: capacity %u reached, overwriting oldest slots\n", cap);
            wrapReported = true;
        }
        return SimError::CapacityExceeded;
    }
    return SimError::None;
}

SimError ParticleStore::swapFrom(const ParticleStore& other) {
    if (&other == this || other.particleCount == 0) {
        return SimError::None;
    }
    if (other.desc.capacity != desc.capacity) {
        fprintf(stderr, "particles: swap between stores of capacity %u and %u\n",
                other.desc.capacity, desc.capacity);
        return SimError::InvalidArgument;
    }

    CopyRegion region = {0, 0, (size_t)other.particleCount * sizeof(GpuVec4)};
    SimError err = owner->copyBuffer(other.positionBuffer, positionBuffer, &region, 1);
    if (err == SimError::None) {
        err = owner->copyBuffer(other.velocityBuffer, velocityBuffer, &region, 1);
    }
    if (err == SimError::None) {
        err = owner->copyBuffer(other.predictedBuffer, predictedBuffer, &region, 1);
    }
    bool tableCurrent = other.tableTag != 0 && other.tableTag == other.contentTag;
    if (err == SimError::None && tableCurrent) {
        CopyRegion keys = {0, 0, (size_t)other.particleCount * sizeof(uint32_t)};
        CopyRegion cells = {0, 0, (size_t)DROPLET_CELL_COUNT * sizeof(uint32_t)};
        err = owner->copyBuffer(other.hashBuffer, hashBuffer, &keys, 1);
        if (err == SimError::None) err = owner->copyBuffer(other.indexBuffer, indexBuffer, &keys, 1);
        if (err == SimError::None) err = owner->copyBuffer(other.cellStartBuffer, cellStartBuffer, &cells, 1);
        if (err == SimError::None) err = owner->copyBuffer(other.cellEndBuffer, cellEndBuffer, &cells, 1);
    }
    if (err != SimError::None) {
        fprintf(stderr, "particles: swap of %u particles failed (%s)\n", other.particleCount, simErrorName(err));
        return err;
    }

    particleCount = other.particleCount;
    writeCursor = other.writeCursor;
    contentTag = other.contentTag;
    tableTag = tableCurrent ? other.tableTag : 0;
    cache.invalidate();
    return SimError::None;
}

void ParticleStore::swapSortBuffers() {
    std::swap(hashBuffer, hashTempBuffer);
    std::swap(indexBuffer, indexTempBuffer);
    cache.invalidate();
}

void ParticleStore::reset() {
    particleCount = 0;
    writeCursor = 0;
    wrapReported = false;
    contentTag = nextContentTag();
}

} // namespace droplet
