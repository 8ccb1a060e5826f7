#ifndef DROPLET_PARTICLE_STORE_H
#define DROPLET_PARTICLE_STORE_H

#include <stdint.h>
#include "engine/gpu/ComputeDevice.h"
#include "src/core/ParticleData.h"
#include "src/core/SimError.h"
#include "src/tasks/DescriptorCache.h"

namespace droplet {

struct ParticleStoreDesc {
    uint32_t capacity = DROPLET_PARTICLE_MAX_COUNT;
    uint32_t maxNeighbors = 64;
    uint32_t maxSortWorkGroups = DROPLET_MAX_SORT_WORK_GROUPS;
};

// Fixed-capacity ring of particle slots and every per-particle buffer the
// pipeline needs. Sole owner of those buffers; stages only borrow handles.
class ParticleStore {
public:
    // Factory method - allocates all device buffers; returns nullptr on failure
    static ParticleStore* create(ComputeDevice& device, const ParticleStoreDesc& desc, SimError* error);

    void destroy();

    /**
     * Stages (position, velocity) pairs and copies them into the ring at cursor.
     * predicted_position is seeded with the spawn position.
     * @return SimError::CapacityExceeded when the batch wrapped or count was
     *         clamped; the particles were still written.
     */
    SimError addParticles(const ParticleInitData* data, uint32_t len);

    // GPU copy of other's active slots onto this store; no-op when other is empty.
    // A current hash/index/cell table travels with the slots.
    SimError swapFrom(const ParticleStore& other);

    // Exchanges hash/hash_temp and index/index_temp and drops cached bindings
    void swapSortBuffers();

    void reset();

    uint32_t count() const { return particleCount; }
    uint32_t cursor() const { return writeCursor; }
    uint32_t capacity() const { return desc.capacity; }
    uint32_t maxNeighbors() const { return desc.maxNeighbors; }
    uint32_t maxSortWorkGroups() const { return desc.maxSortWorkGroups; }
    uint32_t cellCount() const { return DROPLET_CELL_COUNT; }

    // Process-unique id of the live slot membership. add and reset issue a new
    // one; swapFrom adopts the source's.
    uint64_t contentId() const { return contentTag; }
    // contentId the hash/index/cell tables were built for, 0 before the first build
    uint64_t spatialTableId() const { return tableTag; }
    void markSpatialTable() { tableTag = contentTag; }

    // Buffer accessors
    BufferHandle position() const { return positionBuffer; }
    BufferHandle velocity() const { return velocityBuffer; }
    BufferHandle predictedPosition() const { return predictedBuffer; }
    BufferHandle density() const { return densityBuffer; }
    BufferHandle hash() const { return hashBuffer; }
    BufferHandle hashTemp() const { return hashTempBuffer; }
    BufferHandle index() const { return indexBuffer; }
    BufferHandle indexTemp() const { return indexTempBuffer; }
    BufferHandle cellStart() const { return cellStartBuffer; }
    BufferHandle cellEnd() const { return cellEndBuffer; }
    BufferHandle contacts() const { return contactsBuffer; }
    BufferHandle contactCounts() const { return contactCountsBuffer; }
    BufferHandle lambda() const { return lambdaBuffer; }
    BufferHandle deltaPosition() const { return deltaBuffer; }
    BufferHandle histograms() const { return histogramsBuffer; }
    BufferHandle prefixSums() const { return prefixSumsBuffer; }

    DescriptorCache& descriptorCache() { return cache; }
    const DescriptorCache& descriptorCache() const { return cache; }
    ComputeDevice& device() const { return *owner; }

private:
    ParticleStore(ComputeDevice& device, const ParticleStoreDesc& desc);
    ~ParticleStore();

    bool init();
    bool allocate(BufferHandle* out, uint32_t usage, size_t elementSize, size_t capacity, const char* label);

    ComputeDevice* owner;
    ParticleStoreDesc desc;
    DescriptorCache cache;

    uint32_t particleCount;
    uint32_t writeCursor;
    uint64_t contentTag;
    uint64_t tableTag;
    bool wrapReported;

    BufferHandle positionBuffer;
    BufferHandle velocityBuffer;
    BufferHandle predictedBuffer;
    BufferHandle densityBuffer;
    BufferHandle hashBuffer;
    BufferHandle hashTempBuffer;
    BufferHandle indexBuffer;
    BufferHandle indexTempBuffer;
    BufferHandle cellStartBuffer;
    BufferHandle cellEndBuffer;
    BufferHandle contactsBuffer;
    BufferHandle contactCountsBuffer;
    BufferHandle lambdaBuffer;
    BufferHandle deltaBuffer;
    BufferHandle histogramsBuffer;
    BufferHandle prefixSumsBuffer;

    // Host-visible staging for addParticles
    BufferHandle stagingPositionBuffer;
    BufferHandle stagingVelocityBuffer;
};

} // namespace droplet

#endif
