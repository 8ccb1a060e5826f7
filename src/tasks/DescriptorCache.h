#ifndef DROPLET_DESCRIPTOR_CACHE_H
#define DROPLET_DESCRIPTOR_CACHE_H

#include "engine/gpu/ComputeDevice.h"
#include "src/tasks/StageId.h"

namespace droplet {

// Binding sets cached per pipeline stage. Anything that changes which buffer
// a stage must see (sort ping-pong, store swap) has to call invalidate()
// before the next dispatch.
class DescriptorCache {
public:
    DescriptorCache();

    const BindingSet* find(StageId stage) const;
    const BindingSet& store(StageId stage, const BindingSet& set);

    void invalidate(StageId stage);
    void invalidate();

    bool contains(StageId stage) const { return find(stage) != nullptr; }
    uint32_t size() const;
    // Bumped on every full invalidation
    uint32_t generation() const { return invalidations; }

private:
    BindingSet sets[kStageCount];
    bool valid[kStageCount];
    uint32_t invalidations;
};

} // namespace droplet

#endif
