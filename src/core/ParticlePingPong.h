#ifndef DROPLET_PARTICLE_PING_PONG_H
#define DROPLET_PARTICLE_PING_PONG_H

#include "src/core/ParticleStore.h"

namespace droplet {

// Two particle stores: front() is the stable state for drawing, back() is
// simulated and receives new particles. swap() flips the roles and copies the
// newest state into the new back store.
class ParticlePingPong {
public:
    static ParticlePingPong* create(ComputeDevice& device, const ParticleStoreDesc& desc, SimError* error);
    void destroy();

    SimError swap();

    ParticleStore& front() { return *stores[current]; }
    ParticleStore& back() { return *stores[current ^ 1u]; }
    const ParticleStore& front() const { return *stores[current]; }
    const ParticleStore& back() const { return *stores[current ^ 1u]; }

    uint32_t frontIndex() const { return current; }

private:
    ParticlePingPong();
    ~ParticlePingPong();

    ParticleStore* stores[2];
    uint32_t current;
};

} // namespace droplet

#endif
