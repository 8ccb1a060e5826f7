#include "src/core/ParticlePingPong.h"
#include <stdio.h>

namespace droplet {

ParticlePingPong::ParticlePingPong() : stores{nullptr, nullptr}, current(0) {}

ParticlePingPong::~ParticlePingPong() {
    for (ParticleStore* store : stores) {
        if (store) store->destroy();
    }
}

ParticlePingPong* ParticlePingPong::create(ComputeDevice& device, const ParticleStoreDesc& desc, SimError* error) {
    ParticlePingPong* pair = new ParticlePingPong();
    SimError err = SimError::None;
    for (int i = 0; i < 2; i++) {
        pair->stores[i] = ParticleStore::create(device, desc, &err);
        if (!pair->stores[i]) {
            fprintf(stderr, "particles: failed to create store %d of ping-pong pair (%s)\n", i, simErrorName(err));
            pair->destroy();
            if (error) *error = err;
            return nullptr;
        }
    }
    if (error) *error = SimError::None;
    return pair;
}

void ParticlePingPong::destroy() {
    delete this;
}

SimError ParticlePingPong::swap() {
    current ^= 1u;
    // The new back store continues from the state just simulated
    return back().swapFrom(front());
}

} // namespace droplet
