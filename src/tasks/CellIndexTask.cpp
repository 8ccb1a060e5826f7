#include "src/tasks/CellIndexTask.h"

namespace droplet {

uint32_t bindBuildCellIndex(const ParticleStore& particles, BufferBinding* out) {
    out[0] = {0, particles.hash()};
    out[1] = {1, particles.cellStart()};
    out[2] = {2, particles.cellEnd()};
    return 3;
}

CellIndexBuilder::CellIndexBuilder()
    : task(StageId::BuildCellIndex, "build_cell_index", bindBuildCellIndex) {}

SimError CellIndexBuilder::init(ComputeDevice& device) {
    return task.init(device);
}

SimError CellIndexBuilder::build(ParticleStore& particles) {
    ComputeDevice& device = particles.device();
    SimError err = device.fillBuffer(particles.cellStart(), DROPLET_EMPTY_CELL);
    if (err == SimError::None) {
        err = device.fillBuffer(particles.cellEnd(), DROPLET_EMPTY_CELL);
    }
    if (err != SimError::None) {
        fprintf(stderr, "sim: clearing %u-entry cell table failed (%s)\n", particles.cellCount(), simErrorName(err));
        return err;
    }

    CellIndexConstants c = {};
    c.particleCount = particles.count();
    c.cellCount = particles.cellCount();
    task.setConstants(c);
    return task.dispatch(particles, particles.count());
}

} // namespace droplet
