#ifndef DROPLET_CELL_INDEX_TASK_H
#define DROPLET_CELL_INDEX_TASK_H

#include <stdint.h>
#include "src/tasks/ComputeTask.h"

namespace droplet {

// build_cell_index.comp: [start,end) of every run of equal cell ids in the sorted hashes
struct CellIndexConstants {
    uint32_t particleCount;
    uint32_t cellCount;
    uint32_t pad0;
    uint32_t pad1;
};

// hash(0), cell_start(1), cell_end(2)
uint32_t bindBuildCellIndex(const ParticleStore& particles, BufferBinding* out);

// Resets the table to the empty sentinel, then records the runs of the sorted hashes
class CellIndexBuilder {
public:
    CellIndexBuilder();

    SimError init(ComputeDevice& device);
    SimError build(ParticleStore& particles);

private:
    ComputeTask<CellIndexConstants> task;
};

} // namespace droplet

#endif
