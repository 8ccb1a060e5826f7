#ifndef DROPLET_SIM_ERROR_H
#define DROPLET_SIM_ERROR_H

namespace droplet {

// Status codes returned by the simulation core.
// None is success; everything else carries a diagnostic line on stderr.
enum class SimError {
    None,
    CapacityExceeded,   // ring wrapped or count clamped, data is still valid
    AllocationError,    // buffer or binding set creation failed
    SyncTimeout,        // GPU wait exceeded the retry budget
    InvalidConfig,      // rejected by SimulationConfig::validate()
    KernelBuildError,   // compute kernel missing or failed to compile
    InvalidArgument
};

const char* simErrorName(SimError error);

// Only CapacityExceeded leaves the simulation in a usable state.
inline bool isFatal(SimError error) {
    return error != SimError::None && error != SimError::CapacityExceeded;
}

} // namespace droplet

#endif
