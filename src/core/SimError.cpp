#include "src/core/SimError.h"

namespace droplet {

const char* simErrorName(SimError error) {
    switch (error) {
        case SimError::None: return "None";
        case SimError::CapacityExceeded: return "CapacityExceeded";
        case SimError::AllocationError: return "AllocationError";
        case SimError::SyncTimeout: return "SyncTimeout";
        case SimError::InvalidConfig: return "InvalidConfig";
        case SimError::KernelBuildError: return "KernelBuildError";
        case SimError::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

} // namespace droplet
