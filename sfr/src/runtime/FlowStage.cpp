#include "runtime/FlowStage.h"

namespace SFR {

const char *toString(FlowStage stage) {
    switch (stage) {
    case FlowStage::Idle:
        return "Idle";
    case FlowStage::LockPending:
        return "LockPending";
    case FlowStage::LockAcquired:
        return "LockAcquired";
    case FlowStage::Loaded:
        return "Loaded";
    case FlowStage::Dispatched:
        return "Dispatched";
    case FlowStage::Transitioned:
        return "Transitioned";
    case FlowStage::Stored:
        return "Stored";
    case FlowStage::Rendered:
        return "Rendered";
    case FlowStage::Unlocked:
        return "Unlocked";
    case FlowStage::Failed:
        return "Failed";
    case FlowStage::FailureRendered:
        return "FailureRendered";
    default:
        return "Unknown";
    }
}

}  // namespace SFR
