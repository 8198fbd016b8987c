#pragma once

namespace SFR {

/**
 * @brief Lifecycle of one event inside the pipeline
 *
 * Success:  Idle -> LockPending -> LockAcquired -> Loaded -> Dispatched -> Transitioned -> Stored -> Rendered ->
 *           Unlocked
 * Failure:  any non-terminal stage -> Failed -> FailureRendered -> Unlocked
 *           (a failed lock acquire ends at Failed / FailureRendered without an unlock)
 */
enum class FlowStage {
    Idle,
    LockPending,
    LockAcquired,
    Loaded,
    Dispatched,
    Transitioned,
    Stored,
    Rendered,
    Unlocked,
    Failed,
    FailureRendered
};

const char *toString(FlowStage stage);

}  // namespace SFR
