// modules/executor/stub_step_executor.h
#ifndef STAGECRAFT_MODULES_EXECUTOR_STUB_STEP_EXECUTOR_H
#define STAGECRAFT_MODULES_EXECUTOR_STUB_STEP_EXECUTOR_H

#include "modules/executor/step_executor.h"

namespace stagecraft {

// Decodes and validates the typed inputs of a step, then does nothing.
// Lets a host plan travel the whole pipeline without touching infrastructure.
class StubStepExecutor : public StepExecutor {
public:
    void execute(const HostPlanStep& step) override;
};

// Registers one shared StubStepExecutor for every action with typed inputs
// (build, migrate, apply_compose, render_compose, rollout, health_check).
void register_stub_executors(ExecutorRegistry& registry);

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_EXECUTOR_STUB_STEP_EXECUTOR_H
