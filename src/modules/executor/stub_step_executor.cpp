// modules/executor/stub_step_executor.cpp
#include "modules/executor/stub_step_executor.h"
#include "modules/inputs/step_inputs.h"
#include "common/utils/log.h"

namespace stagecraft {

void StubStepExecutor::execute(const HostPlanStep& step) {
    inputs::check_step_inputs(step.action, step.inputs);
    log::debug("stub: would " + std::string(to_string(step.action)) + " for step \"" + step.id + "\"");
}

void register_stub_executors(ExecutorRegistry& registry) {
    auto stub = std::make_shared<StubStepExecutor>();
    for (StepAction action : {StepAction::BUILD,
                              StepAction::MIGRATE,
                              StepAction::APPLY_COMPOSE,
                              StepAction::RENDER_COMPOSE,
                              StepAction::ROLLOUT,
                              StepAction::HEALTH_CHECK}) {
        registry.register_executor(action, stub);
    }
}

} // namespace stagecraft
