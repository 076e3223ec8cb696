// modules/executor/step_executor.h
#ifndef STAGECRAFT_MODULES_EXECUTOR_STEP_EXECUTOR_H
#define STAGECRAFT_MODULES_EXECUTOR_STEP_EXECUTOR_H

#include "core/types/plan.h"
#include <map>
#include <memory>
#include <vector>

namespace stagecraft {

// Runs one step against real infrastructure. Throws on failure.
// Implementations must tolerate concurrent calls from several host workers.
class StepExecutor {
public:
    virtual ~StepExecutor() = default;
    virtual void execute(const HostPlanStep& step) = 0;
};

// Action -> step executor. Built once, then handed read-only to executors.
class ExecutorRegistry {
public:
    ExecutorRegistry() = default;

    void register_executor(StepAction action, std::shared_ptr<StepExecutor> executor);

    bool has_executor(StepAction action) const;
    // nullptr when nothing is registered for the action
    StepExecutor* find(StepAction action) const;
    std::vector<StepAction> list_actions() const;

private:
    std::map<StepAction, std::shared_ptr<StepExecutor>> executors_;
};

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_EXECUTOR_STEP_EXECUTOR_H
