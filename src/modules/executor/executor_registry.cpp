// modules/executor/executor_registry.cpp
#include "modules/executor/step_executor.h"
#include "core/types/errors.h"

namespace stagecraft {

void ExecutorRegistry::register_executor(StepAction action, std::shared_ptr<StepExecutor> executor) {
    if (!executor) {
        throw ExecutorError("cannot register a null executor for action \"" +
                            std::string(to_string(action)) + "\"");
    }
    executors_[action] = std::move(executor);
}

bool ExecutorRegistry::has_executor(StepAction action) const {
    return executors_.count(action) > 0;
}

StepExecutor* ExecutorRegistry::find(StepAction action) const {
    auto it = executors_.find(action);
    if (it == executors_.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<StepAction> ExecutorRegistry::list_actions() const {
    std::vector<StepAction> actions;
    actions.reserve(executors_.size());
    for (const auto& [action, _] : executors_) {
        actions.push_back(action);
    }
    return actions;
}

} // namespace stagecraft
