// modules/engine/state_inspector.cpp
#include "modules/engine/state_inspector.h"
#include "core/types/errors.h"

namespace stagecraft {

void StateInspectorRegistry::register_inspector(std::string runtime, std::shared_ptr<StateInspector> inspector) {
    if (runtime.empty()) {
        throw EngineError("state inspector runtime name must not be empty");
    }
    if (!inspector) {
        throw EngineError("cannot register a null state inspector for runtime \"" + runtime + "\"");
    }
    inspectors_[std::move(runtime)] = std::move(inspector);
}

bool StateInspectorRegistry::has_inspector(const std::string& runtime) const {
    return inspectors_.count(runtime) > 0;
}

StateInspector* StateInspectorRegistry::find(const std::string& runtime) const {
    auto it = inspectors_.find(runtime);
    return it == inspectors_.end() ? nullptr : it->second.get();
}

std::vector<std::string> StateInspectorRegistry::list_runtimes() const {
    std::vector<std::string> names;
    names.reserve(inspectors_.size());
    for (const auto& [name, _] : inspectors_) {
        names.push_back(name);
    }
    return names;
}

} // namespace stagecraft
