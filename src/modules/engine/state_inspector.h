// modules/engine/state_inspector.h
#ifndef STAGECRAFT_MODULES_ENGINE_STATE_INSPECTOR_H
#define STAGECRAFT_MODULES_ENGINE_STATE_INSPECTOR_H

#include "core/types/plan.h"
#include "core/types/resource.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace stagecraft {

// Observes the resources a runtime currently holds on one host.
class StateInspector {
public:
    virtual ~StateInspector() = default;
    virtual StateSnapshot inspect(const HostRef& host) = 0;
};

// Runtime name -> inspector.
class StateInspectorRegistry {
public:
    void register_inspector(std::string runtime, std::shared_ptr<StateInspector> inspector);

    bool has_inspector(const std::string& runtime) const;
    // nullptr when the runtime is unknown
    StateInspector* find(const std::string& runtime) const;
    std::vector<std::string> list_runtimes() const;

private:
    std::map<std::string, std::shared_ptr<StateInspector>> inspectors_;
};

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_ENGINE_STATE_INSPECTOR_H
