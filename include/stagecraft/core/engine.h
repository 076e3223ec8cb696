// stagecraft/core/engine.h
#ifndef STAGECRAFT_CORE_ENGINE_H
#define STAGECRAFT_CORE_ENGINE_H

#include "core/types/options.h"
#include "core/types/plan.h"
#include "core/types/report.h"
#include "core/types/resource.h"
#include <string>

namespace stagecraft {

struct ComputePlanRequest {
    TopologySnapshot topology;
    StateSnapshot state;
    PlanOptions options;
};

struct ComputePlanResponse {
    Plan plan;
};

struct ExecutePlanRequest {
    Plan plan;
    ExecOptions options;
};

struct ExecutePlanResponse {
    ExecutionReport report;
};

struct InspectStateRequest {
    HostRef host;
    std::string runtime; // e.g. "docker-compose"
};

struct InspectStateResponse {
    StateSnapshot state;
};

// Planning, execution and state inspection behind one contract. A local
// composition (LocalEngine) and a remote controller both implement it.
// Errors are thrown as StagecraftError subclasses.
class Engine {
public:
    virtual ~Engine() = default;

    virtual ComputePlanResponse compute_plan(const ComputePlanRequest& request) = 0;
    virtual ExecutePlanResponse execute_plan(const ExecutePlanRequest& request) = 0;
    virtual InspectStateResponse inspect_state(const InspectStateRequest& request) = 0;
};

} // namespace stagecraft

#endif // STAGECRAFT_CORE_ENGINE_H
