// modules/engine/local_engine.h
#ifndef STAGECRAFT_MODULES_ENGINE_LOCAL_ENGINE_H
#define STAGECRAFT_MODULES_ENGINE_LOCAL_ENGINE_H

#include "stagecraft/core/engine.h"
#include "modules/engine/state_inspector.h"
#include "modules/executor/host_plan_executor.h"
#include "modules/executor/step_executor.h"
#include "modules/planner/planner.h"
#include <memory>
#include <set>
#include <string>

namespace stagecraft {

// In-process Engine: slices the plan, runs global steps on the calling
// thread, then runs host plans on up to options.max_parallel workers.
//
// A host plan is dispatched only when every global step its steps wait for
// succeeded (or was filtered out / dry-run skipped). Otherwise all of its
// steps are reported skipped with GLOBAL_DEPENDENCY_FAILED.
//
// Collaborators are shared with the caller and must tolerate concurrent use.
class LocalEngine : public Engine {
public:
    LocalEngine(std::shared_ptr<Planner> planner,
                std::shared_ptr<const ExecutorRegistry> executors,
                std::shared_ptr<const StateInspectorRegistry> inspectors,
                ReportClock clock = {});

    ComputePlanResponse compute_plan(const ComputePlanRequest& request) override;
    ExecutePlanResponse execute_plan(const ExecutePlanRequest& request) override;
    InspectStateResponse inspect_state(const InspectStateRequest& request) override;

private:
    ExecutionReport run_host_plan(const HostPlanExecutor& executor,
                                  const HostPlan& plan,
                                  const SliceResult& sliced,
                                  const std::set<std::string>& satisfied_globals,
                                  const ExecOptions& options) const;

    std::shared_ptr<Planner> planner_;
    std::shared_ptr<const ExecutorRegistry> executors_;
    std::shared_ptr<const StateInspectorRegistry> inspectors_;
    ReportClock clock_;
};

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_ENGINE_LOCAL_ENGINE_H
