// modules/executor/host_plan_executor.h
#ifndef STAGECRAFT_MODULES_EXECUTOR_HOST_PLAN_EXECUTOR_H
#define STAGECRAFT_MODULES_EXECUTOR_HOST_PLAN_EXECUTOR_H

#include "core/types/options.h"
#include "core/types/plan.h"
#include "core/types/report.h"
#include "modules/executor/step_executor.h"
#include <functional>
#include <string>
#include <vector>

namespace stagecraft {

// Error codes recorded in StepExecution::error.
inline constexpr const char* kErrNoExecutor = "NO_EXECUTOR";
inline constexpr const char* kErrExecution = "EXECUTION_ERROR";
inline constexpr const char* kErrDependencyNotMet = "DEPENDENCY_NOT_MET";
inline constexpr const char* kErrFiltered = "FILTERED";
inline constexpr const char* kErrHalted = "HALTED";
inline constexpr const char* kErrGlobalDependencyFailed = "GLOBAL_DEPENDENCY_FAILED";

// Returns the current time as an RFC 3339 string.
using ReportClock = std::function<std::string()>;

// Runs a host plan step by step in (index, id) order and records the outcome
// of every step. Step failures end up in the report; only a malformed
// host plan throws (ExecutorError).
//
//   dependency not succeeded     -> skipped, DEPENDENCY_NOT_MET
//   no executor for action       -> skipped, NO_EXECUTOR
//   executor throws              -> failed, EXECUTION_ERROR; later steps skipped (HALTED)
//   options.dry_run              -> skipped, meta dryRun = "true", no executor called
//   not in options.step_filter   -> skipped, FILTERED (satisfies dependents)
class HostPlanExecutor {
public:
    explicit HostPlanExecutor(const ExecutorRegistry& registry, ReportClock clock = {});

    ExecutionReport execute_host_plan(const HostPlan& plan, const ExecOptions& options = {}) const;

    // Same rules for the host-less steps of a sliced plan. Steps report an
    // empty host.
    ExecutionReport execute_global_steps(const std::string& plan_id,
                                         const std::vector<PlanStep>& steps,
                                         const ExecOptions& options = {}) const;

    // failed if any step failed, partial if any was skipped, otherwise succeeded.
    static ExecutionStatus summarize(const std::vector<StepExecution>& steps);

private:
    std::vector<StepExecution> run_steps(const HostRef& host,
                                         std::vector<HostPlanStep> steps,
                                         const ExecOptions& options) const;

    const ExecutorRegistry& registry_;
    ReportClock clock_;
};

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_EXECUTOR_HOST_PLAN_EXECUTOR_H
