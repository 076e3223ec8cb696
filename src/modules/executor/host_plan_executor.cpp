// modules/executor/host_plan_executor.cpp
#include "modules/executor/host_plan_executor.h"
#include "modules/slicer/plan_slicer.h"
#include "core/types/errors.h"
#include "common/utils/clock.h"
#include "common/utils/log.h"
#include <algorithm>
#include <set>
#include <unordered_set>

namespace stagecraft {

namespace {

void mark_skipped(StepExecution& exec, const char* code, std::string message) {
    exec.status = StepStatus::SKIPPED;
    exec.error = ExecutionErrorInfo{code, std::move(message)};
}

} // namespace

HostPlanExecutor::HostPlanExecutor(const ExecutorRegistry& registry, ReportClock clock)
    : registry_(registry), clock_(clock ? std::move(clock) : ReportClock(rfc3339_now)) {}

ExecutionReport HostPlanExecutor::execute_host_plan(const HostPlan& plan, const ExecOptions& options) const {
    if (plan.host.logical_id.empty()) {
        throw ExecutorError("host plan for plan \"" + plan.plan_id +
                            "\" has empty host.logicalId (required for HostPlans)");
    }

    log::info("executing host plan for host \"" + plan.host.logical_id + "\" (" +
              std::to_string(plan.steps.size()) + " steps)");

    ExecutionReport report;
    report.plan_id = plan.plan_id;
    report.steps = run_steps(plan.host, plan.steps, options);
    report.status = summarize(report.steps);
    if (options.dry_run) {
        report.meta["dryRun"] = "true";
    }

    log::info("host \"" + plan.host.logical_id + "\" finished: " + std::string(to_string(report.status)));
    return report;
}

ExecutionReport HostPlanExecutor::execute_global_steps(const std::string& plan_id,
                                                       const std::vector<PlanStep>& steps,
                                                       const ExecOptions& options) const {
    std::vector<HostPlanStep> host_steps;
    host_steps.reserve(steps.size());
    for (const auto& step : steps) {
        host_steps.push_back(to_host_plan_step(step));
    }

    log::info("executing " + std::to_string(steps.size()) + " global steps");

    ExecutionReport report;
    report.plan_id = plan_id;
    report.steps = run_steps(HostRef{}, std::move(host_steps), options);
    report.status = summarize(report.steps);
    if (options.dry_run) {
        report.meta["dryRun"] = "true";
    }
    return report;
}

ExecutionStatus HostPlanExecutor::summarize(const std::vector<StepExecution>& steps) {
    bool any_skipped = false;
    for (const auto& s : steps) {
        if (s.status == StepStatus::FAILED) {
            return ExecutionStatus::FAILED;
        }
        if (s.status != StepStatus::SUCCEEDED) {
            any_skipped = true;
        }
    }
    return any_skipped ? ExecutionStatus::PARTIAL : ExecutionStatus::SUCCEEDED;
}

std::vector<StepExecution> HostPlanExecutor::run_steps(const HostRef& host,
                                                       std::vector<HostPlanStep> steps,
                                                       const ExecOptions& options) const {
    std::stable_sort(steps.begin(), steps.end(), [](const HostPlanStep& a, const HostPlanStep& b) {
        if (a.index != b.index) return a.index < b.index;
        return a.id < b.id;
    });

    const std::set<std::string> filter(options.step_filter.begin(), options.step_filter.end());

    // Ids a later step may depend on: succeeded, or deliberately filtered out.
    std::unordered_set<std::string> satisfied;
    std::string failed_step;
    std::vector<StepExecution> results;
    results.reserve(steps.size());

    for (const auto& step : steps) {
        StepExecution exec;
        exec.step_id = step.id;
        exec.host = host;

        if (!failed_step.empty()) {
            mark_skipped(exec, kErrHalted, "execution halted after step \"" + failed_step + "\" failed");
        } else if (options.dry_run) {
            exec.status = StepStatus::SKIPPED;
            exec.meta["dryRun"] = "true";
        } else if (!filter.empty() && filter.count(step.id) == 0) {
            mark_skipped(exec, kErrFiltered, "step \"" + step.id + "\" excluded by step filter");
            satisfied.insert(step.id);
        } else {
            auto unmet = std::find_if(step.depends_on.begin(), step.depends_on.end(),
                                      [&satisfied](const std::string& dep) { return satisfied.count(dep) == 0; });
            StepExecutor* executor = registry_.find(step.action);

            if (unmet != step.depends_on.end()) {
                mark_skipped(exec, kErrDependencyNotMet,
                             "step \"" + step.id + "\" depends on \"" + *unmet + "\" which has not succeeded");
            } else if (executor == nullptr) {
                mark_skipped(exec, kErrNoExecutor,
                             "no executor registered for action \"" + std::string(to_string(step.action)) + "\"");
            } else {
                exec.started_at = clock_();
                log::debug("step \"" + step.id + "\" (" + std::string(to_string(step.action)) + ") started");
                try {
                    executor->execute(step);
                    exec.status = StepStatus::SUCCEEDED;
                    satisfied.insert(step.id);
                } catch (const std::exception& e) {
                    exec.status = StepStatus::FAILED;
                    exec.error = ExecutionErrorInfo{kErrExecution, e.what()};
                    failed_step = step.id;
                    log::error("step \"" + step.id + "\" failed: " + e.what());
                }
            }
        }

        exec.completed_at = clock_();
        if (exec.error) {
            exec.logs.push_back(LogLine{exec.completed_at, "system", exec.error->message});
        }
        results.push_back(std::move(exec));
    }
    return results;
}

} // namespace stagecraft
