// modules/engine/local_engine.cpp
#include "modules/engine/local_engine.h"
#include "modules/planner/plan_id.h"
#include "modules/slicer/plan_slicer.h"
#include "core/types/errors.h"
#include "common/utils/clock.h"
#include "common/utils/log.h"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <thread>
#include <vector>

namespace stagecraft {

namespace {

// A global step that does not block its dependents.
bool global_step_satisfied(const StepExecution& exec) {
    if (exec.status == StepStatus::SUCCEEDED) return true;
    if (exec.status != StepStatus::SKIPPED) return false;
    if (exec.error && exec.error->code == kErrFiltered) return true;
    auto it = exec.meta.find("dryRun");
    return it != exec.meta.end() && it->second == "true";
}

} // namespace

LocalEngine::LocalEngine(std::shared_ptr<Planner> planner,
                         std::shared_ptr<const ExecutorRegistry> executors,
                         std::shared_ptr<const StateInspectorRegistry> inspectors,
                         ReportClock clock)
    : planner_(std::move(planner)),
      executors_(std::move(executors)),
      inspectors_(std::move(inspectors)),
      clock_(clock ? std::move(clock) : ReportClock(rfc3339_now)) {
    if (!executors_) {
        executors_ = std::make_shared<const ExecutorRegistry>();
    }
    if (!inspectors_) {
        inspectors_ = std::make_shared<const StateInspectorRegistry>();
    }
}

ComputePlanResponse LocalEngine::compute_plan(const ComputePlanRequest& request) {
    if (!planner_) {
        throw EngineError("compute_plan: no planner configured");
    }
    ComputePlanResponse response;
    response.plan = planner_->compute(request.topology, request.state, request.options);
    response.plan.version = std::string(kPlanSchemaVersion);
    if (response.plan.id.empty()) {
        response.plan.id = compute_plan_id(request.topology, request.state);
    }
    log::info("computed plan \"" + response.plan.id + "\" with " +
              std::to_string(response.plan.steps.size()) + " steps");
    return response;
}

ExecutePlanResponse LocalEngine::execute_plan(const ExecutePlanRequest& request) {
    const Plan& plan = request.plan;
    const ExecOptions& options = request.options;

    SliceResult sliced = slice_plan(plan);
    const std::vector<std::string> hosts = host_plan_ids(sliced);
    log::info("plan \"" + plan.id + "\": " + std::to_string(sliced.global_steps.size()) +
              " global steps, " + std::to_string(hosts.size()) + " host plans");

    HostPlanExecutor executor(*executors_, clock_);
    ExecutionReport global_report = executor.execute_global_steps(plan.id, sliced.global_steps, options);

    std::set<std::string> satisfied_globals;
    for (const auto& exec : global_report.steps) {
        if (global_step_satisfied(exec)) {
            satisfied_globals.insert(exec.step_id);
        }
    }

    // One slot per host; each worker writes only its own slot.
    std::vector<ExecutionReport> host_reports(hosts.size());
    std::vector<std::exception_ptr> host_errors(hosts.size());

    auto run_slot = [&](size_t i) {
        try {
            host_reports[i] = run_host_plan(executor, sliced.host_plans.at(hosts[i]), sliced,
                                            satisfied_globals, options);
        } catch (...) {
            host_errors[i] = std::current_exception();
        }
    };

    const size_t workers = std::min(hosts.size(), static_cast<size_t>(std::max(options.max_parallel, 1)));
    if (workers <= 1) {
        for (size_t i = 0; i < hosts.size(); ++i) {
            run_slot(i);
        }
    } else {
        log::debug("running host plans on " + std::to_string(workers) + " workers");
        std::atomic<size_t> next{0};
        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&] {
                for (size_t i = next++; i < hosts.size(); i = next++) {
                    run_slot(i);
                }
            });
        }
        for (auto& t : pool) {
            t.join();
        }
    }

    for (const auto& err : host_errors) {
        if (err) {
            std::rethrow_exception(err);
        }
    }

    ExecutePlanResponse response;
    ExecutionReport& report = response.report;
    report.plan_id = plan.id;
    report.steps = std::move(global_report.steps);
    for (auto& host_report : host_reports) {
        std::move(host_report.steps.begin(), host_report.steps.end(), std::back_inserter(report.steps));
    }
    report.status = HostPlanExecutor::summarize(report.steps);
    if (options.dry_run) {
        report.meta["dryRun"] = "true";
    }

    log::info("plan \"" + plan.id + "\" finished: " + std::string(to_string(report.status)));
    return response;
}

InspectStateResponse LocalEngine::inspect_state(const InspectStateRequest& request) {
    StateInspector* inspector = inspectors_->find(request.runtime);
    if (inspector == nullptr) {
        throw EngineError("no state inspector registered for runtime \"" + request.runtime + "\"");
    }
    InspectStateResponse response;
    response.state = inspector->inspect(request.host);
    return response;
}

ExecutionReport LocalEngine::run_host_plan(const HostPlanExecutor& executor,
                                           const HostPlan& plan,
                                           const SliceResult& sliced,
                                           const std::set<std::string>& satisfied_globals,
                                           const ExecOptions& options) const {
    std::string blocking_global;
    for (const auto& step : plan.steps) {
        auto refs = sliced.global_dependency_refs.find(step.id);
        if (refs == sliced.global_dependency_refs.end()) continue;
        for (const auto& global_id : refs->second) {
            if (satisfied_globals.count(global_id) == 0) {
                blocking_global = global_id;
                break;
            }
        }
        if (!blocking_global.empty()) break;
    }

    if (blocking_global.empty()) {
        return executor.execute_host_plan(plan, options);
    }

    log::warn("host plan for \"" + plan.host.logical_id + "\" not dispatched: global step \"" +
              blocking_global + "\" did not succeed");

    ExecutionReport report;
    report.plan_id = plan.plan_id;
    const std::string now = clock_();
    const std::string message = "host plan for \"" + plan.host.logical_id +
                                "\" depends on global step \"" + blocking_global + "\" which did not succeed";
    for (const auto& step : plan.steps) {
        StepExecution exec;
        exec.step_id = step.id;
        exec.host = plan.host;
        exec.status = StepStatus::SKIPPED;
        exec.completed_at = now;
        exec.error = ExecutionErrorInfo{kErrGlobalDependencyFailed, message};
        exec.logs.push_back(LogLine{now, "system", message});
        report.steps.push_back(std::move(exec));
    }
    report.status = HostPlanExecutor::summarize(report.steps);
    return report;
}

} // namespace stagecraft
