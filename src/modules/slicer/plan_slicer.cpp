// modules/slicer/plan_slicer.cpp
#include "modules/slicer/plan_slicer.h"
#include "core/types/errors.h"
#include <algorithm>
#include <set>
#include <unordered_map>

namespace stagecraft {

namespace {

// Owner value for global steps in the step -> host index.
const std::string kGlobalOwner;

template<typename Step>
bool canonical_less(const Step& a, const Step& b) {
    if (a.index != b.index) return a.index < b.index;
    return a.id < b.id;
}

template<typename Step>
void sort_canonical(std::vector<Step>& steps) {
    std::stable_sort(steps.begin(), steps.end(), canonical_less<Step>);
}

std::string quoted(const std::string& s) {
    return "\"" + s + "\"";
}

[[noreturn]] void throw_unknown_step(const PlanStep& step, const std::string& dep_id) {
    throw SliceError(SliceErrorCode::UNKNOWN_STEP, step.id, step.host.logical_id, dep_id, "",
                     "step " + quoted(step.id) + " depends on unknown step " + quoted(dep_id));
}

} // namespace

HostPlanStep to_host_plan_step(const PlanStep& step) {
    HostPlanStep out;
    out.id = step.id;
    out.index = step.index;
    out.action = step.action;
    out.target = step.target;
    out.inputs = step.inputs;
    out.depends_on = step.depends_on;
    out.meta = step.meta;
    return out;
}

SliceResult slice_plan(const Plan& plan) {
    SliceResult result;

    // Pass 1: owner index, global partition.
    std::unordered_map<std::string, const std::string*> owner_of;
    owner_of.reserve(plan.steps.size());
    for (const auto& step : plan.steps) {
        const std::string* owner = step.host.is_global() ? &kGlobalOwner : &step.host.logical_id;
        auto [it, inserted] = owner_of.emplace(step.id, owner);
        if (!inserted) {
            throw SliceError(SliceErrorCode::DUPLICATE_STEP, step.id, step.host.logical_id, "", "",
                             "duplicate step id " + quoted(step.id) + " in plan " + quoted(plan.id));
        }
        if (step.host.is_global()) {
            result.global_steps.push_back(step);
        }
    }

    // Pass 2: canonical order for global steps; the id list follows the sorted steps.
    sort_canonical(result.global_steps);
    result.global_step_ids.reserve(result.global_steps.size());
    for (const auto& step : result.global_steps) {
        result.global_step_ids.push_back(step.id);
    }

    // Global steps run on the controller, so only resolution is checked for them.
    for (const auto& step : result.global_steps) {
        for (const auto& dep_id : step.depends_on) {
            if (owner_of.find(dep_id) == owner_of.end()) {
                throw_unknown_step(step, dep_id);
            }
        }
    }

    // Pass 3: assign host steps and validate dependency locality.
    for (const auto& step : plan.steps) {
        if (step.host.is_global()) continue;
        const std::string& host_id = step.host.logical_id;

        std::set<std::string> local_deps;
        std::set<std::string> global_deps;
        for (const auto& dep_id : step.depends_on) {
            auto it = owner_of.find(dep_id);
            if (it == owner_of.end()) {
                throw_unknown_step(step, dep_id);
            }
            const std::string& dep_host = *it->second;
            if (dep_host.empty()) {
                global_deps.insert(dep_id);
            } else if (dep_host == host_id) {
                local_deps.insert(dep_id);
            } else {
                throw SliceError(SliceErrorCode::CROSS_HOST_DEPENDENCY, step.id, host_id, dep_id, dep_host,
                                 "step " + quoted(step.id) + " on host " + quoted(host_id) +
                                 " depends on step " + quoted(dep_id) + " on host " + quoted(dep_host) +
                                 " (cross-host dependencies are not allowed)");
            }
        }

        if (!global_deps.empty()) {
            result.global_dependency_refs[step.id].assign(global_deps.begin(), global_deps.end());
        }

        auto [hp_it, created] = result.host_plans.try_emplace(host_id);
        HostPlan& host_plan = hp_it->second;
        if (created) {
            host_plan.plan_id = plan.id;
            host_plan.host = step.host;
        }

        HostPlanStep host_step = to_host_plan_step(step);
        host_step.depends_on.assign(local_deps.begin(), local_deps.end());
        host_plan.steps.push_back(std::move(host_step));
    }

    // Pass 4: canonical order inside every host plan.
    for (auto& [host_id, host_plan] : result.host_plans) {
        sort_canonical(host_plan.steps);
    }

    return result;
}

std::vector<std::string> host_plan_ids(const SliceResult& result) {
    std::vector<std::string> ids;
    ids.reserve(result.host_plans.size());
    for (const auto& [host_id, host_plan] : result.host_plans) {
        ids.push_back(host_id);
    }
    return ids;
}

std::string host_plan_file_name(const std::string& host_id) {
    if (host_id.empty() || host_id == "." || host_id == ".." ||
        host_id.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        throw StagecraftError("host id \"" + host_id + "\" cannot be used as a file name");
    }
    return "hostplan-" + host_id + ".json";
}

} // namespace stagecraft
