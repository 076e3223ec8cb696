// modules/slicer/plan_slicer.h
#ifndef STAGECRAFT_MODULES_SLICER_PLAN_SLICER_H
#define STAGECRAFT_MODULES_SLICER_PLAN_SLICER_H

#include "core/types/plan.h"
#include <string>
#include <vector>

namespace stagecraft {

// Partition a plan into per-host HostPlans and the global (host-less) steps.
//
// - A step goes to HostPlan[step.host.logical_id], or to global_steps when
//   the logical id is empty.
// - A dependency on a step of the same host stays in depends_on (sorted, unique).
// - A dependency on a global step moves to global_dependency_refs[step.id].
// - A dependency on another host's step throws SliceError(CROSS_HOST_DEPENDENCY).
// - A dependency on an id absent from the plan throws SliceError(UNKNOWN_STEP).
// - A repeated step id throws SliceError(DUPLICATE_STEP).
//
// global_steps, global_step_ids and every HostPlan's steps are ordered by
// (index, id). The input is never modified and nothing in the result aliases it.
SliceResult slice_plan(const Plan& plan);

// Host logical ids of the result, ascending.
std::vector<std::string> host_plan_ids(const SliceResult& result);

// "hostplan-<host>.json". Throws StagecraftError when the host id is empty,
// "." or "..", or contains a path separator or NUL.
std::string host_plan_file_name(const std::string& host_id);

// Copy a plan step into the host-scoped form, dropping its host reference.
HostPlanStep to_host_plan_step(const PlanStep& step);

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_SLICER_PLAN_SLICER_H
