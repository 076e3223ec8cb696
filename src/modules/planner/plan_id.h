// modules/planner/plan_id.h
#ifndef STAGECRAFT_MODULES_PLANNER_PLAN_ID_H
#define STAGECRAFT_MODULES_PLANNER_PLAN_ID_H

#include "core/types/resource.h"
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace stagecraft {

// 64-bit FNV-1a.
uint64_t fnv1a_64(std::string_view data);

// Content derived plan id: "plan-" + 16 hex digits of the FNV-1a hash over
// the canonical (compact, key sorted) JSON of both snapshots.
// Equal snapshots always give the same id.
std::string compute_plan_id(const TopologySnapshot& topology, const StateSnapshot& state);

// Orders resources by kind, then name (stable for equal keys).
void sort_resources(std::vector<ResourceSpec>& resources);
void sort_resources(std::vector<ResourceState>& resources);

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_PLANNER_PLAN_ID_H
