// modules/planner/plan_id.cpp
#include "modules/planner/plan_id.h"
#include "modules/codec/wire_json.h"
#include <algorithm>
#include <cstdio>

namespace stagecraft {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

template<typename Resource>
void sort_by_kind_and_name(std::vector<Resource>& resources) {
    std::stable_sort(resources.begin(), resources.end(), [](const Resource& a, const Resource& b) {
        if (a.ref.kind != b.ref.kind) return a.ref.kind < b.ref.kind;
        return a.ref.name < b.ref.name;
    });
}

} // namespace

uint64_t fnv1a_64(std::string_view data) {
    uint64_t hash = kFnvOffsetBasis;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

std::string compute_plan_id(const TopologySnapshot& topology, const StateSnapshot& state) {
    // The separator keeps ("ab", "c") and ("a", "bc") style splits apart.
    const std::string canonical = encode_topology_snapshot(topology) + "\n" + encode_state_snapshot(state);

    char hex[17];
    std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(fnv1a_64(canonical)));
    return "plan-" + std::string(hex);
}

void sort_resources(std::vector<ResourceSpec>& resources) {
    sort_by_kind_and_name(resources);
}

void sort_resources(std::vector<ResourceState>& resources) {
    sort_by_kind_and_name(resources);
}

} // namespace stagecraft
