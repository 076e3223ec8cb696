// core/types/plan.h
#ifndef STAGECRAFT_CORE_TYPES_PLAN_H
#define STAGECRAFT_CORE_TYPES_PLAN_H

#include "core/types/resource.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stagecraft {

// Wire contract versions.
inline constexpr std::string_view kPlanSchemaVersion = "v1";
inline constexpr std::string_view kHostPlanSchemaVersion = "v1";

enum class StepAction : uint8_t {
    CREATE,
    UPDATE,
    DELETE,
    NOOP,
    RENDER_COMPOSE,
    APPLY_COMPOSE,
    ROLLOUT,
    BUILD,
    MIGRATE,
    HEALTH_CHECK
};

inline std::string_view to_string(StepAction action) {
    switch (action) {
        case StepAction::CREATE: return "create";
        case StepAction::UPDATE: return "update";
        case StepAction::DELETE: return "delete";
        case StepAction::NOOP: return "noop";
        case StepAction::RENDER_COMPOSE: return "render_compose";
        case StepAction::APPLY_COMPOSE: return "apply_compose";
        case StepAction::ROLLOUT: return "rollout";
        case StepAction::BUILD: return "build";
        case StepAction::MIGRATE: return "migrate";
        case StepAction::HEALTH_CHECK: return "health_check";
    }
    return "noop";
}

inline std::optional<StepAction> parse_step_action(std::string_view text) {
    if (text == "create") return StepAction::CREATE;
    if (text == "update") return StepAction::UPDATE;
    if (text == "delete") return StepAction::DELETE;
    if (text == "noop") return StepAction::NOOP;
    if (text == "render_compose") return StepAction::RENDER_COMPOSE;
    if (text == "apply_compose") return StepAction::APPLY_COMPOSE;
    if (text == "rollout") return StepAction::ROLLOUT;
    if (text == "build") return StepAction::BUILD;
    if (text == "migrate") return StepAction::MIGRATE;
    if (text == "health_check") return StepAction::HEALTH_CHECK;
    return std::nullopt;
}

// Where a step executes. Empty logical_id means "global" (no host affinity).
struct HostRef {
    std::string logical_id;
    StringMap labels;

    bool is_global() const { return logical_id.empty(); }
    bool operator==(const HostRef&) const = default;
};

struct PlanStep {
    std::string id;       // unique within the plan
    int64_t index = 0;    // total order across the full plan
    StepAction action = StepAction::NOOP;
    ResourceRef target;
    HostRef host;
    RawPayload inputs;    // opaque, owned by the provider
    std::vector<std::string> depends_on; // step ids
    StringMap meta;

    bool operator==(const PlanStep&) const = default;
};

// Produced once by a planner, immutable afterwards.
struct Plan {
    std::string version{kPlanSchemaVersion};
    std::string id;       // content derived, see compute_plan_id()
    std::string summary;
    std::vector<PlanStep> steps;
    StringMap meta;

    bool operator==(const Plan&) const = default;
};

struct HostPlanStep {
    std::string id;
    int64_t index = 0;
    StepAction action = StepAction::NOOP;
    ResourceRef target;
    RawPayload inputs;
    std::vector<std::string> depends_on; // only ids inside the same HostPlan
    StringMap meta;

    bool operator==(const HostPlanStep&) const = default;
};

// Self-contained sub-plan handed to a single host agent.
struct HostPlan {
    std::string version{kHostPlanSchemaVersion};
    std::string plan_id;
    HostRef host;
    std::vector<HostPlanStep> steps;
    StringMap meta;

    bool operator==(const HostPlan&) const = default;
};

struct SliceResult {
    std::map<std::string, HostPlan> host_plans;  // keyed by host logical id
    std::vector<PlanStep> global_steps;          // (index, id) ascending
    std::vector<std::string> global_step_ids;    // same order as global_steps
    // host step id -> global step ids it waits for (sorted, unique)
    std::map<std::string, std::vector<std::string>> global_dependency_refs;

    bool operator==(const SliceResult&) const = default;
};

} // namespace stagecraft

#endif // STAGECRAFT_CORE_TYPES_PLAN_H
