// tests/plan_fixtures.h
#ifndef STAGECRAFT_TESTS_PLAN_FIXTURES_H
#define STAGECRAFT_TESTS_PLAN_FIXTURES_H

#include "core/types/plan.h"
#include <string>
#include <vector>

namespace stagecraft::testing {

inline PlanStep make_step(std::string id,
                          int64_t index,
                          std::string host,
                          std::vector<std::string> depends_on = {},
                          StepAction action = StepAction::NOOP) {
    PlanStep step;
    step.id = std::move(id);
    step.index = index;
    step.action = action;
    step.target = ResourceRef{"service", step.id, "docker-compose", ""};
    step.host.logical_id = std::move(host);
    step.inputs = nlohmann::json::object();
    step.depends_on = std::move(depends_on);
    return step;
}

inline Plan make_plan(std::vector<PlanStep> steps, std::string id = "plan-test") {
    Plan plan;
    plan.id = std::move(id);
    plan.steps = std::move(steps);
    return plan;
}

} // namespace stagecraft::testing

#endif // STAGECRAFT_TESTS_PLAN_FIXTURES_H
