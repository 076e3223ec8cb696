// modules/planner/planner.h
#ifndef STAGECRAFT_MODULES_PLANNER_PLANNER_H
#define STAGECRAFT_MODULES_PLANNER_PLANNER_H

#include "core/types/options.h"
#include "core/types/plan.h"
#include "core/types/resource.h"

namespace stagecraft {

// Turns the difference between desired topology and observed state into an
// ordered Plan. The planner owns step ids, indices and host assignment.
class Planner {
public:
    virtual ~Planner() = default;
    virtual Plan compute(const TopologySnapshot& topology,
                         const StateSnapshot& state,
                         const PlanOptions& options) = 0;
};

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_PLANNER_PLANNER_H
