// core/types/options.h
#ifndef STAGECRAFT_CORE_TYPES_OPTIONS_H
#define STAGECRAFT_CORE_TYPES_OPTIONS_H

#include <string>
#include <vector>

namespace stagecraft {

// Options for plan computation. Intentionally empty in v1.
struct PlanOptions {
    bool operator==(const PlanOptions&) const = default;
};

struct ExecOptions {
    bool dry_run = false;
    int max_parallel = 0;                 // 0 or 1: hosts run one after another
    std::vector<std::string> step_filter; // empty: run every step

    bool operator==(const ExecOptions&) const = default;
};

} // namespace stagecraft

#endif // STAGECRAFT_CORE_TYPES_OPTIONS_H
