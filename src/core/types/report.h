// core/types/report.h
#ifndef STAGECRAFT_CORE_TYPES_REPORT_H
#define STAGECRAFT_CORE_TYPES_REPORT_H

#include "core/types/plan.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stagecraft {

// Overall outcome of a plan or host plan run.
enum class ExecutionStatus : uint8_t {
    SUCCEEDED,
    FAILED,
    PARTIAL
};

enum class StepStatus : uint8_t {
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    SKIPPED
};

inline std::string_view to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::SUCCEEDED: return "succeeded";
        case ExecutionStatus::FAILED: return "failed";
        case ExecutionStatus::PARTIAL: return "partial";
    }
    return "failed";
}

inline std::optional<ExecutionStatus> parse_execution_status(std::string_view text) {
    if (text == "succeeded") return ExecutionStatus::SUCCEEDED;
    if (text == "failed") return ExecutionStatus::FAILED;
    if (text == "partial") return ExecutionStatus::PARTIAL;
    return std::nullopt;
}

inline std::string_view to_string(StepStatus status) {
    switch (status) {
        case StepStatus::PENDING: return "pending";
        case StepStatus::RUNNING: return "running";
        case StepStatus::SUCCEEDED: return "succeeded";
        case StepStatus::FAILED: return "failed";
        case StepStatus::SKIPPED: return "skipped";
    }
    return "pending";
}

inline std::optional<StepStatus> parse_step_status(std::string_view text) {
    if (text == "pending") return StepStatus::PENDING;
    if (text == "running") return StepStatus::RUNNING;
    if (text == "succeeded") return StepStatus::SUCCEEDED;
    if (text == "failed") return StepStatus::FAILED;
    if (text == "skipped") return StepStatus::SKIPPED;
    return std::nullopt;
}

struct ExecutionErrorInfo {
    std::string code;     // e.g. "EXECUTION_ERROR", "NO_EXECUTOR"
    std::string message;

    bool operator==(const ExecutionErrorInfo&) const = default;
};

struct LogLine {
    std::string time;
    std::string stream;   // "stdout" | "stderr" | "system"
    std::string message;  // single line

    bool operator==(const LogLine&) const = default;
};

// Timestamps are RFC 3339 strings, never native time values, so reports
// stay diffable across processes and languages.
struct StepExecution {
    std::string step_id;
    HostRef host;
    StepStatus status = StepStatus::PENDING;
    std::string started_at;
    std::string completed_at;
    std::optional<ExecutionErrorInfo> error;
    std::vector<LogLine> logs;
    StringMap meta;

    bool operator==(const StepExecution&) const = default;
};

struct ExecutionReport {
    std::string plan_id;
    ExecutionStatus status = ExecutionStatus::SUCCEEDED;
    std::vector<StepExecution> steps;
    StringMap meta;

    bool operator==(const ExecutionReport&) const = default;
};

} // namespace stagecraft

#endif // STAGECRAFT_CORE_TYPES_REPORT_H
