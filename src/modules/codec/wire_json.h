// modules/codec/wire_json.h
#ifndef STAGECRAFT_MODULES_CODEC_WIRE_JSON_H
#define STAGECRAFT_MODULES_CODEC_WIRE_JSON_H

#include "core/types/plan.h"
#include "core/types/report.h"
#include "core/types/resource.h"
#include "modules/codec/json_reader.h"
#include <string>
#include <nlohmann/json.hpp>

namespace stagecraft {

// --- Encoding ---
// Empty optional fields are omitted. nlohmann::json objects keep their keys
// sorted, so equal values always encode to identical bytes.

void to_json(nlohmann::json& j, const ResourceRef& ref);
void to_json(nlohmann::json& j, const ResourceSpec& spec);
void to_json(nlohmann::json& j, const ResourceState& state);
void to_json(nlohmann::json& j, const TopologySnapshot& snapshot);
void to_json(nlohmann::json& j, const StateSnapshot& snapshot);
void to_json(nlohmann::json& j, const HostRef& host);
void to_json(nlohmann::json& j, const PlanStep& step);
void to_json(nlohmann::json& j, const Plan& plan);
void to_json(nlohmann::json& j, const HostPlanStep& step);
void to_json(nlohmann::json& j, const HostPlan& plan);
void to_json(nlohmann::json& j, const SliceResult& result);
void to_json(nlohmann::json& j, const StepExecution& exec);
void to_json(nlohmann::json& j, const ExecutionReport& report);

// indent < 0 gives the compact form.
std::string encode_plan(const Plan& plan, int indent = -1);
std::string encode_host_plan(const HostPlan& plan, int indent = -1);
std::string encode_slice_result(const SliceResult& result, int indent = -1);
std::string encode_execution_report(const ExecutionReport& report, int indent = -1);
std::string encode_topology_snapshot(const TopologySnapshot& snapshot, int indent = -1);
std::string encode_state_snapshot(const StateSnapshot& snapshot, int indent = -1);

// --- Decoding from an already parsed document ---
// path is the JSON path used in error messages ("$" for the root).

ResourceRef read_resource_ref(const nlohmann::json& j, const std::string& path, DecodeMode mode);
HostRef read_host_ref(const nlohmann::json& j, const std::string& path, DecodeMode mode);
PlanStep read_plan_step(const nlohmann::json& j, const std::string& path, DecodeMode mode);
Plan read_plan(const nlohmann::json& j, const std::string& path, DecodeMode mode);
HostPlanStep read_host_plan_step(const nlohmann::json& j, const std::string& path, DecodeMode mode);
HostPlan read_host_plan(const nlohmann::json& j, const std::string& path, DecodeMode mode);
TopologySnapshot read_topology_snapshot(const nlohmann::json& j, const std::string& path, DecodeMode mode);
StateSnapshot read_state_snapshot(const nlohmann::json& j, const std::string& path, DecodeMode mode);
ExecutionReport read_execution_report(const nlohmann::json& j, const std::string& path, DecodeMode mode);

// Lenient decoders for trusted local files: unknown fields are ignored and
// the schema version is not checked. Throws DecodeError.
Plan decode_plan(std::string_view payload);
ExecutionReport decode_execution_report(std::string_view payload);
TopologySnapshot decode_topology_snapshot(std::string_view payload);
StateSnapshot decode_state_snapshot(std::string_view payload);

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_CODEC_WIRE_JSON_H
