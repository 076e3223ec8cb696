// modules/codec/wire_json.cpp
#include "modules/codec/wire_json.h"

namespace stagecraft {

namespace {

std::string dump(const nlohmann::json& j, int indent) {
    return j.dump(indent);
}

void put_meta(nlohmann::json& j, const char* key, const StringMap& meta) {
    if (!meta.empty()) j[key] = meta;
}

void put_list(nlohmann::json& j, const char* key, const std::vector<std::string>& list) {
    if (!list.empty()) j[key] = list;
}

StepAction read_action(const JsonObjectReader& r) {
    std::string text = r.get_string("action");
    auto action = parse_step_action(text);
    if (!action) {
        std::string path = r.field_path("action");
        throw DecodeError(DecodeErrorCode::TYPE_MISMATCH, path,
                          "unknown step action \"" + text + "\" at " + path);
    }
    return *action;
}

ExecutionErrorInfo read_error_info(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"code", "message"});
    return {r.get_string("code"), r.get_string("message")};
}

LogLine read_log_line(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"time", "stream", "message"});
    return {r.get_string("time"), r.get_string("stream"), r.get_string("message")};
}

StepExecution read_step_execution(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode,
                       {"stepId", "host", "status", "startedAt", "completedAt", "error", "logs", "meta"});
    StepExecution exec;
    exec.step_id = r.get_string("stepId");
    if (const auto* host = r.find("host")) {
        exec.host = read_host_ref(*host, r.field_path("host"), mode);
    }
    std::string status = r.get_string("status");
    auto parsed = parse_step_status(status);
    if (!parsed) {
        throw DecodeError(DecodeErrorCode::TYPE_MISMATCH, r.field_path("status"),
                          "unknown step status \"" + status + "\" at " + r.field_path("status"));
    }
    exec.status = *parsed;
    exec.started_at = r.get_string("startedAt");
    exec.completed_at = r.get_string("completedAt");
    if (const auto* err = r.find("error")) {
        exec.error = read_error_info(*err, r.field_path("error"), mode);
    }
    r.for_each_element("logs", [&](const nlohmann::json& item, const std::string& item_path) {
        exec.logs.push_back(read_log_line(item, item_path, mode));
    });
    exec.meta = r.get_string_map("meta");
    return exec;
}

} // namespace

// --- Encoding ---

void to_json(nlohmann::json& j, const ResourceRef& ref) {
    j = nlohmann::json{{"kind", ref.kind}, {"name", ref.name}, {"provider", ref.provider}};
    if (!ref.ns.empty()) j["namespace"] = ref.ns;
}

void to_json(nlohmann::json& j, const ResourceSpec& spec) {
    j = nlohmann::json{{"ref", spec.ref}, {"data", spec.data}};
    put_meta(j, "meta", spec.meta);
}

void to_json(nlohmann::json& j, const ResourceState& state) {
    j = nlohmann::json{{"ref", state.ref}, {"data", state.data}};
    put_meta(j, "meta", state.meta);
}

void to_json(nlohmann::json& j, const TopologySnapshot& snapshot) {
    j = nlohmann::json::object();
    j["version"] = snapshot.version;
    j["resources"] = snapshot.resources;
    put_meta(j, "meta", snapshot.meta);
}

void to_json(nlohmann::json& j, const StateSnapshot& snapshot) {
    j = nlohmann::json::object();
    j["version"] = snapshot.version;
    j["resources"] = snapshot.resources;
    put_meta(j, "meta", snapshot.meta);
}

void to_json(nlohmann::json& j, const HostRef& host) {
    j = nlohmann::json{{"logicalId", host.logical_id}};
    put_meta(j, "labels", host.labels);
}

void to_json(nlohmann::json& j, const PlanStep& step) {
    j = nlohmann::json::object();
    j["id"] = step.id;
    j["index"] = step.index;
    j["action"] = std::string(to_string(step.action));
    j["target"] = step.target;
    j["host"] = step.host;
    j["inputs"] = step.inputs;
    put_list(j, "dependsOn", step.depends_on);
    put_meta(j, "meta", step.meta);
}

void to_json(nlohmann::json& j, const Plan& plan) {
    j = nlohmann::json::object();
    j["version"] = plan.version;
    j["id"] = plan.id;
    if (!plan.summary.empty()) j["summary"] = plan.summary;
    j["steps"] = plan.steps;
    put_meta(j, "meta", plan.meta);
}

void to_json(nlohmann::json& j, const HostPlanStep& step) {
    j = nlohmann::json::object();
    j["id"] = step.id;
    j["index"] = step.index;
    j["action"] = std::string(to_string(step.action));
    j["target"] = step.target;
    j["inputs"] = step.inputs;
    put_list(j, "dependsOn", step.depends_on);
    put_meta(j, "meta", step.meta);
}

void to_json(nlohmann::json& j, const HostPlan& plan) {
    j = nlohmann::json::object();
    j["version"] = plan.version;
    j["planId"] = plan.plan_id;
    j["host"] = plan.host;
    j["steps"] = plan.steps;
    put_meta(j, "meta", plan.meta);
}

void to_json(nlohmann::json& j, const SliceResult& result) {
    j = nlohmann::json::object();
    j["hostPlans"] = nlohmann::json::object();
    for (const auto& [host_id, host_plan] : result.host_plans) {
        j["hostPlans"][host_id] = host_plan;
    }
    if (!result.global_steps.empty()) j["globalSteps"] = result.global_steps;
    put_list(j, "globalStepIds", result.global_step_ids);
    if (!result.global_dependency_refs.empty()) {
        j["globalDependencyRefs"] = result.global_dependency_refs;
    }
}

void to_json(nlohmann::json& j, const StepExecution& exec) {
    j = nlohmann::json::object();
    j["stepId"] = exec.step_id;
    j["host"] = exec.host;
    j["status"] = std::string(to_string(exec.status));
    if (!exec.started_at.empty()) j["startedAt"] = exec.started_at;
    if (!exec.completed_at.empty()) j["completedAt"] = exec.completed_at;
    if (exec.error) {
        nlohmann::json err = nlohmann::json{{"message", exec.error->message}};
        if (!exec.error->code.empty()) err["code"] = exec.error->code;
        j["error"] = std::move(err);
    }
    if (!exec.logs.empty()) {
        nlohmann::json logs = nlohmann::json::array();
        for (const auto& line : exec.logs) {
            nlohmann::json lj{{"stream", line.stream}, {"message", line.message}};
            if (!line.time.empty()) lj["time"] = line.time;
            logs.push_back(std::move(lj));
        }
        j["logs"] = std::move(logs);
    }
    put_meta(j, "meta", exec.meta);
}

void to_json(nlohmann::json& j, const ExecutionReport& report) {
    j = nlohmann::json::object();
    j["planId"] = report.plan_id;
    j["status"] = std::string(to_string(report.status));
    j["steps"] = report.steps;
    put_meta(j, "meta", report.meta);
}

std::string encode_plan(const Plan& plan, int indent) {
    return dump(nlohmann::json(plan), indent);
}

std::string encode_host_plan(const HostPlan& plan, int indent) {
    return dump(nlohmann::json(plan), indent);
}

std::string encode_slice_result(const SliceResult& result, int indent) {
    return dump(nlohmann::json(result), indent);
}

std::string encode_execution_report(const ExecutionReport& report, int indent) {
    return dump(nlohmann::json(report), indent);
}

std::string encode_topology_snapshot(const TopologySnapshot& snapshot, int indent) {
    return dump(nlohmann::json(snapshot), indent);
}

std::string encode_state_snapshot(const StateSnapshot& snapshot, int indent) {
    return dump(nlohmann::json(snapshot), indent);
}

// --- Decoding ---

ResourceRef read_resource_ref(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"kind", "name", "provider", "namespace"});
    ResourceRef ref;
    ref.kind = r.get_string("kind");
    ref.name = r.get_string("name");
    ref.provider = r.get_string("provider");
    ref.ns = r.get_string("namespace");
    return ref;
}

HostRef read_host_ref(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"logicalId", "labels"});
    HostRef host;
    host.logical_id = r.get_string("logicalId");
    host.labels = r.get_string_map("labels");
    return host;
}

PlanStep read_plan_step(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode,
                       {"id", "index", "action", "target", "host", "inputs", "dependsOn", "meta"});
    PlanStep step;
    step.id = r.get_string("id");
    step.index = r.get_int("index");
    step.action = read_action(r);
    if (const auto* target = r.find("target")) {
        step.target = read_resource_ref(*target, r.field_path("target"), mode);
    }
    if (const auto* host = r.find("host")) {
        step.host = read_host_ref(*host, r.field_path("host"), mode);
    }
    step.inputs = r.get_raw("inputs");
    step.depends_on = r.get_string_list("dependsOn");
    step.meta = r.get_string_map("meta");
    return step;
}

Plan read_plan(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"version", "id", "summary", "steps", "meta"});
    Plan plan;
    plan.version = r.get_string("version");
    plan.id = r.get_string("id");
    plan.summary = r.get_string("summary");
    r.for_each_element("steps", [&](const nlohmann::json& item, const std::string& item_path) {
        plan.steps.push_back(read_plan_step(item, item_path, mode));
    });
    plan.meta = r.get_string_map("meta");
    return plan;
}

HostPlanStep read_host_plan_step(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode,
                       {"id", "index", "action", "target", "inputs", "dependsOn", "meta"});
    HostPlanStep step;
    step.id = r.get_string("id");
    step.index = r.get_int("index");
    step.action = read_action(r);
    if (const auto* target = r.find("target")) {
        step.target = read_resource_ref(*target, r.field_path("target"), mode);
    }
    step.inputs = r.get_raw("inputs");
    step.depends_on = r.get_string_list("dependsOn");
    step.meta = r.get_string_map("meta");
    return step;
}

HostPlan read_host_plan(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"version", "planId", "host", "steps", "meta"});
    HostPlan plan;
    plan.version = r.get_string("version");
    plan.plan_id = r.get_string("planId");
    if (const auto* host = r.find("host")) {
        plan.host = read_host_ref(*host, r.field_path("host"), mode);
    }
    r.for_each_element("steps", [&](const nlohmann::json& item, const std::string& item_path) {
        plan.steps.push_back(read_host_plan_step(item, item_path, mode));
    });
    plan.meta = r.get_string_map("meta");
    return plan;
}

TopologySnapshot read_topology_snapshot(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"version", "meta", "resources"});
    TopologySnapshot snapshot;
    snapshot.version = r.get_string("version");
    snapshot.meta = r.get_string_map("meta");
    r.for_each_element("resources", [&](const nlohmann::json& item, const std::string& item_path) {
        JsonObjectReader ir(item, item_path, mode, {"ref", "data", "meta"});
        ResourceSpec spec;
        if (const auto* ref = ir.find("ref")) {
            spec.ref = read_resource_ref(*ref, ir.field_path("ref"), mode);
        }
        spec.data = ir.get_raw("data");
        spec.meta = ir.get_string_map("meta");
        snapshot.resources.push_back(std::move(spec));
    });
    return snapshot;
}

StateSnapshot read_state_snapshot(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"version", "meta", "resources"});
    StateSnapshot snapshot;
    snapshot.version = r.get_string("version");
    snapshot.meta = r.get_string_map("meta");
    r.for_each_element("resources", [&](const nlohmann::json& item, const std::string& item_path) {
        JsonObjectReader ir(item, item_path, mode, {"ref", "data", "meta"});
        ResourceState state;
        if (const auto* ref = ir.find("ref")) {
            state.ref = read_resource_ref(*ref, ir.field_path("ref"), mode);
        }
        state.data = ir.get_raw("data");
        state.meta = ir.get_string_map("meta");
        snapshot.resources.push_back(std::move(state));
    });
    return snapshot;
}

ExecutionReport read_execution_report(const nlohmann::json& j, const std::string& path, DecodeMode mode) {
    JsonObjectReader r(j, path, mode, {"planId", "status", "steps", "meta"});
    ExecutionReport report;
    report.plan_id = r.get_string("planId");
    std::string status = r.get_string("status");
    auto parsed = parse_execution_status(status);
    if (!parsed) {
        throw DecodeError(DecodeErrorCode::TYPE_MISMATCH, r.field_path("status"),
                          "unknown execution status \"" + status + "\" at " + r.field_path("status"));
    }
    report.status = *parsed;
    r.for_each_element("steps", [&](const nlohmann::json& item, const std::string& item_path) {
        report.steps.push_back(read_step_execution(item, item_path, mode));
    });
    report.meta = r.get_string_map("meta");
    return report;
}

Plan decode_plan(std::string_view payload) {
    return read_plan(parse_single_value(payload), "$", DecodeMode::LENIENT);
}

ExecutionReport decode_execution_report(std::string_view payload) {
    return read_execution_report(parse_single_value(payload), "$", DecodeMode::LENIENT);
}

TopologySnapshot decode_topology_snapshot(std::string_view payload) {
    return read_topology_snapshot(parse_single_value(payload), "$", DecodeMode::LENIENT);
}

StateSnapshot decode_state_snapshot(std::string_view payload) {
    return read_state_snapshot(parse_single_value(payload), "$", DecodeMode::LENIENT);
}

} // namespace stagecraft
