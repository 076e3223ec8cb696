// modules/inputs/step_inputs.cpp
#include "modules/inputs/step_inputs.h"
#include "modules/codec/json_reader.h"
#include "core/types/errors.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace stagecraft::inputs {

namespace {

const nlohmann::json kEmptyObject = nlohmann::json::object();

// Decode runs through the strict JSON reader; its errors surface as InputsError.
template<typename Fn>
auto decode_strict(std::string_view kind, const nlohmann::json& j, Fn&& fn) {
    const nlohmann::json& src = j.is_null() ? kEmptyObject : j;
    try {
        return fn(src);
    } catch (const DecodeError& e) {
        throw InputsError("invalid " + std::string(kind) + " inputs: " + e.what());
    }
}

[[noreturn]] void fail(const std::string& message) {
    throw InputsError(message);
}

std::vector<KeyValue> read_key_values(const JsonObjectReader& r, std::string_view name) {
    std::vector<KeyValue> out;
    r.for_each_element(name, [&out](const nlohmann::json& item, const std::string& path) {
        JsonObjectReader ir(item, path, DecodeMode::STRICT, {"key", "value"});
        out.push_back({ir.get_string("key"), ir.get_string("value")});
    });
    return out;
}

void normalize_strings(std::vector<std::string>& values) {
    for (auto& v : values) v = normalize_string(v);
}

void normalize_key_values(std::vector<KeyValue>& items) {
    for (auto& kv : items) {
        kv.key = normalize_string(kv.key);
        kv.value = normalize_string(kv.value);
    }
    std::stable_sort(items.begin(), items.end(),
                     [](const KeyValue& a, const KeyValue& b) { return a.key < b.key; });
}

void require(const std::string& value, const char* field, const char* suffix = "") {
    if (value.empty()) fail(std::string(field) + " is required" + suffix);
}

void require_positive_if_set(int64_t value, const char* field) {
    if (value < 0) fail(std::string(field) + " must be > 0 if present");
}

void require_no_empty(const std::vector<std::string>& values, const char* field) {
    for (const auto& v : values) {
        if (normalize_string(v).empty()) fail(std::string(field) + " contains empty value");
    }
}

void validate_expected_hash(const std::string& alg, const std::string& hash) {
    if (alg.empty() && hash.empty()) return;
    if (alg != "sha256") fail("expected_compose_hash_alg must be 'sha256'");
    try {
        validate_sha256_hex64(hash);
    } catch (const InputsError& e) {
        fail(std::string("expected_compose_hash: ") + e.what());
    }
}

std::string normalize_path_field(const std::string& value, const std::string& field) {
    try {
        return normalize_path(value);
    } catch (const InputsError& e) {
        fail(field + ": " + e.what());
    }
}

} // namespace

// --- helpers ---

std::string normalize_string(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

std::string normalize_path(std::string_view raw) {
    std::string p(raw);
    std::replace(p.begin(), p.end(), '\\', '/');
    p = normalize_string(p);
    if (p.empty()) fail("path is empty");

    if (p[0] == '/' || p[0] == '~' || p.find(":/") != std::string::npos) {
        fail("path must be relative: \"" + p + "\"");
    }
    if (p == ".") return p;

    std::vector<std::string> segments;
    std::stringstream ss(p);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (part == "." || part == "..") {
            fail("path must not contain '.' or '..' segments: \"" + p + "\"");
        }
        if (!part.empty()) segments.push_back(part);
    }
    if (segments.empty()) fail("path invalid after clean: \"" + p + "\"");

    std::string clean;
    for (const auto& seg : segments) {
        if (!clean.empty()) clean += '/';
        clean += seg;
    }
    return clean;
}

void validate_sha256_hex64(std::string_view hash) {
    static const std::regex kLowerHex64("^[0-9a-f]{64}$");
    if (!std::regex_match(hash.begin(), hash.end(), kLowerHex64)) {
        fail("sha256 hash must be 64 lowercase hex chars: \"" + std::string(hash) + "\"");
    }
}

// --- build ---

BuildInputs BuildInputs::decode(const nlohmann::json& j) {
    return decode_strict("build", j, [](const nlohmann::json& src) {
        JsonObjectReader r(src, "$", DecodeMode::STRICT,
                           {"provider", "workdir", "target", "dockerfile", "context", "tags", "build_args", "labels"});
        BuildInputs in;
        in.provider = r.get_string("provider");
        in.workdir = r.get_string("workdir");
        in.target = r.get_string("target");
        in.dockerfile = r.get_string("dockerfile");
        in.context = r.get_string("context");
        in.tags = r.get_string_list("tags");
        in.build_args = read_key_values(r, "build_args");
        in.labels = read_key_values(r, "labels");
        return in;
    });
}

void BuildInputs::normalize() {
    provider = normalize_string(provider);
    workdir = normalize_string(workdir);
    target = normalize_string(target);
    dockerfile = normalize_string(dockerfile);
    context = normalize_string(context);
    normalize_strings(tags);
    std::sort(tags.begin(), tags.end());
    normalize_key_values(build_args);
    normalize_key_values(labels);

    if (!workdir.empty()) workdir = normalize_path_field(workdir, "workdir");
    if (!dockerfile.empty()) dockerfile = normalize_path_field(dockerfile, "dockerfile");
    if (!context.empty()) context = normalize_path_field(context, "context");
}

void BuildInputs::validate() const {
    require(provider, "provider");
    require(workdir, "workdir");
    require(dockerfile, "dockerfile", " (producer must set explicitly)");
    require(context, "context", " (producer must set explicitly)");
    require_no_empty(tags, "tags");
    for (const auto& a : build_args) {
        if (a.key.empty()) fail("build_args.key is required");
    }
    for (const auto& l : labels) {
        if (l.key.empty()) fail("labels.key is required");
    }
}

// --- migrate ---

MigrateInputs MigrateInputs::decode(const nlohmann::json& j) {
    return decode_strict("migrate", j, [](const nlohmann::json& src) {
        JsonObjectReader r(src, "$", DecodeMode::STRICT,
                           {"database", "strategy", "engine", "path", "conn_env", "timeout_seconds", "args"});
        MigrateInputs in;
        in.database = r.get_string("database");
        in.strategy = r.get_string("strategy");
        in.engine = r.get_string("engine");
        in.path = r.get_string("path");
        in.conn_env = r.get_string("conn_env");
        in.timeout_seconds = r.get_int("timeout_seconds");
        in.args = r.get_string_list("args");
        return in;
    });
}

void MigrateInputs::normalize() {
    database = normalize_string(database);
    strategy = normalize_string(strategy);
    engine = normalize_string(engine);
    conn_env = normalize_string(conn_env);
    normalize_strings(args);
    path = normalize_path_field(path, "path");
}

void MigrateInputs::validate() const {
    require(database, "database");
    require(strategy, "strategy");
    require(engine, "engine");
    require(path, "path");
    require(conn_env, "conn_env");
    require_positive_if_set(timeout_seconds, "timeout_seconds");
}

// --- apply_compose ---

ApplyComposeInputs ApplyComposeInputs::decode(const nlohmann::json& j) {
    return decode_strict("apply_compose", j, [](const nlohmann::json& src) {
        JsonObjectReader r(src, "$", DecodeMode::STRICT,
                           {"environment", "compose_path", "project_name", "pull", "detach", "services",
                            "expected_compose_hash_alg", "expected_compose_hash"});
        ApplyComposeInputs in;
        in.environment = r.get_string("environment");
        in.compose_path = r.get_string("compose_path");
        in.project_name = r.get_string("project_name");
        in.pull = r.get_optional_bool("pull");
        in.detach = r.get_optional_bool("detach");
        in.services = r.get_string_list("services");
        in.expected_compose_hash_alg = r.get_string("expected_compose_hash_alg");
        in.expected_compose_hash = r.get_string("expected_compose_hash");
        return in;
    });
}

void ApplyComposeInputs::normalize() {
    environment = normalize_string(environment);
    project_name = normalize_string(project_name);
    expected_compose_hash_alg = normalize_string(expected_compose_hash_alg);
    expected_compose_hash = normalize_string(expected_compose_hash);
    normalize_strings(services);
    std::sort(services.begin(), services.end());
    compose_path = normalize_path_field(compose_path, "compose_path");
}

void ApplyComposeInputs::validate() const {
    require(environment, "environment");
    require(compose_path, "compose_path");
    require(project_name, "project_name");
    if (!pull) fail("pull is required (producer must set explicitly)");
    if (!detach) fail("detach is required (producer must set explicitly)");
    require_no_empty(services, "services");
    validate_expected_hash(expected_compose_hash_alg, expected_compose_hash);
}

// --- render_compose ---

RenderComposeInputs RenderComposeInputs::decode(const nlohmann::json& j) {
    return decode_strict("render_compose", j, [](const nlohmann::json& src) {
        JsonObjectReader r(src, "$", DecodeMode::STRICT,
                           {"environment", "base_compose_path", "base_compose_inline", "overlays", "variables",
                            "output_path", "expected_compose_hash_alg", "expected_compose_hash"});
        RenderComposeInputs in;
        in.environment = r.get_string("environment");
        in.base_compose_path = r.get_string("base_compose_path");
        in.base_compose_inline = r.get_string("base_compose_inline");
        r.for_each_element("overlays", [&in](const nlohmann::json& item, const std::string& path) {
            JsonObjectReader ir(item, path, DecodeMode::STRICT, {"name", "path"});
            in.overlays.push_back({ir.get_string("name"), ir.get_string("path")});
        });
        in.variables = read_key_values(r, "variables");
        in.output_path = r.get_string("output_path");
        in.expected_compose_hash_alg = r.get_string("expected_compose_hash_alg");
        in.expected_compose_hash = r.get_string("expected_compose_hash");
        return in;
    });
}

void RenderComposeInputs::normalize() {
    environment = normalize_string(environment);
    base_compose_path = normalize_string(base_compose_path);
    base_compose_inline = normalize_string(base_compose_inline);
    expected_compose_hash_alg = normalize_string(expected_compose_hash_alg);
    expected_compose_hash = normalize_string(expected_compose_hash);

    for (size_t i = 0; i < overlays.size(); ++i) {
        overlays[i].name = normalize_string(overlays[i].name);
        overlays[i].path = normalize_path_field(overlays[i].path,
                                                "overlays[" + std::to_string(i) + "].path");
    }
    std::stable_sort(overlays.begin(), overlays.end(),
                     [](const ComposeOverlay& a, const ComposeOverlay& b) { return a.name < b.name; });
    normalize_key_values(variables);

    if (!base_compose_path.empty()) {
        base_compose_path = normalize_path_field(base_compose_path, "base_compose_path");
    }
    output_path = normalize_path_field(output_path, "output_path");
}

void RenderComposeInputs::validate() const {
    require(environment, "environment");
    require(output_path, "output_path");
    if (base_compose_path.empty() == base_compose_inline.empty()) {
        fail("exactly one of base_compose_path or base_compose_inline must be provided");
    }
    validate_expected_hash(expected_compose_hash_alg, expected_compose_hash);
    for (const auto& o : overlays) {
        if (o.name.empty()) fail("overlays.name is required");
        if (o.path.empty()) fail("overlays.path is required");
    }
    for (const auto& v : variables) {
        if (v.key.empty()) fail("variables.key is required");
    }
}

// --- rollout ---

RolloutInputs RolloutInputs::decode(const nlohmann::json& j) {
    return decode_strict("rollout", j, [](const nlohmann::json& src) {
        JsonObjectReader r(src, "$", DecodeMode::STRICT, {"mode", "batch_size", "targets"});
        RolloutInputs in;
        in.mode = r.get_string("mode");
        in.batch_size = r.get_int("batch_size");
        in.targets = r.get_string_list("targets");
        return in;
    });
}

void RolloutInputs::normalize() {
    mode = normalize_string(mode);
    normalize_strings(targets);
    std::sort(targets.begin(), targets.end());
}

void RolloutInputs::validate() const {
    require(mode, "mode");
    require_positive_if_set(batch_size, "batch_size");
    require_no_empty(targets, "targets");
}

// --- health_check ---

HealthCheckInputs HealthCheckInputs::decode(const nlohmann::json& j) {
    return decode_strict("health_check", j, [](const nlohmann::json& src) {
        JsonObjectReader r(src, "$", DecodeMode::STRICT,
                           {"environment", "endpoints", "services", "timeout_seconds", "interval_seconds", "retries"});
        HealthCheckInputs in;
        in.environment = r.get_string("environment");
        r.for_each_element("endpoints", [&in](const nlohmann::json& item, const std::string& path) {
            JsonObjectReader ir(item, path, DecodeMode::STRICT,
                                {"name", "url", "expected_status", "method", "headers"});
            HealthEndpoint ep;
            ep.name = ir.get_string("name");
            ep.url = ir.get_string("url");
            ep.expected_status = ir.get_int("expected_status");
            ep.method = ir.get_string("method");
            ep.headers = read_key_values(ir, "headers");
            in.endpoints.push_back(std::move(ep));
        });
        in.services = r.get_string_list("services");
        in.timeout_seconds = r.get_int("timeout_seconds");
        in.interval_seconds = r.get_int("interval_seconds");
        in.retries = r.get_int("retries");
        return in;
    });
}

void HealthCheckInputs::normalize() {
    environment = normalize_string(environment);
    normalize_strings(services);
    std::sort(services.begin(), services.end());
    for (auto& ep : endpoints) {
        ep.name = normalize_string(ep.name);
        ep.url = normalize_string(ep.url);
        ep.method = normalize_string(ep.method);
        normalize_key_values(ep.headers);
    }
    std::stable_sort(endpoints.begin(), endpoints.end(),
                     [](const HealthEndpoint& a, const HealthEndpoint& b) { return a.name < b.name; });
}

void HealthCheckInputs::validate() const {
    require(environment, "environment");
    if (endpoints.empty() == services.empty()) {
        fail("exactly one of endpoints or services must be provided");
    }
    require_positive_if_set(timeout_seconds, "timeout_seconds");
    require_positive_if_set(interval_seconds, "interval_seconds");
    if (retries < 0) fail("retries must be >= 0 if present");
    require_no_empty(services, "services");
    for (const auto& ep : endpoints) {
        if (ep.name.empty()) fail("endpoints.name is required");
        if (ep.url.empty()) fail("endpoints.url is required");
        if (ep.expected_status <= 0) fail("endpoints.expected_status must be a valid HTTP status");
        if (ep.method.empty()) fail("endpoints.method is required (producer must set explicitly)");
        for (const auto& h : ep.headers) {
            if (h.key.empty()) fail("endpoints.headers.key is required");
        }
    }
}

// --- dispatch ---

namespace {

template<typename Inputs>
void check_typed(std::string_view action, const nlohmann::json& raw) {
    Inputs in = Inputs::decode(raw);
    try {
        in.normalize();
        in.validate();
    } catch (const InputsError& e) {
        fail(std::string(action) + " inputs validation failed: " + e.what());
    }
}

} // namespace

void check_step_inputs(StepAction action, const nlohmann::json& raw) {
    switch (action) {
        case StepAction::BUILD: return check_typed<BuildInputs>("build", raw);
        case StepAction::MIGRATE: return check_typed<MigrateInputs>("migrate", raw);
        case StepAction::APPLY_COMPOSE: return check_typed<ApplyComposeInputs>("apply_compose", raw);
        case StepAction::RENDER_COMPOSE: return check_typed<RenderComposeInputs>("render_compose", raw);
        case StepAction::ROLLOUT: return check_typed<RolloutInputs>("rollout", raw);
        case StepAction::HEALTH_CHECK: return check_typed<HealthCheckInputs>("health_check", raw);
        case StepAction::CREATE:
        case StepAction::UPDATE:
        case StepAction::DELETE:
        case StepAction::NOOP:
            return;
    }
}

} // namespace stagecraft::inputs
