// modules/inputs/step_inputs.h
#ifndef STAGECRAFT_MODULES_INPUTS_STEP_INPUTS_H
#define STAGECRAFT_MODULES_INPUTS_STEP_INPUTS_H

#include "core/types/plan.h"
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace stagecraft::inputs {

// Typed views over PlanStep::inputs for the well-known actions.
// Every type offers:
//   decode(json)  strict decode, unknown fields rejected
//   normalize()   trim strings, sort unordered lists, clean relative paths
//   validate()    required fields and value ranges
// All three throw InputsError.

struct KeyValue {
    std::string key;
    std::string value;

    bool operator==(const KeyValue&) const = default;
};

struct ComposeOverlay {
    std::string name;
    std::string path;

    bool operator==(const ComposeOverlay&) const = default;
};

struct HealthEndpoint {
    std::string name;
    std::string url;
    int64_t expected_status = 0;
    std::string method;
    std::vector<KeyValue> headers;

    bool operator==(const HealthEndpoint&) const = default;
};

struct BuildInputs {
    std::string provider;
    std::string workdir;
    std::string target;
    std::string dockerfile;
    std::string context;
    std::vector<std::string> tags;
    std::vector<KeyValue> build_args;
    std::vector<KeyValue> labels;

    static BuildInputs decode(const nlohmann::json& j);
    void normalize();
    void validate() const;
};

struct MigrateInputs {
    std::string database;
    std::string strategy;
    std::string engine;
    std::string path;
    std::string conn_env;
    int64_t timeout_seconds = 0;
    std::vector<std::string> args; // order is significant

    static MigrateInputs decode(const nlohmann::json& j);
    void normalize();
    void validate() const;
};

struct ApplyComposeInputs {
    std::string environment;
    std::string compose_path;
    std::string project_name;
    std::optional<bool> pull;   // producer must set explicitly
    std::optional<bool> detach; // producer must set explicitly
    std::vector<std::string> services;
    std::string expected_compose_hash_alg;
    std::string expected_compose_hash;

    static ApplyComposeInputs decode(const nlohmann::json& j);
    void normalize();
    void validate() const;
};

struct RenderComposeInputs {
    std::string environment;
    std::string base_compose_path;
    std::string base_compose_inline;
    std::vector<ComposeOverlay> overlays;
    std::vector<KeyValue> variables;
    std::string output_path;
    std::string expected_compose_hash_alg;
    std::string expected_compose_hash;

    static RenderComposeInputs decode(const nlohmann::json& j);
    void normalize();
    void validate() const;
};

struct RolloutInputs {
    std::string mode;
    int64_t batch_size = 0;
    std::vector<std::string> targets;

    static RolloutInputs decode(const nlohmann::json& j);
    void normalize();
    void validate() const;
};

struct HealthCheckInputs {
    std::string environment;
    std::vector<HealthEndpoint> endpoints; // exactly one of endpoints / services
    std::vector<std::string> services;
    int64_t timeout_seconds = 0;
    int64_t interval_seconds = 0;
    int64_t retries = 0;

    static HealthCheckInputs decode(const nlohmann::json& j);
    void normalize();
    void validate() const;
};

// Trimmed copy.
std::string normalize_string(std::string_view s);

// Clean a relative path: "\" becomes "/", duplicate slashes collapse.
// Empty, absolute ("/x", "~/x", "C:/x") and "."/".." segment paths are rejected;
// a lone "." is accepted.
std::string normalize_path(std::string_view p);

// 64 lowercase hex characters.
void validate_sha256_hex64(std::string_view hash);

// Decode, normalize and validate the inputs of a step with a typed action.
// Actions without a typed schema (create, update, delete, noop) accept anything.
void check_step_inputs(StepAction action, const nlohmann::json& inputs);

} // namespace stagecraft::inputs

#endif // STAGECRAFT_MODULES_INPUTS_STEP_INPUTS_H
