// modules/codec/strict_codec.cpp
#include "modules/codec/strict_codec.h"
#include "modules/codec/json_reader.h"
#include "modules/codec/wire_json.h"
#include "core/types/errors.h"

namespace stagecraft {

namespace {

void check_version(const std::string& actual, std::string_view expected) {
    if (actual != expected) {
        throw DecodeError(DecodeErrorCode::VERSION_MISMATCH, "$.version",
                          "schema version \"" + actual + "\" does not match expected \"" +
                          std::string(expected) + "\"");
    }
}

// Re-throw with the decoder context prepended, keeping code and path.
[[noreturn]] void rethrow_with_context(const DecodeError& e, const std::string& context) {
    throw DecodeError(e.code(), e.path(), context + ": " + e.what());
}

} // namespace

Plan decode_plan_strict(std::string_view payload) {
    try {
        Plan plan = read_plan(parse_single_value(payload), "$", DecodeMode::STRICT);
        check_version(plan.version, kPlanSchemaVersion);
        return plan;
    } catch (const DecodeError& e) {
        rethrow_with_context(e, "strict decode plan");
    }
}

HostPlan decode_host_plan_strict(std::string_view payload, const std::string& plan_id_hint) {
    try {
        HostPlan plan = read_host_plan(parse_single_value(payload), "$", DecodeMode::STRICT);
        check_version(plan.version, kHostPlanSchemaVersion);
        return plan;
    } catch (const DecodeError& e) {
        std::string context = "strict decode host plan";
        if (!plan_id_hint.empty()) {
            context += " (planId: \"" + plan_id_hint + "\")";
        }
        rethrow_with_context(e, context);
    }
}

std::optional<std::string> peek_plan_id(std::string_view payload) noexcept {
    try {
        auto doc = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
        if (!doc.is_object()) return std::nullopt;
        auto it = doc.find("planId");
        if (it == doc.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace stagecraft
