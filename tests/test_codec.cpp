// tests/test_codec.cpp
#include <catch2/catch.hpp>
#include "modules/codec/strict_codec.h"
#include "modules/codec/wire_json.h"
#include "modules/planner/plan_id.h"
#include "core/types/errors.h"
#include "plan_fixtures.h"
#include <limits>

using namespace stagecraft;
using stagecraft::testing::make_plan;
using stagecraft::testing::make_step;

namespace {

Plan sample_plan() {
    Plan plan = make_plan({
        make_step("net", 0, ""),
        make_step("build-api", 1, "host-a", {"net"}, StepAction::BUILD),
        make_step("deploy-api", 2, "host-a", {"build-api"}, StepAction::APPLY_COMPOSE),
    });
    plan.summary = "deploy api";
    plan.meta["env"] = "staging";
    plan.steps[1].target.ns = "apps";
    plan.steps[1].host.labels["role"] = "web";
    plan.steps[1].inputs = nlohmann::json{{"provider", "docker"}, {"tags", {"api:1"}}};
    plan.steps[2].meta["note"] = "rolling";
    return plan;
}

DecodeErrorCode plan_error_code(const std::string& payload) {
    try {
        decode_plan_strict(payload);
    } catch (const DecodeError& e) {
        return e.code();
    }
    FAIL("expected DecodeError");
    return DecodeErrorCode::SYNTAX;
}

} // namespace

TEST_CASE("Plan survives a strict round trip", "[codec]") {
    Plan plan = sample_plan();
    Plan decoded = decode_plan_strict(encode_plan(plan));
    REQUIRE(decoded == plan);
}

TEST_CASE("HostPlan survives a strict round trip", "[codec]") {
    HostPlan hp;
    hp.plan_id = "plan-1";
    hp.host.logical_id = "host-a";
    hp.host.labels["zone"] = "eu";
    HostPlanStep step;
    step.id = "s1";
    step.index = 4;
    step.action = StepAction::HEALTH_CHECK;
    step.target = ResourceRef{"service", "api", "docker-compose", ""};
    step.inputs = nlohmann::json{{"environment", "prod"}};
    step.depends_on = {"s0"};
    hp.steps.push_back(step);

    HostPlan decoded = decode_host_plan_strict(encode_host_plan(hp, 2));
    REQUIRE(decoded == hp);
}

TEST_CASE("Encoding uses the wire field names and sorted keys", "[codec]") {
    Plan plan = sample_plan();
    nlohmann::json j = nlohmann::json::parse(encode_plan(plan));

    REQUIRE(j["version"] == "v1");
    REQUIRE(j["summary"] == "deploy api");
    REQUIRE(j["steps"][1]["action"] == "build");
    REQUIRE(j["steps"][1]["dependsOn"] == nlohmann::json::array({"net"}));
    REQUIRE(j["steps"][1]["host"]["logicalId"] == "host-a");
    REQUIRE(j["steps"][1]["target"]["namespace"] == "apps");
    REQUIRE_FALSE(j["steps"][0].contains("dependsOn"));
    REQUIRE_FALSE(j["steps"][0]["host"].contains("labels"));

    std::string encoded = encode_plan(plan);
    REQUIRE(encoded.find(R"({"id":"plan-test","meta":)") == 0);
    REQUIRE(encoded == encode_plan(decode_plan_strict(encoded)));
}

TEST_CASE("Unknown top-level field is rejected", "[codec]") {
    nlohmann::json j = nlohmann::json::parse(encode_plan(sample_plan()));
    j["extra"] = 1;
    try {
        decode_plan_strict(j.dump());
        FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
        REQUIRE(e.code() == DecodeErrorCode::UNKNOWN_FIELD);
        REQUIRE(e.path() == "$");
        std::string msg = e.what();
        REQUIRE(msg.find("strict decode plan") == 0);
        REQUIRE(msg.find("\"extra\"") != std::string::npos);
    }
}

TEST_CASE("Unknown nested field is rejected with its path", "[codec]") {
    nlohmann::json j = nlohmann::json::parse(encode_plan(sample_plan()));
    j["steps"][1]["host"]["zone"] = "eu";
    try {
        decode_plan_strict(j.dump());
        FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
        REQUIRE(e.code() == DecodeErrorCode::UNKNOWN_FIELD);
        REQUIRE(e.path() == "$.steps[1].host");
    }
}

TEST_CASE("Opaque inputs accept any field", "[codec]") {
    nlohmann::json j = nlohmann::json::parse(encode_plan(sample_plan()));
    j["steps"][1]["inputs"]["anything"] = {{"nested", true}};
    Plan plan = decode_plan_strict(j.dump());
    REQUIRE(plan.steps[1].inputs["anything"]["nested"] == true);
}

TEST_CASE("Trailing content after the value is rejected", "[codec]") {
    std::string payload = encode_plan(sample_plan());

    REQUIRE(plan_error_code(payload + " {}") == DecodeErrorCode::TRAILING_CONTENT);
    REQUIRE(plan_error_code(payload + "garbage") == DecodeErrorCode::TRAILING_CONTENT);
    REQUIRE_NOTHROW(decode_plan_strict(payload + " \n\t "));
}

TEST_CASE("Content hidden behind a NUL byte is rejected", "[codec]") {
    const std::string nul(1, '\0');
    std::string plan = encode_plan(sample_plan());
    REQUIRE(plan_error_code(plan + nul + R"({"smuggled":true})") == DecodeErrorCode::TRAILING_CONTENT);
    REQUIRE(plan_error_code(plan + nul) == DecodeErrorCode::TRAILING_CONTENT);

    std::string host_plan = R"({"version":"v1","planId":"plan-1","host":{"logicalId":"h"},"steps":[]})";
    REQUIRE_NOTHROW(decode_host_plan_strict(host_plan));
    try {
        decode_host_plan_strict(host_plan + nul + "{}");
        FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
        REQUIRE(e.code() == DecodeErrorCode::TRAILING_CONTENT);
    }
}

TEST_CASE("Malformed JSON is a syntax error", "[codec]") {
    REQUIRE(plan_error_code("{\"version\": ") == DecodeErrorCode::SYNTAX);
    REQUIRE(plan_error_code("") == DecodeErrorCode::SYNTAX);
}

TEST_CASE("Schema version must match", "[codec]") {
    nlohmann::json j = nlohmann::json::parse(encode_plan(sample_plan()));
    j["version"] = "v2";
    REQUIRE(plan_error_code(j.dump()) == DecodeErrorCode::VERSION_MISMATCH);

    j.erase("version");
    REQUIRE(plan_error_code(j.dump()) == DecodeErrorCode::VERSION_MISMATCH);
}

TEST_CASE("Type mismatches are rejected", "[codec]") {
    nlohmann::json base = nlohmann::json::parse(encode_plan(sample_plan()));

    SECTION("index not an integer") {
        nlohmann::json j = base;
        j["steps"][0]["index"] = "0";
        REQUIRE(plan_error_code(j.dump()) == DecodeErrorCode::TYPE_MISMATCH);
    }
    SECTION("fractional index") {
        nlohmann::json j = base;
        j["steps"][0]["index"] = 1.5;
        REQUIRE(plan_error_code(j.dump()) == DecodeErrorCode::TYPE_MISMATCH);
    }
    SECTION("index beyond the signed 64-bit range") {
        nlohmann::json j = base;
        j["steps"][0]["index"] = std::numeric_limits<uint64_t>::max();
        REQUIRE(plan_error_code(j.dump()) == DecodeErrorCode::TYPE_MISMATCH);

        std::string host_plan = R"({"version":"v1","planId":"p","host":{"logicalId":"h"},)"
                                R"("steps":[{"id":"a","index":18446744073709551615,"action":"noop"}]})";
        REQUIRE_THROWS_AS(decode_host_plan_strict(host_plan), DecodeError);
    }
    SECTION("largest signed index is kept") {
        nlohmann::json j = base;
        j["steps"][0]["index"] = std::numeric_limits<int64_t>::max();
        REQUIRE(decode_plan_strict(j.dump()).steps[0].index == std::numeric_limits<int64_t>::max());
    }
    SECTION("steps not an array") {
        nlohmann::json j = base;
        j["steps"] = nlohmann::json::object();
        REQUIRE(plan_error_code(j.dump()) == DecodeErrorCode::TYPE_MISMATCH);
    }
    SECTION("unknown action") {
        nlohmann::json j = base;
        j["steps"][2]["action"] = "teleport";
        try {
            decode_plan_strict(j.dump());
            FAIL("expected DecodeError");
        } catch (const DecodeError& e) {
            REQUIRE(e.code() == DecodeErrorCode::TYPE_MISMATCH);
            REQUIRE(e.path() == "$.steps[2].action");
        }
    }
    SECTION("top level not an object") {
        REQUIRE(plan_error_code("[]") == DecodeErrorCode::TYPE_MISMATCH);
    }
}

TEST_CASE("Host plan errors carry the plan id hint", "[codec]") {
    std::string payload = R"({"version":"v1","planId":"plan-42","host":{"logicalId":"h"},"steps":[],"bogus":1})";
    try {
        decode_host_plan_strict(payload, "plan-42");
        FAIL("expected DecodeError");
    } catch (const DecodeError& e) {
        REQUIRE(e.code() == DecodeErrorCode::UNKNOWN_FIELD);
        std::string msg = e.what();
        REQUIRE(msg.find(R"(strict decode host plan (planId: "plan-42"))") == 0);
    }
}

TEST_CASE("peek_plan_id is best effort", "[codec]") {
    REQUIRE(peek_plan_id(R"({"planId":"p-1","junk":true})") == std::optional<std::string>("p-1"));
    REQUIRE_FALSE(peek_plan_id("not json").has_value());
    REQUIRE_FALSE(peek_plan_id(R"({"planId":7})").has_value());
    REQUIRE_FALSE(peek_plan_id("[]").has_value());
}

TEST_CASE("Lenient decoders ignore unknown fields", "[codec]") {
    Plan plan = decode_plan(R"({"version":"v9","id":"p","steps":[{"id":"a","index":0,"action":"noop","x":1}],"y":2})");
    REQUIRE(plan.version == "v9");
    REQUIRE(plan.steps.size() == 1);
    REQUIRE(plan.steps[0].id == "a");

    ExecutionReport report = decode_execution_report(
        R"({"planId":"p","status":"partial","steps":[{"stepId":"a","host":{"logicalId":"h"},"status":"skipped","error":{"code":"NO_EXECUTOR","message":"m"}}]})");
    REQUIRE(report.status == ExecutionStatus::PARTIAL);
    REQUIRE(report.steps[0].status == StepStatus::SKIPPED);
    REQUIRE(report.steps[0].error->code == "NO_EXECUTOR");
}

TEST_CASE("Execution report encoding omits empty fields", "[codec]") {
    ExecutionReport report;
    report.plan_id = "p";
    report.status = ExecutionStatus::SUCCEEDED;
    StepExecution exec;
    exec.step_id = "a";
    exec.host.logical_id = "h";
    exec.status = StepStatus::SUCCEEDED;
    report.steps.push_back(exec);

    REQUIRE(encode_execution_report(report) ==
            R"({"planId":"p","status":"succeeded","steps":[{"host":{"logicalId":"h"},"status":"succeeded","stepId":"a"}]})");

    report.steps[0].error = ExecutionErrorInfo{"EXECUTION_ERROR", "boom"};
    report.steps[0].logs.push_back(LogLine{"2025-01-01T00:00:00.000Z", "system", "boom"});
    ExecutionReport back = decode_execution_report(encode_execution_report(report));
    REQUIRE(back == report);
}

TEST_CASE("Snapshots decode and hash deterministically", "[codec]") {
    TopologySnapshot topo = decode_topology_snapshot(
        R"({"version":"v1","resources":[{"ref":{"kind":"service","name":"web","provider":"docker-compose"},"data":{"image":"nginx"}},
            {"ref":{"kind":"network","name":"default","provider":"docker-compose"},"data":null}]})");
    StateSnapshot state = decode_state_snapshot(R"({"version":"v1","resources":[]})");

    REQUIRE(topo.resources.size() == 2);
    sort_resources(topo.resources);
    REQUIRE(topo.resources[0].ref.kind == "network");
    REQUIRE(topo.resources[1].ref.name == "web");

    std::string id = compute_plan_id(topo, state);
    REQUIRE(id.rfind("plan-", 0) == 0);
    REQUIRE(id.size() == 5 + 16);
    REQUIRE(id == compute_plan_id(topo, state));

    topo.resources[1].data["image"] = "nginx:1.27";
    REQUIRE(id != compute_plan_id(topo, state));
}

TEST_CASE("FNV-1a matches reference vectors", "[codec]") {
    REQUIRE(fnv1a_64("") == 0xcbf29ce484222325ULL);
    REQUIRE(fnv1a_64("a") == 0xaf63dc4c8601ec8cULL);
}
