// tests/test_inputs.cpp
#include <catch2/catch.hpp>
#include "modules/inputs/step_inputs.h"
#include "core/types/errors.h"

using namespace stagecraft;
using namespace stagecraft::inputs;
using nlohmann::json;

namespace {

json valid_build() {
    return json{
        {"provider", "docker"},
        {"workdir", "services/api"},
        {"dockerfile", "Dockerfile"},
        {"context", "."},
        {"tags", {"api:2", " api:1 "}},
        {"build_args", {{{"key", "B"}, {"value", "2"}}, {{"key", "A"}, {"value", "1"}}}},
    };
}

json valid_apply_compose() {
    return json{
        {"environment", "prod"},
        {"compose_path", "deploy/docker-compose.yml"},
        {"project_name", "shop"},
        {"pull", true},
        {"detach", false},
    };
}

} // namespace

TEST_CASE("normalize_path cleans relative paths", "[inputs]") {
    REQUIRE(normalize_path("a//b///c") == "a/b/c");
    REQUIRE(normalize_path("a\\b\\c.yml") == "a/b/c.yml");
    REQUIRE(normalize_path("  dir/file  ") == "dir/file");
    REQUIRE(normalize_path("dir/") == "dir");
    REQUIRE(normalize_path(".") == ".");
}

TEST_CASE("normalize_path rejects unsafe paths", "[inputs]") {
    REQUIRE_THROWS_AS(normalize_path(""), InputsError);
    REQUIRE_THROWS_AS(normalize_path("   "), InputsError);
    REQUIRE_THROWS_AS(normalize_path("/etc/passwd"), InputsError);
    REQUIRE_THROWS_AS(normalize_path("~/secrets"), InputsError);
    REQUIRE_THROWS_AS(normalize_path("C:/Windows"), InputsError);
    REQUIRE_THROWS_AS(normalize_path("a/../b"), InputsError);
    REQUIRE_THROWS_AS(normalize_path("./a"), InputsError);
}

TEST_CASE("sha256 hashes must be 64 lowercase hex characters", "[inputs]") {
    REQUIRE_NOTHROW(validate_sha256_hex64(std::string(64, 'a')));
    REQUIRE_THROWS_AS(validate_sha256_hex64(std::string(63, 'a')), InputsError);
    REQUIRE_THROWS_AS(validate_sha256_hex64(std::string(64, 'A')), InputsError);
    REQUIRE_THROWS_AS(validate_sha256_hex64(std::string(64, 'g')), InputsError);
}

TEST_CASE("Build inputs decode, normalize and validate", "[inputs]") {
    BuildInputs in = BuildInputs::decode(valid_build());
    in.normalize();
    REQUIRE_NOTHROW(in.validate());

    REQUIRE(in.tags == std::vector<std::string>{"api:1", "api:2"});
    REQUIRE(in.build_args.size() == 2);
    REQUIRE(in.build_args[0].key == "A");
    REQUIRE(in.context == ".");
    REQUIRE(in.workdir == "services/api");
}

TEST_CASE("Build inputs reject unknown fields and missing requirements", "[inputs]") {
    json extra = valid_build();
    extra["cache"] = true;
    REQUIRE_THROWS_AS(BuildInputs::decode(extra), InputsError);

    json missing = valid_build();
    missing.erase("dockerfile");
    BuildInputs in = BuildInputs::decode(missing);
    in.normalize();
    REQUIRE_THROWS_AS(in.validate(), InputsError);
}

TEST_CASE("Apply compose requires explicit pull and detach", "[inputs]") {
    ApplyComposeInputs ok = ApplyComposeInputs::decode(valid_apply_compose());
    ok.normalize();
    REQUIRE_NOTHROW(ok.validate());
    REQUIRE(ok.detach == false);

    json no_pull = valid_apply_compose();
    no_pull.erase("pull");
    ApplyComposeInputs in = ApplyComposeInputs::decode(no_pull);
    in.normalize();
    REQUIRE_THROWS_AS(in.validate(), InputsError);
}

TEST_CASE("Apply compose validates the expected hash pair", "[inputs]") {
    json j = valid_apply_compose();
    j["expected_compose_hash_alg"] = "md5";
    j["expected_compose_hash"] = std::string(64, 'f');
    ApplyComposeInputs in = ApplyComposeInputs::decode(j);
    in.normalize();
    REQUIRE_THROWS_AS(in.validate(), InputsError);

    j["expected_compose_hash_alg"] = "sha256";
    ApplyComposeInputs good = ApplyComposeInputs::decode(j);
    good.normalize();
    REQUIRE_NOTHROW(good.validate());
}

TEST_CASE("Render compose needs exactly one base", "[inputs]") {
    json j{{"environment", "dev"}, {"output_path", "out/compose.yml"}};

    RenderComposeInputs none = RenderComposeInputs::decode(j);
    none.normalize();
    REQUIRE_THROWS_AS(none.validate(), InputsError);

    j["base_compose_path"] = "compose.yml";
    j["base_compose_inline"] = "services: {}";
    RenderComposeInputs both = RenderComposeInputs::decode(j);
    both.normalize();
    REQUIRE_THROWS_AS(both.validate(), InputsError);

    j.erase("base_compose_inline");
    j["overlays"] = json::array({{{"name", "z"}, {"path", "z.yml"}}, {{"name", "a"}, {"path", "over//a.yml"}}});
    RenderComposeInputs one = RenderComposeInputs::decode(j);
    one.normalize();
    REQUIRE_NOTHROW(one.validate());
    REQUIRE(one.overlays[0].name == "a");
    REQUIRE(one.overlays[0].path == "over/a.yml");
}

TEST_CASE("Health check needs exactly one of endpoints or services", "[inputs]") {
    json j{{"environment", "prod"}};
    HealthCheckInputs none = HealthCheckInputs::decode(j);
    none.normalize();
    REQUIRE_THROWS_AS(none.validate(), InputsError);

    j["services"] = {"web", "api"};
    HealthCheckInputs svc = HealthCheckInputs::decode(j);
    svc.normalize();
    REQUIRE_NOTHROW(svc.validate());
    REQUIRE(svc.services == std::vector<std::string>{"api", "web"});

    j["retries"] = -1;
    HealthCheckInputs bad = HealthCheckInputs::decode(j);
    bad.normalize();
    REQUIRE_THROWS_AS(bad.validate(), InputsError);
}

TEST_CASE("Health check endpoints are checked field by field", "[inputs]") {
    json ep{{"name", "api"}, {"url", "http://localhost/health"}, {"expected_status", 200}, {"method", "GET"}};
    json j{{"environment", "prod"}, {"endpoints", {ep}}};
    HealthCheckInputs ok = HealthCheckInputs::decode(j);
    ok.normalize();
    REQUIRE_NOTHROW(ok.validate());

    j["endpoints"][0].erase("method");
    HealthCheckInputs no_method = HealthCheckInputs::decode(j);
    no_method.normalize();
    REQUIRE_THROWS_AS(no_method.validate(), InputsError);

    j["endpoints"][0]["verb"] = "GET";
    REQUIRE_THROWS_AS(HealthCheckInputs::decode(j), InputsError);
}

TEST_CASE("Migrate and rollout validation", "[inputs]") {
    json migrate{{"database", "main"}, {"strategy", "up"}, {"engine", "postgres"},
                 {"path", "db/migrations"}, {"conn_env", "DATABASE_URL"}, {"args", {"--verbose"}}};
    REQUIRE_NOTHROW(check_step_inputs(StepAction::MIGRATE, migrate));

    migrate["timeout_seconds"] = -5;
    REQUIRE_THROWS_AS(check_step_inputs(StepAction::MIGRATE, migrate), InputsError);

    json rollout{{"mode", "rolling"}, {"batch_size", 2}, {"targets", {"b", "a"}}};
    REQUIRE_NOTHROW(check_step_inputs(StepAction::ROLLOUT, rollout));

    rollout["batch_size"] = 0;
    REQUIRE_NOTHROW(check_step_inputs(StepAction::ROLLOUT, rollout));
    rollout["batch_size"] = -1;
    REQUIRE_THROWS_AS(check_step_inputs(StepAction::ROLLOUT, rollout), InputsError);

    rollout["batch_size"] = "2";
    REQUIRE_THROWS_AS(check_step_inputs(StepAction::ROLLOUT, rollout), InputsError);
}

TEST_CASE("check_step_inputs dispatches on the action", "[inputs]") {
    REQUIRE_NOTHROW(check_step_inputs(StepAction::NOOP, json{{"whatever", 1}}));
    REQUIRE_NOTHROW(check_step_inputs(StepAction::CREATE, json()));
    REQUIRE_NOTHROW(check_step_inputs(StepAction::BUILD, valid_build()));
    REQUIRE_THROWS_AS(check_step_inputs(StepAction::BUILD, json()), InputsError);
    REQUIRE_THROWS_AS(check_step_inputs(StepAction::BUILD, json::array()), InputsError);

    try {
        check_step_inputs(StepAction::APPLY_COMPOSE, json{{"environment", "prod"}});
        FAIL("expected InputsError");
    } catch (const InputsError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("apply_compose inputs validation failed") == 0);
    }
}
