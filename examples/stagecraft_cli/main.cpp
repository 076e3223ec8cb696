// main.cpp
#include "modules/codec/strict_codec.h"
#include "modules/codec/wire_json.h"
#include "modules/config/engine_config.h"
#include "modules/executor/host_plan_executor.h"
#include "modules/executor/stub_step_executor.h"
#include "modules/slicer/plan_slicer.h"
#include "common/utils/log.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_usage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " plan slice <plan.json> [--output-dir DIR] [--config FILE]\n"
              << "  " << prog << " agent run <hostplan.json> [--output FILE] [--config FILE]\n";
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot write file: " + path.string());
    }
    file << content << '\n';
    if (!file) {
        throw std::runtime_error("failed writing file: " + path.string());
    }
}

// "<positional> [--flag value]..." after the subcommand words.
struct Args {
    std::string input;
    std::string output;
    std::string output_dir;
    std::string config;
};

Args parse_args(int argc, char* argv[], int first) {
    Args args;
    for (int i = first; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("missing value for " + a);
            }
            return argv[++i];
        };
        if (a == "--output") {
            args.output = value();
        } else if (a == "--output-dir") {
            args.output_dir = value();
        } else if (a == "--config") {
            args.config = value();
        } else if (!a.empty() && a[0] == '-') {
            throw std::runtime_error("unknown option: " + a);
        } else if (args.input.empty()) {
            args.input = a;
        } else {
            throw std::runtime_error("unexpected argument: " + a);
        }
    }
    if (args.input.empty()) {
        throw std::runtime_error("missing input file");
    }
    return args;
}

stagecraft::EngineConfig load_config(const Args& args) {
    stagecraft::EngineConfig config;
    if (!args.config.empty()) {
        config = stagecraft::EngineConfig::load(args.config);
    }
    stagecraft::log::set_level(config.log_level);
    return config;
}

int run_plan_slice(const Args& args) {
    auto config = load_config(args);

    const std::string payload = read_file(args.input);
    stagecraft::Plan plan = stagecraft::decode_plan_strict(payload);
    stagecraft::SliceResult sliced = stagecraft::slice_plan(plan);
    stagecraft::log::info("sliced plan \"" + plan.id + "\" into " +
                          std::to_string(sliced.host_plans.size()) + " host plans");

    if (args.output_dir.empty()) {
        nlohmann::json out = nlohmann::json::object();
        out["hostPlans"] = sliced.host_plans;
        out["globalSteps"] = sliced.global_steps;
        std::cout << out.dump(config.output_indent) << "\n";
        return 0;
    }

    std::filesystem::path dir(args.output_dir);
    std::filesystem::create_directories(dir);
    for (const auto& [host, host_plan] : sliced.host_plans) {
        auto path = dir / stagecraft::host_plan_file_name(host);
        write_file(path, stagecraft::encode_host_plan(host_plan, config.output_indent));
        std::cout << "Wrote " << path.string() << " (" << host_plan.steps.size() << " steps)\n";
    }
    nlohmann::json globals = sliced.global_steps;
    auto global_path = dir / "global-steps.json";
    write_file(global_path, globals.dump(config.output_indent));
    std::cout << "Wrote " << global_path.string() << " (" << sliced.global_steps.size() << " steps)\n";
    return 0;
}

int run_agent(const Args& args) {
    auto config = load_config(args);

    const std::string payload = read_file(args.input);
    const std::string plan_id = stagecraft::peek_plan_id(payload).value_or("");
    stagecraft::HostPlan host_plan = stagecraft::decode_host_plan_strict(payload, plan_id);

    stagecraft::ExecutorRegistry registry;
    stagecraft::register_stub_executors(registry);
    stagecraft::HostPlanExecutor executor(registry);

    stagecraft::ExecutionReport report = executor.execute_host_plan(host_plan, config.exec_options());
    const std::string json = stagecraft::encode_execution_report(report, config.output_indent);

    if (args.output.empty()) {
        std::cout << json << "\n";
    } else {
        write_file(args.output, json);
        std::cout << "Execution report written to " << args.output << "\n";
    }
    stagecraft::log::info("host plan status: " + std::string(stagecraft::to_string(report.status)));
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string group = argv[1];
    const std::string command = argv[2];

    try {
        if (group == "plan" && command == "slice") {
            return run_plan_slice(parse_args(argc, argv, 3));
        }
        if (group == "agent" && command == "run") {
            return run_agent(parse_args(argc, argv, 3));
        }
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
}
