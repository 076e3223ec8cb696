// modules/config/engine_config.cpp
#include "modules/config/engine_config.h"
#include "common/utils/yaml_json.h"
#include "core/types/errors.h"
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace stagecraft {

namespace {

[[noreturn]] void bad_type(const std::string& key, const char* expected) {
    throw ConfigError("config key \"" + key + "\" must be " + expected);
}

void warn_unknown_keys(const nlohmann::json& obj, const std::string& prefix,
                       std::initializer_list<const char*> known) {
    for (const auto& [key, _] : obj.items()) {
        bool found = false;
        for (const char* k : known) {
            if (key == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            log::warn("ignoring unknown config key \"" + prefix + key + "\"");
        }
    }
}

int read_int(const nlohmann::json& v, const std::string& key, int min_value) {
    if (!v.is_number_integer()) bad_type(key, "an integer");
    if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw ConfigError("config key \"" + key + "\" out of range: " + v.dump());
    }
    const int64_t n = v.get<int64_t>();
    if (n < min_value || n > std::numeric_limits<int>::max()) {
        throw ConfigError("config key \"" + key + "\" out of range: " + std::to_string(n));
    }
    return static_cast<int>(n);
}

void read_execution(const nlohmann::json& exec, ExecOptions& out) {
    if (exec.is_null()) return;
    if (!exec.is_object()) bad_type("execution", "a mapping");
    warn_unknown_keys(exec, "execution.", {"dry_run", "max_parallel", "step_filter"});

    if (auto it = exec.find("dry_run"); it != exec.end() && !it->is_null()) {
        if (!it->is_boolean()) bad_type("execution.dry_run", "a boolean");
        out.dry_run = it->get<bool>();
    }
    if (auto it = exec.find("max_parallel"); it != exec.end() && !it->is_null()) {
        out.max_parallel = read_int(*it, "execution.max_parallel", 0);
    }
    if (auto it = exec.find("step_filter"); it != exec.end() && !it->is_null()) {
        if (!it->is_array()) bad_type("execution.step_filter", "a list of step ids");
        out.step_filter.clear();
        for (const auto& id : *it) {
            if (!id.is_string()) bad_type("execution.step_filter", "a list of step ids");
            out.step_filter.push_back(id.get<std::string>());
        }
    }
}

} // namespace

EngineConfig EngineConfig::from_json(const nlohmann::json& doc) {
    EngineConfig config;
    if (doc.is_null()) {
        return config;
    }
    if (!doc.is_object()) {
        throw ConfigError("config document must be a mapping");
    }
    warn_unknown_keys(doc, "", {"log_level", "execution", "output"});

    if (auto it = doc.find("log_level"); it != doc.end() && !it->is_null()) {
        if (!it->is_string()) bad_type("log_level", "a string");
        auto level = parse_log_level(it->get<std::string>());
        if (!level) {
            throw ConfigError("unknown log_level \"" + it->get<std::string>() +
                              "\" (expected debug, info, warn or error)");
        }
        config.log_level = *level;
    }

    if (auto it = doc.find("execution"); it != doc.end()) {
        read_execution(*it, config.execution);
    }

    if (auto it = doc.find("output"); it != doc.end() && !it->is_null()) {
        if (!it->is_object()) bad_type("output", "a mapping");
        warn_unknown_keys(*it, "output.", {"indent"});
        if (auto ind = it->find("indent"); ind != it->end() && !ind->is_null()) {
            config.output_indent = read_int(*ind, "output.indent", -1);
        }
    }
    return config;
}

EngineConfig EngineConfig::from_string(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("malformed config: ") + e.what());
    }
    return from_json(yaml_to_json(root));
}

EngineConfig EngineConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        log::warn("config file not found: " + path + ", using defaults");
        return EngineConfig{};
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return from_string(buffer.str());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace stagecraft
