// modules/config/engine_config.h
#ifndef STAGECRAFT_MODULES_CONFIG_ENGINE_CONFIG_H
#define STAGECRAFT_MODULES_CONFIG_ENGINE_CONFIG_H

#include "core/types/options.h"
#include "common/utils/log.h"
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace stagecraft {

// Runtime settings for the CLI and the local engine.
//
//   log_level: info          # debug | info | warn | error
//   execution:
//     dry_run: false
//     max_parallel: 1
//     step_filter: []
//   output:
//     indent: 2              # -1 for compact JSON
//
// YAML and JSON files are both accepted. Unknown keys are logged and ignored;
// wrong types throw ConfigError.
struct EngineConfig {
    LogLevel log_level = LogLevel::INFO;
    ExecOptions execution;
    int output_indent = 2;

    ExecOptions exec_options() const { return execution; }

    static EngineConfig from_json(const nlohmann::json& doc);
    static EngineConfig from_string(std::string_view text);

    // A missing file yields the defaults (with a warning).
    static EngineConfig load(const std::string& path);
};

} // namespace stagecraft

#endif // STAGECRAFT_MODULES_CONFIG_ENGINE_CONFIG_H
