// common/utils/yaml_json.h
#ifndef STAGECRAFT_COMMON_UTILS_YAML_JSON_H
#define STAGECRAFT_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace stagecraft {

// Convert a YAML document into the equivalent nlohmann::json value.
// Plain scalars are typed (bool, null, integer, float); quoted scalars stay strings.
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace stagecraft

#endif // STAGECRAFT_COMMON_UTILS_YAML_JSON_H
