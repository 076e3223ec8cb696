// core/types/resource.h
#ifndef STAGECRAFT_CORE_TYPES_RESOURCE_H
#define STAGECRAFT_CORE_TYPES_RESOURCE_H

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace stagecraft {

// Annotation maps are ordered so that every serialization is stable.
using StringMap = std::map<std::string, std::string>;

// Provider/runtime owned payload. This library never looks inside it.
using RawPayload = nlohmann::json;

// Identity of a managed resource.
struct ResourceRef {
    std::string kind;      // e.g. "service", "network", "volume", "droplet"
    std::string name;      // logical name
    std::string provider;  // e.g. "docker-compose", "digitalocean"
    std::string ns;        // optional grouping ("namespace" on the wire)

    bool operator==(const ResourceRef&) const = default;
};

// Desired resource in a topology.
struct ResourceSpec {
    ResourceRef ref;
    RawPayload data;
    StringMap meta;

    bool operator==(const ResourceSpec&) const = default;
};

// Observed resource in a runtime.
struct ResourceState {
    ResourceRef ref;
    RawPayload data;
    StringMap meta;

    bool operator==(const ResourceState&) const = default;
};

struct TopologySnapshot {
    std::string version;
    StringMap meta;
    std::vector<ResourceSpec> resources; // kind, then name

    bool operator==(const TopologySnapshot&) const = default;
};

struct StateSnapshot {
    std::string version;
    StringMap meta;
    std::vector<ResourceState> resources; // kind, then name

    bool operator==(const StateSnapshot&) const = default;
};

} // namespace stagecraft

#endif // STAGECRAFT_CORE_TYPES_RESOURCE_H
