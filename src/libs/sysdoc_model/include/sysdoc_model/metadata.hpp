#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sysdoc_model {

// Callee name used by the service connector when a named service is not known.
constexpr const char* external_service = "EXTERNAL";

struct ModuleInfo {
    std::string tag;
    std::string module_name;
};

struct ComponentInfo {
    std::string package_name;
    std::set<std::string> depends_on;
};

struct ModuleComponents {
    std::string module_name;
    std::vector<ComponentInfo> components;
};

// One collected build unit. `module_dependencies` is empty (nullopt) when the
// collector had no data for the unit, which is not the same as an empty map.
struct ProjectMetadata {
    std::string tag;
    std::string project_name;
    std::string system;
    std::string subsystem;
    std::optional<std::map<std::string, std::vector<std::string>>> module_dependencies;
    std::vector<ModuleInfo> modules;
    std::vector<ModuleComponents> components;
};

// One observed service-to-service call.
struct CallDependency {
    std::string service_package;     // caller package
    std::string depends_on_package;  // callee package
    std::string service;             // caller display name
    std::string depends_on;          // callee display name, may be an external marker
    std::string method;
    std::string path;
};

// Output key -> diagram text, ordered by key.
using DiagramTexts = std::map<std::string, std::string>;

} // namespace sysdoc_model
