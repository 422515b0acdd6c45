#include <sysdoc_loaders/metadata_loader.hpp>
#include <sysdoc_common/logging.hpp>
#include "json_fields.hpp"
#include <fstream>

namespace sysdoc_loaders {

namespace {

using detail::string_field;

std::optional<sysdoc_model::ComponentInfo> parse_component(const nlohmann::json& c) {
    if (!c.is_object() || !c.contains("packageName") || !c["packageName"].is_string()) return std::nullopt;

    sysdoc_model::ComponentInfo info;
    info.package_name = c["packageName"].get<std::string>();
    if (c.contains("dependsOn") && c["dependsOn"].is_array()) {
        for (const auto& dep : c["dependsOn"])
            if (dep.is_string()) info.depends_on.insert(dep.get<std::string>());
    }
    return info;
}

std::optional<std::map<std::string, std::vector<std::string>>> parse_module_dependencies(const nlohmann::json& j) {
    std::map<std::string, std::vector<std::string>> deps;
    for (const auto& item : j.items()) {
        if (!item.value().is_array()) return std::nullopt;
        auto& list = deps[item.key()];
        for (const auto& d : item.value())
            if (d.is_string()) list.push_back(d.get<std::string>());
    }
    return deps;
}

std::optional<sysdoc_model::ProjectMetadata> parse_project(const nlohmann::json& j) {
    sysdoc_model::ProjectMetadata p;
    if (!j.contains("tag") || !j["tag"].is_string()) return std::nullopt;
    p.tag = j["tag"].get<std::string>();
    p.project_name = string_field(j, "projectName");
    p.system = string_field(j, "system");
    p.subsystem = string_field(j, "subsystem");

    // null and missing both mean "no data"
    if (j.contains("moduleDependencies") && !j["moduleDependencies"].is_null()) {
        if (!j["moduleDependencies"].is_object()) return std::nullopt;
        p.module_dependencies = parse_module_dependencies(j["moduleDependencies"]);
        if (!p.module_dependencies) return std::nullopt;
    }

    if (j.contains("modules") && j["modules"].is_array()) {
        for (const auto& m : j["modules"]) {
            if (!m.is_object()) continue;
            p.modules.push_back({ string_field(m, "tag"), string_field(m, "moduleName") });
        }
    }

    if (j.contains("components") && j["components"].is_array()) {
        for (const auto& mc : j["components"]) {
            if (!mc.is_object()) return std::nullopt;
            sysdoc_model::ModuleComponents module;
            module.module_name = string_field(mc, "moduleName");
            if (mc.contains("components") && mc["components"].is_array()) {
                for (const auto& c : mc["components"]) {
                    auto component = parse_component(c);
                    if (!component) return std::nullopt;
                    module.components.push_back(std::move(*component));
                }
            }
            p.components.push_back(std::move(module));
        }
    }

    return p;
}

} // namespace

std::optional<std::vector<sysdoc_model::ProjectMetadata>> load_project_metadata_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        auto units = detail::parse_units<sysdoc_model::ProjectMetadata>(j, parse_project);
        if (!units) sysdoc_common::logger()->error("Malformed project metadata");
        return units;
    } catch (const nlohmann::json::exception& e) {
        sysdoc_common::logger()->error("Invalid project metadata JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<sysdoc_model::ProjectMetadata>> load_project_metadata_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        sysdoc_common::logger()->error("Cannot open {}", path);
        return std::nullopt;
    }
    return load_project_metadata_from_json(f);
}

} // namespace sysdoc_loaders
