#pragma once

#include <sysdoc_diagrams/name_index.hpp>
#include <sysdoc_model/metadata.hpp>
#include <string>
#include <utility>
#include <vector>

namespace sysdoc_diagrams {

// Builders are pure: the same input always yields byte-identical text.

// "<tag>_plantUML_modules.txt" per unit that carries module dependency data,
// plus "all_modules.txt".
sysdoc_model::DiagramTexts create_module_diagrams(const std::vector<sysdoc_model::ProjectMetadata>& projects);

// "<tag>_plantUML_components.txt" per unit, plus "all_components.txt" which
// also carries the cross-unit call edges resolved from `dependencies`.
sysdoc_model::DiagramTexts create_component_diagrams(const std::vector<sysdoc_model::ProjectMetadata>& projects,
    const std::vector<sysdoc_model::CallDependency>& dependencies);

// "systems.txt": systems with their distinct subsystems.
sysdoc_model::DiagramTexts create_system_diagram(const std::vector<sysdoc_model::ProjectMetadata>& projects);

// "services.txt": system / subsystem / service nesting plus one edge per call.
sysdoc_model::DiagramTexts create_service_diagram(const std::vector<sysdoc_model::ProjectMetadata>& projects,
    const std::vector<sysdoc_model::CallDependency>& dependencies,
    const std::string& default_external_service);

// Body texts (without wrapper) of single-unit diagrams.
std::string module_diagram_body(const sysdoc_model::ProjectMetadata& project);
std::string component_diagram_body(const sysdoc_model::ProjectMetadata& project);

// Nests each (tag, diagram) into a package named after its service and wraps
// the result; `trailer` is appended after the last package.
std::string nest_in_services(const std::vector<std::pair<std::string, std::string>>& diagrams,
    const NameIndex& projects, const std::string& trailer = {});

} // namespace sysdoc_diagrams
