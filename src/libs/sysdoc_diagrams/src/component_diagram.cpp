#include <sysdoc_diagrams/diagram_builder.hpp>
#include <sysdoc_diagrams/component_resolver.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <sysdoc_common/logging.hpp>
#include <sstream>

namespace sysdoc_diagrams {

namespace {

std::string component_ref(const std::string& package_name) {
    return "[" + quoted(package_name) + "]";
}

std::string component_calls(const std::vector<sysdoc_model::ProjectMetadata>& projects,
    const std::vector<sysdoc_model::CallDependency>& dependencies)
{
    std::ostringstream out;
    if (dependencies.empty()) {
        sysdoc_common::logger()->info("No dependencies between components found");
        return out.str();
    }
    for (const auto& call : resolve_component_calls(available_components(projects), dependencies))
        out << component_ref(call.caller) << " ..> " << component_ref(call.callee) << " : call \n";
    return out.str();
}

} // namespace

std::string component_diagram_body(const sysdoc_model::ProjectMetadata& project) {
    std::ostringstream out;

    for (const auto& module : project.components) {
        out << "package " << quoted(module.module_name) << " { \n";
        for (const auto& component : module.components)
            out << component_ref(component.package_name) << " \n";
        out << "}\n\n";
    }
    out << "\n";

    for (const auto& module : project.components) {
        for (const auto& component : module.components)
            for (const auto& dep : component.depends_on)
                out << component_ref(component.package_name) << " ..> " << component_ref(dep) << " : use \n";
        out << "\n";
    }
    return out.str();
}

sysdoc_model::DiagramTexts create_component_diagrams(const std::vector<sysdoc_model::ProjectMetadata>& projects,
    const std::vector<sysdoc_model::CallDependency>& dependencies)
{
    sysdoc_common::logger()->info("---- creating diagrams for components ----");

    sysdoc_model::DiagramTexts texts;
    std::vector<std::pair<std::string, std::string>> diagrams;
    for (const auto& project : projects) {
        std::string diagram = wrap_diagram(component_diagram_body(project));
        texts[text_file_name(diagram_name(project.tag, "components"))] = diagram;
        diagrams.emplace_back(project.tag, std::move(diagram));
    }

    texts[text_file_name("all_components")] =
        nest_in_services(diagrams, project_names(projects), component_calls(projects, dependencies));
    return texts;
}

} // namespace sysdoc_diagrams
