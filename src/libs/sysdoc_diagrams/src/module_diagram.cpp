#include <sysdoc_diagrams/diagram_builder.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <sysdoc_common/logging.hpp>
#include <sstream>

namespace sysdoc_diagrams {

std::string module_diagram_body(const sysdoc_model::ProjectMetadata& project) {
    std::ostringstream out;
    if (!project.module_dependencies || project.module_dependencies->empty()) return out.str();

    const NameIndex names = module_names(project);
    const auto& dependencies = *project.module_dependencies;

    for (const auto& entry : dependencies)
        out << "package " << quoted(names.name_or(entry.first, entry.first)) << " {}\n";
    out << "\n";

    for (const auto& entry : dependencies) {
        const std::string from = quoted(names.name_or(entry.first, entry.first));
        for (const auto& dep : entry.second)
            out << from << " --> " << quoted(names.name_or(dep, dep)) << "\n";
    }
    return out.str();
}

std::string nest_in_services(const std::vector<std::pair<std::string, std::string>>& diagrams,
    const NameIndex& projects, const std::string& trailer)
{
    std::ostringstream out;
    for (const auto& entry : diagrams) {
        out << "package " << quoted(service_display_name(projects, entry.first)) << " { \n";
        out << unwrap_diagram(entry.second);
        out << "}\n\n";
    }
    out << trailer;
    return wrap_diagram(out.str());
}

sysdoc_model::DiagramTexts create_module_diagrams(const std::vector<sysdoc_model::ProjectMetadata>& projects) {
    auto log = sysdoc_common::logger();
    log->info("---- creating diagrams for modules ----");

    sysdoc_model::DiagramTexts texts;
    std::vector<std::pair<std::string, std::string>> diagrams;
    for (const auto& project : projects) {
        if (!project.module_dependencies) {
            log->info("No info about module dependencies found for: {}", project.project_name);
            continue;
        }
        std::string diagram = wrap_diagram(module_diagram_body(project));
        texts[text_file_name(diagram_name(project.tag, "modules"))] = diagram;
        diagrams.emplace_back(project.tag, std::move(diagram));
    }

    texts[text_file_name("all_modules")] = nest_in_services(diagrams, project_names(projects));
    return texts;
}

} // namespace sysdoc_diagrams
