#include <sysdoc_diagrams/diagram_builder.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <sysdoc_common/logging.hpp>
#include <algorithm>
#include <map>
#include <sstream>

namespace sysdoc_diagrams {

namespace {

// system -> subsystem -> service names in input order
using ServiceGrouping = std::map<std::string, std::map<std::string, std::vector<std::string>>>;

ServiceGrouping group_services(const std::vector<sysdoc_model::ProjectMetadata>& projects) {
    ServiceGrouping grouping;
    for (const auto& project : projects)
        grouping[project.system][project.subsystem].push_back(project.project_name);
    return grouping;
}

bool targets_external(const std::vector<sysdoc_model::CallDependency>& dependencies,
    const std::string& default_external_service)
{
    return std::any_of(dependencies.begin(), dependencies.end(), [&](const sysdoc_model::CallDependency& d) {
        return equals_ignore_case(d.depends_on, "external")
            || equals_ignore_case(d.depends_on, default_external_service);
    });
}

} // namespace

sysdoc_model::DiagramTexts create_service_diagram(const std::vector<sysdoc_model::ProjectMetadata>& projects,
    const std::vector<sysdoc_model::CallDependency>& dependencies,
    const std::string& default_external_service)
{
    auto log = sysdoc_common::logger();
    log->info("---- creating diagrams for microservices in system ----");

    std::ostringstream out;
    for (const auto& system : group_services(projects)) {
        out << "package " << quoted(system.first) << " {\n";
        for (const auto& subsystem : system.second) {
            out << "package " << quoted(subsystem.first) << " {\n";
            for (const auto& service : subsystem.second)
                out << "package " << quoted(service) << " {}\n";
            out << "}\n";
        }
        out << "}\n\n";
    }

    if (dependencies.empty()) {
        log->info("No dependencies between services found");
    } else {
        if (targets_external(dependencies, default_external_service))
            out << "package \"external\" {}\n";
        for (const auto& d : dependencies) {
            out << quoted(d.service) << "-->" << quoted(d.depends_on)
                << " : " << quoted(d.method + " : " + d.path) << "\n";
        }
    }

    sysdoc_model::DiagramTexts texts;
    texts[text_file_name("services")] = wrap_diagram(out.str());
    return texts;
}

} // namespace sysdoc_diagrams
