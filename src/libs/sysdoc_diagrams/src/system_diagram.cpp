#include <sysdoc_diagrams/diagram_builder.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <sysdoc_common/logging.hpp>
#include <map>
#include <set>
#include <sstream>

namespace sysdoc_diagrams {

sysdoc_model::DiagramTexts create_system_diagram(const std::vector<sysdoc_model::ProjectMetadata>& projects) {
    sysdoc_common::logger()->info("---- creating system diagram ----");

    std::map<std::string, std::set<std::string>> subsystems_by_system;
    for (const auto& project : projects)
        subsystems_by_system[project.system].insert(project.subsystem);

    std::ostringstream out;
    for (const auto& system : subsystems_by_system) {
        out << "package " << quoted(system.first) << " {\n";
        for (const auto& subsystem : system.second)
            out << "package " << quoted(subsystem) << " {}\n";
        out << "}\n\n";
    }

    sysdoc_model::DiagramTexts texts;
    texts[text_file_name("systems")] = wrap_diagram(out.str());
    return texts;
}

} // namespace sysdoc_diagrams
