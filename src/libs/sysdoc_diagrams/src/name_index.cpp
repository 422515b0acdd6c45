#include <sysdoc_diagrams/name_index.hpp>
#include <algorithm>
#include <cctype>

namespace sysdoc_diagrams {

void NameIndex::add(const std::string& id, const std::string& name) {
    names_.emplace(to_lower(id), name);
}

std::string NameIndex::name_or(const std::string& id, const std::string& fallback) const {
    auto it = names_.find(to_lower(id));
    return it != names_.end() ? it->second : fallback;
}

bool NameIndex::contains(const std::string& id) const {
    return names_.count(to_lower(id)) != 0;
}

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool equals_ignore_case(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

NameIndex module_names(const sysdoc_model::ProjectMetadata& project) {
    NameIndex index;
    for (const auto& m : project.modules)
        index.add(m.tag, m.module_name);
    return index;
}

NameIndex project_names(const std::vector<sysdoc_model::ProjectMetadata>& projects) {
    NameIndex index;
    for (const auto& p : projects)
        index.add(p.tag, p.project_name);
    return index;
}

std::string service_display_name(const NameIndex& projects, const std::string& tag) {
    return "service: " + projects.name_or(tag, tag);
}

} // namespace sysdoc_diagrams
