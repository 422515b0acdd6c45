#pragma once

#include <sysdoc_model/metadata.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace sysdoc_diagrams {

// Case-insensitive identifier -> display name lookup, built once per run.
// The first registration of an identifier wins.
class NameIndex {
public:
    void add(const std::string& id, const std::string& name);

    // Registered name for `id`, or `fallback` when none is registered.
    std::string name_or(const std::string& id, const std::string& fallback) const;
    bool contains(const std::string& id) const;
    std::size_t size() const { return names_.size(); }

private:
    std::unordered_map<std::string, std::string> names_;
};

std::string to_lower(const std::string& s);
bool equals_ignore_case(const std::string& a, const std::string& b);

// Module tag -> module name of one unit.
NameIndex module_names(const sysdoc_model::ProjectMetadata& project);

// Unit tag -> project name over a whole collection.
NameIndex project_names(const std::vector<sysdoc_model::ProjectMetadata>& projects);

// "service: <project name>", or "service: <tag>" for an unknown tag.
std::string service_display_name(const NameIndex& projects, const std::string& tag);

} // namespace sysdoc_diagrams
