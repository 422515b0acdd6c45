#include <sysdoc_diagrams/component_resolver.hpp>
#include <set>
#include <utility>

namespace sysdoc_diagrams {

namespace {

bool has_prefix(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::vector<std::string> available_components(const std::vector<sysdoc_model::ProjectMetadata>& projects) {
    std::vector<std::string> names;
    for (const auto& project : projects)
        for (const auto& module : project.components)
            for (const auto& component : module.components)
                names.push_back(component.package_name);
    return names;
}

std::string resolve_component(const std::vector<std::string>& known, const std::string& package_name) {
    const std::string* longest = nullptr;
    for (const auto& component : known) {
        if (!has_prefix(package_name, component)) continue;
        if (!longest || component.size() > longest->size())
            longest = &component;
    }
    return longest ? *longest : extern_component;
}

std::vector<ComponentCall> resolve_component_calls(const std::vector<std::string>& known,
    const std::vector<sysdoc_model::CallDependency>& dependencies)
{
    std::vector<ComponentCall> calls;
    std::set<std::pair<std::string, std::string>> seen;

    for (const auto& dependency : dependencies) {
        std::string caller = resolve_component(known, dependency.service_package);
        if (caller == extern_component) continue;

        std::string callee = resolve_component(known, dependency.depends_on_package);
        if (!seen.emplace(caller, callee).second) continue;
        calls.push_back({ std::move(caller), std::move(callee) });
    }
    return calls;
}

} // namespace sysdoc_diagrams
