#pragma once

#include <sysdoc_model/metadata.hpp>
#include <string>
#include <vector>

namespace sysdoc_diagrams {

// Result of resolving a package that no known component encloses.
constexpr const char* extern_component = "EXTERN";

struct ComponentCall {
    std::string caller;
    std::string callee;
};

// Package names of every component of every unit, in input order.
std::vector<std::string> available_components(const std::vector<sysdoc_model::ProjectMetadata>& projects);

// Longest known component that is a string prefix of `package_name`, or
// extern_component. On equal lengths the first one in `known` wins.
std::string resolve_component(const std::vector<std::string>& known, const std::string& package_name);

// Maps call dependencies onto (caller component, callee component) pairs.
// Calls whose caller package is not enclosed by a known component are dropped;
// each distinct pair is reported once, in first-seen order. Self-loops are kept.
std::vector<ComponentCall> resolve_component_calls(const std::vector<std::string>& known,
    const std::vector<sysdoc_model::CallDependency>& dependencies);

} // namespace sysdoc_diagrams
