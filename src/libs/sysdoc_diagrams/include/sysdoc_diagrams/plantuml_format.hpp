#pragma once

#include <string>
#include <utility>

namespace sysdoc_diagrams {

// Fixed wrapper shared by every diagram text.
constexpr const char* begin_diagram = "@startuml\n skinparam componentStyle uml2\n\n";
constexpr const char* end_diagram = "@enduml\n";

constexpr const char* text_extension = "txt";

std::string wrap_diagram(const std::string& body);

// Inverse of wrap_diagram(): strips the preamble and terminator so the body
// can be nested into another diagram.
std::string unwrap_diagram(const std::string& diagram);

// "<tag>_plantUML_<diagram_type>"
std::string diagram_name(const std::string& tag, const std::string& diagram_type);

// "<stem>.txt"
std::string text_file_name(const std::string& stem);

// Splits an output key once, at its extension separator:
// "a_plantUML_modules.txt" -> {"a_plantUML_modules", "txt"}.
// A key without a separator yields an empty suffix.
std::pair<std::string, std::string> split_output_key(const std::string& key);

std::string quoted(const std::string& name);

} // namespace sysdoc_diagrams
