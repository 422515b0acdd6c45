#include <sysdoc_diagrams/plantuml_format.hpp>
#include <cstring>

namespace sysdoc_diagrams {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

bool ends_with(const std::string& s, const char* suffix) {
    const std::size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

} // namespace

std::string wrap_diagram(const std::string& body) {
    std::string out = begin_diagram;
    out += body;
    out += end_diagram;
    return out;
}

std::string unwrap_diagram(const std::string& diagram) {
    std::size_t first = 0;
    std::size_t last = diagram.size();
    if (starts_with(diagram, begin_diagram))
        first = std::strlen(begin_diagram);
    if (ends_with(diagram, end_diagram) && last - first >= std::strlen(end_diagram))
        last -= std::strlen(end_diagram);
    return diagram.substr(first, last - first);
}

std::string diagram_name(const std::string& tag, const std::string& diagram_type) {
    return tag + "_plantUML_" + diagram_type;
}

std::string text_file_name(const std::string& stem) {
    return stem + "." + text_extension;
}

std::pair<std::string, std::string> split_output_key(const std::string& key) {
    const std::size_t dot = key.rfind('.');
    if (dot == std::string::npos) return { key, {} };
    return { key.substr(0, dot), key.substr(dot + 1) };
}

std::string quoted(const std::string& name) {
    return "\"" + name + "\"";
}

} // namespace sysdoc_diagrams
