#pragma once

#include <sysdoc_model/metadata.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace sysdoc_output {

class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr const char* svg_subfolder = "svg";

// Renders diagram texts to SVG by piping them through `<command> -pipe -tsvg`.
// Needs PlantUML (and GraphViz for most diagram types) on the host.
class PlantUmlRenderer {
public:
    explicit PlantUmlRenderer(std::string command = "plantuml");

    // Writes <target_folder>/svg/<stem>.svg per entry and returns the files.
    std::vector<std::filesystem::path> render_to_files(const sysdoc_model::DiagramTexts& texts,
        const std::filesystem::path& target_folder) const;

    // "<stem>.svg" -> SVG document per entry.
    sysdoc_model::DiagramTexts render_to_strings(const sysdoc_model::DiagramTexts& texts) const;

    const std::string& command() const { return command_; }

private:
    void render(const std::string& text, const std::filesystem::path& svg_file) const;

    std::string command_;
};

// "<stem>.svg" for an output key "<stem>.<ext>".
std::string svg_file_name(const std::string& key);

} // namespace sysdoc_output
