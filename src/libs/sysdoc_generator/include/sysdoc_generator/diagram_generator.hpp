#pragma once

#include <sysdoc_model/api_metadata.hpp>
#include <sysdoc_model/metadata.hpp>
#include <sysdoc_model/options.hpp>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace sysdoc_generator {

// A collected metadata file could not be read or parsed.
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CollectedMetadata {
    std::vector<sysdoc_model::ProjectMetadata> projects;
    std::vector<sysdoc_model::ApiMetadata> apis;
};

// Builds module, component, system and service diagrams from the metadata
// files collected below a set of source folders.
//
// Descriptions are written to <target>/txt and, when visualizing, rendered
// to <target>/svg. PlantUML and GraphViz must be installed for rendering.
class DiagramGenerator {
public:
    explicit DiagramGenerator(sysdoc_model::GeneratorOptions options = {});

    // File mode: returns every written file (descriptions, then images).
    std::vector<std::filesystem::path> generate_documents(const std::filesystem::path& target_folder,
        bool visualize, const std::vector<std::filesystem::path>& src_folders) const;

    // In-memory mode: output key -> text; "<stem>.svg" entries are added
    // when visualizing.
    sysdoc_model::DiagramTexts generate_documents(bool visualize,
        const std::vector<std::filesystem::path>& src_folders) const;

    // Locates and loads the collected files. Throws GenerationError.
    CollectedMetadata collect(const std::vector<std::filesystem::path>& src_folders) const;

    // Call dependencies between services, empty without API metadata.
    std::vector<sysdoc_model::CallDependency> connect(const std::vector<sysdoc_model::ApiMetadata>& apis) const;

    // Runs the four builders and merges their output (modules, components,
    // systems, services; a later key replaces an earlier one).
    sysdoc_model::DiagramTexts create_diagrams(const std::vector<sysdoc_model::ProjectMetadata>& projects,
        const std::vector<sysdoc_model::CallDependency>& dependencies) const;

    const sysdoc_model::GeneratorOptions& options() const { return options_; }

private:
    sysdoc_model::DiagramTexts build(const std::vector<std::filesystem::path>& src_folders) const;

    sysdoc_model::GeneratorOptions options_;
};

} // namespace sysdoc_generator
