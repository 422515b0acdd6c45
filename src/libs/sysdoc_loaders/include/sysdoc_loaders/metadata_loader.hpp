#pragma once

#include <sysdoc_model/api_metadata.hpp>
#include <sysdoc_model/metadata.hpp>
#include <sysdoc_model/options.hpp>
#include <filesystem>
#include <optional>
#include <istream>
#include <string>
#include <vector>

namespace sysdoc_loaders {

// Each document holds one unit (object) or several (array of objects).
// std::nullopt on unreadable input, invalid JSON or a malformed unit.
std::optional<std::vector<sysdoc_model::ProjectMetadata>> load_project_metadata_from_json(std::istream& in);
std::optional<std::vector<sysdoc_model::ProjectMetadata>> load_project_metadata_from_json_file(const std::string& path);

std::optional<std::vector<sysdoc_model::ApiMetadata>> load_api_metadata_from_json(std::istream& in);
std::optional<std::vector<sysdoc_model::ApiMetadata>> load_api_metadata_from_json_file(const std::string& path);

// Missing keys keep their defaults; a key of the wrong type fails the load.
std::optional<sysdoc_model::GeneratorOptions> load_generator_options_from_json(std::istream& in);
std::optional<sysdoc_model::GeneratorOptions> load_generator_options_from_json_file(const std::string& path);

// Regular files below `root` named exactly `name + extension`, sorted by path.
std::vector<std::filesystem::path> find_files_with_name(const std::filesystem::path& root,
    const std::string& name, const std::string& extension);

} // namespace sysdoc_loaders
