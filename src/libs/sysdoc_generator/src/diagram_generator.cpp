#include <sysdoc_generator/diagram_generator.hpp>
#include <sysdoc_connect/service_connector.hpp>
#include <sysdoc_diagrams/diagram_builder.hpp>
#include <sysdoc_diagrams/plantuml_format.hpp>
#include <sysdoc_loaders/metadata_loader.hpp>
#include <sysdoc_output/plantuml_renderer.hpp>
#include <sysdoc_output/text_writer.hpp>
#include <sysdoc_common/logging.hpp>
#include <utility>

namespace sysdoc_generator {

namespace {

const char* json_extension = ".json";

template <typename Unit, typename Load>
std::vector<Unit> load_all(const std::vector<std::filesystem::path>& src_folders,
    const std::string& file_name, Load load)
{
    std::vector<Unit> units;
    for (const auto& folder : src_folders) {
        for (const auto& file : sysdoc_loaders::find_files_with_name(folder, file_name, json_extension)) {
            auto loaded = load(file.string());
            if (!loaded)
                throw GenerationError("Cannot load collected metadata from " + file.string());
            sysdoc_common::logger()->debug("Loaded {} unit(s) from {}", loaded->size(), file.string());
            for (auto& unit : *loaded)
                units.push_back(std::move(unit));
        }
    }
    return units;
}

void merge_into(sysdoc_model::DiagramTexts& into, sysdoc_model::DiagramTexts&& from) {
    for (auto& entry : from)
        into.insert_or_assign(entry.first, std::move(entry.second));
}

} // namespace

DiagramGenerator::DiagramGenerator(sysdoc_model::GeneratorOptions options)
    : options_(std::move(options)) {}

CollectedMetadata DiagramGenerator::collect(const std::vector<std::filesystem::path>& src_folders) const {
    CollectedMetadata collected;
    collected.projects = load_all<sysdoc_model::ProjectMetadata>(src_folders,
        options_.maven_aggregate_name + options_.suffix,
        [](const std::string& path) { return sysdoc_loaders::load_project_metadata_from_json_file(path); });
    collected.apis = load_all<sysdoc_model::ApiMetadata>(src_folders,
        options_.api_aggregate_name + options_.suffix,
        [](const std::string& path) { return sysdoc_loaders::load_api_metadata_from_json_file(path); });

    sysdoc_common::logger()->info("Collected {} project(s) and {} API description(s)",
        collected.projects.size(), collected.apis.size());
    return collected;
}

std::vector<sysdoc_model::CallDependency> DiagramGenerator::connect(
    const std::vector<sysdoc_model::ApiMetadata>& apis) const
{
    if (apis.empty()) return {};
    auto dependencies = sysdoc_connect::connect_services(apis, options_.default_external_service);
    sysdoc_common::logger()->info("FOUND {} DEPENDENCIES", dependencies.size());
    return dependencies;
}

sysdoc_model::DiagramTexts DiagramGenerator::create_diagrams(
    const std::vector<sysdoc_model::ProjectMetadata>& projects,
    const std::vector<sysdoc_model::CallDependency>& dependencies) const
{
    sysdoc_model::DiagramTexts texts;
    merge_into(texts, sysdoc_diagrams::create_module_diagrams(projects));
    merge_into(texts, sysdoc_diagrams::create_component_diagrams(projects, dependencies));
    merge_into(texts, sysdoc_diagrams::create_system_diagram(projects));
    merge_into(texts, sysdoc_diagrams::create_service_diagram(projects, dependencies,
        options_.default_external_service));
    return texts;
}

sysdoc_model::DiagramTexts DiagramGenerator::build(const std::vector<std::filesystem::path>& src_folders) const {
    const CollectedMetadata collected = collect(src_folders);
    return create_diagrams(collected.projects, connect(collected.apis));
}

std::vector<std::filesystem::path> DiagramGenerator::generate_documents(const std::filesystem::path& target_folder,
    bool visualize, const std::vector<std::filesystem::path>& src_folders) const
{
    const sysdoc_model::DiagramTexts texts = build(src_folders);

    std::vector<std::filesystem::path> files;
    for (const auto& entry : texts) {
        const auto [name, suffix] = sysdoc_diagrams::split_output_key(entry.first);
        auto written = sysdoc_output::write_to_file(entry.second, name, suffix, target_folder);
        files.insert(files.end(), written.begin(), written.end());
    }

    if (visualize) {
        const sysdoc_output::PlantUmlRenderer renderer(options_.plantuml_command);
        auto images = renderer.render_to_files(texts, target_folder);
        files.insert(files.end(), images.begin(), images.end());
    }
    return files;
}

sysdoc_model::DiagramTexts DiagramGenerator::generate_documents(bool visualize,
    const std::vector<std::filesystem::path>& src_folders) const
{
    sysdoc_model::DiagramTexts texts = build(src_folders);

    if (visualize) {
        const sysdoc_output::PlantUmlRenderer renderer(options_.plantuml_command);
        merge_into(texts, renderer.render_to_strings(texts));
    }
    return texts;
}

} // namespace sysdoc_generator
