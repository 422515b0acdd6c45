// sysdoc: PlantUML architecture diagrams from collected project metadata (C++20)
#include <sysdoc_generator/diagram_generator.hpp>
#include <sysdoc_loaders/metadata_loader.hpp>
#include <sysdoc_common/logging.hpp>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

void print_usage(const char* program)
{
    (void)fprintf(stderr,
        "usage: %s [--config FILE] [--target DIR] [--visualize] [--verbose] SRC...\n"
        "  --config FILE   JSON generator options\n"
        "  --target DIR    write diagrams below DIR (txt/, svg/) instead of printing them\n"
        "  --visualize     render SVG images with PlantUML\n"
        "  --verbose       debug logging\n",
        program);
}

} // namespace

int main(int argc, char* argv[])
{
    std::optional<std::string> config_path;
    std::optional<std::filesystem::path> target_folder;
    bool visualize = false;
    bool verbose = false;
    std::vector<std::filesystem::path> src_folders;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "--target") {
            if (i + 1 >= argc) {
                (void)fprintf(stderr, "%s needs a value\n", arg.c_str());
                print_usage(argv[0]);
                return 1;
            }
            if (arg == "--config")
                config_path = argv[++i];
            else
                target_folder = std::filesystem::path(argv[++i]);
        } else if (arg == "--visualize") {
            visualize = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            (void)fprintf(stderr, "unknown option %s\n", arg.c_str());
            print_usage(argv[0]);
            return 1;
        } else {
            src_folders.emplace_back(arg);
        }
    }

    if (src_folders.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    sysdoc_model::GeneratorOptions options;
    if (config_path) {
        auto loaded = sysdoc_loaders::load_generator_options_from_json_file(*config_path);
        if (!loaded) {
            (void)fprintf(stderr, "cannot load options from %s\n", config_path->c_str());
            return 1;
        }
        options = std::move(*loaded);
    }
    sysdoc_common::init_logging(verbose ? "debug" : options.log_level, options.log_file);
    auto log = sysdoc_common::logger();

    const sysdoc_generator::DiagramGenerator generator(options);
    try {
        if (target_folder) {
            const auto files = generator.generate_documents(*target_folder, visualize, src_folders);
            for (const auto& file : files)
                std::cout << file.string() << "\n";
            log->info("Wrote {} file(s) below {}", files.size(), target_folder->string());
        } else {
            const auto texts = generator.generate_documents(visualize, src_folders);
            for (const auto& entry : texts)
                std::cout << "' " << entry.first << "\n" << entry.second << "\n";
        }
    } catch (const std::runtime_error& e) {
        // GenerationError, OutputError, RenderError and filesystem errors
        log->error("{}", e.what());
        return 2;
    }
    return 0;
}
