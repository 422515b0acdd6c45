#include <sysdoc_loaders/metadata_loader.hpp>
#include <sysdoc_common/logging.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>
#include <fstream>

namespace sysdoc_loaders {

namespace {

// Overwrites `field` when `key` is present; false when it is not a string.
bool read_string(const nlohmann::json& j, const char* key, std::string& field) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return false;
    field = j[key].get<std::string>();
    return true;
}

// spdlog maps names it does not know to `off`.
bool is_log_level(const std::string& name) {
    return name == "off" || spdlog::level::from_str(name) != spdlog::level::off;
}

std::optional<sysdoc_model::GeneratorOptions> parse_options(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;

    sysdoc_model::GeneratorOptions o;
    const bool ok = read_string(j, "mavenAggregateName", o.maven_aggregate_name)
        && read_string(j, "apiAggregateName", o.api_aggregate_name)
        && read_string(j, "suffix", o.suffix)
        && read_string(j, "defaultExternalService", o.default_external_service)
        && read_string(j, "plantumlCommand", o.plantuml_command)
        && read_string(j, "logLevel", o.log_level)
        && read_string(j, "logFile", o.log_file);
    if (!ok) return std::nullopt;
    if (!is_log_level(o.log_level)) {
        sysdoc_common::logger()->error("Unknown log level '{}'", o.log_level);
        return std::nullopt;
    }
    return o;
}

} // namespace

std::optional<sysdoc_model::GeneratorOptions> load_generator_options_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        auto options = parse_options(j);
        if (!options) sysdoc_common::logger()->error("Malformed generator options");
        return options;
    } catch (const nlohmann::json::exception& e) {
        sysdoc_common::logger()->error("Invalid options JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<sysdoc_model::GeneratorOptions> load_generator_options_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        sysdoc_common::logger()->error("Cannot open {}", path);
        return std::nullopt;
    }
    return load_generator_options_from_json(f);
}

} // namespace sysdoc_loaders
