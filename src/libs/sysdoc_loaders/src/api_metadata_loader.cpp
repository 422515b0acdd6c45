#include <sysdoc_loaders/metadata_loader.hpp>
#include <sysdoc_common/logging.hpp>
#include "json_fields.hpp"
#include <fstream>

namespace sysdoc_loaders {

namespace {

using detail::string_field;

sysdoc_model::ProvidedApi parse_provided(const nlohmann::json& p) {
    sysdoc_model::ProvidedApi api;
    api.package_name = string_field(p, "packageName");
    api.method = string_field(p, "method");
    api.path = string_field(p, "path");
    return api;
}

sysdoc_model::ConsumedApi parse_consumed(const nlohmann::json& c) {
    sysdoc_model::ConsumedApi api;
    api.package_name = string_field(c, "packageName");
    api.service = string_field(c, "service");
    api.method = string_field(c, "method");
    api.path = string_field(c, "path");
    return api;
}

std::optional<sysdoc_model::ApiMetadata> parse_api_unit(const nlohmann::json& j) {
    sysdoc_model::ApiMetadata out;
    if (!j.contains("tag") || !j["tag"].is_string()) return std::nullopt;
    out.tag = j["tag"].get<std::string>();
    out.project_name = string_field(j, "projectName");
    out.system = string_field(j, "system");
    out.subsystem = string_field(j, "subsystem");

    if (j.contains("providedApis") && j["providedApis"].is_array()) {
        for (const auto& p : j["providedApis"]) {
            if (!p.is_object()) return std::nullopt;
            out.provided_apis.push_back(parse_provided(p));
        }
    }
    if (j.contains("consumedApis") && j["consumedApis"].is_array()) {
        for (const auto& c : j["consumedApis"]) {
            if (!c.is_object()) return std::nullopt;
            out.consumed_apis.push_back(parse_consumed(c));
        }
    }
    return out;
}

} // namespace

std::optional<std::vector<sysdoc_model::ApiMetadata>> load_api_metadata_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        auto units = detail::parse_units<sysdoc_model::ApiMetadata>(j, parse_api_unit);
        if (!units) sysdoc_common::logger()->error("Malformed API metadata");
        return units;
    } catch (const nlohmann::json::exception& e) {
        sysdoc_common::logger()->error("Invalid API metadata JSON: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::vector<sysdoc_model::ApiMetadata>> load_api_metadata_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        sysdoc_common::logger()->error("Cannot open {}", path);
        return std::nullopt;
    }
    return load_api_metadata_from_json(f);
}

} // namespace sysdoc_loaders
