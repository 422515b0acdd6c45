#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace sysdoc_loaders::detail {

inline std::string string_field(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : "";
}

// The units of a collected document: the document itself when it is an
// object, its elements when it is an array of objects.
inline std::optional<std::vector<nlohmann::json>> unit_objects(const nlohmann::json& j) {
    if (j.is_object()) return std::vector<nlohmann::json>{ j };
    if (!j.is_array()) return std::nullopt;

    std::vector<nlohmann::json> units;
    for (const auto& u : j) {
        if (!u.is_object()) return std::nullopt;
        units.push_back(u);
    }
    return units;
}

template <typename Unit, typename Parse>
std::optional<std::vector<Unit>> parse_units(const nlohmann::json& j, Parse parse) {
    auto objects = unit_objects(j);
    if (!objects) return std::nullopt;

    std::vector<Unit> units;
    for (const auto& o : *objects) {
        std::optional<Unit> unit = parse(o);
        if (!unit) return std::nullopt;
        units.push_back(std::move(*unit));
    }
    return units;
}

} // namespace sysdoc_loaders::detail
