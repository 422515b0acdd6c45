#pragma once

#include <string>

namespace sysdoc_model {

struct GeneratorOptions {
    // Collected files are named <aggregate name><suffix>.json.
    std::string maven_aggregate_name = "maven-aggregate";
    std::string api_aggregate_name = "api-aggregate";
    std::string suffix = "-info";
    // Callee marker for calls whose target service was never named.
    std::string default_external_service = "[default-service]";
    std::string plantuml_command = "plantuml";
    std::string log_level = "info";
    std::string log_file;   // empty: console only
};

} // namespace sysdoc_model
