#pragma once

#include <string>
#include <vector>

namespace sysdoc_model {

struct ProvidedApi {
    std::string package_name;
    std::string method;
    std::string path;   // may contain {placeholder} segments
};

struct ConsumedApi {
    std::string package_name;
    std::string service;   // called service; empty or the default marker when unknown
    std::string method;
    std::string path;
};

struct ApiMetadata {
    std::string tag;
    std::string project_name;
    std::string system;
    std::string subsystem;
    std::vector<ProvidedApi> provided_apis;
    std::vector<ConsumedApi> consumed_apis;
};

} // namespace sysdoc_model
