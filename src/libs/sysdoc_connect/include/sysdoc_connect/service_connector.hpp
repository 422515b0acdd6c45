#pragma once

#include <sysdoc_model/api_metadata.hpp>
#include <sysdoc_model/metadata.hpp>
#include <string>
#include <vector>

namespace sysdoc_connect {

// Matches every consumed API against the provided APIs of all units and
// returns one call dependency per consumed API, in input order.
// Unmatched calls target sysdoc_model::external_service when the called
// service was named, otherwise `default_external_service`.
std::vector<sysdoc_model::CallDependency> connect_services(const std::vector<sysdoc_model::ApiMetadata>& apis,
    const std::string& default_external_service);

// Segment-wise path comparison; a `{name}` segment on either side matches any
// single segment. Empty segments and query strings are ignored.
bool path_matches(const std::string& provided, const std::string& consumed);

} // namespace sysdoc_connect
