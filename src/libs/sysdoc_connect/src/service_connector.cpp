#include <sysdoc_connect/service_connector.hpp>
#include <sysdoc_common/logging.hpp>
#include <algorithm>
#include <cctype>

namespace sysdoc_connect {

namespace {

bool same_text(const std::string& a, const std::string& b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

std::vector<std::string> path_segments(const std::string& path) {
    const std::string plain = path.substr(0, path.find('?'));
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= plain.size()) {
        std::size_t end = plain.find('/', start);
        if (end == std::string::npos) end = plain.size();
        if (end > start) segments.push_back(plain.substr(start, end - start));
        start = end + 1;
    }
    return segments;
}

bool is_placeholder(const std::string& segment) {
    return segment.size() >= 2 && segment.front() == '{' && segment.back() == '}';
}

struct Provider {
    const sysdoc_model::ApiMetadata* unit = nullptr;
    const sysdoc_model::ProvidedApi* api = nullptr;
};

Provider find_provider(const std::vector<sysdoc_model::ApiMetadata>& apis,
    const sysdoc_model::ApiMetadata& consumer,
    const sysdoc_model::ConsumedApi& consumed,
    bool service_named)
{
    for (const auto& unit : apis) {
        if (service_named) {
            if (!same_text(unit.project_name, consumed.service)) continue;
        } else if (&unit == &consumer) {
            continue;
        }
        for (const auto& provided : unit.provided_apis) {
            if (same_text(provided.method, consumed.method) && path_matches(provided.path, consumed.path))
                return { &unit, &provided };
        }
    }
    return {};
}

} // namespace

bool path_matches(const std::string& provided, const std::string& consumed) {
    const auto expected = path_segments(provided);
    const auto actual = path_segments(consumed);
    if (expected.size() != actual.size()) return false;
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (is_placeholder(expected[i]) || is_placeholder(actual[i])) continue;
        if (expected[i] != actual[i]) return false;
    }
    return true;
}

std::vector<sysdoc_model::CallDependency> connect_services(const std::vector<sysdoc_model::ApiMetadata>& apis,
    const std::string& default_external_service)
{
    auto log = sysdoc_common::logger();
    std::vector<sysdoc_model::CallDependency> dependencies;

    for (const auto& consumer : apis) {
        for (const auto& consumed : consumer.consumed_apis) {
            const bool service_named = !consumed.service.empty()
                && !same_text(consumed.service, default_external_service);

            sysdoc_model::CallDependency d;
            d.service_package = consumed.package_name;
            d.service = consumer.project_name;
            d.method = consumed.method;
            d.path = consumed.path;

            const Provider provider = find_provider(apis, consumer, consumed, service_named);
            if (provider.unit) {
                d.depends_on_package = provider.api->package_name;
                d.depends_on = provider.unit->project_name;
            } else {
                d.depends_on = service_named ? sysdoc_model::external_service : default_external_service;
                d.depends_on_package = d.depends_on;
                log->debug("No provider for {} {} called by {}", consumed.method, consumed.path,
                    consumer.project_name);
            }
            dependencies.push_back(std::move(d));
        }
    }
    return dependencies;
}

} // namespace sysdoc_connect
