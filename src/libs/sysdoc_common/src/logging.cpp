#include <sysdoc_common/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace sysdoc_common {

namespace {

const char* logger_name = "sysdoc";
const char* log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_file.empty()) {
        const std::filesystem::path path(log_file);
        if (path.has_parent_path())
            std::filesystem::create_directories(path.parent_path());
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), true));
    }
    auto logger = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    logger->set_pattern(log_pattern);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& logger = logger_slot();
    if (logger) return logger;

    try {
        logger = make_logger({});
        logger->set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

void init_logging(const std::string& level, const std::string& log_file) {
    auto& logger = logger_slot();
    try {
        logger = make_logger(log_file);
    } catch (const spdlog::spdlog_ex& e) {
        logger = spdlog::default_logger();
        logger->warn("Falling back to default logger: {}", e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        logger = spdlog::default_logger();
        logger->warn("Cannot create log directory for {}: {}", log_file, e.what());
    }
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);
}

} // namespace sysdoc_common
