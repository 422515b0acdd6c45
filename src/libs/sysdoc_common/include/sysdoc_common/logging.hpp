#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace sysdoc_common {

// Shared "sysdoc" logger. Created on first use with a stderr sink if
// init_logging() has not been called.
std::shared_ptr<spdlog::logger> logger();

// (Re)creates the "sysdoc" logger. `level` is an spdlog level name
// ("trace", "debug", "info", ...); an empty `log_file` means console only.
void init_logging(const std::string& level, const std::string& log_file = {});

} // namespace sysdoc_common
