#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace metro_logging {

// Named logger from the spdlog registry. Created on first use with a colored
// stderr sink; falls back to the default logger if spdlog refuses.
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

// Adds a file sink under <project root>/logs/<file_name> to every logger
// handed out afterwards, and to those already created. Returns the log path
// or an empty string when the file could not be opened.
std::string enable_file_log(const std::string& file_name);

// Level of every registered logger and of those created later.
void set_level(spdlog::level::level_enum level);

} // namespace metro_logging
