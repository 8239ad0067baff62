#include <metro_logging/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>

namespace metro_logging {

namespace {

const char* log_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

// Set once the viewer enables the file log; loggers created afterwards get it too.
spdlog::sink_ptr& file_sink() {
    static spdlog::sink_ptr sink;
    return sink;
}

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path() || p.parent_path() == p) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

} // namespace

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    if (auto existing = spdlog::get(name)) return existing;

    try {
        auto logger = spdlog::stderr_color_mt(name);
        logger->set_pattern(log_pattern);
        logger->flush_on(spdlog::level::warn);
        if (file_sink()) logger->sinks().push_back(file_sink());
        return logger;
    } catch (const spdlog::spdlog_ex&) {
        if (auto existing = spdlog::get(name)) return existing;
        return spdlog::default_logger();
    }
}

std::string enable_file_log(const std::string& file_name) {
    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / file_name;
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), true);
        sink->set_pattern(log_pattern);
        spdlog::apply_all([&sink](std::shared_ptr<spdlog::logger> logger) {
            logger->sinks().push_back(sink);
        });
        file_sink() = sink;
        return log_file.string();
    } catch (const spdlog::spdlog_ex&) {
        file_sink().reset();
    } catch (const std::filesystem::filesystem_error&) {
        file_sink().reset();
    }
    return {};
}

void set_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace metro_logging
