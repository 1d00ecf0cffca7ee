#include "logging/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

} // namespace

spdlog::level::level_enum parse_log_level(std::string_view level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    throw std::invalid_argument("Unknown log level: " + std::string(level));
}

void init_logging(const LoggingConfig& config) {
    auto level = parse_log_level(config.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file.string(), config.max_file_size, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>("filler", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern(LOG_PATTERN);
    logger->flush_on(spdlog::level::err);

    spdlog::set_default_logger(std::move(logger));
}
