#pragma once

#include "config/configs.hpp"

#include <spdlog/common.h>

#include <string_view>

// Throws std::invalid_argument for anything spdlog does not know.
[[nodiscard]] spdlog::level::level_enum parse_log_level(std::string_view level);

/**
 * Installs the default spdlog logger: colored stdout, plus a rotating file
 * sink when config.file is set. Safe to call more than once; the last call
 * wins.
 */
void init_logging(const LoggingConfig& config);
