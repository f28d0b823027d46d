#pragma once

#include <spdlog/spdlog.h>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace convgen::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Key/value pairs of a structured event, logged in the order given.
using Fields = std::vector<std::pair<std::string, std::string>>;

void init();

void shutdown();

/// Logs `name key=value ...` at `level`.
void event(std::string_view name, const Fields& fields, spdlog::level::level_enum level = spdlog::level::info);

}  // namespace convgen::log
