#pragma once

#include <filesystem>
#include <string_view>

#include "engine/error.hpp"

namespace convgen::render {

/// Writes rendered source to `path`, creating parent directories. Fails unless
/// every byte reached the file.
auto write_source_file(const std::filesystem::path& path, std::string_view source) -> engine::Expected<void>;

}  // namespace convgen::render
