#include "render/source_file.hpp"

#include <format>
#include <fstream>
#include <system_error>

namespace convgen::render {

auto write_source_file(const std::filesystem::path& path, std::string_view source) -> engine::Expected<void> {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return tl::unexpected(
        engine::make_error(std::format("cannot create {}: {}", path.parent_path().string(), ec.message())));
    }
  }
  std::ofstream stream(path, std::ios::binary | std::ios::trunc);
  if (!stream) {
    return tl::unexpected(engine::make_error(std::format("cannot write {}", path.string())));
  }
  stream.write(source.data(), static_cast<std::streamsize>(source.size()));
  stream.flush();
  if (!stream) {
    return tl::unexpected(engine::make_error(std::format("failed writing {}", path.string())));
  }
  return {};
}

}  // namespace convgen::render
