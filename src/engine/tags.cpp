#include "engine/tags.hpp"

#include <cctype>

namespace convgen::engine {
namespace {

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

auto extract_comment_tags(std::string_view marker, std::span<const std::string> lines)
  -> std::map<std::string, std::vector<std::string>> {
  std::map<std::string, std::vector<std::string>> tags;
  for (const auto& raw : lines) {
    auto line = trim(raw);
    // Accept comment-prefixed lines as written in headers.
    while (line.starts_with("/")) {
      line.remove_prefix(1);
    }
    line = trim(line);
    if (!line.starts_with(marker)) {
      continue;
    }
    line.remove_prefix(marker.size());
    auto eq = line.find('=');
    auto name = trim(line.substr(0, eq));
    if (name.empty()) {
      continue;
    }
    auto& values = tags[std::string(name)];
    if (eq == std::string_view::npos) {
      values.emplace_back();
      continue;
    }
    auto rest = line.substr(eq + 1);
    while (true) {
      auto comma = rest.find(',');
      values.emplace_back(trim(rest.substr(0, comma)));
      if (comma == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(comma + 1);
    }
  }
  return tags;
}

auto extract_tag(std::string_view tag_name, std::span<const std::string> lines) -> std::vector<std::string> {
  if (tag_name.empty()) {
    return {};
  }
  auto tags = extract_comment_tags("+", lines);
  auto it = tags.find(std::string(tag_name));
  if (it == tags.end()) {
    return {};
  }
  return std::move(it->second);
}

auto has_tag_value(std::string_view tag_name, std::span<const std::string> lines, std::string_view value)
  -> bool {
  for (const auto& candidate : extract_tag(tag_name, lines)) {
    if (candidate == value) {
      return true;
    }
  }
  return false;
}

auto tag_option(std::string_view tag_name, std::span<const std::string> lines, std::string_view option)
  -> std::optional<std::string> {
  for (const auto& value : extract_tag(tag_name, lines)) {
    auto colon = value.find(':');
    if (colon == std::string::npos || value.find(':', colon + 1) != std::string::npos) {
      continue;
    }
    if (std::string_view(value).substr(0, colon) == option) {
      return value.substr(colon + 1);
    }
  }
  return std::nullopt;
}

}  // namespace convgen::engine
