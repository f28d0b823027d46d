#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace convgen::engine {

/// Values of every `+name=value` line, keyed by tag name. Values listed with
/// commas (`+name=a,b`) are split; `+name` alone yields an empty value.
auto extract_comment_tags(std::string_view marker, std::span<const std::string> lines)
  -> std::map<std::string, std::vector<std::string>>;

/// Values of one tag; empty when `tag_name` is empty or absent.
auto extract_tag(std::string_view tag_name, std::span<const std::string> lines) -> std::vector<std::string>;

auto has_tag_value(std::string_view tag_name, std::span<const std::string> lines, std::string_view value)
  -> bool;

/// Value of an option tag of the form `+name=option:value`.
auto tag_option(std::string_view tag_name, std::span<const std::string> lines, std::string_view option)
  -> std::optional<std::string>;

}  // namespace convgen::engine
