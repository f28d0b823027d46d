#include "engine/naming.hpp"

#include <cctype>
#include <format>

namespace convgen::engine {
namespace {

auto sanitize(std::string_view text) -> std::string {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    out.push_back(std::isalnum(static_cast<unsigned char>(c)) ? c : '_');
  }
  if (!out.empty() && std::isdigit(static_cast<unsigned char>(out.front()))) {
    out.insert(out.begin(), '_');
  }
  return out;
}

auto type_part(const Type& t) -> std::string {
  if (t.name.package.empty()) {
    return std::format("builtin_{}", sanitize(t.name.name));
  }
  return std::format("{}_{}", package_tag(t.name.package), sanitize(t.name.name));
}

}  // namespace

auto package_tag(std::string_view package_path) -> std::string {
  auto slash = package_path.rfind('/');
  if (slash != std::string_view::npos) {
    package_path.remove_prefix(slash + 1);
  }
  return sanitize(package_path);
}

auto public_conversion_name(const Type& in, const Type& out) -> std::string {
  return std::format("{}{}_To_{}", kConversionFunctionPrefix, type_part(in), type_part(out));
}

auto private_conversion_name(const Type& in, const Type& out) -> std::string {
  return std::format("{}{}", kPrivateFunctionPrefix, public_conversion_name(in, out));
}

auto package_namespace(std::string_view package_path) -> std::string {
  std::string out;
  while (!package_path.empty()) {
    auto slash = package_path.find('/');
    auto segment = package_path.substr(0, slash);
    if (!segment.empty()) {
      if (!out.empty()) {
        out += "::";
      }
      out += sanitize(segment);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    package_path.remove_prefix(slash + 1);
  }
  return out;
}

}  // namespace convgen::engine
