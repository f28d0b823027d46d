#include "engine/converter.hpp"

#include <format>
#include <set>

#include "common/logging/log.hpp"
#include "engine/manual_conversions.hpp"

namespace convgen::engine {

Converter::Converter(ConverterOptions options) : options_(std::move(options)) {}

auto Converter::run(Universe& universe, std::span<const std::string> inputs)
  -> Expected<std::vector<GeneratedFile>> {
  auto generator_options = options_.generator;
  if (!generator_options.tracker) {
    auto tracker = ManualConversionTracker::create(generator_options.extra_params);
    if (!tracker) {
      return tl::unexpected(tracker.error());
    }
    generator_options.tracker = std::move(*tracker);
  }

  std::vector<GeneratedFile> files;
  std::set<std::string> seen;
  for (const auto& input : inputs) {
    if (!seen.insert(input).second) {
      log::debug("skipping duplicate input package {}", input);
      continue;
    }
    auto package = universe.resolve_package(input);
    if (!package) {
      if (package.error().code != ErrorCode::NotFound) {
        return tl::unexpected(package.error());
      }
      log::warn("skipping package {}: {}", input, package.error().message);
      continue;
    }
    log::debug("considering package {}", input);

    auto generator = Generator::create(universe, input, input, options_.base_peer_packages, generator_options);
    if (!generator) {
      return tl::unexpected(
        make_error(std::format("unable to create generator for package {}: {}", input, generator.error().message)));
    }

    GeneratedFile file;
    file.package = input;
    file.base_name = options_.output_base_name;
    file.extra_imports = (*generator)->extra_imports();
    file.extra_params = (*generator)->options().extra_params;

    std::size_t considered = 0;
    for (const auto& [name, type] : (*package)->types) {
      if (!(*generator)->filter(*type)) {
        continue;
      }
      ++considered;
      for (auto& function : (*generator)->generate_type(*type)) {
        file.functions.push_back(std::move(function));
      }
    }

    std::size_t public_wrappers = 0;
    std::size_t suppressed = 0;
    for (const auto& function : file.functions) {
      if (function.has_public_wrapper()) {
        ++public_wrappers;
      } else {
        ++suppressed;
      }
    }
    log::event("package_generated", {
                                      {"package", input},
                                      {"types", std::to_string(considered)},
                                      {"functions", std::to_string(file.functions.size())},
                                      {"public", std::to_string(public_wrappers)},
                                      {"suppressed", std::to_string(suppressed)},
                                    });
    files.push_back(std::move(file));
  }
  return files;
}

auto error_missing_field_handler(const NamedVariable& in, const NamedVariable& out, const Member& member,
                                 EmitBuffer& buffer) -> Expected<void> {
  buffer.comment(CommentLevel::Warning,
                 std::format("{} does not exist in peer-type {}", member.name, out.type->name.qualified()));
  return tl::unexpected(make_error(std::format("field {}.{} requires manual conversion",
                                               in.type->name.qualified(), member.name)));
}

auto error_inconvertible_fields_handler(const NamedVariable& in, const NamedVariable& out,
                                        const Member& in_member, const Member& out_member, EmitBuffer& buffer)
  -> Expected<void> {
  buffer.comment(CommentLevel::Warning,
                 std::format("{} and {} have inconvertible types: {} vs {}", in_member.name, out_member.name,
                             in_member.type->name.qualified(), out_member.type->name.qualified()));
  return tl::unexpected(make_error(std::format("fields {}.{} and {}.{} have inconvertible types",
                                               in.type->name.qualified(), in_member.name,
                                               out.type->name.qualified(), out_member.name)));
}

}  // namespace convgen::engine
