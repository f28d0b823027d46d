#include <gflags/gflags.h>

#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging/log.hpp"
#include "engine/converter.hpp"
#include "engine/model_json.hpp"
#include "engine/options.hpp"
#include "engine/universe.hpp"
#include "render/cxx_renderer.hpp"
#include "render/source_file.hpp"

DEFINE_string(model_dir, "", "Root directory of package models; package a/b is read from <model_dir>/a/b/package.json");
DEFINE_string(model_files, "", "Comma-separated model files loaded up front (single package or {\"packages\": [...]})");
DEFINE_string(inputs, "", "Comma-separated packages to generate conversions for");
DEFINE_string(base_peer_packages, "", "Comma-separated peer packages consulted for every input");
DEFINE_string(tag_name, convgen::engine::kDefaultTagName, "Annotation controlling types and members");
DEFINE_string(function_tag_name, convgen::engine::kDefaultTagName,
              "Annotation controlling manual conversion functions (drop, copy-only)");
DEFINE_string(peer_packages_tag_name, "conversion-gen:peer-packages",
              "Package annotation listing the peer packages");
DEFINE_string(extra_imports_tag_name, "conversion-gen:extra-imports",
              "Package annotation listing extra includes for the generated file");
DEFINE_bool(skip_unsafe, false, "Never reinterpret values of layout-equivalent types");
DEFINE_bool(no_public_conversion_function_on_error, false,
            "Suppress the public wrapper when a member is missing or inconvertible");
DEFINE_string(extra_args, "",
              "Comma-separated name:type parameters added to every conversion function, e.g. scope:ptr<pkg.Scope>");
DEFINE_string(output_base_name, convgen::engine::kDefaultOutputBaseName, "Base name of the generated files");
DEFINE_string(output_dir, "", "Directory receiving <output_dir>/<package>/<base>.cpp; stdout when empty");
DEFINE_string(error_type, "std::error_code", "Result type of the generated functions");
DEFINE_string(error_include, "<system_error>", "Header declaring --error_type");

namespace {

using convgen::engine::Expected;
using convgen::engine::make_error;

// Splits on commas outside of angle brackets so that `map<K, V>` stays whole.
auto split_list(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> parts;
  int depth = 0;
  std::string current;
  auto flush = [&] {
    auto first = current.find_first_not_of(" \t");
    if (first != std::string::npos) {
      auto last = current.find_last_not_of(" \t");
      parts.push_back(current.substr(first, last - first + 1));
    }
    current.clear();
  };
  for (char c : text) {
    if (c == '<') {
      ++depth;
    } else if (c == '>') {
      --depth;
    } else if (c == ',' && depth == 0) {
      flush();
      continue;
    }
    current.push_back(c);
  }
  flush();
  return parts;
}

auto parse_extra_args(std::string_view text, convgen::engine::Universe& universe)
  -> Expected<std::vector<convgen::engine::ExtraParam>> {
  std::vector<convgen::engine::ExtraParam> params;
  for (const auto& entry : split_list(text)) {
    auto colon = entry.find(':');
    if (colon == std::string::npos || colon == 0) {
      return tl::unexpected(make_error(std::format("invalid extra argument '{}', expected name:type", entry)));
    }
    auto type = convgen::engine::parse_type_expr(std::string_view(entry).substr(colon + 1), universe);
    if (!type) {
      return tl::unexpected(make_error(std::format("extra argument '{}': {}", entry, type.error().message)));
    }
    params.push_back(convgen::engine::ExtraParam{entry.substr(0, colon), *type});
  }
  return params;
}

auto write_output(const std::string& package, const std::string& file_name, const std::string& source)
  -> Expected<void> {
  if (FLAGS_output_dir.empty()) {
    std::cout << source << std::flush;
    if (!std::cout) {
      return tl::unexpected(make_error("failed writing to stdout"));
    }
    return {};
  }
  auto path = std::filesystem::path(FLAGS_output_dir) / package / file_name;
  if (auto written = convgen::render::write_source_file(path, source); !written) {
    return tl::unexpected(written.error());
  }
  convgen::log::event("file_written", {{"package", package}, {"path", path.string()}});
  return {};
}

auto run() -> Expected<void> {
  std::unique_ptr<convgen::engine::PackageSource> source;
  if (!FLAGS_model_dir.empty()) {
    source = std::make_unique<convgen::engine::JsonPackageSource>(FLAGS_model_dir);
  }
  convgen::engine::Universe universe(std::move(source));
  for (const auto& file : split_list(FLAGS_model_files)) {
    if (auto loaded = convgen::engine::load_model_file(file, universe); !loaded) {
      return tl::unexpected(loaded.error());
    }
  }

  auto inputs = split_list(FLAGS_inputs);
  if (inputs.empty()) {
    return tl::unexpected(make_error("no input packages, set --inputs"));
  }

  convgen::engine::ConverterOptions options;
  options.base_peer_packages = split_list(FLAGS_base_peer_packages);
  options.output_base_name = FLAGS_output_base_name;
  auto& generator = options.generator;
  generator.tag_name = FLAGS_tag_name;
  generator.function_tag_name = FLAGS_function_tag_name;
  generator.peer_packages_tag_name = FLAGS_peer_packages_tag_name;
  generator.extra_imports_tag_name = FLAGS_extra_imports_tag_name;
  generator.no_unsafe_conversions = FLAGS_skip_unsafe;
  auto extra_params = parse_extra_args(FLAGS_extra_args, universe);
  if (!extra_params) {
    return tl::unexpected(extra_params.error());
  }
  generator.extra_params = std::move(*extra_params);
  if (FLAGS_no_public_conversion_function_on_error) {
    generator.missing_fields_handler = convgen::engine::error_missing_field_handler;
    generator.inconvertible_fields_handler = convgen::engine::error_inconvertible_fields_handler;
  }

  convgen::engine::Converter converter(std::move(options));
  auto files = converter.run(universe, inputs);
  if (!files) {
    return tl::unexpected(files.error());
  }

  convgen::render::CxxRenderer renderer(
    universe, convgen::render::RenderOptions{.error_type = FLAGS_error_type, .error_include = FLAGS_error_include});
  for (const auto& file : *files) {
    auto rendered = renderer.render(file);
    if (!rendered) {
      return tl::unexpected(make_error(std::format("rendering {}: {}", file.package, rendered.error().message)));
    }
    if (auto written = write_output(file.package, convgen::render::CxxRenderer::file_name(file), *rendered);
        !written) {
      return tl::unexpected(written.error());
    }
  }
  return {};
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Generates conversion functions between peer packages");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  convgen::log::init();

  int status = 0;
  if (auto result = run(); !result) {
    convgen::log::critical("convgen failed: {}", result.error().message);
    status = 1;
  }

  convgen::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return status;
}
