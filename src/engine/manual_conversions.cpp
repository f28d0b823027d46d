#include "engine/manual_conversions.hpp"

#include <format>
#include <set>

#include "common/logging/log.hpp"
#include "engine/naming.hpp"
#include "engine/tags.hpp"

namespace convgen::engine {
namespace {

auto pair_key(const Type& in, const Type& out) -> std::pair<const Type*, const Type*> {
  return {&in, &out};
}

}  // namespace

ManualConversionTracker::ManualConversionTracker(std::vector<ExtraParam> extra_params)
    : extra_params_(std::move(extra_params)) {}

auto ManualConversionTracker::create(std::vector<ExtraParam> extra_params)
  -> Expected<std::shared_ptr<ManualConversionTracker>> {
  std::set<std::string> names;
  for (const auto& param : extra_params) {
    if (param.name.empty()) {
      return tl::unexpected(make_error("extra conversion parameter needs a name"));
    }
    if (param.name == "in" || param.name == "out") {
      return tl::unexpected(make_error(std::format("extra conversion parameter cannot be named {}", param.name)));
    }
    if (!param.type) {
      return tl::unexpected(make_error(std::format("extra conversion parameter {} has no type", param.name)));
    }
    if (!names.insert(param.name).second) {
      return tl::unexpected(make_error(std::format("duplicate extra conversion parameter {}", param.name)));
    }
  }
  return std::shared_ptr<ManualConversionTracker>(new ManualConversionTracker(std::move(extra_params)));
}

auto ManualConversionTracker::discover(Universe& universe, std::span<const std::string> packages)
  -> Expected<void> {
  for (const auto& path : packages) {
    const auto& errors = discover_package(universe, path);
    if (errors.empty()) {
      continue;
    }
    std::string message = std::format("errors when looking for manual conversion functions in {}:", path);
    for (const auto& error : errors) {
      message += "\n" + error.message;
    }
    return tl::unexpected(make_error(std::move(message)));
  }
  return {};
}

auto ManualConversionTracker::discover_package(Universe& universe, std::string_view path)
  -> const std::vector<GenError>& {
  if (auto it = processed_.find(path); it != processed_.end()) {
    return it->second;
  }

  std::vector<GenError> errors;
  auto package = universe.resolve_package(path);
  if (!package) {
    errors.push_back(package.error());
  } else {
    // Functions iterate in sorted-name order, so the first registration is
    // stable across runs.
    for (const auto& [name, function] : (*package)->functions) {
      if (!name.starts_with(kConversionFunctionPrefix)) {
        continue;
      }
      auto pair = check_signature(*function);
      if (!pair) {
        errors.push_back(pair.error());
        continue;
      }
      auto key = pair_key(*pair->in, *pair->out);
      auto [it, inserted] = conversions_.emplace(std::move(key), function.get());
      if (inserted) {
        log::debug("found manual conversion {} for {} -> {}", function->name.qualified(),
                   pair->in->name.qualified(), pair->out->name.qualified());
      } else {
        log::debug("ignoring manual conversion {}: {} already registered", function->name.qualified(),
                   it->second->name.qualified());
      }
    }
  }

  auto [it, inserted] = processed_.emplace(std::string(path), std::move(errors));
  return it->second;
}

auto ManualConversionTracker::check_signature(const Function& function) const -> Expected<ConversionPair> {
  const auto name = function.name.qualified();
  if (function.has_receiver) {
    return tl::unexpected(make_error(std::format("function {} has a receiver", name)));
  }
  const auto expected_params = 2 + extra_params_.size();
  if (function.params.size() != expected_params) {
    return tl::unexpected(make_error(
      std::format("function {} has {} parameters, expected {}", name, function.params.size(), expected_params)));
  }
  if (function.results.size() != 1 || !function.results[0] ||
      function.results[0]->kind != TypeKind::Builtin || function.results[0]->name.name != "error") {
    return tl::unexpected(make_error(std::format("function {} must return exactly one error", name)));
  }
  const auto* in = function.params[0].type;
  const auto* out = function.params[1].type;
  if (!in || in->kind != TypeKind::Pointer || !in->elem) {
    return tl::unexpected(make_error(std::format("function {}: first parameter must be a pointer", name)));
  }
  if (!out || out->kind != TypeKind::Pointer || !out->elem) {
    return tl::unexpected(make_error(std::format("function {}: second parameter must be a pointer", name)));
  }
  for (std::size_t i = 0; i < extra_params_.size(); ++i) {
    const auto& param = function.params[2 + i];
    if (!same_type(param.type, extra_params_[i].type)) {
      return tl::unexpected(make_error(std::format(
        "function {}: parameter {} ({}) must have type {}", name, 2 + i, param.name,
        extra_params_[i].type->name.qualified())));
    }
  }
  return ConversionPair{in->elem, out->elem};
}

auto ManualConversionTracker::preexists(const Type& in, const Type& out) const -> const Function* {
  auto it = conversions_.find(pair_key(in, out));
  if (it == conversions_.end()) {
    return nullptr;
  }
  return it->second;
}

auto ManualConversionTracker::has_tag(const Function& function, std::string_view tag_name, std::string_view value)
  -> bool {
  return has_tag_value(tag_name, function.comments, value);
}

}  // namespace convgen::engine
