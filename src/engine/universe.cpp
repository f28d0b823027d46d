#include "engine/universe.hpp"

#include <array>
#include <format>

#include "common/logging/log.hpp"

namespace convgen::engine {
namespace {

constexpr std::array<std::string_view, 16> kBuiltinNames = {
    "bool",   "byte",   "error",  "float32", "float64", "int",    "int16", "int32",
    "int64",  "int8",   "string", "uint",    "uint16",  "uint32", "uint64", "uint8",
};

}  // namespace

auto Package::has(std::string_view name) const -> bool {
  return types.find(std::string(name)) != types.end();
}

auto Package::type(std::string_view name) const -> Type* {
  auto it = types.find(std::string(name));
  if (it == types.end()) {
    return nullptr;
  }
  return it->second;
}

Universe::Universe(std::unique_ptr<PackageSource> source) : source_(std::move(source)) {}

auto Universe::is_builtin_name(std::string_view name) -> bool {
  for (auto builtin : kBuiltinNames) {
    if (builtin == name) {
      return true;
    }
  }
  return false;
}

auto Universe::intern(std::string key, TypeName name, TypeKind kind) -> Type* {
  auto it = types_.find(key);
  if (it != types_.end()) {
    return it->second.get();
  }
  auto type = std::make_unique<Type>();
  type->name = std::move(name);
  type->kind = kind;
  auto* raw = type.get();
  types_.emplace(std::move(key), std::move(type));
  return raw;
}

auto Universe::builtin(std::string_view name) -> Type* {
  return intern(std::string(name), TypeName{"", std::string(name)}, TypeKind::Builtin);
}

auto Universe::named(std::string_view package, std::string_view name) -> Type* {
  TypeName type_name{std::string(package), std::string(name)};
  auto key = type_name.qualified();
  return intern(std::move(key), std::move(type_name), TypeKind::Unknown);
}

auto Universe::pointer_to(Type* elem) -> Type* {
  auto canonical = std::format("ptr<{}>", elem->name.qualified());
  auto* type = intern(canonical, TypeName{"", canonical}, TypeKind::Pointer);
  type->elem = elem;
  return type;
}

auto Universe::sequence_of(Type* elem) -> Type* {
  auto canonical = std::format("seq<{}>", elem->name.qualified());
  auto* type = intern(canonical, TypeName{"", canonical}, TypeKind::Sequence);
  type->elem = elem;
  return type;
}

auto Universe::map_of(Type* key, Type* elem) -> Type* {
  auto canonical = std::format("map<{}, {}>", key->name.qualified(), elem->name.qualified());
  auto* type = intern(canonical, TypeName{"", canonical}, TypeKind::Associative);
  type->key = key;
  type->elem = elem;
  return type;
}

auto Universe::alias_view(const Type* alias) -> const Type* {
  const auto* underlying = unwrap_alias(alias);
  if (underlying == alias) {
    return alias;
  }
  auto key = type_key(*alias);
  auto it = alias_views_.find(key);
  if (it != alias_views_.end()) {
    return it->second.get();
  }
  auto view = std::make_unique<Type>(*underlying);
  view->name = alias->name;
  const auto* raw = view.get();
  alias_views_.emplace(std::move(key), std::move(view));
  return raw;
}

auto Universe::add_package(std::unique_ptr<Package> package) -> Expected<Package*> {
  if (packages_.contains(package->path)) {
    return tl::unexpected(make_error(std::format("package already defined: {}", package->path)));
  }
  auto* raw = package.get();
  auto path = package->path;
  packages_.emplace(std::move(path), std::move(package));
  return raw;
}

auto Universe::package(std::string_view path) -> Package* {
  auto it = packages_.find(path);
  if (it == packages_.end()) {
    return nullptr;
  }
  return it->second.get();
}

auto Universe::package(std::string_view path) const -> const Package* {
  auto it = packages_.find(path);
  if (it == packages_.end()) {
    return nullptr;
  }
  return it->second.get();
}

auto Universe::resolve_package(std::string_view path) -> Expected<Package*> {
  if (auto* existing = package(path)) {
    return existing;
  }
  const auto context = std::format("unable to load package \"{}\"", path);
  if (!source_) {
    return tl::unexpected(make_error(ErrorCode::NotFound, context + ": no package source"));
  }
  log::debug("loading package {}", path);
  if (auto loaded = source_->load(path, *this); !loaded) {
    return tl::unexpected(with_context(context, std::move(loaded.error())));
  }
  auto* loaded = package(path);
  if (!loaded) {
    return tl::unexpected(make_error(context + ": source did not define it"));
  }
  return loaded;
}

}  // namespace convgen::engine
