#pragma once

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

#include "engine/error.hpp"
#include "engine/universe.hpp"

namespace convgen::engine {

using Json = nlohmann::json;

/// Parses a type expression: a builtin name, `path/to/pkg.Name`, `ptr<T>`,
/// `seq<T>` or `map<K, V>`.
auto parse_type_expr(std::string_view text, Universe& universe) -> Expected<Type*>;

/// Defines one package in `universe` from its JSON model:
///
///   { "path": "example/v1", "header": "example/v1/types.hpp",
///     "comments": ["+conversion-gen:peer-packages=example/internal"],
///     "types": [ { "name": "Foo", "kind": "record", "members": [...] } ],
///     "functions": [ { "name": "...", "params": [...], "results": ["error"] } ] }
auto parse_package_json(const Json& json, Universe& universe) -> Expected<Package*>;

/// Loads either a single package object or `{ "packages": [...] }`.
auto load_model_file(const std::filesystem::path& file, Universe& universe) -> Expected<void>;

/// Resolves package `a/b` from `<root>/a/b/package.json`.
class JsonPackageSource : public PackageSource {
 public:
  explicit JsonPackageSource(std::filesystem::path root);

  auto load(std::string_view path, Universe& universe) -> Expected<void> override;

 private:
  std::filesystem::path root_;
};

}  // namespace convgen::engine
