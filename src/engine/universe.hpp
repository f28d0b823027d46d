#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace convgen::engine {

struct Package {
  std::string path;
  std::string header;                  ///< Header generated code includes to see this package
  std::vector<std::string> comments;   ///< Package-level annotations
  std::map<std::string, Type*> types;  ///< Sorted by simple name
  std::map<std::string, std::unique_ptr<Function>> functions;

  auto has(std::string_view name) const -> bool;
  auto type(std::string_view name) const -> Type*;
};

class Universe;

/// Materializes packages on demand, e.g. from model files on disk.
class PackageSource {
 public:
  virtual ~PackageSource() = default;

  virtual auto load(std::string_view path, Universe& universe) -> Expected<void> = 0;
};

/// Every type and package known to a generation run. Types are interned by
/// canonical name so that pointers stay stable and identical names share one
/// node; a named type referenced before its package is loaded starts out as an
/// Unknown placeholder and is filled in when the package arrives.
class Universe {
 public:
  explicit Universe(std::unique_ptr<PackageSource> source = nullptr);

  Universe(const Universe&) = delete;
  auto operator=(const Universe&) -> Universe& = delete;

  static auto is_builtin_name(std::string_view name) -> bool;

  auto builtin(std::string_view name) -> Type*;
  auto named(std::string_view package, std::string_view name) -> Type*;
  auto pointer_to(Type* elem) -> Type*;
  auto sequence_of(Type* elem) -> Type*;
  auto map_of(Type* key, Type* elem) -> Type*;

  /// Copy of the alias' underlying shape that keeps the alias' name.
  auto alias_view(const Type* alias) -> const Type*;

  /// Takes ownership of a fully parsed package. Fails if the path is taken.
  auto add_package(std::unique_ptr<Package> package) -> Expected<Package*>;
  auto package(std::string_view path) -> Package*;
  auto package(std::string_view path) const -> const Package*;

  /// Returns the package, loading it through the source when not yet known.
  /// A package without any model fails with ErrorCode::NotFound.
  auto resolve_package(std::string_view path) -> Expected<Package*>;

  auto packages() const -> const std::map<std::string, std::unique_ptr<Package>, std::less<>>& {
    return packages_;
  }

 private:
  auto intern(std::string key, TypeName name, TypeKind kind) -> Type*;

  std::unique_ptr<PackageSource> source_;
  std::map<std::string, std::unique_ptr<Type>, std::less<>> types_;
  std::map<std::string, std::unique_ptr<Type>, std::less<>> alias_views_;
  std::map<std::string, std::unique_ptr<Package>, std::less<>> packages_;
};

}  // namespace convgen::engine
