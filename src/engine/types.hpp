#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace convgen::engine {

enum class TypeKind {
  Builtin,
  Record,
  Sequence,
  Associative,
  Pointer,
  NamedAlias,
  Unknown,
};

auto to_string(TypeKind kind) -> std::string_view;

/// Package-qualified name. Builtins and anonymous types have an empty package
/// and carry their canonical spelling (`seq<T>`, `map<K, V>`, `ptr<T>`) as name.
struct TypeName {
  std::string package;
  std::string name;

  auto qualified() const -> std::string;
  auto operator==(const TypeName&) const -> bool = default;
};

struct Type;

struct Member {
  std::string name;
  Type* type = nullptr;
  std::vector<std::string> comments;
};

struct Type {
  TypeName name;
  TypeKind kind = TypeKind::Unknown;
  std::vector<Member> members;   ///< Record only, in declaration order
  Type* elem = nullptr;          ///< Sequence, Associative, Pointer
  Type* key = nullptr;           ///< Associative
  Type* underlying = nullptr;    ///< NamedAlias
  std::vector<std::string> comments;
  bool exported = true;
};

struct Param {
  std::string name;
  Type* type = nullptr;
};

/// Free function declared in a package. Only consulted when looking for
/// hand-written conversion functions.
struct Function {
  TypeName name;
  std::vector<Param> params;
  std::vector<Type*> results;
  bool has_receiver = false;
  std::vector<std::string> comments;
};

/// Identity key: (qualified name, kind).
auto type_key(const Type& t) -> std::string;

auto same_type(const Type* a, const Type* b) -> bool;

/// Follows NamedAlias chains down to the first non-alias type.
auto unwrap_alias(const Type* t) -> const Type*;

auto find_member(const Type& t, std::string_view name) -> const Member*;

auto is_primitive(const Type& t) -> bool;

auto is_assignable(const Type& t) -> bool;

auto is_same_package(const Type& a, const Type& b) -> bool;

/// Superficial assignability: values of `in` can be copied into `out` with a
/// plain assignment (possibly through an explicit cast for primitives).
auto is_directly_assignable(const Type& in, const Type& out) -> bool;

}  // namespace convgen::engine
