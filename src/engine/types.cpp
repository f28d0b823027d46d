#include "engine/types.hpp"

#include <format>

namespace convgen::engine {

auto to_string(TypeKind kind) -> std::string_view {
  switch (kind) {
    case TypeKind::Builtin:
      return "builtin";
    case TypeKind::Record:
      return "record";
    case TypeKind::Sequence:
      return "sequence";
    case TypeKind::Associative:
      return "associative";
    case TypeKind::Pointer:
      return "pointer";
    case TypeKind::NamedAlias:
      return "alias";
    case TypeKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

auto TypeName::qualified() const -> std::string {
  if (package.empty()) {
    return name;
  }
  return package + "." + name;
}

auto type_key(const Type& t) -> std::string {
  return std::format("{}#{}", t.name.qualified(), to_string(t.kind));
}

auto same_type(const Type* a, const Type* b) -> bool {
  if (a == b) {
    return true;
  }
  if (!a || !b) {
    return false;
  }
  return a->kind == b->kind && a->name == b->name;
}

auto unwrap_alias(const Type* t) -> const Type* {
  // Bounded so that a malformed self-referencing alias cannot hang the walk.
  for (int depth = 0; t && t->kind == TypeKind::NamedAlias && t->underlying && depth < 64; ++depth) {
    t = t->underlying;
  }
  return t;
}

auto find_member(const Type& t, std::string_view name) -> const Member* {
  for (const auto& member : t.members) {
    if (member.name == name) {
      return &member;
    }
  }
  return nullptr;
}

auto is_primitive(const Type& t) -> bool {
  if (t.kind == TypeKind::Builtin) {
    return true;
  }
  if (t.kind == TypeKind::NamedAlias) {
    const auto* underlying = unwrap_alias(&t);
    return underlying && underlying->kind == TypeKind::Builtin;
  }
  return false;
}

namespace {

auto is_assignable_impl(const Type& t, int depth) -> bool {
  if (is_primitive(t)) {
    return true;
  }
  if (t.kind == TypeKind::Record && depth < 64) {
    for (const auto& member : t.members) {
      if (!member.type || !is_assignable_impl(*member.type, depth + 1)) {
        return false;
      }
    }
    return true;
  }
  return false;
}

}  // namespace

auto is_assignable(const Type& t) -> bool {
  return is_assignable_impl(t, 0);
}

auto is_same_package(const Type& a, const Type& b) -> bool {
  return a.name.package == b.name.package;
}

auto is_directly_assignable(const Type& in, const Type& out) -> bool {
  return is_assignable(in) && (is_primitive(in) || is_same_package(in, out));
}

}  // namespace convgen::engine
