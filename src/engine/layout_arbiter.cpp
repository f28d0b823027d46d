#include "engine/layout_arbiter.hpp"

namespace convgen::engine {

LayoutArbiter::LayoutArbiter(std::shared_ptr<const ManualConversionTracker> tracker,
                             std::string function_tag_name, bool enabled)
    : tracker_(std::move(tracker)), function_tag_name_(std::move(function_tag_name)), enabled_(enabled) {}

auto LayoutArbiter::can_use_unsafe_conversion(const Type* a, const Type* b) -> bool {
  return enabled_ && equal(a, b);
}

auto LayoutArbiter::equal(const Type* a, const Type* b) -> bool {
  if (!a || !b) {
    return false;
  }
  if (a == b) {
    return true;
  }
  auto key = std::make_pair(a, b);
  if (auto it = cache_.find(key); it != cache_.end()) {
    return it->second;
  }
  // Seeded with false so that self-referential types terminate.
  cache_[key] = false;
  bool result = equal_uncached(a, b);
  cache_[key] = result;
  return result;
}

auto LayoutArbiter::equal_uncached(const Type* a, const Type* b) -> bool {
  if (tracker_) {
    if (const auto* function = tracker_->preexists(*a, *b);
        function && !ManualConversionTracker::has_tag(*function, function_tag_name_, "copy-only")) {
      return false;
    }
  }

  const auto* in = unwrap_alias(a);
  const auto* out = unwrap_alias(b);
  if (in == out) {
    return true;
  }
  if (in->kind != out->kind) {
    return false;
  }

  switch (in->kind) {
    case TypeKind::Builtin:
      return in->name.name == out->name.name;
    case TypeKind::Record: {
      if (in->members.size() != out->members.size()) {
        return false;
      }
      for (std::size_t i = 0; i < in->members.size(); ++i) {
        if (!equal(in->members[i].type, out->members[i].type)) {
          return false;
        }
      }
      return true;
    }
    case TypeKind::Pointer:
    case TypeKind::Sequence:
      return equal(in->elem, out->elem);
    case TypeKind::Associative:
      return equal(in->key, out->key) && equal(in->elem, out->elem);
    case TypeKind::NamedAlias:
    case TypeKind::Unknown:
      return false;
  }
  return false;
}

auto is_fast_conversion(const Type& in, const Type& out) -> bool {
  switch (in.kind) {
    case TypeKind::Builtin:
      return true;
    case TypeKind::Associative:
    case TypeKind::Sequence:
    case TypeKind::Pointer:
    case TypeKind::Record:
    case TypeKind::NamedAlias:
      return is_directly_assignable(in, out);
    case TypeKind::Unknown:
      return false;
  }
  return false;
}

}  // namespace convgen::engine
