#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>

#include "engine/manual_conversions.hpp"
#include "engine/types.hpp"

namespace convgen::engine {

/// Decides whether two types are guaranteed to share one memory layout, so
/// that a value can be reinterpreted instead of copied field by field.
/// Member order matters, and a manual conversion that is not `copy-only`
/// anywhere in the walk rules equivalence out.
class LayoutArbiter {
 public:
  LayoutArbiter(std::shared_ptr<const ManualConversionTracker> tracker, std::string function_tag_name,
                bool enabled = true);

  auto can_use_unsafe_conversion(const Type* a, const Type* b) -> bool;

  /// Structural layout equality, ignoring the enabled switch.
  auto equal(const Type* a, const Type* b) -> bool;

 private:
  auto equal_uncached(const Type* a, const Type* b) -> bool;

  std::shared_ptr<const ManualConversionTracker> tracker_;
  std::string function_tag_name_;
  bool enabled_;
  std::map<std::pair<const Type*, const Type*>, bool> cache_;
};

/// True when a plain assignment is as good as any conversion function.
auto is_fast_conversion(const Type& in, const Type& out) -> bool;

}  // namespace convgen::engine
