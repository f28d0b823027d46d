#pragma once

#include <map>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "engine/error.hpp"
#include "engine/options.hpp"
#include "engine/types.hpp"
#include "engine/universe.hpp"

namespace convgen::engine {

struct ConversionPair {
  const Type* in = nullptr;
  const Type* out = nullptr;
};

/// Finds and indexes hand-written conversion functions, i.e. functions named
/// `Convert_...` with the signature `(ptr<In> in, ptr<Out> out, extras...) -> error`.
/// The index is keyed by the (in, out) type nodes; the first function registered
/// for a pair wins. Each package is scanned once, and a tracker can be shared
/// between the generators of one run.
class ManualConversionTracker {
 public:
  static auto create(std::vector<ExtraParam> extra_params = {})
    -> Expected<std::shared_ptr<ManualConversionTracker>>;

  /// Scans each package (loading it if needed). Malformed conversion functions
  /// are reported together in one error.
  auto discover(Universe& universe, std::span<const std::string> packages) -> Expected<void>;

  auto preexists(const Type& in, const Type& out) const -> const Function*;

  auto extra_params() const -> const std::vector<ExtraParam>& { return extra_params_; }

  auto size() const -> std::size_t { return conversions_.size(); }

  /// Whether `function` carries `+<tag_name>=<value>`.
  static auto has_tag(const Function& function, std::string_view tag_name, std::string_view value) -> bool;

 private:
  explicit ManualConversionTracker(std::vector<ExtraParam> extra_params);

  auto discover_package(Universe& universe, std::string_view path) -> const std::vector<GenError>&;
  auto check_signature(const Function& function) const -> Expected<ConversionPair>;

  std::vector<ExtraParam> extra_params_;
  std::map<std::string, std::vector<GenError>, std::less<>> processed_;
  // Keyed by interned type nodes; only ever used for lookups.
  std::map<std::pair<const Type*, const Type*>, const Function*> conversions_;
};

}  // namespace convgen::engine
