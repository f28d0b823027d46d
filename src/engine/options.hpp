#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "engine/emit.hpp"
#include "engine/error.hpp"
#include "engine/types.hpp"

namespace convgen::engine {

class ManualConversionTracker;

inline constexpr const char* kDefaultTagName = "conversion-gen";

/// An expression in the generated code together with its static type.
struct NamedVariable {
  Expr expr;
  const Type* type = nullptr;
};

/// Additional parameter accepted by every generated and manual conversion
/// function, appended positionally after `in` and `out`.
struct ExtraParam {
  std::string name;
  const Type* type = nullptr;
};

/// Called when a source member has no same-named member in the target type.
using MissingFieldsHandler =
  std::function<Expected<void>(const NamedVariable& in, const NamedVariable& out, const Member& member,
                               EmitBuffer& buffer)>;

/// Called when two same-named members have kinds that cannot be converted.
using InconvertibleFieldsHandler =
  std::function<Expected<void>(const NamedVariable& in, const NamedVariable& out, const Member& in_member,
                               const Member& out_member, EmitBuffer& buffer)>;

/// Called when the generator has no strategy at all for a pair of types.
using UnsupportedTypesHandler =
  std::function<Expected<void>(const NamedVariable& in, const NamedVariable& out, EmitBuffer& buffer)>;

/// Called when a conversion would need a function outside the home package.
/// Returns whether the handler wrote code for the conversion.
using ExternalConversionsHandler =
  std::function<Expected<bool>(const NamedVariable& in, const NamedVariable& out, EmitBuffer& buffer)>;

/// Handlers may write into `buffer` at the spot where the conversion code would
/// go. A handler error keeps the private function but suppresses the public
/// wrapper for the pair.
struct GeneratorOptions {
  /// Shared between generators; created from `extra_params` when null.
  std::shared_ptr<ManualConversionTracker> tracker;

  /// Parameters threaded through every conversion call.
  std::vector<ExtraParam> extra_params;

  bool no_unsafe_conversions = false;

  /// `+<tag>=false` opts a type or member out, `+<tag>=no-public` suppresses
  /// the public wrapper, `+<tag>=peerName:<Name>` overrides peer lookup.
  std::string tag_name = kDefaultTagName;

  /// `+<tag>=drop` and `+<tag>=copy-only` on manual conversion functions.
  std::string function_tag_name = kDefaultTagName;

  /// `+<tag>=<pkg>,<pkg>` in a package's comments lists its peer packages.
  std::string peer_packages_tag_name = std::string(kDefaultTagName) + ":peer-packages";

  /// `+<tag>=<header>` in a package's comments adds includes to its output.
  std::string extra_imports_tag_name = std::string(kDefaultTagName) + ":extra-imports";

  MissingFieldsHandler missing_fields_handler;
  InconvertibleFieldsHandler inconvertible_fields_handler;
  UnsupportedTypesHandler unsupported_types_handler;
  ExternalConversionsHandler external_conversions_handler;
};

}  // namespace convgen::engine
