#pragma once

#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "engine/emit.hpp"
#include "engine/error.hpp"
#include "engine/layout_arbiter.hpp"
#include "engine/manual_conversions.hpp"
#include "engine/options.hpp"
#include "engine/peer_resolver.hpp"
#include "engine/types.hpp"
#include "engine/universe.hpp"

namespace convgen::engine {

/// Lifecycle of one generated pair. The private function is always emitted;
/// the public wrapper only when eligible.
enum class Visibility {
  Generating,
  PrivateEmitted,
  PublicEligible,
  PublicSuppressed,
};

struct GeneratedFunction {
  ConversionPair pair;
  std::string private_name;
  std::string public_name;
  EmitBuffer body;
  std::vector<GenError> field_errors;
  Visibility visibility = Visibility::Generating;

  auto has_public_wrapper() const -> bool { return visibility == Visibility::PublicEligible; }
};

/// Synthesizes conversion functions between the types of one package and
/// their peers.
class Generator {
 public:
  /// Loads the involved packages and discovers manual conversions in the peer,
  /// output and types packages. Peer packages come from the types package's
  /// peer-packages tag, followed by `base_peer_packages`.
  static auto create(Universe& universe, std::string types_package, std::string output_package,
                     std::vector<std::string> base_peer_packages, GeneratorOptions options)
    -> Expected<std::unique_ptr<Generator>>;

  /// Whether conversions should be generated for `t`.
  auto filter(const Type& t) -> bool;

  /// Conversions t -> peer and peer -> t, skipping pairs already emitted.
  auto generate_type(const Type& t) -> std::vector<GeneratedFunction>;

  auto generate_function(const Type& in, const Type& out) -> GeneratedFunction;

  auto peer_type_for(const Type& t) -> const Type*;

  /// Extra includes requested through the types package's comments.
  auto extra_imports() const -> std::vector<std::string>;

  auto options() const -> const GeneratorOptions& { return options_; }
  auto peer_packages() const -> const std::vector<std::string>& { return peers_.peer_packages(); }

 private:
  Generator(Universe& universe, GeneratorOptions options, const Package& types_package,
            std::string output_package, std::vector<std::string> peer_packages);

  using Errors = std::vector<GenError>;

  auto generate_for(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;
  auto do_builtin(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;
  auto do_associative(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;
  auto do_sequence(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;
  auto do_record(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;
  auto do_pointer(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;
  auto do_alias(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;
  auto do_unknown(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors;

  /// Manual, internal or external conversion of one container element.
  /// Emits a placeholder when nothing handles it.
  auto convert_element(const Type& owner, const Type& in_elem, const Type& out_elem, Expr in, Expr out,
                       EmitBuffer& buffer, Errors& errors) -> void;

  auto convert_record_member(const Type& in_type, const Type& out_type, const Member& in_member,
                             const Member& out_member, EmitBuffer& buffer, Errors& errors) -> void;
  auto call_external_handler(const Type& in_type, const Type& out_type, const Member& in_member,
                             const Member& out_member, const Type& in_member_type,
                             const Type& out_member_type, EmitBuffer& buffer, Errors& errors) -> void;

  /// Whether the pair may use a generated conversion of this package rather
  /// than deferring to the external conversions handler.
  auto convertible_within_package(const Type& in, const Type& out) const -> bool;
  auto public_function_ref(const Type& in, const Type& out) const -> FunctionRef;
  auto preexists(const Type& in, const Type& out) const -> const Function*;
  auto function_has_tag(const Function& function, std::string_view value) const -> bool;

  auto opted_out(const std::vector<std::string>& comments) const -> bool;
  auto no_public_function(const Type& t) const -> bool;

  Universe& universe_;
  GeneratorOptions options_;
  const Package& package_;
  std::string types_package_;
  std::string output_package_;
  PeerResolver peers_;
  LayoutArbiter arbiter_;
  std::set<std::pair<std::string, std::string>> emitted_;
};

}  // namespace convgen::engine
