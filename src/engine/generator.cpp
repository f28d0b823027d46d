#include "engine/generator.hpp"

#include <format>

#include "common/logging/log.hpp"
#include "engine/naming.hpp"
#include "engine/tags.hpp"

namespace convgen::engine {
namespace {

// Every generated routine sees `in` and `out` as pointers to the values being
// converted, at any nesting depth.
auto in_value() -> Expr {
  return Expr::var("in").deref();
}

auto out_value() -> Expr {
  return Expr::var("out").deref();
}

auto function_ref(const Function& function) -> FunctionRef {
  return FunctionRef{function.name.package, function.name.name};
}

auto same_params(const std::vector<ExtraParam>& a, const std::vector<ExtraParam>& b) -> bool {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (a[i].name != b[i].name || !same_type(a[i].type, b[i].type)) {
      return false;
    }
  }
  return true;
}

auto append_unique(std::vector<std::string>& list, const std::string& value) -> void {
  for (const auto& existing : list) {
    if (existing == value) {
      return;
    }
  }
  list.push_back(value);
}

}  // namespace

auto Generator::create(Universe& universe, std::string types_package, std::string output_package,
                       std::vector<std::string> base_peer_packages, GeneratorOptions options)
  -> Expected<std::unique_ptr<Generator>> {
  if (!options.tracker) {
    auto tracker = ManualConversionTracker::create(options.extra_params);
    if (!tracker) {
      return tl::unexpected(tracker.error());
    }
    options.tracker = std::move(*tracker);
  } else if (options.extra_params.empty()) {
    options.extra_params = options.tracker->extra_params();
  } else if (!same_params(options.extra_params, options.tracker->extra_params())) {
    return tl::unexpected(make_error("extra conversion parameters do not match the shared tracker"));
  }

  auto types_pkg = universe.resolve_package(types_package);
  if (!types_pkg) {
    return tl::unexpected(types_pkg.error());
  }
  auto output_pkg = universe.resolve_package(output_package);
  if (!output_pkg) {
    return tl::unexpected(output_pkg.error());
  }

  std::vector<std::string> peer_packages;
  for (const auto& path : extract_tag(options.peer_packages_tag_name, (*types_pkg)->comments)) {
    if (!path.empty()) {
      append_unique(peer_packages, path);
    }
  }
  for (const auto& path : base_peer_packages) {
    append_unique(peer_packages, path);
  }

  auto scanned = peer_packages;
  append_unique(scanned, output_package);
  append_unique(scanned, types_package);
  if (auto discovered = options.tracker->discover(universe, scanned); !discovered) {
    return tl::unexpected(discovered.error());
  }

  return std::unique_ptr<Generator>(new Generator(universe, std::move(options), **types_pkg,
                                                  std::move(output_package), std::move(peer_packages)));
}

Generator::Generator(Universe& universe, GeneratorOptions options, const Package& types_package,
                     std::string output_package, std::vector<std::string> peer_packages)
    : universe_(universe),
      options_(std::move(options)),
      package_(types_package),
      types_package_(types_package.path),
      output_package_(std::move(output_package)),
      peers_(universe, std::move(peer_packages), options_.tag_name),
      arbiter_(options_.tracker, options_.function_tag_name, !options_.no_unsafe_conversions) {}

auto Generator::filter(const Type& t) -> bool {
  const auto* peer = peer_type_for(t);
  return peer && convertible_within_package(t, *peer);
}

auto Generator::peer_type_for(const Type& t) -> const Type* {
  return peers_.resolve(t);
}

auto Generator::extra_imports() const -> std::vector<std::string> {
  std::vector<std::string> imports;
  for (const auto& value : extract_tag(options_.extra_imports_tag_name, package_.comments)) {
    if (!value.empty()) {
      append_unique(imports, value);
    }
  }
  return imports;
}

auto Generator::generate_type(const Type& t) -> std::vector<GeneratedFunction> {
  std::vector<GeneratedFunction> functions;
  log::debug("generating for type {}", t.name.qualified());
  const auto* peer = peer_type_for(t);
  if (!peer) {
    return functions;
  }
  for (const auto& [in, out] : {std::make_pair(&t, peer), std::make_pair(peer, &t)}) {
    if (emitted_.contains({type_key(*in), type_key(*out)})) {
      log::debug("conversion {} -> {} already generated", in->name.qualified(), out->name.qualified());
      continue;
    }
    functions.push_back(generate_function(*in, *out));
  }
  return functions;
}

auto Generator::generate_function(const Type& in, const Type& out) -> GeneratedFunction {
  GeneratedFunction function;
  function.pair = ConversionPair{&in, &out};
  function.private_name = private_conversion_name(in, out);
  function.public_name = public_conversion_name(in, out);

  function.field_errors = generate_for(in, out, function.body);
  function.visibility = Visibility::PrivateEmitted;
  emitted_.insert({type_key(in), type_key(out)});

  if (preexists(in, out)) {
    // A manual public conversion already covers the pair.
    function.visibility = Visibility::PublicSuppressed;
  } else if (no_public_function(in) || no_public_function(out)) {
    function.visibility = Visibility::PublicSuppressed;
  } else if (function.field_errors.empty()) {
    function.visibility = Visibility::PublicEligible;
  } else {
    function.visibility = Visibility::PublicSuppressed;
    log::error("could not find nor generate a final conversion function for {} -> {}", in.name.qualified(),
               out.name.qualified());
    log::error("  you need to add manual conversions:");
    for (const auto& error : function.field_errors) {
      log::error("      - {}", error.message);
    }
  }
  return function;
}

auto Generator::generate_for(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  log::trace("generating {} -> {}", in.name.qualified(), out.name.qualified());
  if (in.kind != out.kind) {
    return do_unknown(in, out, buffer);
  }
  switch (out.kind) {
    case TypeKind::Builtin:
      return do_builtin(in, out, buffer);
    case TypeKind::Associative:
      return do_associative(in, out, buffer);
    case TypeKind::Sequence:
      return do_sequence(in, out, buffer);
    case TypeKind::Record:
      return do_record(in, out, buffer);
    case TypeKind::Pointer:
      return do_pointer(in, out, buffer);
    case TypeKind::NamedAlias:
      return do_alias(in, out, buffer);
    case TypeKind::Unknown:
      return do_unknown(in, out, buffer);
  }
  return do_unknown(in, out, buffer);
}

auto Generator::do_builtin(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  if (same_type(&in, &out)) {
    buffer.assign(out_value(), in_value());
  } else {
    buffer.assign(out_value(), in_value().cast_to(&out));
  }
  return {};
}

auto Generator::do_associative(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  Errors errors;
  if (same_type(in.key, out.key) && same_type(in.elem, out.elem) && in.key->kind == TypeKind::Builtin &&
      in.elem->kind == TypeKind::Builtin) {
    buffer.bulk_copy(out_value(), in_value(), &out);
    return errors;
  }
  buffer.allocate(out_value(), in_value(), &out);

  if (!is_directly_assignable(*in.key, *out.key)) {
    log::warn("{}: converting unassignable keys {} -> {} is unsupported, emitting a stub", in.name.qualified(),
              in.key->name.qualified(), out.key->name.qualified());
    buffer.for_each_stub(in_value(), in.key);
    buffer.comment(CommentLevel::Fixme,
                   std::format("converting unassignable keys unsupported {}", in.key->name.qualified()));
    buffer.end_block();
    return errors;
  }

  buffer.for_each_entry(in_value(), "key", "val");
  auto key = Expr::var("key");
  auto value = Expr::var("val");
  auto target = out_value().at(same_type(in.key, out.key) ? key : key.cast_to(out.key));
  if (is_directly_assignable(*in.elem, *out.elem)) {
    buffer.assign(target, same_type(in.elem, out.elem) ? value : value.cast_to(out.elem));
  } else {
    auto new_value = Expr::var("newVal");
    buffer.new_element("newVal", out.elem);
    convert_element(in, *in.elem, *out.elem, value.address_of(), new_value.address_of(), buffer, errors);
    buffer.assign(target, new_value);
  }
  buffer.end_block();
  return errors;
}

auto Generator::do_sequence(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  Errors errors;
  if (same_type(in.elem, out.elem) && in.elem->kind == TypeKind::Builtin) {
    buffer.bulk_copy(out_value(), in_value(), &out);
    return errors;
  }
  buffer.allocate(out_value(), in_value(), &out);

  buffer.for_each_index(in_value(), "i");
  auto index = Expr::var("i");
  auto source = in_value().at(index);
  auto target = out_value().at(index);
  if (is_directly_assignable(*in.elem, *out.elem)) {
    buffer.assign(target, same_type(in.elem, out.elem) ? source : source.cast_to(out.elem));
  } else {
    convert_element(in, *in.elem, *out.elem, source.address_of(), target.address_of(), buffer, errors);
  }
  buffer.end_block();
  return errors;
}

auto Generator::do_pointer(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  Errors errors;
  buffer.allocate(out_value(), Expr{}, &out);
  auto pointee_in = in_value().deref();
  auto pointee_out = out_value().deref();
  if (is_directly_assignable(*in.elem, *out.elem)) {
    buffer.assign(pointee_out, same_type(in.elem, out.elem) ? pointee_in : pointee_in.cast_to(out.elem));
  } else {
    convert_element(in, *in.elem, *out.elem, pointee_in.address_of(), pointee_out.address_of(), buffer, errors);
  }
  return errors;
}

auto Generator::do_alias(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  // TODO: convert through the underlying types once alias-transparent peers
  // can be told apart from aliases that deliberately change representation.
  return do_unknown(in, out, buffer);
}

auto Generator::do_unknown(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  if (!options_.unsupported_types_handler) {
    log::warn("don't know how to convert {} to {}", in.name.qualified(), out.name.qualified());
    return {};
  }
  auto handled = options_.unsupported_types_handler(NamedVariable{Expr::var("in"), &in},
                                                    NamedVariable{Expr::var("out"), &out}, buffer);
  if (!handled) {
    return {handled.error()};
  }
  return {};
}

auto Generator::convert_element(const Type& owner, const Type& in_elem, const Type& out_elem, Expr in, Expr out,
                                 EmitBuffer& buffer, Errors& errors) -> void {
  if (const auto* function = preexists(in_elem, out_elem)) {
    if (function_has_tag(*function, "drop")) {
      log::debug("dropping element conversion {} for {}", function->name.qualified(), owner.name.qualified());
      buffer.comment(CommentLevel::Info, std::format("{} is dropped", function->name.name));
      return;
    }
    buffer.call_conversion(function_ref(*function), std::move(in), std::move(out));
    return;
  }
  if (convertible_within_package(in_elem, out_elem)) {
    buffer.call_conversion(public_function_ref(in_elem, out_elem), std::move(in), std::move(out));
    return;
  }

  bool handled = false;
  if (!options_.external_conversions_handler) {
    log::warn("{}'s elements of type {} require manual conversion to external type {}", owner.name.qualified(),
              in_elem.name.qualified(), out_elem.name.qualified());
  } else {
    auto result = options_.external_conversions_handler(NamedVariable{in, &in_elem},
                                                        NamedVariable{out, &out_elem}, buffer);
    if (!result) {
      errors.push_back(result.error());
    } else {
      handled = *result;
    }
  }
  if (!handled) {
    buffer.comment(CommentLevel::Fixme, std::format("{} -> {} requires manual conversion", in_elem.name.qualified(),
                                                    out_elem.name.qualified()));
  }
}

auto Generator::do_record(const Type& in, const Type& out, EmitBuffer& buffer) -> Errors {
  Errors errors;
  for (const auto& in_member : in.members) {
    if (opted_out(in_member.comments)) {
      buffer.comment(CommentLevel::Info, std::format("in.{} opted out of conversion generation", in_member.name));
      continue;
    }
    const auto* out_member = find_member(out, in_member.name);
    if (!out_member) {
      if (!options_.missing_fields_handler) {
        log::warn("{}.{} requires manual conversion: does not exist in peer-type {}", in.name.qualified(),
                  in_member.name, out.name.qualified());
      } else if (auto handled = options_.missing_fields_handler(NamedVariable{Expr::var("in"), &in},
                                                                NamedVariable{Expr::var("out"), &out}, in_member,
                                                                buffer);
                 !handled) {
        errors.push_back(handled.error());
      }
      continue;
    }
    convert_record_member(in, out, in_member, *out_member, buffer, errors);
  }
  return errors;
}

auto Generator::convert_record_member(const Type& in_type, const Type& out_type, const Member& in_member,
                                      const Member& out_member, EmitBuffer& buffer, Errors& errors) -> void {
  // Aliases convert like their underlying shape but keep their own name.
  const Type& in_t = *universe_.alias_view(in_member.type);
  const Type& out_t = *universe_.alias_view(out_member.type);
  auto in_field = in_value().field(in_member.name);
  auto out_field = out_value().field(out_member.name);

  // Manual conversions are matched on the declared member types.
  if (const auto* function = preexists(*in_member.type, *out_member.type)) {
    if (function_has_tag(*function, "drop")) {
      log::debug("dropping {}.{}: {} is tagged drop", in_type.name.qualified(), in_member.name,
                 function->name.qualified());
      return;
    }
    const bool fast = is_fast_conversion(in_t, out_t);
    if (!function_has_tag(*function, "copy-only") ||
        !(fast || arbiter_.can_use_unsafe_conversion(in_member.type, out_member.type))) {
      buffer.call_conversion(function_ref(*function), in_field.address_of(), out_field.address_of());
      return;
    }
    log::debug("skipped function {} because it is copy-only and a direct copy is possible",
               function->name.qualified());
    // The manual function suppresses this pair's public wrapper.
    if (!fast && (in_t.kind == TypeKind::Record || in_t.kind == TypeKind::NamedAlias)) {
      buffer.reinterpret_assign(out_field, in_field, &in_t, &out_t);
      return;
    }
  }

  // Identical types take the regular path below and end up as a copy.
  if (!same_type(&in_t, &out_t) && arbiter_.can_use_unsafe_conversion(in_member.type, out_member.type)) {
    switch (in_t.kind) {
      case TypeKind::Pointer:
      case TypeKind::Associative:
      case TypeKind::Sequence:
        buffer.reinterpret_assign(out_field, in_field, &in_t, &out_t);
        return;
      case TypeKind::Builtin:
      case TypeKind::Record:
      case TypeKind::NamedAlias:
      case TypeKind::Unknown:
        break;
    }
  }

  if (in_t.kind != out_t.kind) {
    if (!options_.inconvertible_fields_handler) {
      log::warn("{}.{} requires manual conversion: inconvertible types: {} vs {} for {}.{}", in_type.name.qualified(),
                in_member.name, in_t.name.qualified(), out_t.name.qualified(), out_type.name.qualified(),
                out_member.name);
    } else if (auto handled = options_.inconvertible_fields_handler(NamedVariable{Expr::var("in"), &in_type},
                                                                    NamedVariable{Expr::var("out"), &out_type},
                                                                    in_member, out_member, buffer);
               !handled) {
      errors.push_back(handled.error());
    }
    return;
  }

  switch (in_t.kind) {
    case TypeKind::Builtin:
      buffer.assign(out_field, same_type(&in_t, &out_t) ? in_field : in_field.cast_to(&out_t));
      return;
    case TypeKind::Associative:
    case TypeKind::Sequence:
    case TypeKind::Pointer: {
      if (is_directly_assignable(in_t, out_t)) {
        buffer.assign(out_field, in_field);
        return;
      }
      buffer.if_not_null(in_field, &in_t);
      buffer.begin_scope(in_field.address_of(), out_field.address_of(), &in_t, &out_t);
      auto nested = generate_for(in_t, out_t, buffer);
      errors.insert(errors.end(), nested.begin(), nested.end());
      buffer.end_block();
      buffer.otherwise();
      buffer.assign_null(out_field, &out_t);
      buffer.end_block();
      return;
    }
    case TypeKind::Record:
      if (is_directly_assignable(in_t, out_t)) {
        buffer.assign(out_field, in_field);
        return;
      }
      break;
    case TypeKind::NamedAlias:
      if (is_directly_assignable(in_t, out_t)) {
        buffer.assign(out_field, same_type(&in_t, &out_t) ? in_field : in_field.cast_to(&out_t));
        return;
      }
      break;
    case TypeKind::Unknown:
      break;
  }

  if (convertible_within_package(in_t, out_t)) {
    buffer.call_conversion(public_function_ref(in_t, out_t), in_field.address_of(), out_field.address_of());
    return;
  }
  call_external_handler(in_type, out_type, in_member, out_member, in_t, out_t, buffer, errors);
}

auto Generator::call_external_handler(const Type& in_type, const Type& out_type, const Member& in_member,
                                      const Member& out_member, const Type& in_member_type,
                                      const Type& out_member_type, EmitBuffer& buffer, Errors& errors) -> void {
  if (!options_.external_conversions_handler) {
    log::warn("{}.{} requires manual conversion to external type {}.{}", in_type.name.qualified(), in_member.name,
              out_type.name.qualified(), out_member.name);
    return;
  }
  NamedVariable in{in_value().field(in_member.name).address_of(), &in_member_type};
  NamedVariable out{out_value().field(out_member.name).address_of(), &out_member_type};
  if (auto handled = options_.external_conversions_handler(in, out, buffer); !handled) {
    errors.push_back(handled.error());
  }
}

auto Generator::convertible_within_package(const Type& in, const Type& out) const -> bool {
  const Type* t = &in;
  const Type* other = &out;
  if (in.name.package != types_package_) {
    std::swap(t, other);
  }
  if (t->name.package != types_package_) {
    return false;
  }
  if (opted_out(t->comments)) {
    log::debug("type {} requests no conversion generation, skipping", t->name.qualified());
    return false;
  }
  // TODO: consider generating functions for sequences and maps declared as
  // named types once the model can declare them.
  return t->kind == TypeKind::Record && other->exported;
}

auto Generator::public_function_ref(const Type& in, const Type& out) const -> FunctionRef {
  return FunctionRef{output_package_, public_conversion_name(in, out)};
}

auto Generator::preexists(const Type& in, const Type& out) const -> const Function* {
  return options_.tracker->preexists(in, out);
}

auto Generator::function_has_tag(const Function& function, std::string_view value) const -> bool {
  return ManualConversionTracker::has_tag(function, options_.function_tag_name, value);
}

auto Generator::opted_out(const std::vector<std::string>& comments) const -> bool {
  return has_tag_value(options_.tag_name, comments, "false");
}

auto Generator::no_public_function(const Type& t) const -> bool {
  return has_tag_value(options_.tag_name, t.comments, "no-public");
}

}  // namespace convgen::engine
