#include "engine/model_json.hpp"

#include <cctype>
#include <format>
#include <fstream>
#include <memory>
#include <system_error>
#include <string>
#include <utility>

namespace convgen::engine {
namespace {

auto trim(std::string_view text) -> std::string_view {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

struct TypeExprParser {
  std::string_view text;
  Universe& universe;

  // Splits `inner` at its single top-level comma.
  static auto split_pair(std::string_view inner) -> std::pair<std::string_view, std::string_view> {
    int depth = 0;
    for (std::size_t i = 0; i < inner.size(); ++i) {
      char c = inner[i];
      if (c == '<') {
        ++depth;
      } else if (c == '>') {
        --depth;
      } else if (c == ',' && depth == 0) {
        return {inner.substr(0, i), inner.substr(i + 1)};
      }
    }
    return {inner, std::string_view{}};
  }

  auto wrapped(std::string_view expr, std::string_view prefix) const -> Expected<std::string_view> {
    if (expr.back() != '>') {
      return tl::unexpected(make_error(std::format("unterminated '{}' in type expression '{}'", prefix, text)));
    }
    auto inner = trim(expr.substr(prefix.size(), expr.size() - prefix.size() - 1));
    if (inner.empty()) {
      return tl::unexpected(make_error(std::format("empty '{}' in type expression '{}'", prefix, text)));
    }
    return inner;
  }

  auto parse(std::string_view expr) -> Expected<Type*> {
    expr = trim(expr);
    if (expr.empty()) {
      return tl::unexpected(make_error(std::format("empty type in type expression '{}'", text)));
    }
    if (expr.starts_with("ptr<")) {
      auto inner = wrapped(expr, "ptr<");
      if (!inner) {
        return tl::unexpected(inner.error());
      }
      auto elem = parse(*inner);
      if (!elem) {
        return tl::unexpected(elem.error());
      }
      return universe.pointer_to(*elem);
    }
    if (expr.starts_with("seq<")) {
      auto inner = wrapped(expr, "seq<");
      if (!inner) {
        return tl::unexpected(inner.error());
      }
      auto elem = parse(*inner);
      if (!elem) {
        return tl::unexpected(elem.error());
      }
      return universe.sequence_of(*elem);
    }
    if (expr.starts_with("map<")) {
      auto inner = wrapped(expr, "map<");
      if (!inner) {
        return tl::unexpected(inner.error());
      }
      auto [key_text, elem_text] = split_pair(*inner);
      if (trim(elem_text).empty()) {
        return tl::unexpected(make_error(std::format("map needs a key and a value in type expression '{}'", text)));
      }
      auto key = parse(key_text);
      if (!key) {
        return tl::unexpected(key.error());
      }
      auto elem = parse(elem_text);
      if (!elem) {
        return tl::unexpected(elem.error());
      }
      return universe.map_of(*key, *elem);
    }

    for (char c : expr) {
      if (c == '<' || c == '>' || c == ',' || std::isspace(static_cast<unsigned char>(c))) {
        return tl::unexpected(make_error(std::format("malformed type name '{}' in type expression '{}'", expr, text)));
      }
    }

    auto slash = expr.rfind('/');
    auto dot = expr.rfind('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
      if (!Universe::is_builtin_name(expr)) {
        return tl::unexpected(make_error(std::format("unknown builtin type '{}'", expr)));
      }
      return universe.builtin(expr);
    }
    if (dot == 0 || dot + 1 == expr.size()) {
      return tl::unexpected(make_error(std::format("expected package.Name, got '{}'", expr)));
    }
    return universe.named(expr.substr(0, dot), expr.substr(dot + 1));
  }
};

auto get_string_field(const Json& obj, std::string_view field, std::string_view context)
  -> Expected<std::string> {
  auto it = obj.find(std::string(field));
  if (it == obj.end() || !it->is_string()) {
    return tl::unexpected(make_error(std::string(context) + ": missing or invalid field '" + std::string(field) + "'"));
  }
  return it->get<std::string>();
}

auto get_comments(const Json& obj, std::string_view context) -> Expected<std::vector<std::string>> {
  std::vector<std::string> comments;
  auto it = obj.find("comments");
  if (it == obj.end()) {
    return comments;
  }
  if (!it->is_array()) {
    return tl::unexpected(make_error(std::format("{}: comments must be an array", context)));
  }
  for (const auto& line : *it) {
    if (!line.is_string()) {
      return tl::unexpected(make_error(std::format("{}: comment lines must be strings", context)));
    }
    comments.push_back(line.get<std::string>());
  }
  return comments;
}

auto parse_kind(std::string_view kind) -> Expected<TypeKind> {
  if (kind == "record" || kind == "struct") return TypeKind::Record;
  if (kind == "alias") return TypeKind::NamedAlias;
  if (kind == "unknown" || kind == "interface" || kind == "opaque") return TypeKind::Unknown;
  return tl::unexpected(make_error(std::format("unsupported type kind '{}'", kind)));
}

auto parse_type_decl(const Json& decl, Package& package, Universe& universe) -> Expected<void> {
  if (!decl.is_object()) {
    return tl::unexpected(make_error("type entry must be an object"));
  }
  auto name = get_string_field(decl, "name", "type");
  if (!name) {
    return tl::unexpected(name.error());
  }
  auto context = std::format("type {}.{}", package.path, *name);
  if (package.has(*name)) {
    return tl::unexpected(make_error(std::format("duplicate type name: {}", context)));
  }
  auto kind_name = get_string_field(decl, "kind", context);
  if (!kind_name) {
    return tl::unexpected(kind_name.error());
  }
  auto kind = parse_kind(*kind_name);
  if (!kind) {
    return tl::unexpected(make_error(std::format("{}: {}", context, kind.error().message)));
  }
  auto comments = get_comments(decl, context);
  if (!comments) {
    return tl::unexpected(comments.error());
  }

  Type* type = universe.named(package.path, *name);
  if (type->kind != TypeKind::Unknown || !type->members.empty() || type->underlying) {
    return tl::unexpected(make_error(std::format("{}: already defined", context)));
  }
  package.types.emplace(type->name.name, type);
  type->kind = *kind;
  type->comments = std::move(*comments);
  if (auto it = decl.find("exported"); it != decl.end()) {
    if (!it->is_boolean()) {
      return tl::unexpected(make_error(std::format("{}: exported must be a boolean", context)));
    }
    type->exported = it->get<bool>();
  }

  switch (*kind) {
    case TypeKind::Record: {
      auto members_it = decl.find("members");
      if (members_it == decl.end()) {
        break;
      }
      if (!members_it->is_array()) {
        return tl::unexpected(make_error(std::format("{}: members must be an array", context)));
      }
      for (const auto& member_json : *members_it) {
        if (!member_json.is_object()) {
          return tl::unexpected(make_error(std::format("{}: member entry must be an object", context)));
        }
        auto member_name = get_string_field(member_json, "name", context);
        if (!member_name) {
          return tl::unexpected(member_name.error());
        }
        if (find_member(*type, *member_name)) {
          return tl::unexpected(make_error(std::format("{}: duplicate member {}", context, *member_name)));
        }
        auto member_context = std::format("{}.{}", context, *member_name);
        auto type_text = get_string_field(member_json, "type", member_context);
        if (!type_text) {
          return tl::unexpected(type_text.error());
        }
        auto member_type = parse_type_expr(*type_text, universe);
        if (!member_type) {
          return tl::unexpected(make_error(std::format("{}: {}", member_context, member_type.error().message)));
        }
        auto member_comments = get_comments(member_json, member_context);
        if (!member_comments) {
          return tl::unexpected(member_comments.error());
        }
        type->members.push_back(Member{std::move(*member_name), *member_type, std::move(*member_comments)});
      }
      break;
    }
    case TypeKind::NamedAlias: {
      auto underlying_text = get_string_field(decl, "underlying", context);
      if (!underlying_text) {
        return tl::unexpected(underlying_text.error());
      }
      auto underlying = parse_type_expr(*underlying_text, universe);
      if (!underlying) {
        return tl::unexpected(make_error(std::format("{}: {}", context, underlying.error().message)));
      }
      if (*underlying == type) {
        return tl::unexpected(make_error(std::format("{}: alias refers to itself", context)));
      }
      type->underlying = *underlying;
      break;
    }
    case TypeKind::Builtin:
    case TypeKind::Sequence:
    case TypeKind::Associative:
    case TypeKind::Pointer:
    case TypeKind::Unknown:
      break;
  }

  return {};
}

auto parse_function_decl(const Json& decl, Package& package, Universe& universe) -> Expected<void> {
  if (!decl.is_object()) {
    return tl::unexpected(make_error("function entry must be an object"));
  }
  auto name = get_string_field(decl, "name", "function");
  if (!name) {
    return tl::unexpected(name.error());
  }
  auto context = std::format("function {}.{}", package.path, *name);
  if (package.functions.contains(*name)) {
    return tl::unexpected(make_error(std::format("duplicate function name: {}", context)));
  }
  auto comments = get_comments(decl, context);
  if (!comments) {
    return tl::unexpected(comments.error());
  }

  auto function = std::make_unique<Function>();
  function->name = TypeName{package.path, *name};
  function->comments = std::move(*comments);
  if (auto it = decl.find("receiver"); it != decl.end()) {
    if (!it->is_boolean()) {
      return tl::unexpected(make_error(std::format("{}: receiver must be a boolean", context)));
    }
    function->has_receiver = it->get<bool>();
  }

  if (auto params_it = decl.find("params"); params_it != decl.end()) {
    if (!params_it->is_array()) {
      return tl::unexpected(make_error(std::format("{}: params must be an array", context)));
    }
    for (const auto& param_json : *params_it) {
      if (!param_json.is_object()) {
        return tl::unexpected(make_error(std::format("{}: param entry must be an object", context)));
      }
      auto param_name = get_string_field(param_json, "name", context);
      if (!param_name) {
        return tl::unexpected(param_name.error());
      }
      auto type_text = get_string_field(param_json, "type", context);
      if (!type_text) {
        return tl::unexpected(type_text.error());
      }
      auto param_type = parse_type_expr(*type_text, universe);
      if (!param_type) {
        return tl::unexpected(make_error(std::format("{}: {}", context, param_type.error().message)));
      }
      function->params.push_back(Param{std::move(*param_name), *param_type});
    }
  }

  if (auto results_it = decl.find("results"); results_it != decl.end()) {
    if (!results_it->is_array()) {
      return tl::unexpected(make_error(std::format("{}: results must be an array", context)));
    }
    for (const auto& result_json : *results_it) {
      if (!result_json.is_string()) {
        return tl::unexpected(make_error(std::format("{}: result types must be strings", context)));
      }
      auto result_type = parse_type_expr(result_json.get<std::string>(), universe);
      if (!result_type) {
        return tl::unexpected(make_error(std::format("{}: {}", context, result_type.error().message)));
      }
      function->results.push_back(*result_type);
    }
  }

  package.functions.emplace(*name, std::move(function));
  return {};
}

auto read_json_file(const std::filesystem::path& file) -> Expected<Json> {
  std::ifstream stream(file);
  if (!stream) {
    return tl::unexpected(make_error(std::format("cannot open model file {}", file.string())));
  }
  try {
    return Json::parse(stream);
  } catch (const std::exception& ex) {
    return tl::unexpected(make_error(std::format("invalid JSON in {}: {}", file.string(), ex.what())));
  }
}

// Turns the named types a failed package had started to fill back into
// placeholders.
auto reset_types(Package& package) -> void {
  for (auto& [name, type] : package.types) {
    Type placeholder;
    placeholder.name = type->name;
    *type = std::move(placeholder);
  }
}

auto parse_package_body(const Json& json, Package& package, Universe& universe) -> Expected<void> {
  const auto context = std::format("package {}", package.path);
  auto comments = get_comments(json, context);
  if (!comments) {
    return tl::unexpected(comments.error());
  }
  package.comments = std::move(*comments);
  if (auto it = json.find("header"); it != json.end()) {
    if (!it->is_string()) {
      return tl::unexpected(make_error(std::format("{}: header must be a string", context)));
    }
    package.header = it->get<std::string>();
  }

  if (auto types_it = json.find("types"); types_it != json.end()) {
    if (!types_it->is_array()) {
      return tl::unexpected(make_error(std::format("{}: types must be an array", context)));
    }
    for (const auto& decl : *types_it) {
      if (auto result = parse_type_decl(decl, package, universe); !result) {
        return tl::unexpected(result.error());
      }
    }
  }

  if (auto functions_it = json.find("functions"); functions_it != json.end()) {
    if (!functions_it->is_array()) {
      return tl::unexpected(make_error(std::format("{}: functions must be an array", context)));
    }
    for (const auto& decl : *functions_it) {
      if (auto result = parse_function_decl(decl, package, universe); !result) {
        return tl::unexpected(result.error());
      }
    }
  }
  return {};
}

}  // namespace

auto parse_type_expr(std::string_view text, Universe& universe) -> Expected<Type*> {
  TypeExprParser parser{text, universe};
  return parser.parse(text);
}

auto parse_package_json(const Json& json, Universe& universe) -> Expected<Package*> {
  if (!json.is_object()) {
    return tl::unexpected(make_error("package json must be an object"));
  }
  auto path = get_string_field(json, "path", "package");
  if (!path) {
    return tl::unexpected(path.error());
  }
  if (path->empty()) {
    return tl::unexpected(make_error("package: path must not be empty"));
  }
  if (universe.package(*path)) {
    return tl::unexpected(make_error(std::format("package already defined: {}", *path)));
  }

  // Nothing is committed to the universe unless the whole model parses.
  auto package = std::make_unique<Package>();
  package->path = *path;
  if (auto parsed = parse_package_body(json, *package, universe); !parsed) {
    reset_types(*package);
    return tl::unexpected(parsed.error());
  }
  return universe.add_package(std::move(package));
}

auto load_model_file(const std::filesystem::path& file, Universe& universe) -> Expected<void> {
  auto json = read_json_file(file);
  if (!json) {
    return tl::unexpected(json.error());
  }
  if (auto it = json->find("packages"); json->is_object() && it != json->end()) {
    if (!it->is_array()) {
      return tl::unexpected(make_error(std::format("{}: packages must be an array", file.string())));
    }
    for (const auto& package_json : *it) {
      if (auto package = parse_package_json(package_json, universe); !package) {
        return tl::unexpected(package.error());
      }
    }
    return {};
  }
  if (auto package = parse_package_json(*json, universe); !package) {
    return tl::unexpected(package.error());
  }
  return {};
}

JsonPackageSource::JsonPackageSource(std::filesystem::path root) : root_(std::move(root)) {}

auto JsonPackageSource::load(std::string_view path, Universe& universe) -> Expected<void> {
  auto file = root_ / std::filesystem::path(std::string(path)) / "package.json";
  std::error_code ec;
  if (!std::filesystem::exists(file, ec)) {
    return tl::unexpected(make_error(ErrorCode::NotFound, std::format("no model at {}", file.string())));
  }
  auto json = read_json_file(file);
  if (!json) {
    return tl::unexpected(json.error());
  }
  if (auto it = json->find("path"); json->is_object() && it != json->end() && it->is_string() &&
                                   it->get<std::string>() != path) {
    return tl::unexpected(
      make_error(std::format("{} declares package {}, expected {}", file.string(), it->get<std::string>(), path)));
  }
  auto package = parse_package_json(*json, universe);
  if (!package) {
    return tl::unexpected(package.error());
  }
  return {};
}

}  // namespace convgen::engine
