#include "render/cxx_renderer.hpp"

#include <format>
#include <string_view>

#include "common/logging/log.hpp"
#include "engine/naming.hpp"

namespace convgen::render {
namespace {

using engine::EmitOp;
using engine::Expr;
using engine::OpKind;
using engine::Type;
using engine::TypeKind;

constexpr std::string_view kHeaderComment = "// Code generated by convgen. DO NOT EDIT.";

constexpr std::string_view kSystemIncludes[] = {
    "<cstddef>", "<cstdint>", "<map>", "<memory>", "<string>", "<vector>",
};

auto builtin_spelling(std::string_view name) -> std::string_view {
  if (name == "bool") return "bool";
  if (name == "byte" || name == "uint8") return "std::uint8_t";
  if (name == "int8") return "std::int8_t";
  if (name == "int16") return "std::int16_t";
  if (name == "int32") return "std::int32_t";
  if (name == "int64") return "std::int64_t";
  if (name == "uint16") return "std::uint16_t";
  if (name == "uint32") return "std::uint32_t";
  if (name == "uint64") return "std::uint64_t";
  if (name == "int") return "int";
  if (name == "uint") return "unsigned int";
  if (name == "float32") return "float";
  if (name == "float64") return "double";
  if (name == "string") return "std::string";
  return {};
}

auto include_line(std::string_view header) -> std::string {
  if (header.starts_with('<') || header.starts_with('"')) {
    return std::format("#include {}", header);
  }
  return std::format("#include \"{}\"", header);
}

auto comment_prefix(engine::CommentLevel level) -> std::string_view {
  switch (level) {
    case engine::CommentLevel::Info:
      return "// ";
    case engine::CommentLevel::Warning:
      return "// WARNING: ";
    case engine::CommentLevel::Fixme:
      return "// FIXME: ";
  }
  return "// ";
}

}  // namespace

CxxRenderer::CxxRenderer(const engine::Universe& universe, RenderOptions options)
    : universe_(universe), options_(std::move(options)) {}

auto CxxRenderer::file_name(const engine::GeneratedFile& file) -> std::string {
  return file.base_name + ".cpp";
}

auto CxxRenderer::render_type(const Type* type) -> std::string {
  if (!type) {
    return "void";
  }
  if (!type->name.package.empty()) {
    referenced_.insert(type->name.package);
    return std::format("::{}::{}", engine::package_namespace(type->name.package), type->name.name);
  }
  switch (type->kind) {
    case TypeKind::Builtin:
      if (type->name.name == "error") {
        return options_.error_type;
      }
      return std::string(builtin_spelling(type->name.name));
    case TypeKind::Sequence:
      return std::format("std::vector<{}>", render_type(type->elem));
    case TypeKind::Associative:
      return std::format("std::map<{}, {}>", render_type(type->key), render_type(type->elem));
    case TypeKind::Pointer:
      return std::format("std::shared_ptr<{}>", render_type(type->elem));
    case TypeKind::Record:
    case TypeKind::NamedAlias:
    case TypeKind::Unknown:
      break;
  }
  return type->name.name;
}

// Function parameters of pointer type are plain pointers; everything else is
// taken by const reference.
auto CxxRenderer::render_param_type(const Type* type) -> std::string {
  if (type && type->kind == TypeKind::Pointer && type->name.package.empty()) {
    return std::format("{}*", render_type(type->elem));
  }
  return std::format("const {}&", render_type(type));
}

auto CxxRenderer::operand(const Expr& expr) -> std::string {
  auto text = render_expr(expr);
  switch (expr.kind) {
    case Expr::Kind::Deref:
    case Expr::Kind::AddressOf:
      return std::format("({})", text);
    case Expr::Kind::Var:
    case Expr::Kind::Field:
    case Expr::Kind::Index:
    case Expr::Kind::Cast:
      break;
  }
  return text;
}

auto CxxRenderer::render_expr(const Expr& expr) -> std::string {
  switch (expr.kind) {
    case Expr::Kind::Var:
      return expr.name;
    case Expr::Kind::Field:
      if (expr.base->kind == Expr::Kind::Deref) {
        return std::format("{}->{}", operand(*expr.base->base), expr.name);
      }
      return std::format("{}.{}", operand(*expr.base), expr.name);
    case Expr::Kind::Index:
      return std::format("{}[{}]", operand(*expr.base), render_expr(*expr.index));
    case Expr::Kind::Deref:
      return std::format("*{}", render_expr(*expr.base));
    case Expr::Kind::AddressOf:
      return std::format("&{}", render_expr(*expr.base));
    case Expr::Kind::Cast:
      return std::format("static_cast<{}>({})", render_type(expr.type), render_expr(*expr.base));
  }
  return expr.name;
}

auto CxxRenderer::call_args(const std::string& in, const std::string& out) const -> std::string {
  auto args = std::format("{}, {}", in, out);
  for (const auto& extra : extras_) {
    args += ", " + extra.name;
  }
  return args;
}

auto CxxRenderer::line(std::size_t depth, std::string_view text, std::string& out) const -> void {
  out.append(depth * 2, ' ');
  out += text;
  out += '\n';
}

auto CxxRenderer::signature(const std::string& name, const engine::ConversionPair& pair,
                            const std::vector<engine::ExtraParam>& extras) -> std::string {
  auto params = std::format("const {}* in, {}* out", render_type(pair.in), render_type(pair.out));
  for (const auto& extra : extras) {
    params += std::format(", {} {}", render_param_type(extra.type), extra.name);
  }
  return std::format("auto {}({}) -> {}", name, params, options_.error_type);
}

auto CxxRenderer::render_op(const EmitOp& op, std::vector<Block>& blocks, std::string& out)
  -> engine::Expected<void> {
  const auto depth = blocks.size() + 1;
  switch (op.kind) {
    case OpKind::Comment:
      line(depth, std::format("{}{}", comment_prefix(op.level), op.text), out);
      return {};
    case OpKind::Raw:
      line(depth, op.text, out);
      return {};
    case OpKind::Assign:
      line(depth, std::format("{} = {};", render_expr(op.dst), render_expr(op.src)), out);
      return {};
    case OpKind::ReinterpretAssign:
      if (op.type->kind == TypeKind::Pointer) {
        line(depth,
             std::format("{} = std::reinterpret_pointer_cast<{}>({});", render_expr(op.dst),
                         render_type(op.type->elem), render_expr(op.src)),
             out);
      } else {
        line(depth,
             std::format("{} = *reinterpret_cast<const {}*>(&{});", render_expr(op.dst), render_type(op.type),
                         render_expr(op.src)),
             out);
      }
      return {};
    case OpKind::AssignNull:
      if (op.type->kind == TypeKind::Pointer) {
        line(depth, std::format("{} = nullptr;", render_expr(op.dst)), out);
      } else {
        line(depth, std::format("{}.clear();", operand(op.dst)), out);
      }
      return {};
    case OpKind::Allocate:
      switch (op.type->kind) {
        case TypeKind::Pointer:
          line(depth, std::format("{} = std::make_shared<{}>();", render_expr(op.dst), render_type(op.type->elem)),
               out);
          break;
        case TypeKind::Sequence:
          line(depth,
               std::format("{} = {}({}.size());", render_expr(op.dst), render_type(op.type), operand(op.src)), out);
          break;
        case TypeKind::Builtin:
        case TypeKind::Record:
        case TypeKind::Associative:
        case TypeKind::NamedAlias:
        case TypeKind::Unknown:
          line(depth, std::format("{} = {}{{}};", render_expr(op.dst), render_type(op.type)), out);
          break;
      }
      return {};
    case OpKind::BulkCopy:
      line(depth,
           std::format("{} = {}({}.begin(), {}.end());", render_expr(op.dst), render_type(op.type), operand(op.src),
                       operand(op.src)),
           out);
      return {};
    case OpKind::NewElement:
      line(depth, std::format("{} {}{{}};", render_type(op.type), op.text), out);
      return {};
    case OpKind::CallConversion: {
      if (!op.function.package.empty()) {
        referenced_.insert(op.function.package);
      }
      auto function = op.function.package.empty()
                        ? op.function.name
                        : std::format("::{}::{}", engine::package_namespace(op.function.package), op.function.name);
      line(depth,
           std::format("if (auto err = {}({}); {}) {{", function,
                       call_args(render_expr(op.src), render_expr(op.dst)), options_.failure_test),
           out);
      line(depth + 1, "return err;", out);
      line(depth, "}", out);
      return {};
    }
    case OpKind::ForEachIndex:
      line(depth,
           std::format("for (std::size_t {0} = 0; {0} < {1}.size(); ++{0}) {{", op.text, operand(op.src)), out);
      blocks.push_back(Block{});
      return {};
    case OpKind::ForEachEntry:
      line(depth, std::format("for (const auto& [{}, {}] : {}) {{", op.text, op.text2, render_expr(op.src)), out);
      blocks.push_back(Block{});
      return {};
    case OpKind::ForEachStub:
      line(depth, std::format("for ([[maybe_unused]] const auto& entry : {}) {{", render_expr(op.src)), out);
      blocks.push_back(Block{});
      return {};
    case OpKind::IfNotNull:
      if (op.src_type && op.src_type->kind == TypeKind::Pointer) {
        line(depth, std::format("if ({}) {{", render_expr(op.src)), out);
      } else {
        line(depth, std::format("if (!{}.empty()) {{", operand(op.src)), out);
      }
      blocks.push_back(Block{Block::Kind::Guard});
      return {};
    case OpKind::Else:
      if (blocks.empty() || blocks.back().kind != Block::Kind::Guard) {
        return tl::unexpected(engine::make_error("else without a matching guard"));
      }
      line(depth - 1, "} else {", out);
      blocks.back().kind = Block::Kind::Plain;
      return {};
    case OpKind::BeginScope: {
      Block block{Block::Kind::Scope, render_expr(op.src), render_expr(op.dst)};
      line(depth,
           std::format("if (auto err = [&](const {}* in, {}* out) -> {} {{", render_type(op.src_type),
                       render_type(op.type), options_.error_type),
           out);
      blocks.push_back(std::move(block));
      return {};
    }
    case OpKind::EndBlock: {
      if (blocks.empty()) {
        return tl::unexpected(engine::make_error("unbalanced end of block"));
      }
      auto block = std::move(blocks.back());
      blocks.pop_back();
      if (block.kind != Block::Kind::Scope) {
        line(depth - 1, "}", out);
        return {};
      }
      line(depth, "return {};", out);
      line(depth - 1,
           std::format("}}({}, {}); {}) {{", block.in, block.out, options_.failure_test), out);
      line(depth, "return err;", out);
      line(depth - 1, "}", out);
      return {};
    }
  }
  return {};
}

auto CxxRenderer::render_function(const engine::GeneratedFunction& function,
                                  const std::vector<engine::ExtraParam>& extras, std::string& out)
  -> engine::Expected<void> {
  out += signature(function.private_name, function.pair, extras) + " {\n";
  std::vector<Block> blocks;
  for (const auto& op : function.body.ops()) {
    if (auto rendered = render_op(op, blocks, out); !rendered) {
      return tl::unexpected(engine::make_error(std::format("{}: {}", function.private_name, rendered.error().message)));
    }
  }
  if (!blocks.empty()) {
    return tl::unexpected(engine::make_error(std::format("{}: {} unclosed block(s)", function.private_name, blocks.size())));
  }
  line(1, "return {};", out);
  out += "}\n";

  if (function.has_public_wrapper()) {
    out += "\n";
    out += signature(function.public_name, function.pair, extras) + " {\n";
    line(1, std::format("return {}({});", function.private_name, call_args("in", "out")), out);
    out += "}\n";
  }
  return {};
}

auto CxxRenderer::render(const engine::GeneratedFile& file) -> engine::Expected<std::string> {
  referenced_.clear();
  extras_ = file.extra_params;
  referenced_.insert(file.package);

  std::string prototypes;
  for (const auto& function : file.functions) {
    prototypes += signature(function.private_name, function.pair, extras_) + ";\n";
    if (function.has_public_wrapper()) {
      prototypes += signature(function.public_name, function.pair, extras_) + ";\n";
    }
  }

  std::string definitions;
  for (const auto& function : file.functions) {
    definitions += "\n";
    if (auto rendered = render_function(function, extras_, definitions); !rendered) {
      return tl::unexpected(rendered.error());
    }
  }

  std::string out;
  out += kHeaderComment;
  out += "\n\n";
  for (auto include : kSystemIncludes) {
    out += include_line(include) + "\n";
  }
  if (!options_.error_include.empty()) {
    out += include_line(options_.error_include) + "\n";
  }
  out += "\n";

  std::set<std::string> headers;
  for (const auto& path : referenced_) {
    const auto* package = universe_.package(path);
    if (!package) {
      log::warn("generated code for {} references unknown package {}", file.package, path);
      continue;
    }
    if (!package->header.empty()) {
      headers.insert(package->header);
    }
  }
  for (const auto& header : headers) {
    out += include_line(header) + "\n";
  }
  for (const auto& extra : file.extra_imports) {
    if (!headers.contains(extra)) {
      out += include_line(extra) + "\n";
    }
  }
  if (!headers.empty() || !file.extra_imports.empty()) {
    out += "\n";
  }

  auto ns = engine::package_namespace(file.package);
  out += std::format("namespace {} {{\n\n", ns);
  out += prototypes;
  out += definitions;
  out += std::format("\n}}  // namespace {}\n", ns);
  return out;
}

}  // namespace convgen::render
