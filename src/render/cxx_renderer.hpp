#pragma once

#include <set>
#include <string>
#include <vector>

#include "engine/converter.hpp"
#include "engine/emit.hpp"
#include "engine/error.hpp"
#include "engine/generator.hpp"
#include "engine/types.hpp"
#include "engine/universe.hpp"

namespace convgen::render {

struct RenderOptions {
  /// Result type of every conversion function; value-initialized on success.
  std::string error_type = "std::error_code";
  std::string error_include = "<system_error>";
  /// Condition on `err` that signals a failed conversion.
  std::string failure_test = "err";
};

/// Turns the emit operations of a generated file into C++ source.
///
/// Sequences render as std::vector, associative types as std::map and
/// pointers as std::shared_ptr. Package `a/b` maps to namespace `a::b`, and
/// the generated functions take `const In* in, Out* out` followed by the
/// extra parameters. Nested conversions run in immediately invoked lambdas
/// that rebind `in` and `out`.
class CxxRenderer {
 public:
  explicit CxxRenderer(const engine::Universe& universe, RenderOptions options = {});

  auto render(const engine::GeneratedFile& file) -> engine::Expected<std::string>;

  auto render_type(const engine::Type* type) -> std::string;
  auto render_expr(const engine::Expr& expr) -> std::string;

  static auto file_name(const engine::GeneratedFile& file) -> std::string;

 private:
  struct Block {
    enum class Kind {
      Plain,
      Guard,
      Scope,
    };
    Kind kind = Kind::Plain;
    std::string in;
    std::string out;
  };

  auto render_function(const engine::GeneratedFunction& function, const std::vector<engine::ExtraParam>& extras,
                       std::string& out) -> engine::Expected<void>;
  auto render_op(const engine::EmitOp& op, std::vector<Block>& blocks, std::string& out)
    -> engine::Expected<void>;
  auto signature(const std::string& name, const engine::ConversionPair& pair,
                 const std::vector<engine::ExtraParam>& extras) -> std::string;
  auto render_param_type(const engine::Type* type) -> std::string;
  auto call_args(const std::string& in, const std::string& out) const -> std::string;
  auto operand(const engine::Expr& expr) -> std::string;
  auto line(std::size_t depth, std::string_view text, std::string& out) const -> void;

  const engine::Universe& universe_;
  RenderOptions options_;
  std::vector<engine::ExtraParam> extras_;
  std::set<std::string> referenced_;
};

}  // namespace convgen::render
