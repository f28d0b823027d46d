#pragma once

#include <memory>
#include <string>
#include <vector>

#include "engine/types.hpp"

namespace convgen::engine {

/// Backend-neutral expression. `in` and `out` variables are pointers to the
/// values being converted; `field` selects a member of a value, so `in->X` is
/// `Expr::var("in").deref().field("X")`.
struct Expr {
  enum class Kind {
    Var,
    Field,
    Index,
    Deref,
    AddressOf,
    Cast,
  };

  Kind kind = Kind::Var;
  std::string name;
  const Type* type = nullptr;  ///< Cast target
  std::shared_ptr<const Expr> base;
  std::shared_ptr<const Expr> index;

  static auto var(std::string name) -> Expr;

  auto field(std::string member) const -> Expr;
  auto at(const Expr& subscript) const -> Expr;
  auto deref() const -> Expr;
  auto address_of() const -> Expr;
  auto cast_to(const Type* target) const -> Expr;

  auto empty() const -> bool { return kind == Kind::Var && name.empty(); }
};

enum class CommentLevel {
  Info,
  Warning,
  Fixme,
};

struct FunctionRef {
  std::string package;
  std::string name;

  auto operator==(const FunctionRef&) const -> bool = default;
};

enum class OpKind {
  Comment,
  Raw,
  Assign,
  ReinterpretAssign,
  AssignNull,
  Allocate,
  BulkCopy,
  NewElement,
  CallConversion,
  ForEachIndex,
  ForEachEntry,
  ForEachStub,
  IfNotNull,
  Else,
  BeginScope,
  EndBlock,
};

/// One emit operation. Which slots are meaningful depends on `kind`.
struct EmitOp {
  OpKind kind = OpKind::Comment;
  Expr dst;
  Expr src;
  const Type* type = nullptr;      ///< target-side type slot
  const Type* src_type = nullptr;  ///< source-side type slot
  FunctionRef function;
  std::string text;                ///< comment text, raw code, or loop variable names
  std::string text2;
  CommentLevel level = CommentLevel::Info;
};

/// Append-only sequence of emit operations. Block-opening operations
/// (loops, guards, scopes) are closed by `end_block`.
class EmitBuffer {
 public:
  auto comment(CommentLevel level, std::string text) -> void;
  auto raw(std::string code) -> void;
  auto assign(Expr dst, Expr src) -> void;
  auto reinterpret_assign(Expr dst, Expr src, const Type* src_type, const Type* type) -> void;
  auto assign_null(Expr dst, const Type* type) -> void;
  /// `dst` becomes a fresh value of `type`, sized like `src` for containers.
  auto allocate(Expr dst, Expr src, const Type* type) -> void;
  /// `dst` becomes a `type` holding a copy of every element of `src`.
  auto bulk_copy(Expr dst, Expr src, const Type* type) -> void;
  auto new_element(std::string name, const Type* type) -> void;
  auto call_conversion(FunctionRef function, Expr in, Expr out) -> void;
  auto for_each_index(Expr src, std::string index) -> void;
  auto for_each_entry(Expr src, std::string key, std::string value) -> void;
  auto for_each_stub(Expr src, const Type* key_type) -> void;
  auto if_not_null(Expr src, const Type* type) -> void;
  auto otherwise() -> void;
  auto begin_scope(Expr in, Expr out, const Type* in_type, const Type* out_type) -> void;
  auto end_block() -> void;


  auto ops() const -> const std::vector<EmitOp>& { return ops_; }
  auto size() const -> std::size_t { return ops_.size(); }
  auto empty() const -> bool { return ops_.empty(); }

 private:
  auto push(EmitOp op) -> void;

  std::vector<EmitOp> ops_;
};

}  // namespace convgen::engine
