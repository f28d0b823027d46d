#include "engine/emit.hpp"

#include <utility>

namespace convgen::engine {

auto Expr::var(std::string name) -> Expr {
  Expr expr;
  expr.kind = Kind::Var;
  expr.name = std::move(name);
  return expr;
}

auto Expr::field(std::string member) const -> Expr {
  Expr expr;
  expr.kind = Kind::Field;
  expr.name = std::move(member);
  expr.base = std::make_shared<const Expr>(*this);
  return expr;
}

auto Expr::at(const Expr& subscript) const -> Expr {
  Expr expr;
  expr.kind = Kind::Index;
  expr.base = std::make_shared<const Expr>(*this);
  expr.index = std::make_shared<const Expr>(subscript);
  return expr;
}

auto Expr::deref() const -> Expr {
  if (kind == Kind::AddressOf) {
    return *base;
  }
  Expr expr;
  expr.kind = Kind::Deref;
  expr.base = std::make_shared<const Expr>(*this);
  return expr;
}

auto Expr::address_of() const -> Expr {
  // `&*p` is kept as is: `p` may be an owning pointer.
  Expr expr;
  expr.kind = Kind::AddressOf;
  expr.base = std::make_shared<const Expr>(*this);
  return expr;
}

auto Expr::cast_to(const Type* target) const -> Expr {
  Expr expr;
  expr.kind = Kind::Cast;
  expr.type = target;
  expr.base = std::make_shared<const Expr>(*this);
  return expr;
}

auto EmitBuffer::push(EmitOp op) -> void {
  ops_.push_back(std::move(op));
}

auto EmitBuffer::comment(CommentLevel level, std::string text) -> void {
  EmitOp op;
  op.kind = OpKind::Comment;
  op.level = level;
  op.text = std::move(text);
  push(std::move(op));
}

auto EmitBuffer::raw(std::string code) -> void {
  EmitOp op;
  op.kind = OpKind::Raw;
  op.text = std::move(code);
  push(std::move(op));
}

auto EmitBuffer::assign(Expr dst, Expr src) -> void {
  EmitOp op;
  op.kind = OpKind::Assign;
  op.dst = std::move(dst);
  op.src = std::move(src);
  push(std::move(op));
}

auto EmitBuffer::reinterpret_assign(Expr dst, Expr src, const Type* src_type, const Type* type) -> void {
  EmitOp op;
  op.kind = OpKind::ReinterpretAssign;
  op.dst = std::move(dst);
  op.src = std::move(src);
  op.src_type = src_type;
  op.type = type;
  push(std::move(op));
}

auto EmitBuffer::assign_null(Expr dst, const Type* type) -> void {
  EmitOp op;
  op.kind = OpKind::AssignNull;
  op.dst = std::move(dst);
  op.type = type;
  push(std::move(op));
}

auto EmitBuffer::allocate(Expr dst, Expr src, const Type* type) -> void {
  EmitOp op;
  op.kind = OpKind::Allocate;
  op.dst = std::move(dst);
  op.src = std::move(src);
  op.type = type;
  push(std::move(op));
}

auto EmitBuffer::bulk_copy(Expr dst, Expr src, const Type* type) -> void {
  EmitOp op;
  op.kind = OpKind::BulkCopy;
  op.dst = std::move(dst);
  op.src = std::move(src);
  op.type = type;
  push(std::move(op));
}

auto EmitBuffer::new_element(std::string name, const Type* type) -> void {
  EmitOp op;
  op.kind = OpKind::NewElement;
  op.text = std::move(name);
  op.type = type;
  push(std::move(op));
}

auto EmitBuffer::call_conversion(FunctionRef function, Expr in, Expr out) -> void {
  EmitOp op;
  op.kind = OpKind::CallConversion;
  op.function = std::move(function);
  op.src = std::move(in);
  op.dst = std::move(out);
  push(std::move(op));
}

auto EmitBuffer::for_each_index(Expr src, std::string index) -> void {
  EmitOp op;
  op.kind = OpKind::ForEachIndex;
  op.src = std::move(src);
  op.text = std::move(index);
  push(std::move(op));
}

auto EmitBuffer::for_each_entry(Expr src, std::string key, std::string value) -> void {
  EmitOp op;
  op.kind = OpKind::ForEachEntry;
  op.src = std::move(src);
  op.text = std::move(key);
  op.text2 = std::move(value);
  push(std::move(op));
}

auto EmitBuffer::for_each_stub(Expr src, const Type* key_type) -> void {
  EmitOp op;
  op.kind = OpKind::ForEachStub;
  op.src = std::move(src);
  op.src_type = key_type;
  push(std::move(op));
}

auto EmitBuffer::if_not_null(Expr src, const Type* type) -> void {
  EmitOp op;
  op.kind = OpKind::IfNotNull;
  op.src = std::move(src);
  op.src_type = type;
  push(std::move(op));
}

auto EmitBuffer::otherwise() -> void {
  EmitOp op;
  op.kind = OpKind::Else;
  push(std::move(op));
}

auto EmitBuffer::begin_scope(Expr in, Expr out, const Type* in_type, const Type* out_type) -> void {
  EmitOp op;
  op.kind = OpKind::BeginScope;
  op.src = std::move(in);
  op.dst = std::move(out);
  op.src_type = in_type;
  op.type = out_type;
  push(std::move(op));
}

auto EmitBuffer::end_block() -> void {
  EmitOp op;
  op.kind = OpKind::EndBlock;
  push(std::move(op));
}

}  // namespace convgen::engine
