#pragma once

#include "span.hpp"

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace forge {

enum class UnaryOp : std::uint8_t { Neg, Not, BitNot, Ref, RefMut, Deref };
enum class BinaryOp : std::uint8_t {
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
  And,
  Or,
  BitAnd,
  BitOr,
  BitXor,
  Shl,
  Shr,
  Range,  // `a..b`, only as a `for` iterable
};
enum class AssignOp : std::uint8_t { Set, Add, Sub, Mul, Div };
enum class CtParamKind : std::uint8_t { Int, Bool };

enum class AstNodeKind : std::uint16_t {
  File,

  // Types
  TypeName,
  TypeRef,
  TypeArray,
  TypeGeneric,

  // Items
  ItemFn,
  ItemStruct,
  ItemConst,

  // Decls
  CtParam,
  Param,
  FieldDecl,

  // Statements
  StmtLet,
  StmtAssign,
  StmtReturn,
  StmtIf,
  StmtWhile,
  StmtFor,
  StmtExpr,
  StmtDefer,
  StmtMatch,
  StmtWith,
  StmtBreak,
  StmtContinue,
  StmtPass,

  // Patterns
  PatWildcard,
  PatLiteral,
  PatBinding,
  PatVariant,
  PatOr,

  Block,
  ElifClause,
  MatchArm,
  FieldInit,

  // Expressions
  ExprInt,
  ExprFloat,
  ExprString,
  ExprChar,
  ExprBool,
  ExprNone,
  ExprIdent,
  ExprBinary,
  ExprUnary,
  ExprCall,
  ExprMethodCall,
  ExprField,
  ExprIndex,
  ExprSlice,
  ExprList,
  ExprStructLit,
  ExprTernary,
  ExprTry,
};

struct AstNode {
  AstNodeKind kind{};
  Span span{};

  AstNode(AstNodeKind kind, Span span) : kind(kind), span(span) {}
  virtual ~AstNode() = default;
};

class AstArena {
 public:
  template <typename T, typename... Args>
  T* make(Args&&... args) {
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    T* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
  }

  size_t size() const { return nodes_.size(); }

 private:
  std::vector<std::unique_ptr<AstNode>> nodes_{};
};

// ---- Categories ----

struct Type : AstNode {
  explicit Type(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct Stmt : AstNode {
  explicit Stmt(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct Expr : AstNode {
  explicit Expr(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct Pattern : AstNode {
  explicit Pattern(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct Block final : AstNode {
  std::vector<Stmt*> stmts{};
  explicit Block(Span span, std::vector<Stmt*> stmts)
      : AstNode(AstNodeKind::Block, span), stmts(std::move(stmts)) {}
};

// ---- Types ----

struct TypeName final : Type {
  std::string name{};
  explicit TypeName(Span span, std::string name) : Type(AstNodeKind::TypeName, span), name(std::move(name)) {}
};

struct TypeRef final : Type {
  bool is_mut = false;
  Type* pointee = nullptr;
  explicit TypeRef(Span span, bool is_mut, Type* pointee)
      : Type(AstNodeKind::TypeRef, span), is_mut(is_mut), pointee(pointee) {}
};

// `[T; N]`, or `[T]` when `size` is null.
struct TypeArray final : Type {
  Type* elem = nullptr;
  Expr* size = nullptr;  // optional
  explicit TypeArray(Span span, Type* elem, Expr* size)
      : Type(AstNodeKind::TypeArray, span), elem(elem), size(size) {}
};

// `Name[A, B]`. Each argument is either a `Type` or an `Expr` (a value
// argument such as `Matrix[3, 4]`).
struct TypeGeneric final : Type {
  std::string name{};
  std::vector<AstNode*> args{};
  explicit TypeGeneric(Span span, std::string name, std::vector<AstNode*> args)
      : Type(AstNodeKind::TypeGeneric, span), name(std::move(name)), args(std::move(args)) {}
};

// ---- Patterns ----

struct PatWildcard final : Pattern {
  explicit PatWildcard(Span span) : Pattern(AstNodeKind::PatWildcard, span) {}
};

struct PatLiteral final : Pattern {
  Expr* value = nullptr;  // a literal expression
  explicit PatLiteral(Span span, Expr* value) : Pattern(AstNodeKind::PatLiteral, span), value(value) {}
};

struct PatBinding final : Pattern {
  std::string name{};
  explicit PatBinding(Span span, std::string name) : Pattern(AstNodeKind::PatBinding, span), name(std::move(name)) {}
};

struct PatVariant final : Pattern {
  std::string name{};
  std::vector<Pattern*> args{};
  explicit PatVariant(Span span, std::string name, std::vector<Pattern*> args)
      : Pattern(AstNodeKind::PatVariant, span), name(std::move(name)), args(std::move(args)) {}
};

struct PatOr final : Pattern {
  Pattern* lhs = nullptr;
  Pattern* rhs = nullptr;
  explicit PatOr(Span span, Pattern* lhs, Pattern* rhs)
      : Pattern(AstNodeKind::PatOr, span), lhs(lhs), rhs(rhs) {}
};

// ---- Expressions ----

struct ExprInt final : Expr {
  std::int64_t value = 0;
  explicit ExprInt(Span span, std::int64_t value) : Expr(AstNodeKind::ExprInt, span), value(value) {}
};

struct ExprFloat final : Expr {
  double value = 0.0;
  explicit ExprFloat(Span span, double value) : Expr(AstNodeKind::ExprFloat, span), value(value) {}
};

struct ExprString final : Expr {
  std::string value{};
  explicit ExprString(Span span, std::string value) : Expr(AstNodeKind::ExprString, span), value(std::move(value)) {}
};

struct ExprChar final : Expr {
  std::uint32_t value = 0;
  explicit ExprChar(Span span, std::uint32_t value) : Expr(AstNodeKind::ExprChar, span), value(value) {}
};

struct ExprBool final : Expr {
  bool value = false;
  explicit ExprBool(Span span, bool value) : Expr(AstNodeKind::ExprBool, span), value(value) {}
};

struct ExprNone final : Expr {
  explicit ExprNone(Span span) : Expr(AstNodeKind::ExprNone, span) {}
};

struct ExprIdent final : Expr {
  std::string name{};
  explicit ExprIdent(Span span, std::string name) : Expr(AstNodeKind::ExprIdent, span), name(std::move(name)) {}
};

struct ExprBinary final : Expr {
  BinaryOp op{};
  Expr* lhs = nullptr;
  Expr* rhs = nullptr;
  explicit ExprBinary(Span span, BinaryOp op, Expr* lhs, Expr* rhs)
      : Expr(AstNodeKind::ExprBinary, span), op(op), lhs(lhs), rhs(rhs) {}
};

struct ExprUnary final : Expr {
  UnaryOp op{};
  Expr* operand = nullptr;
  explicit ExprUnary(Span span, UnaryOp op, Expr* operand)
      : Expr(AstNodeKind::ExprUnary, span), op(op), operand(operand) {}
};

// `callee[ct_args...](args...)`; `ct_args` is empty for ordinary calls.
struct ExprCall final : Expr {
  Expr* callee = nullptr;
  std::vector<Expr*> ct_args{};
  std::vector<Expr*> args{};
  explicit ExprCall(Span span, Expr* callee, std::vector<Expr*> ct_args, std::vector<Expr*> args)
      : Expr(AstNodeKind::ExprCall, span),
        callee(callee),
        ct_args(std::move(ct_args)),
        args(std::move(args)) {}
};

struct ExprMethodCall final : Expr {
  Expr* receiver = nullptr;
  std::string method{};
  std::vector<Expr*> args{};
  explicit ExprMethodCall(Span span, Expr* receiver, std::string method, std::vector<Expr*> args)
      : Expr(AstNodeKind::ExprMethodCall, span),
        receiver(receiver),
        method(std::move(method)),
        args(std::move(args)) {}
};

struct ExprField final : Expr {
  Expr* base = nullptr;
  std::string field{};
  explicit ExprField(Span span, Expr* base, std::string field)
      : Expr(AstNodeKind::ExprField, span), base(base), field(std::move(field)) {}
};

struct ExprIndex final : Expr {
  Expr* base = nullptr;
  Expr* index = nullptr;
  explicit ExprIndex(Span span, Expr* base, Expr* index)
      : Expr(AstNodeKind::ExprIndex, span), base(base), index(index) {}
};

struct ExprSlice final : Expr {
  Expr* base = nullptr;
  Expr* start = nullptr;  // optional
  Expr* end = nullptr;    // optional
  explicit ExprSlice(Span span, Expr* base, Expr* start, Expr* end)
      : Expr(AstNodeKind::ExprSlice, span), base(base), start(start), end(end) {}
};

struct ExprList final : Expr {
  std::vector<Expr*> elems{};
  explicit ExprList(Span span, std::vector<Expr*> elems) : Expr(AstNodeKind::ExprList, span), elems(std::move(elems)) {}
};

struct FieldInit final : AstNode {
  std::string name{};
  Expr* value = nullptr;
  explicit FieldInit(Span span, std::string name, Expr* value)
      : AstNode(AstNodeKind::FieldInit, span), name(std::move(name)), value(value) {}
};

struct ExprStructLit final : Expr {
  std::string type_name{};
  std::vector<FieldInit*> inits{};
  explicit ExprStructLit(Span span, std::string type_name, std::vector<FieldInit*> inits)
      : Expr(AstNodeKind::ExprStructLit, span), type_name(std::move(type_name)), inits(std::move(inits)) {}
};

// `then_expr if cond else else_expr`
struct ExprTernary final : Expr {
  Expr* then_expr = nullptr;
  Expr* cond = nullptr;
  Expr* else_expr = nullptr;
  explicit ExprTernary(Span span, Expr* then_expr, Expr* cond, Expr* else_expr)
      : Expr(AstNodeKind::ExprTernary, span), then_expr(then_expr), cond(cond), else_expr(else_expr) {}
};

struct ExprTry final : Expr {
  Expr* inner = nullptr;
  explicit ExprTry(Span span, Expr* inner) : Expr(AstNodeKind::ExprTry, span), inner(inner) {}
};

// ---- Statements ----

struct StmtLet final : Stmt {
  bool is_mut = false;  // `var` rather than `let`
  std::string name{};
  Type* type_ann = nullptr;  // optional
  Expr* init = nullptr;
  explicit StmtLet(Span span, bool is_mut, std::string name, Type* type_ann, Expr* init)
      : Stmt(AstNodeKind::StmtLet, span), is_mut(is_mut), name(std::move(name)), type_ann(type_ann), init(init) {}
};

struct StmtAssign final : Stmt {
  AssignOp op = AssignOp::Set;
  Expr* target = nullptr;
  Expr* value = nullptr;
  explicit StmtAssign(Span span, AssignOp op, Expr* target, Expr* value)
      : Stmt(AstNodeKind::StmtAssign, span), op(op), target(target), value(value) {}
};

struct StmtReturn final : Stmt {
  Expr* value = nullptr;  // optional
  explicit StmtReturn(Span span, Expr* value) : Stmt(AstNodeKind::StmtReturn, span), value(value) {}
};

struct ElifClause final : AstNode {
  Expr* cond = nullptr;
  Block* body = nullptr;
  explicit ElifClause(Span span, Expr* cond, Block* body)
      : AstNode(AstNodeKind::ElifClause, span), cond(cond), body(body) {}
};

struct StmtIf final : Stmt {
  Expr* cond = nullptr;
  Block* then_block = nullptr;
  std::vector<ElifClause*> elifs{};
  Block* else_block = nullptr;  // optional
  explicit StmtIf(Span span, Expr* cond, Block* then_block, std::vector<ElifClause*> elifs, Block* else_block)
      : Stmt(AstNodeKind::StmtIf, span),
        cond(cond),
        then_block(then_block),
        elifs(std::move(elifs)),
        else_block(else_block) {}
};

struct StmtWhile final : Stmt {
  Expr* cond = nullptr;
  Block* body = nullptr;
  explicit StmtWhile(Span span, Expr* cond, Block* body)
      : Stmt(AstNodeKind::StmtWhile, span), cond(cond), body(body) {}
};

struct StmtFor final : Stmt {
  std::string var{};
  Expr* iterable = nullptr;
  Block* body = nullptr;
  explicit StmtFor(Span span, std::string var, Expr* iterable, Block* body)
      : Stmt(AstNodeKind::StmtFor, span), var(std::move(var)), iterable(iterable), body(body) {}
};

struct StmtExpr final : Stmt {
  Expr* expr = nullptr;
  explicit StmtExpr(Span span, Expr* expr) : Stmt(AstNodeKind::StmtExpr, span), expr(expr) {}
};

struct StmtDefer final : Stmt {
  Block* body = nullptr;
  explicit StmtDefer(Span span, Block* body) : Stmt(AstNodeKind::StmtDefer, span), body(body) {}
};

struct MatchArm final : AstNode {
  Pattern* pat = nullptr;
  Expr* guard = nullptr;  // optional
  Block* body = nullptr;
  explicit MatchArm(Span span, Pattern* pat, Expr* guard, Block* body)
      : AstNode(AstNodeKind::MatchArm, span), pat(pat), guard(guard), body(body) {}
};

struct StmtMatch final : Stmt {
  Expr* scrutinee = nullptr;
  std::vector<MatchArm*> arms{};
  explicit StmtMatch(Span span, Expr* scrutinee, std::vector<MatchArm*> arms)
      : Stmt(AstNodeKind::StmtMatch, span), scrutinee(scrutinee), arms(std::move(arms)) {}
};

// `with var = value:` scoped resource.
struct StmtWith final : Stmt {
  std::string var{};
  Expr* value = nullptr;
  Block* body = nullptr;
  explicit StmtWith(Span span, std::string var, Expr* value, Block* body)
      : Stmt(AstNodeKind::StmtWith, span), var(std::move(var)), value(value), body(body) {}
};

struct StmtBreak final : Stmt {
  explicit StmtBreak(Span span) : Stmt(AstNodeKind::StmtBreak, span) {}
};

struct StmtContinue final : Stmt {
  explicit StmtContinue(Span span) : Stmt(AstNodeKind::StmtContinue, span) {}
};

struct StmtPass final : Stmt {
  explicit StmtPass(Span span) : Stmt(AstNodeKind::StmtPass, span) {}
};

// ---- Items and decls ----

struct CtParam final : AstNode {
  std::string name{};
  CtParamKind param_kind = CtParamKind::Int;
  explicit CtParam(Span span, std::string name, CtParamKind param_kind)
      : AstNode(AstNodeKind::CtParam, span), name(std::move(name)), param_kind(param_kind) {}
};

struct Param final : AstNode {
  std::string name{};
  Type* type = nullptr;
  explicit Param(Span span, std::string name, Type* type)
      : AstNode(AstNodeKind::Param, span), name(std::move(name)), type(type) {}
};

struct FieldDecl final : AstNode {
  std::string name{};
  Type* type = nullptr;
  explicit FieldDecl(Span span, std::string name, Type* type)
      : AstNode(AstNodeKind::FieldDecl, span), name(std::move(name)), type(type) {}
};

struct Item : AstNode {
  explicit Item(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct ItemFn final : Item {
  std::string name{};
  std::vector<CtParam*> ct_params{};
  std::vector<Param*> params{};
  Type* ret = nullptr;  // optional; null means no return value
  Block* body = nullptr;
  explicit ItemFn(Span span, std::string name, std::vector<CtParam*> ct_params, std::vector<Param*> params, Type* ret,
                  Block* body)
      : Item(AstNodeKind::ItemFn, span),
        name(std::move(name)),
        ct_params(std::move(ct_params)),
        params(std::move(params)),
        ret(ret),
        body(body) {}
};

struct ItemStruct final : Item {
  std::string name{};
  std::vector<FieldDecl*> fields{};
  explicit ItemStruct(Span span, std::string name, std::vector<FieldDecl*> fields)
      : Item(AstNodeKind::ItemStruct, span), name(std::move(name)), fields(std::move(fields)) {}
};

struct ItemConst final : Item {
  std::string name{};
  Type* type = nullptr;  // optional
  Expr* value = nullptr;
  explicit ItemConst(Span span, std::string name, Type* type, Expr* value)
      : Item(AstNodeKind::ItemConst, span), name(std::move(name)), type(type), value(value) {}
};

struct FileAst final : AstNode {
  std::vector<Item*> items{};
  explicit FileAst(Span span, std::vector<Item*> items) : AstNode(AstNodeKind::File, span), items(std::move(items)) {}
};

// A parsed compilation unit: the arena owns every node reachable from `root`.
struct Program {
  AstArena arena{};
  FileAst* root = nullptr;
};

bool is_literal(const Expr* expr);
bool is_type_node(const AstNode* node);
bool is_expr_node(const AstNode* node);

std::string_view ast_kind_name(AstNodeKind kind);
std::string_view binary_op_spelling(BinaryOp op);
std::string_view unary_op_spelling(UnaryOp op);
std::string_view assign_op_spelling(AssignOp op);
void dump_ast(std::ostream& os, const AstNode* node, int indent = 0);

}  // namespace forge
