#include "ast.hpp"

#include <utility>

namespace forge {

bool is_literal(const Expr* expr) {
  if (!expr) return false;
  switch (expr->kind) {
    case AstNodeKind::ExprInt:
    case AstNodeKind::ExprFloat:
    case AstNodeKind::ExprString:
    case AstNodeKind::ExprChar:
    case AstNodeKind::ExprBool:
    case AstNodeKind::ExprNone:
      return true;
    default:
      return false;
  }
}

bool is_type_node(const AstNode* node) {
  if (!node) return false;
  switch (node->kind) {
    case AstNodeKind::TypeName:
    case AstNodeKind::TypeRef:
    case AstNodeKind::TypeArray:
    case AstNodeKind::TypeGeneric:
      return true;
    default:
      return false;
  }
}

bool is_expr_node(const AstNode* node) {
  if (!node) return false;
  return node->kind >= AstNodeKind::ExprInt && node->kind <= AstNodeKind::ExprTry;
}

std::string_view ast_kind_name(AstNodeKind kind) {
  switch (kind) {
    case AstNodeKind::File:
      return "File";
    case AstNodeKind::TypeName:
      return "TypeName";
    case AstNodeKind::TypeRef:
      return "TypeRef";
    case AstNodeKind::TypeArray:
      return "TypeArray";
    case AstNodeKind::TypeGeneric:
      return "TypeGeneric";
    case AstNodeKind::ItemFn:
      return "ItemFn";
    case AstNodeKind::ItemStruct:
      return "ItemStruct";
    case AstNodeKind::ItemConst:
      return "ItemConst";
    case AstNodeKind::CtParam:
      return "CtParam";
    case AstNodeKind::Param:
      return "Param";
    case AstNodeKind::FieldDecl:
      return "FieldDecl";
    case AstNodeKind::StmtLet:
      return "StmtLet";
    case AstNodeKind::StmtAssign:
      return "StmtAssign";
    case AstNodeKind::StmtReturn:
      return "StmtReturn";
    case AstNodeKind::StmtIf:
      return "StmtIf";
    case AstNodeKind::StmtWhile:
      return "StmtWhile";
    case AstNodeKind::StmtFor:
      return "StmtFor";
    case AstNodeKind::StmtExpr:
      return "StmtExpr";
    case AstNodeKind::StmtDefer:
      return "StmtDefer";
    case AstNodeKind::StmtMatch:
      return "StmtMatch";
    case AstNodeKind::StmtWith:
      return "StmtWith";
    case AstNodeKind::StmtBreak:
      return "StmtBreak";
    case AstNodeKind::StmtContinue:
      return "StmtContinue";
    case AstNodeKind::StmtPass:
      return "StmtPass";
    case AstNodeKind::PatWildcard:
      return "PatWildcard";
    case AstNodeKind::PatLiteral:
      return "PatLiteral";
    case AstNodeKind::PatBinding:
      return "PatBinding";
    case AstNodeKind::PatVariant:
      return "PatVariant";
    case AstNodeKind::PatOr:
      return "PatOr";
    case AstNodeKind::Block:
      return "Block";
    case AstNodeKind::ElifClause:
      return "ElifClause";
    case AstNodeKind::MatchArm:
      return "MatchArm";
    case AstNodeKind::FieldInit:
      return "FieldInit";
    case AstNodeKind::ExprInt:
      return "ExprInt";
    case AstNodeKind::ExprFloat:
      return "ExprFloat";
    case AstNodeKind::ExprString:
      return "ExprString";
    case AstNodeKind::ExprChar:
      return "ExprChar";
    case AstNodeKind::ExprBool:
      return "ExprBool";
    case AstNodeKind::ExprNone:
      return "ExprNone";
    case AstNodeKind::ExprIdent:
      return "ExprIdent";
    case AstNodeKind::ExprBinary:
      return "ExprBinary";
    case AstNodeKind::ExprUnary:
      return "ExprUnary";
    case AstNodeKind::ExprCall:
      return "ExprCall";
    case AstNodeKind::ExprMethodCall:
      return "ExprMethodCall";
    case AstNodeKind::ExprField:
      return "ExprField";
    case AstNodeKind::ExprIndex:
      return "ExprIndex";
    case AstNodeKind::ExprSlice:
      return "ExprSlice";
    case AstNodeKind::ExprList:
      return "ExprList";
    case AstNodeKind::ExprStructLit:
      return "ExprStructLit";
    case AstNodeKind::ExprTernary:
      return "ExprTernary";
    case AstNodeKind::ExprTry:
      return "ExprTry";
  }
  return "Unknown";
}

std::string_view binary_op_spelling(BinaryOp op) {
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Or:
      return "or";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::Range:
      return "..";
  }
  return "?";
}

std::string_view unary_op_spelling(UnaryOp op) {
  switch (op) {
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Not:
      return "not ";
    case UnaryOp::BitNot:
      return "~";
    case UnaryOp::Ref:
      return "&";
    case UnaryOp::RefMut:
      return "&mut ";
    case UnaryOp::Deref:
      return "*";
  }
  return "?";
}

std::string_view assign_op_spelling(AssignOp op) {
  switch (op) {
    case AssignOp::Set:
      return "=";
    case AssignOp::Add:
      return "+=";
    case AssignOp::Sub:
      return "-=";
    case AssignOp::Mul:
      return "*=";
    case AssignOp::Div:
      return "/=";
  }
  return "=";
}

static void indent_to(std::ostream& os, int indent) {
  for (int i = 0; i < indent; i++) os << "  ";
}

static void dump_opt(std::ostream& os, std::string_view label, const AstNode* node, int indent) {
  if (!node) return;
  indent_to(os, indent);
  os << label << ":\n";
  dump_ast(os, node, indent + 1);
}

template <typename T>
static void dump_list(std::ostream& os, std::string_view label, const std::vector<T*>& nodes, int indent) {
  if (nodes.empty()) return;
  indent_to(os, indent);
  os << label << ":\n";
  for (const T* n : nodes) dump_ast(os, n, indent + 1);
}

void dump_ast(std::ostream& os, const AstNode* node, int indent) {
  if (!node) {
    indent_to(os, indent);
    os << "<null>\n";
    return;
  }

  indent_to(os, indent);
  os << ast_kind_name(node->kind);
  int in = indent + 1;

  switch (node->kind) {
    case AstNodeKind::File: {
      os << '\n';
      for (const Item* item : static_cast<const FileAst*>(node)->items) dump_ast(os, item, in);
      break;
    }
    case AstNodeKind::TypeName:
      os << " " << static_cast<const TypeName*>(node)->name << '\n';
      break;
    case AstNodeKind::TypeRef: {
      auto* t = static_cast<const TypeRef*>(node);
      os << (t->is_mut ? " mut" : "") << '\n';
      dump_ast(os, t->pointee, in);
      break;
    }
    case AstNodeKind::TypeArray: {
      auto* t = static_cast<const TypeArray*>(node);
      os << '\n';
      dump_opt(os, "elem", t->elem, in);
      dump_opt(os, "size", t->size, in);
      break;
    }
    case AstNodeKind::TypeGeneric: {
      auto* t = static_cast<const TypeGeneric*>(node);
      os << " " << t->name << '\n';
      for (const AstNode* a : t->args) dump_ast(os, a, in);
      break;
    }
    case AstNodeKind::ItemFn: {
      auto* f = static_cast<const ItemFn*>(node);
      os << " " << f->name << '\n';
      dump_list(os, "ct_params", f->ct_params, in);
      dump_list(os, "params", f->params, in);
      dump_opt(os, "ret", f->ret, in);
      dump_ast(os, f->body, in);
      break;
    }
    case AstNodeKind::ItemStruct: {
      auto* s = static_cast<const ItemStruct*>(node);
      os << " " << s->name << '\n';
      for (const FieldDecl* f : s->fields) dump_ast(os, f, in);
      break;
    }
    case AstNodeKind::ItemConst: {
      auto* c = static_cast<const ItemConst*>(node);
      os << " " << c->name << '\n';
      dump_opt(os, "type", c->type, in);
      dump_ast(os, c->value, in);
      break;
    }
    case AstNodeKind::CtParam: {
      auto* p = static_cast<const CtParam*>(node);
      os << " " << p->name << ": " << (p->param_kind == CtParamKind::Int ? "int" : "bool") << '\n';
      break;
    }
    case AstNodeKind::Param: {
      auto* p = static_cast<const Param*>(node);
      os << " " << p->name << '\n';
      dump_ast(os, p->type, in);
      break;
    }
    case AstNodeKind::FieldDecl: {
      auto* f = static_cast<const FieldDecl*>(node);
      os << " " << f->name << '\n';
      dump_ast(os, f->type, in);
      break;
    }
    case AstNodeKind::StmtLet: {
      auto* s = static_cast<const StmtLet*>(node);
      os << (s->is_mut ? " var " : " ") << s->name << '\n';
      dump_opt(os, "type", s->type_ann, in);
      dump_ast(os, s->init, in);
      break;
    }
    case AstNodeKind::StmtAssign: {
      auto* s = static_cast<const StmtAssign*>(node);
      os << " " << assign_op_spelling(s->op) << '\n';
      dump_ast(os, s->target, in);
      dump_ast(os, s->value, in);
      break;
    }
    case AstNodeKind::StmtReturn: {
      os << '\n';
      auto* s = static_cast<const StmtReturn*>(node);
      if (s->value) dump_ast(os, s->value, in);
      break;
    }
    case AstNodeKind::StmtIf: {
      auto* s = static_cast<const StmtIf*>(node);
      os << '\n';
      dump_ast(os, s->cond, in);
      dump_ast(os, s->then_block, in);
      for (const ElifClause* e : s->elifs) dump_ast(os, e, in);
      dump_opt(os, "else", s->else_block, in);
      break;
    }
    case AstNodeKind::StmtWhile: {
      auto* s = static_cast<const StmtWhile*>(node);
      os << '\n';
      dump_ast(os, s->cond, in);
      dump_ast(os, s->body, in);
      break;
    }
    case AstNodeKind::StmtFor: {
      auto* s = static_cast<const StmtFor*>(node);
      os << " " << s->var << '\n';
      dump_ast(os, s->iterable, in);
      dump_ast(os, s->body, in);
      break;
    }
    case AstNodeKind::StmtExpr:
      os << '\n';
      dump_ast(os, static_cast<const StmtExpr*>(node)->expr, in);
      break;
    case AstNodeKind::StmtDefer:
      os << '\n';
      dump_ast(os, static_cast<const StmtDefer*>(node)->body, in);
      break;
    case AstNodeKind::StmtMatch: {
      auto* s = static_cast<const StmtMatch*>(node);
      os << '\n';
      dump_ast(os, s->scrutinee, in);
      for (const MatchArm* a : s->arms) dump_ast(os, a, in);
      break;
    }
    case AstNodeKind::StmtWith: {
      auto* s = static_cast<const StmtWith*>(node);
      os << " " << s->var << '\n';
      dump_ast(os, s->value, in);
      dump_ast(os, s->body, in);
      break;
    }
    case AstNodeKind::StmtBreak:
    case AstNodeKind::StmtContinue:
    case AstNodeKind::StmtPass:
    case AstNodeKind::PatWildcard:
    case AstNodeKind::ExprNone:
      os << '\n';
      break;
    case AstNodeKind::PatLiteral:
      os << '\n';
      dump_ast(os, static_cast<const PatLiteral*>(node)->value, in);
      break;
    case AstNodeKind::PatBinding:
      os << " " << static_cast<const PatBinding*>(node)->name << '\n';
      break;
    case AstNodeKind::PatVariant: {
      auto* p = static_cast<const PatVariant*>(node);
      os << " " << p->name << '\n';
      for (const Pattern* a : p->args) dump_ast(os, a, in);
      break;
    }
    case AstNodeKind::PatOr: {
      auto* p = static_cast<const PatOr*>(node);
      os << '\n';
      dump_ast(os, p->lhs, in);
      dump_ast(os, p->rhs, in);
      break;
    }
    case AstNodeKind::Block: {
      os << '\n';
      for (const Stmt* s : static_cast<const Block*>(node)->stmts) dump_ast(os, s, in);
      break;
    }
    case AstNodeKind::ElifClause: {
      auto* e = static_cast<const ElifClause*>(node);
      os << '\n';
      dump_ast(os, e->cond, in);
      dump_ast(os, e->body, in);
      break;
    }
    case AstNodeKind::MatchArm: {
      auto* a = static_cast<const MatchArm*>(node);
      os << '\n';
      dump_ast(os, a->pat, in);
      dump_opt(os, "guard", a->guard, in);
      dump_ast(os, a->body, in);
      break;
    }
    case AstNodeKind::FieldInit: {
      auto* f = static_cast<const FieldInit*>(node);
      os << " " << f->name << '\n';
      dump_ast(os, f->value, in);
      break;
    }
    case AstNodeKind::ExprInt:
      os << " " << static_cast<const ExprInt*>(node)->value << '\n';
      break;
    case AstNodeKind::ExprFloat:
      os << " " << static_cast<const ExprFloat*>(node)->value << '\n';
      break;
    case AstNodeKind::ExprString:
      os << " \"" << static_cast<const ExprString*>(node)->value << "\"\n";
      break;
    case AstNodeKind::ExprChar:
      os << " " << static_cast<const ExprChar*>(node)->value << '\n';
      break;
    case AstNodeKind::ExprBool:
      os << (static_cast<const ExprBool*>(node)->value ? " true" : " false") << '\n';
      break;
    case AstNodeKind::ExprIdent:
      os << " " << static_cast<const ExprIdent*>(node)->name << '\n';
      break;
    case AstNodeKind::ExprBinary: {
      auto* b = static_cast<const ExprBinary*>(node);
      os << " " << binary_op_spelling(b->op) << '\n';
      dump_ast(os, b->lhs, in);
      dump_ast(os, b->rhs, in);
      break;
    }
    case AstNodeKind::ExprUnary: {
      auto* u = static_cast<const ExprUnary*>(node);
      os << " " << unary_op_spelling(u->op) << '\n';
      dump_ast(os, u->operand, in);
      break;
    }
    case AstNodeKind::ExprCall: {
      auto* c = static_cast<const ExprCall*>(node);
      os << '\n';
      dump_ast(os, c->callee, in);
      dump_list(os, "ct_args", c->ct_args, in);
      dump_list(os, "args", c->args, in);
      break;
    }
    case AstNodeKind::ExprMethodCall: {
      auto* m = static_cast<const ExprMethodCall*>(node);
      os << " " << m->method << '\n';
      dump_ast(os, m->receiver, in);
      dump_list(os, "args", m->args, in);
      break;
    }
    case AstNodeKind::ExprField: {
      auto* f = static_cast<const ExprField*>(node);
      os << " " << f->field << '\n';
      dump_ast(os, f->base, in);
      break;
    }
    case AstNodeKind::ExprIndex: {
      auto* i = static_cast<const ExprIndex*>(node);
      os << '\n';
      dump_ast(os, i->base, in);
      dump_ast(os, i->index, in);
      break;
    }
    case AstNodeKind::ExprSlice: {
      auto* s = static_cast<const ExprSlice*>(node);
      os << '\n';
      dump_ast(os, s->base, in);
      dump_opt(os, "start", s->start, in);
      dump_opt(os, "end", s->end, in);
      break;
    }
    case AstNodeKind::ExprList:
      os << '\n';
      for (const Expr* e : static_cast<const ExprList*>(node)->elems) dump_ast(os, e, in);
      break;
    case AstNodeKind::ExprStructLit: {
      auto* s = static_cast<const ExprStructLit*>(node);
      os << " " << s->type_name << '\n';
      for (const FieldInit* f : s->inits) dump_ast(os, f, in);
      break;
    }
    case AstNodeKind::ExprTernary: {
      auto* t = static_cast<const ExprTernary*>(node);
      os << '\n';
      dump_ast(os, t->then_expr, in);
      dump_ast(os, t->cond, in);
      dump_ast(os, t->else_expr, in);
      break;
    }
    case AstNodeKind::ExprTry:
      os << '\n';
      dump_ast(os, static_cast<const ExprTry*>(node)->inner, in);
      break;
  }
}

}  // namespace forge
