#include "print.hpp"

#include <cmath>
#include <cstdio>
#include <ostream>
#include <sstream>
#include <string_view>

namespace forge {
namespace {

static void indent(std::ostream& os, int depth) {
    for (int i = 0; i < depth; i++) os << "    ";
}

static void print_escaped(std::ostream& os, std::uint32_t c, char quote) {
    switch (c) {
        case '\n':
            os << "\\n";
            return;
        case '\r':
            os << "\\r";
            return;
        case '\t':
            os << "\\t";
            return;
        case '\0':
            os << "\\0";
            return;
        case '\\':
            os << "\\\\";
            return;
        default:
            break;
    }
    if (c == static_cast<std::uint32_t>(quote)) {
        os << '\\' << quote;
    } else if (c >= 32 && c < 127) {
        os << static_cast<char>(c);
    } else {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "\\u{%x}", c);
        os << buf;
    }
}

static void print_float(std::ostream& os, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    std::string_view s = buf;
    os << s;
    if (std::isfinite(v) && s.find_first_of(".e") == std::string_view::npos) os << ".0";
}

// Operands that need parentheses when nested inside another operator.
static bool needs_parens(const Expr* e) {
    return e && (e->kind == AstNodeKind::ExprBinary || e->kind == AstNodeKind::ExprTernary);
}

static void print_operand(std::ostream& os, const Expr* e) {
    if (needs_parens(e)) {
        os << "(";
        print_expr(os, e);
        os << ")";
    } else {
        print_expr(os, e);
    }
}

static bool is_negative_literal(const Expr* e) {
    if (e->kind == AstNodeKind::ExprInt) return static_cast<const ExprInt*>(e)->value < 0;
    if (e->kind == AstNodeKind::ExprFloat) return std::signbit(static_cast<const ExprFloat*>(e)->value);
    return false;
}

// Postfix operators bind tighter than every prefix and infix operator, and a
// leading `-` on a literal is a prefix operator once reparsed.
static void print_postfix_base(std::ostream& os, const Expr* e) {
    if (e && (e->kind == AstNodeKind::ExprUnary || is_negative_literal(e))) {
        os << "(";
        print_expr(os, e);
        os << ")";
    } else {
        print_operand(os, e);
    }
}

static void print_expr_list(std::ostream& os, const std::vector<Expr*>& exprs) {
    for (size_t i = 0; i < exprs.size(); i++) {
        if (i) os << ", ";
        print_expr(os, exprs[i]);
    }
}

static void print_type_arg(std::ostream& os, const AstNode* arg) {
    if (is_type_node(arg))
        print_type(os, static_cast<const Type*>(arg));
    else if (is_expr_node(arg))
        print_expr(os, static_cast<const Expr*>(arg));
}

static void print_pattern(std::ostream& os, const Pattern* pat) {
    if (!pat) return;
    switch (pat->kind) {
        case AstNodeKind::PatWildcard:
            os << "_";
            break;
        case AstNodeKind::PatLiteral:
            print_expr(os, static_cast<const PatLiteral*>(pat)->value);
            break;
        case AstNodeKind::PatBinding:
            os << static_cast<const PatBinding*>(pat)->name;
            break;
        case AstNodeKind::PatVariant: {
            auto* p = static_cast<const PatVariant*>(pat);
            os << p->name;
            if (!p->args.empty()) {
                os << "(";
                for (size_t i = 0; i < p->args.size(); i++) {
                    if (i) os << ", ";
                    print_pattern(os, p->args[i]);
                }
                os << ")";
            }
            break;
        }
        case AstNodeKind::PatOr: {
            auto* p = static_cast<const PatOr*>(pat);
            print_pattern(os, p->lhs);
            os << " | ";
            print_pattern(os, p->rhs);
            break;
        }
        default:
            break;
    }
}

static void print_stmt(std::ostream& os, const Stmt* stmt, int depth);

static void print_block(std::ostream& os, const Block* block, int depth) {
    if (!block || block->stmts.empty()) {
        indent(os, depth);
        os << "pass\n";
        return;
    }
    for (const Stmt* s : block->stmts) print_stmt(os, s, depth);
}

static void print_stmt(std::ostream& os, const Stmt* stmt, int depth) {
    if (!stmt) return;
    indent(os, depth);
    switch (stmt->kind) {
        case AstNodeKind::StmtLet: {
            auto* s = static_cast<const StmtLet*>(stmt);
            os << (s->is_mut ? "var " : "let ") << s->name;
            if (s->type_ann) {
                os << ": ";
                print_type(os, s->type_ann);
            }
            if (s->init) {
                os << " = ";
                print_expr(os, s->init);
            }
            os << "\n";
            break;
        }
        case AstNodeKind::StmtAssign: {
            auto* s = static_cast<const StmtAssign*>(stmt);
            print_expr(os, s->target);
            os << " " << assign_op_spelling(s->op) << " ";
            print_expr(os, s->value);
            os << "\n";
            break;
        }
        case AstNodeKind::StmtReturn: {
            auto* s = static_cast<const StmtReturn*>(stmt);
            os << "return";
            if (s->value) {
                os << " ";
                print_expr(os, s->value);
            }
            os << "\n";
            break;
        }
        case AstNodeKind::StmtIf: {
            auto* s = static_cast<const StmtIf*>(stmt);
            os << "if ";
            print_expr(os, s->cond);
            os << ":\n";
            print_block(os, s->then_block, depth + 1);
            for (const ElifClause* c : s->elifs) {
                indent(os, depth);
                os << "elif ";
                print_expr(os, c->cond);
                os << ":\n";
                print_block(os, c->body, depth + 1);
            }
            if (s->else_block) {
                indent(os, depth);
                os << "else:\n";
                print_block(os, s->else_block, depth + 1);
            }
            break;
        }
        case AstNodeKind::StmtWhile: {
            auto* s = static_cast<const StmtWhile*>(stmt);
            os << "while ";
            print_expr(os, s->cond);
            os << ":\n";
            print_block(os, s->body, depth + 1);
            break;
        }
        case AstNodeKind::StmtFor: {
            auto* s = static_cast<const StmtFor*>(stmt);
            os << "for " << s->var << " in ";
            print_expr(os, s->iterable);
            os << ":\n";
            print_block(os, s->body, depth + 1);
            break;
        }
        case AstNodeKind::StmtExpr:
            print_expr(os, static_cast<const StmtExpr*>(stmt)->expr);
            os << "\n";
            break;
        case AstNodeKind::StmtDefer:
            os << "defer:\n";
            print_block(os, static_cast<const StmtDefer*>(stmt)->body, depth + 1);
            break;
        case AstNodeKind::StmtMatch: {
            auto* s = static_cast<const StmtMatch*>(stmt);
            os << "match ";
            print_expr(os, s->scrutinee);
            os << ":\n";
            for (const MatchArm* arm : s->arms) {
                indent(os, depth + 1);
                os << "case ";
                print_pattern(os, arm->pat);
                if (arm->guard) {
                    os << " if ";
                    print_expr(os, arm->guard);
                }
                os << ":\n";
                print_block(os, arm->body, depth + 2);
            }
            break;
        }
        case AstNodeKind::StmtWith: {
            auto* s = static_cast<const StmtWith*>(stmt);
            os << "with " << s->var << " = ";
            print_expr(os, s->value);
            os << ":\n";
            print_block(os, s->body, depth + 1);
            break;
        }
        case AstNodeKind::StmtBreak:
            os << "break\n";
            break;
        case AstNodeKind::StmtContinue:
            os << "continue\n";
            break;
        case AstNodeKind::StmtPass:
            os << "pass\n";
            break;
        default:
            os << "# <" << ast_kind_name(stmt->kind) << ">\n";
            break;
    }
}

static void print_fn(std::ostream& os, const ItemFn* fn) {
    os << "fn " << fn->name;
    if (!fn->ct_params.empty()) {
        os << "[";
        for (size_t i = 0; i < fn->ct_params.size(); i++) {
            if (i) os << ", ";
            const CtParam* p = fn->ct_params[i];
            os << p->name << ": " << (p->param_kind == CtParamKind::Int ? "int" : "bool");
        }
        os << "]";
    }
    os << "(";
    for (size_t i = 0; i < fn->params.size(); i++) {
        if (i) os << ", ";
        os << fn->params[i]->name << ": ";
        print_type(os, fn->params[i]->type);
    }
    os << ")";
    if (fn->ret) {
        os << " -> ";
        print_type(os, fn->ret);
    }
    os << ":\n";
    print_block(os, fn->body, 1);
}

}  // namespace

void print_type(std::ostream& os, const Type* type) {
    if (!type) return;
    switch (type->kind) {
        case AstNodeKind::TypeName:
            os << static_cast<const TypeName*>(type)->name;
            break;
        case AstNodeKind::TypeRef: {
            auto* t = static_cast<const TypeRef*>(type);
            os << (t->is_mut ? "&mut " : "&");
            print_type(os, t->pointee);
            break;
        }
        case AstNodeKind::TypeArray: {
            auto* t = static_cast<const TypeArray*>(type);
            os << "[";
            print_type(os, t->elem);
            if (t->size) {
                os << "; ";
                print_expr(os, t->size);
            }
            os << "]";
            break;
        }
        case AstNodeKind::TypeGeneric: {
            auto* t = static_cast<const TypeGeneric*>(type);
            os << t->name << "[";
            for (size_t i = 0; i < t->args.size(); i++) {
                if (i) os << ", ";
                print_type_arg(os, t->args[i]);
            }
            os << "]";
            break;
        }
        default:
            break;
    }
}

void print_expr(std::ostream& os, const Expr* expr) {
    if (!expr) return;
    switch (expr->kind) {
        case AstNodeKind::ExprInt:
            os << static_cast<const ExprInt*>(expr)->value;
            break;
        case AstNodeKind::ExprFloat:
            print_float(os, static_cast<const ExprFloat*>(expr)->value);
            break;
        case AstNodeKind::ExprString: {
            os << '"';
            for (unsigned char c : static_cast<const ExprString*>(expr)->value) print_escaped(os, c, '"');
            os << '"';
            break;
        }
        case AstNodeKind::ExprChar:
            os << '\'';
            print_escaped(os, static_cast<const ExprChar*>(expr)->value, '\'');
            os << '\'';
            break;
        case AstNodeKind::ExprBool:
            os << (static_cast<const ExprBool*>(expr)->value ? "true" : "false");
            break;
        case AstNodeKind::ExprNone:
            os << "None";
            break;
        case AstNodeKind::ExprIdent:
            os << static_cast<const ExprIdent*>(expr)->name;
            break;
        case AstNodeKind::ExprBinary: {
            auto* e = static_cast<const ExprBinary*>(expr);
            print_operand(os, e->lhs);
            os << " " << binary_op_spelling(e->op) << " ";
            print_operand(os, e->rhs);
            break;
        }
        case AstNodeKind::ExprUnary: {
            auto* e = static_cast<const ExprUnary*>(expr);
            os << unary_op_spelling(e->op);
            if (needs_parens(e->operand) || e->operand->kind == AstNodeKind::ExprUnary) {
                os << "(";
                print_expr(os, e->operand);
                os << ")";
            } else {
                print_expr(os, e->operand);
            }
            break;
        }
        case AstNodeKind::ExprCall: {
            auto* e = static_cast<const ExprCall*>(expr);
            // `a[i](x)` reads back as a compile-time call.
            if (e->callee && e->callee->kind == AstNodeKind::ExprIndex) {
                os << "(";
                print_expr(os, e->callee);
                os << ")";
            } else {
                print_postfix_base(os, e->callee);
            }
            if (!e->ct_args.empty()) {
                os << "[";
                print_expr_list(os, e->ct_args);
                os << "]";
            }
            os << "(";
            print_expr_list(os, e->args);
            os << ")";
            break;
        }
        case AstNodeKind::ExprMethodCall: {
            auto* e = static_cast<const ExprMethodCall*>(expr);
            print_postfix_base(os, e->receiver);
            os << "." << e->method << "(";
            print_expr_list(os, e->args);
            os << ")";
            break;
        }
        case AstNodeKind::ExprField: {
            auto* e = static_cast<const ExprField*>(expr);
            print_postfix_base(os, e->base);
            os << "." << e->field;
            break;
        }
        case AstNodeKind::ExprIndex: {
            auto* e = static_cast<const ExprIndex*>(expr);
            print_postfix_base(os, e->base);
            os << "[";
            print_expr(os, e->index);
            os << "]";
            break;
        }
        case AstNodeKind::ExprSlice: {
            auto* e = static_cast<const ExprSlice*>(expr);
            print_postfix_base(os, e->base);
            os << "[";
            print_expr(os, e->start);
            os << "..";
            print_expr(os, e->end);
            os << "]";
            break;
        }
        case AstNodeKind::ExprList:
            os << "[";
            print_expr_list(os, static_cast<const ExprList*>(expr)->elems);
            os << "]";
            break;
        case AstNodeKind::ExprStructLit: {
            auto* e = static_cast<const ExprStructLit*>(expr);
            os << e->type_name << " {";
            for (size_t i = 0; i < e->inits.size(); i++) {
                os << (i ? ", " : " ") << e->inits[i]->name << ": ";
                print_expr(os, e->inits[i]->value);
            }
            os << (e->inits.empty() ? "}" : " }");
            break;
        }
        case AstNodeKind::ExprTernary: {
            auto* e = static_cast<const ExprTernary*>(expr);
            print_operand(os, e->then_expr);
            os << " if ";
            print_operand(os, e->cond);
            os << " else ";
            print_operand(os, e->else_expr);
            break;
        }
        case AstNodeKind::ExprTry:
            print_postfix_base(os, static_cast<const ExprTry*>(expr)->inner);
            os << "?";
            break;
        default:
            os << "<" << ast_kind_name(expr->kind) << ">";
            break;
    }
}

void print_item(std::ostream& os, const Item* item) {
    if (!item) return;
    switch (item->kind) {
        case AstNodeKind::ItemFn:
            print_fn(os, static_cast<const ItemFn*>(item));
            break;
        case AstNodeKind::ItemStruct: {
            auto* st = static_cast<const ItemStruct*>(item);
            os << "struct " << st->name << ":\n";
            if (st->fields.empty()) {
                indent(os, 1);
                os << "pass\n";
            }
            for (const FieldDecl* f : st->fields) {
                indent(os, 1);
                os << f->name << ": ";
                print_type(os, f->type);
                os << "\n";
            }
            break;
        }
        case AstNodeKind::ItemConst: {
            auto* c = static_cast<const ItemConst*>(item);
            os << "const " << c->name;
            if (c->type) {
                os << ": ";
                print_type(os, c->type);
            }
            os << " = ";
            print_expr(os, c->value);
            os << "\n";
            break;
        }
        default:
            break;
    }
}

void print_program(std::ostream& os, const FileAst* file) {
    if (!file) return;
    for (size_t i = 0; i < file->items.size(); i++) {
        if (i) os << "\n";
        print_item(os, file->items[i]);
    }
}

std::string expr_to_string(const Expr* expr) {
    std::ostringstream out;
    print_expr(out, expr);
    return out.str();
}

}  // namespace forge
