#include "collect.hpp"

#include <utility>

namespace forge {
namespace {

class CallCollector {
   public:
    bool include_plain = false;
    std::vector<ExprCall*> out{};

    void item(Item* item) {
        if (!item) return;
        switch (item->kind) {
            case AstNodeKind::ItemFn: {
                auto* fn = static_cast<ItemFn*>(item);
                for (Param* p : fn->params) type(p->type);
                type(fn->ret);
                block(fn->body);
                break;
            }
            case AstNodeKind::ItemStruct: {
                auto* st = static_cast<ItemStruct*>(item);
                for (FieldDecl* f : st->fields) type(f->type);
                break;
            }
            case AstNodeKind::ItemConst: {
                auto* c = static_cast<ItemConst*>(item);
                type(c->type);
                expr(c->value);
                break;
            }
            default:
                break;
        }
    }

    void block(Block* block) {
        if (!block) return;
        for (Stmt* s : block->stmts) stmt(s);
    }

    void stmt(Stmt* stmt) {
        if (!stmt) return;
        switch (stmt->kind) {
            case AstNodeKind::StmtLet: {
                auto* s = static_cast<StmtLet*>(stmt);
                type(s->type_ann);
                expr(s->init);
                break;
            }
            case AstNodeKind::StmtAssign: {
                auto* s = static_cast<StmtAssign*>(stmt);
                expr(s->target);
                expr(s->value);
                break;
            }
            case AstNodeKind::StmtReturn:
                expr(static_cast<StmtReturn*>(stmt)->value);
                break;
            case AstNodeKind::StmtIf: {
                auto* s = static_cast<StmtIf*>(stmt);
                expr(s->cond);
                block(s->then_block);
                for (ElifClause* c : s->elifs) {
                    expr(c->cond);
                    block(c->body);
                }
                block(s->else_block);
                break;
            }
            case AstNodeKind::StmtWhile: {
                auto* s = static_cast<StmtWhile*>(stmt);
                expr(s->cond);
                block(s->body);
                break;
            }
            case AstNodeKind::StmtFor: {
                auto* s = static_cast<StmtFor*>(stmt);
                expr(s->iterable);
                block(s->body);
                break;
            }
            case AstNodeKind::StmtExpr:
                expr(static_cast<StmtExpr*>(stmt)->expr);
                break;
            case AstNodeKind::StmtDefer:
                block(static_cast<StmtDefer*>(stmt)->body);
                break;
            case AstNodeKind::StmtMatch: {
                auto* s = static_cast<StmtMatch*>(stmt);
                expr(s->scrutinee);
                for (MatchArm* arm : s->arms) {
                    expr(arm->guard);
                    block(arm->body);
                }
                break;
            }
            case AstNodeKind::StmtWith: {
                auto* s = static_cast<StmtWith*>(stmt);
                expr(s->value);
                block(s->body);
                break;
            }
            default:
                break;
        }
    }

    void exprs(const std::vector<Expr*>& list) {
        for (Expr* e : list) expr(e);
    }

    void expr(Expr* expr) {
        if (!expr) return;
        switch (expr->kind) {
            case AstNodeKind::ExprCall: {
                auto* e = static_cast<ExprCall*>(expr);
                if (include_plain || !e->ct_args.empty()) out.push_back(e);
                this->expr(e->callee);
                exprs(e->ct_args);
                exprs(e->args);
                break;
            }
            case AstNodeKind::ExprBinary: {
                auto* e = static_cast<ExprBinary*>(expr);
                this->expr(e->lhs);
                this->expr(e->rhs);
                break;
            }
            case AstNodeKind::ExprUnary:
                this->expr(static_cast<ExprUnary*>(expr)->operand);
                break;
            case AstNodeKind::ExprMethodCall: {
                auto* e = static_cast<ExprMethodCall*>(expr);
                this->expr(e->receiver);
                exprs(e->args);
                break;
            }
            case AstNodeKind::ExprField:
                this->expr(static_cast<ExprField*>(expr)->base);
                break;
            case AstNodeKind::ExprIndex: {
                auto* e = static_cast<ExprIndex*>(expr);
                this->expr(e->base);
                this->expr(e->index);
                break;
            }
            case AstNodeKind::ExprSlice: {
                auto* e = static_cast<ExprSlice*>(expr);
                this->expr(e->base);
                this->expr(e->start);
                this->expr(e->end);
                break;
            }
            case AstNodeKind::ExprList:
                exprs(static_cast<ExprList*>(expr)->elems);
                break;
            case AstNodeKind::ExprStructLit:
                for (FieldInit* fi : static_cast<ExprStructLit*>(expr)->inits) this->expr(fi->value);
                break;
            case AstNodeKind::ExprTernary: {
                auto* e = static_cast<ExprTernary*>(expr);
                this->expr(e->then_expr);
                this->expr(e->cond);
                this->expr(e->else_expr);
                break;
            }
            case AstNodeKind::ExprTry:
                this->expr(static_cast<ExprTry*>(expr)->inner);
                break;
            default:
                break;
        }
    }

    // Array sizes and value arguments of generic types are expressions too.
    void type(Type* type) {
        if (!type) return;
        switch (type->kind) {
            case AstNodeKind::TypeRef:
                this->type(static_cast<TypeRef*>(type)->pointee);
                break;
            case AstNodeKind::TypeArray: {
                auto* t = static_cast<TypeArray*>(type);
                this->type(t->elem);
                expr(t->size);
                break;
            }
            case AstNodeKind::TypeGeneric:
                for (AstNode* arg : static_cast<TypeGeneric*>(type)->args) {
                    if (is_type_node(arg))
                        this->type(static_cast<Type*>(arg));
                    else if (is_expr_node(arg))
                        expr(static_cast<Expr*>(arg));
                }
                break;
            default:
                break;
        }
    }
};

}  // namespace

std::vector<ExprCall*> collect_calls(FileAst* file) {
    CallCollector c;
    if (file) {
        for (Item* item : file->items) c.item(item);
    }
    return std::move(c.out);
}

std::vector<ExprCall*> collect_calls(Item* item) {
    CallCollector c;
    c.item(item);
    return std::move(c.out);
}

std::vector<ExprCall*> collect_all_calls(Item* item) {
    CallCollector c;
    c.include_plain = true;
    c.item(item);
    return std::move(c.out);
}

std::vector<ExprCall*> collect_calls(Block* block) {
    CallCollector c;
    c.block(block);
    return std::move(c.out);
}

std::vector<ExprCall*> collect_calls(Stmt* stmt) {
    CallCollector c;
    c.stmt(stmt);
    return std::move(c.out);
}

std::vector<ExprCall*> collect_calls(Expr* expr) {
    CallCollector c;
    c.expr(expr);
    return std::move(c.out);
}

}  // namespace forge
