#pragma once

#include <string>
#include <utility>
#include <vector>

#include "ast.hpp"

namespace forge::test {

// Terse node construction for tests that do not go through the parser.
class AstBuilder {
   public:
    explicit AstBuilder(AstArena& arena) : arena_(arena) {}

    ExprInt* int_(std::int64_t v) { return arena_.make<ExprInt>(Span{}, v); }
    ExprBool* bool_(bool v) { return arena_.make<ExprBool>(Span{}, v); }
    ExprString* str(std::string v) { return arena_.make<ExprString>(Span{}, std::move(v)); }
    ExprFloat* float_(double v) { return arena_.make<ExprFloat>(Span{}, v); }
    ExprIdent* ident(std::string name) { return arena_.make<ExprIdent>(Span{}, std::move(name)); }

    ExprBinary* bin(BinaryOp op, Expr* lhs, Expr* rhs) { return arena_.make<ExprBinary>(Span{}, op, lhs, rhs); }
    ExprUnary* unary(UnaryOp op, Expr* operand) { return arena_.make<ExprUnary>(Span{}, op, operand); }

    ExprCall* call(std::string callee, std::vector<Expr*> args = {}) {
        return arena_.make<ExprCall>(Span{}, ident(std::move(callee)), std::vector<Expr*>{}, std::move(args));
    }
    ExprCall* ct_call(std::string callee, std::vector<Expr*> ct_args, std::vector<Expr*> args = {}) {
        return arena_.make<ExprCall>(Span{}, ident(std::move(callee)), std::move(ct_args), std::move(args));
    }

    TypeName* type(std::string name) { return arena_.make<TypeName>(Span{}, std::move(name)); }
    TypeArray* array(Type* elem, Expr* size) { return arena_.make<TypeArray>(Span{}, elem, size); }
    TypeGeneric* generic(std::string name, std::vector<AstNode*> args) {
        return arena_.make<TypeGeneric>(Span{}, std::move(name), std::move(args));
    }

    Block* block(std::vector<Stmt*> stmts) { return arena_.make<Block>(Span{}, std::move(stmts)); }
    StmtExpr* expr_stmt(Expr* e) { return arena_.make<StmtExpr>(Span{}, e); }
    StmtReturn* ret(Expr* e) { return arena_.make<StmtReturn>(Span{}, e); }
    StmtLet* let(std::string name, Expr* init, Type* type = nullptr) {
        return arena_.make<StmtLet>(Span{}, false, std::move(name), type, init);
    }

    CtParam* ct_int(std::string name) { return arena_.make<CtParam>(Span{}, std::move(name), CtParamKind::Int); }
    CtParam* ct_bool(std::string name) { return arena_.make<CtParam>(Span{}, std::move(name), CtParamKind::Bool); }
    Param* param(std::string name, Type* type) { return arena_.make<Param>(Span{}, std::move(name), type); }

    ItemFn* fn(std::string name, std::vector<CtParam*> ct_params, std::vector<Stmt*> body,
               std::vector<Param*> params = {}, Type* ret = nullptr) {
        return arena_.make<ItemFn>(Span{}, std::move(name), std::move(ct_params), std::move(params), ret,
                                   block(std::move(body)));
    }

    FileAst* file(std::vector<Item*> items) { return arena_.make<FileAst>(Span{}, std::move(items)); }

   private:
    AstArena& arena_;
};

// First `return` value of `fn`'s body.
inline Expr* returned_expr(const ItemFn* fn) {
    for (Stmt* s : fn->body->stmts) {
        if (s->kind == AstNodeKind::StmtReturn) return static_cast<StmtReturn*>(s)->value;
    }
    return nullptr;
}

inline ItemFn* find_fn(const FileAst* file, const std::string& name) {
    for (Item* item : file->items) {
        if (item->kind == AstNodeKind::ItemFn && static_cast<ItemFn*>(item)->name == name)
            return static_cast<ItemFn*>(item);
    }
    return nullptr;
}

}  // namespace forge::test
