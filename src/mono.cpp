#include "mono.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <limits>
#include <optional>

#include <llvm/ADT/Hashing.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/MathExtras.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "mono"

namespace forge {
namespace {

static std::string hex_byte(unsigned char c) {
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02x", c);
    return buf;
}

// One name segment per argument. Segments only ever contain identifier
// characters so the mangled name stays a valid identifier.
static std::string name_segment(const CtValue& v) {
    switch (v.kind) {
        case CtValue::Kind::Int:
            if (v.int_value < 0) {
                // Negate in unsigned arithmetic so INT64_MIN has a magnitude.
                auto mag = 0 - static_cast<std::uint64_t>(v.int_value);
                return "neg" + std::to_string(mag);
            }
            return std::to_string(v.int_value);
        case CtValue::Kind::Bool:
            return v.bool_value ? "true" : "false";
        case CtValue::Kind::Float: {
            std::uint64_t bits = 0;
            std::memcpy(&bits, &v.float_value, sizeof(bits));
            char buf[17];
            std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(bits));
            return std::string("f") + buf;
        }
        case CtValue::Kind::Char:
            return "c" + std::to_string(v.char_value);
        case CtValue::Kind::String: {
            std::string out = "s" + std::to_string(v.string_value.size()) + "_";
            for (unsigned char c : v.string_value) {
                bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
                if (alnum)
                    out.push_back(static_cast<char>(c));
                else
                    out += "x" + hex_byte(c);
            }
            return out;
        }
        case CtValue::Kind::None:
            return "none";
    }
    return "arg";
}

static std::optional<std::int64_t> fold_int(BinaryOp op, std::int64_t a, std::int64_t b) {
    std::int64_t out = 0;
    switch (op) {
        case BinaryOp::Add:
            if (llvm::AddOverflow(a, b, out)) return std::nullopt;
            return out;
        case BinaryOp::Sub:
            if (llvm::SubOverflow(a, b, out)) return std::nullopt;
            return out;
        case BinaryOp::Mul:
            if (llvm::MulOverflow(a, b, out)) return std::nullopt;
            return out;
        case BinaryOp::Div:
        case BinaryOp::Mod:
            if (b == 0) return std::nullopt;
            if (a == std::numeric_limits<std::int64_t>::min() && b == -1) return std::nullopt;
            return op == BinaryOp::Div ? a / b : a % b;
        default:
            return std::nullopt;
    }
}

}  // namespace

bool operator==(const SpecKey& a, const SpecKey& b) { return a.name == b.name && a.args == b.args; }

size_t SpecKeyHash::operator()(const SpecKey& key) const {
    return llvm::hash_combine(key.name, hash_value(key.args));
}

bool MonoContext::needs_specialization(const ItemFn* fn) { return fn && !fn->ct_params.empty(); }

std::string MonoContext::get_specialized_function_name(std::string_view name, const CtArgs& args) {
    std::string out(name);
    for (const CtValue& v : args) {
        out.push_back('_');
        out += name_segment(v);
    }
    return out;
}

void MonoContext::register_original_function(ItemFn* fn) {
    if (!fn) return;
    if (originals_.try_emplace(fn->name, fn).second) {
        LLVM_DEBUG(llvm::dbgs() << "mono: registered generic '" << fn->name << "' (" << fn->ct_params.size()
                                << " compile-time params)\n");
    }
}

ItemFn* MonoContext::find_original(std::string_view name) const {
    auto it = originals_.find(llvm::StringRef(name.data(), name.size()));
    if (it == originals_.end()) return nullptr;
    return it->second;
}

ItemFn* MonoContext::find_specialization(std::string_view name, const CtArgs& args) const {
    auto it = cache_.find(SpecKey{.name = std::string(name), .args = args});
    if (it == cache_.end()) return nullptr;
    return it->second;
}

ItemFn* MonoContext::specialize_function(const ItemFn* fn, const CtArgs& args) {
    SpecKey key{.name = fn->name, .args = args};
    if (auto it = cache_.find(key); it != cache_.end()) {
        LLVM_DEBUG(llvm::dbgs() << "mono: cache hit " << fn->name << ct_args_to_string(args) << "\n");
        return it->second;
    }

    Substitutions subs;
    size_t n = std::min(fn->ct_params.size(), args.size());
    for (size_t i = 0; i < n; ++i) subs.try_emplace(fn->ct_params[i]->name, args[i]);

    std::vector<Param*> params;
    params.reserve(fn->params.size());
    for (const Param* p : fn->params) {
        params.push_back(arena_.make<Param>(p->span, p->name, subst_type(p->type, subs)));
    }
    Type* ret = subst_type(fn->ret, subs);
    Block* body = subst_block(fn->body, subs);

    std::string name = get_specialized_function_name(fn->name, args);
    auto* spec = arena_.make<ItemFn>(fn->span, name, std::vector<CtParam*>{}, std::move(params), ret, body);

    cache_.emplace(std::move(key), spec);
    order_.push_back(spec);
    LLVM_DEBUG(llvm::dbgs() << "mono: specialized " << fn->name << ct_args_to_string(args) << " -> " << name
                            << "\n");
    return spec;
}

Expr* MonoContext::try_const_fold(ExprBinary* bin) {
    if (!bin) return nullptr;
    if (!bin->lhs || !bin->rhs) return bin;
    if (bin->lhs->kind == AstNodeKind::ExprInt && bin->rhs->kind == AstNodeKind::ExprInt) {
        auto a = static_cast<const ExprInt*>(bin->lhs)->value;
        auto b = static_cast<const ExprInt*>(bin->rhs)->value;
        if (auto v = fold_int(bin->op, a, b)) return arena_.make<ExprInt>(bin->span, *v);
        return bin;
    }
    if (bin->lhs->kind == AstNodeKind::ExprBool && bin->rhs->kind == AstNodeKind::ExprBool) {
        bool a = static_cast<const ExprBool*>(bin->lhs)->value;
        bool b = static_cast<const ExprBool*>(bin->rhs)->value;
        if (bin->op == BinaryOp::And) return arena_.make<ExprBool>(bin->span, a && b);
        if (bin->op == BinaryOp::Or) return arena_.make<ExprBool>(bin->span, a || b);
    }
    return bin;
}

// ---- Substitution ----

Block* MonoContext::subst_block(Block* block, const Substitutions& subs) {
    if (!block) return nullptr;
    std::vector<Stmt*> stmts;
    stmts.reserve(block->stmts.size());
    for (Stmt* s : block->stmts) stmts.push_back(subst_stmt(s, subs));
    return arena_.make<Block>(block->span, std::move(stmts));
}

std::vector<Expr*> MonoContext::subst_exprs(const std::vector<Expr*>& exprs, const Substitutions& subs) {
    std::vector<Expr*> out;
    out.reserve(exprs.size());
    for (Expr* e : exprs) out.push_back(subst_expr(e, subs));
    return out;
}

Stmt* MonoContext::subst_stmt(Stmt* stmt, const Substitutions& subs) {
    if (!stmt) return nullptr;
    switch (stmt->kind) {
        case AstNodeKind::StmtLet: {
            auto* s = static_cast<StmtLet*>(stmt);
            return arena_.make<StmtLet>(s->span, s->is_mut, s->name, subst_type(s->type_ann, subs),
                                        subst_expr(s->init, subs));
        }
        case AstNodeKind::StmtAssign: {
            auto* s = static_cast<StmtAssign*>(stmt);
            return arena_.make<StmtAssign>(s->span, s->op, subst_expr(s->target, subs), subst_expr(s->value, subs));
        }
        case AstNodeKind::StmtReturn: {
            auto* s = static_cast<StmtReturn*>(stmt);
            return arena_.make<StmtReturn>(s->span, subst_expr(s->value, subs));
        }
        case AstNodeKind::StmtIf: {
            auto* s = static_cast<StmtIf*>(stmt);
            std::vector<ElifClause*> elifs;
            elifs.reserve(s->elifs.size());
            for (ElifClause* c : s->elifs) {
                elifs.push_back(
                    arena_.make<ElifClause>(c->span, subst_expr(c->cond, subs), subst_block(c->body, subs)));
            }
            return arena_.make<StmtIf>(s->span, subst_expr(s->cond, subs), subst_block(s->then_block, subs),
                                       std::move(elifs), subst_block(s->else_block, subs));
        }
        case AstNodeKind::StmtWhile: {
            auto* s = static_cast<StmtWhile*>(stmt);
            return arena_.make<StmtWhile>(s->span, subst_expr(s->cond, subs), subst_block(s->body, subs));
        }
        case AstNodeKind::StmtFor: {
            // The loop variable is a binding, never a substitution target.
            auto* s = static_cast<StmtFor*>(stmt);
            return arena_.make<StmtFor>(s->span, s->var, subst_expr(s->iterable, subs), subst_block(s->body, subs));
        }
        case AstNodeKind::StmtExpr: {
            auto* s = static_cast<StmtExpr*>(stmt);
            return arena_.make<StmtExpr>(s->span, subst_expr(s->expr, subs));
        }
        case AstNodeKind::StmtDefer: {
            auto* s = static_cast<StmtDefer*>(stmt);
            return arena_.make<StmtDefer>(s->span, subst_block(s->body, subs));
        }
        case AstNodeKind::StmtMatch: {
            auto* s = static_cast<StmtMatch*>(stmt);
            std::vector<MatchArm*> arms;
            arms.reserve(s->arms.size());
            for (MatchArm* arm : s->arms) {
                arms.push_back(arena_.make<MatchArm>(arm->span, arm->pat, subst_expr(arm->guard, subs),
                                                     subst_block(arm->body, subs)));
            }
            return arena_.make<StmtMatch>(s->span, subst_expr(s->scrutinee, subs), std::move(arms));
        }
        case AstNodeKind::StmtWith: {
            auto* s = static_cast<StmtWith*>(stmt);
            return arena_.make<StmtWith>(s->span, s->var, subst_expr(s->value, subs), subst_block(s->body, subs));
        }
        case AstNodeKind::StmtBreak:
        case AstNodeKind::StmtContinue:
        case AstNodeKind::StmtPass:
            return stmt;
        default:
            return stmt;
    }
}

Expr* MonoContext::subst_expr(Expr* expr, const Substitutions& subs) {
    if (!expr) return nullptr;
    switch (expr->kind) {
        case AstNodeKind::ExprIdent: {
            auto* e = static_cast<ExprIdent*>(expr);
            auto it = subs.find(e->name);
            if (it == subs.end()) return expr;
            return make_literal(arena_, e->span, it->second);
        }
        case AstNodeKind::ExprBinary: {
            auto* e = static_cast<ExprBinary*>(expr);
            auto* bin = arena_.make<ExprBinary>(e->span, e->op, subst_expr(e->lhs, subs), subst_expr(e->rhs, subs));
            return try_const_fold(bin);
        }
        case AstNodeKind::ExprUnary: {
            auto* e = static_cast<ExprUnary*>(expr);
            return arena_.make<ExprUnary>(e->span, e->op, subst_expr(e->operand, subs));
        }
        case AstNodeKind::ExprCall: {
            auto* e = static_cast<ExprCall*>(expr);
            return arena_.make<ExprCall>(e->span, subst_expr(e->callee, subs), subst_exprs(e->ct_args, subs),
                                         subst_exprs(e->args, subs));
        }
        case AstNodeKind::ExprMethodCall: {
            auto* e = static_cast<ExprMethodCall*>(expr);
            return arena_.make<ExprMethodCall>(e->span, subst_expr(e->receiver, subs), e->method,
                                               subst_exprs(e->args, subs));
        }
        case AstNodeKind::ExprField: {
            auto* e = static_cast<ExprField*>(expr);
            return arena_.make<ExprField>(e->span, subst_expr(e->base, subs), e->field);
        }
        case AstNodeKind::ExprIndex: {
            auto* e = static_cast<ExprIndex*>(expr);
            return arena_.make<ExprIndex>(e->span, subst_expr(e->base, subs), subst_expr(e->index, subs));
        }
        case AstNodeKind::ExprSlice: {
            auto* e = static_cast<ExprSlice*>(expr);
            return arena_.make<ExprSlice>(e->span, subst_expr(e->base, subs), subst_expr(e->start, subs),
                                          subst_expr(e->end, subs));
        }
        case AstNodeKind::ExprList: {
            auto* e = static_cast<ExprList*>(expr);
            return arena_.make<ExprList>(e->span, subst_exprs(e->elems, subs));
        }
        case AstNodeKind::ExprStructLit: {
            auto* e = static_cast<ExprStructLit*>(expr);
            std::vector<FieldInit*> inits;
            inits.reserve(e->inits.size());
            for (FieldInit* fi : e->inits) {
                inits.push_back(arena_.make<FieldInit>(fi->span, fi->name, subst_expr(fi->value, subs)));
            }
            return arena_.make<ExprStructLit>(e->span, e->type_name, std::move(inits));
        }
        case AstNodeKind::ExprTernary: {
            auto* e = static_cast<ExprTernary*>(expr);
            return arena_.make<ExprTernary>(e->span, subst_expr(e->then_expr, subs), subst_expr(e->cond, subs),
                                            subst_expr(e->else_expr, subs));
        }
        case AstNodeKind::ExprTry: {
            auto* e = static_cast<ExprTry*>(expr);
            return arena_.make<ExprTry>(e->span, subst_expr(e->inner, subs));
        }
        default:
            // Literals.
            return expr;
    }
}

Type* MonoContext::subst_type(Type* type, const Substitutions& subs) {
    if (!type) return nullptr;
    switch (type->kind) {
        case AstNodeKind::TypeRef: {
            auto* t = static_cast<TypeRef*>(type);
            return arena_.make<TypeRef>(t->span, t->is_mut, subst_type(t->pointee, subs));
        }
        case AstNodeKind::TypeArray: {
            auto* t = static_cast<TypeArray*>(type);
            return arena_.make<TypeArray>(t->span, subst_type(t->elem, subs), subst_expr(t->size, subs));
        }
        case AstNodeKind::TypeGeneric: {
            auto* t = static_cast<TypeGeneric*>(type);
            std::vector<AstNode*> args;
            args.reserve(t->args.size());
            for (AstNode* a : t->args) args.push_back(subst_type_arg(a, subs));
            return arena_.make<TypeGeneric>(t->span, t->name, std::move(args));
        }
        default:
            return type;
    }
}

// `Matrix[N]` parses `N` as a type name; a matching compile-time parameter
// turns it into a value argument.
AstNode* MonoContext::subst_type_arg(AstNode* arg, const Substitutions& subs) {
    if (!arg) return nullptr;
    if (arg->kind == AstNodeKind::TypeName) {
        auto* t = static_cast<TypeName*>(arg);
        auto it = subs.find(t->name);
        if (it == subs.end()) return arg;
        return make_literal(arena_, t->span, it->second);
    }
    if (is_type_node(arg)) return subst_type(static_cast<Type*>(arg), subs);
    if (is_expr_node(arg)) return subst_expr(static_cast<Expr*>(arg), subs);
    return arg;
}

}  // namespace forge
