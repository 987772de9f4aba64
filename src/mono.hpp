#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <llvm/ADT/StringMap.h>

#include "ast.hpp"
#include "ct_value.hpp"

namespace forge {

// Cache key: one specialization per (original name, argument tuple).
struct SpecKey {
    std::string name{};
    CtArgs args{};
};

bool operator==(const SpecKey& a, const SpecKey& b);

struct SpecKeyHash {
    size_t operator()(const SpecKey& key) const;
};

// Specialization context for one compilation.
//
// Owns the registry of generic originals and the specialization cache. All
// nodes it creates are allocated in `arena`, which must outlive every
// function returned from `specialize_function`.
class MonoContext {
   public:
    explicit MonoContext(AstArena& arena) : arena_(arena) {}

    MonoContext(const MonoContext&) = delete;
    MonoContext& operator=(const MonoContext&) = delete;

    static bool needs_specialization(const ItemFn* fn);

    // `name` when `args` is empty, else `name_<seg>_<seg>...`:
    // ints as decimal (`neg` prefix instead of `-`), bools as true/false.
    static std::string get_specialized_function_name(std::string_view name,
                                                     const CtArgs& args);

    // First registration for a name wins; later ones are ignored.
    void register_original_function(ItemFn* fn);
    ItemFn* find_original(std::string_view name) const;
    size_t original_count() const { return originals_.size(); }

    // Returns the cached specialization for (fn->name, args) if one exists,
    // otherwise builds, caches and returns a new one.
    ItemFn* specialize_function(const ItemFn* fn, const CtArgs& args);
    ItemFn* find_specialization(std::string_view name,
                                const CtArgs& args) const;

    // Folds `bin` when both operands are literals and the operation is
    // foldable; otherwise returns `bin` itself.
    Expr* try_const_fold(ExprBinary* bin);

    // Every specialization created so far, in creation order.
    const std::vector<ItemFn*>& specializations() const { return order_; }

    AstArena& arena() { return arena_; }

   private:
    using Substitutions = llvm::StringMap<CtValue>;

    AstArena& arena_;
    llvm::StringMap<ItemFn*> originals_{};
    std::unordered_map<SpecKey, ItemFn*, SpecKeyHash> cache_{};
    std::vector<ItemFn*> order_{};

    Block* subst_block(Block* block, const Substitutions& subs);
    Stmt* subst_stmt(Stmt* stmt, const Substitutions& subs);
    Expr* subst_expr(Expr* expr, const Substitutions& subs);
    std::vector<Expr*> subst_exprs(const std::vector<Expr*>& exprs,
                                   const Substitutions& subs);
    Type* subst_type(Type* type, const Substitutions& subs);
    AstNode* subst_type_arg(AstNode* arg, const Substitutions& subs);
};

}  // namespace forge
