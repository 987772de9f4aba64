#include "monomorphize.hpp"

#include <string>
#include <utility>
#include <vector>

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include "collect.hpp"
#include "mono.hpp"
#include "rewrite.hpp"

#define DEBUG_TYPE "mono"

namespace forge {
namespace {

static std::string callee_name(const ExprCall* call) {
    if (call->callee && call->callee->kind == AstNodeKind::ExprIdent)
        return static_cast<const ExprIdent*>(call->callee)->name;
    return "<expression>";
}

struct PendingRewrite {
    ExprCall* call = nullptr;
    ItemFn* target = nullptr;
};

class Monomorphizer {
   public:
    Monomorphizer(Session& session, AstArena& arena, const MonoOptions& options)
        : session_(session), ctx_(arena), options_(options) {}

    bool run(FileAst* file) {
        for (Item* item : file->items) {
            if (item->kind != AstNodeKind::ItemFn) continue;
            auto* fn = static_cast<ItemFn*>(item);
            if (MonoContext::needs_specialization(fn)) ctx_.register_original_function(fn);
        }

        for (Item* item : file->items) {
            if (item->kind == AstNodeKind::ItemFn && MonoContext::needs_specialization(static_cast<ItemFn*>(item)))
                continue;
            if (!scan(item)) return false;
        }

        // Specializations may call other generics; scanning them in creation
        // order reaches every transitively required instantiation.
        for (size_t i = 0; i < ctx_.specializations().size(); ++i) {
            if (!scan(ctx_.specializations()[i])) return false;
        }

        for (const PendingRewrite& r : pending_) rewrite_call_site(ctx_.arena(), r.call, r.target);
        return true;
    }

    const std::vector<ItemFn*>& specializations() const { return ctx_.specializations(); }

   private:
    Session& session_;
    MonoContext ctx_;
    const MonoOptions& options_;
    std::vector<PendingRewrite> pending_{};

    bool scan(Item* item) {
        if (options_.warn_generic_without_args) warn_plain_generic_calls(item);

        std::vector<ExprCall*> calls = collect_calls(item);
        LLVM_DEBUG({
            if (item->kind == AstNodeKind::ItemFn) {
                llvm::dbgs() << "mono: " << calls.size() << " compile-time call(s) in '"
                             << static_cast<ItemFn*>(item)->name << "'\n";
            }
        });
        for (ExprCall* call : calls) {
            if (!process_call(call)) return false;
        }
        return true;
    }

    bool process_call(ExprCall* call) {
        ItemFn* original = rewrite_target(call, ctx_);
        if (!original) return true;

        if (call->ct_args.size() != original->ct_params.size()) {
            session_.error(call->span, "function '" + original->name + "' expects " +
                                           std::to_string(original->ct_params.size()) +
                                           " compile-time argument(s), got " + std::to_string(call->ct_args.size()));
            session_.note(original->span, "'" + original->name + "' declared here");
            return false;
        }

        std::optional<CtArgs> args = extract_compile_time_args(session_, call);
        if (!args) return false;

        if (!ctx_.find_specialization(original->name, *args) &&
            ctx_.specializations().size() >= options_.max_specializations) {
            session_.error(call->span, "specialization limit of " + std::to_string(options_.max_specializations) +
                                           " reached while instantiating '" + original->name +
                                           ct_args_to_string(*args) + "'");
            return false;
        }

        ItemFn* specialized = ctx_.specialize_function(original, *args);
        pending_.push_back(PendingRewrite{.call = call, .target = specialized});
        return true;
    }

    void warn_plain_generic_calls(Item* item) {
        for (ExprCall* call : collect_all_calls(item)) {
            if (!call->ct_args.empty()) continue;
            if (!call->callee || call->callee->kind != AstNodeKind::ExprIdent) continue;
            const ItemFn* original = ctx_.find_original(static_cast<const ExprIdent*>(call->callee)->name);
            if (!original) continue;
            session_.warning(call->span, "call to generic function '" + original->name +
                                             "' without compile-time arguments is not specialized");
        }
    }
};

}  // namespace

std::optional<CtArgs> extract_compile_time_args(Session& session, const ExprCall* call) {
    CtArgs args;
    args.reserve(call->ct_args.size());
    for (size_t i = 0; i < call->ct_args.size(); ++i) {
        const Expr* arg = call->ct_args[i];
        std::optional<CtValue> v = literal_value(arg);
        if (!v) {
            session.error(arg ? arg->span : call->span,
                          "compile-time argument " + std::to_string(i + 1) + " in call to '" + callee_name(call) +
                              "' must be a literal");
            return std::nullopt;
        }
        args.push_back(std::move(*v));
    }
    return args;
}

std::optional<Program> monomorphize_program(Session& session, Program program, const MonoOptions& options) {
    if (!program.root) return std::optional<Program>(std::move(program));

    Monomorphizer mono(session, program.arena, options);
    if (!mono.run(program.root)) return std::nullopt;

    std::vector<Item*> items;
    for (Item* item : program.root->items) {
        if (item->kind == AstNodeKind::ItemFn && MonoContext::needs_specialization(static_cast<ItemFn*>(item)))
            continue;
        items.push_back(item);
    }
    for (ItemFn* spec : mono.specializations()) items.push_back(spec);

    LLVM_DEBUG(llvm::dbgs() << "mono: " << mono.specializations().size() << " specialization(s), " << items.size()
                            << " item(s) in output\n");

    Span span = program.root->span;
    Program out{};
    out.arena = std::move(program.arena);
    out.root = out.arena.make<FileAst>(span, std::move(items));
    return out;
}

}  // namespace forge
