#include "rewrite.hpp"

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "mono"

namespace forge {

ItemFn* rewrite_target(const ExprCall* call, const MonoContext& ctx) {
    if (!call || call->ct_args.empty()) return nullptr;
    if (!call->callee || call->callee->kind != AstNodeKind::ExprIdent) return nullptr;
    return ctx.find_original(static_cast<const ExprIdent*>(call->callee)->name);
}

void rewrite_call_site(AstArena& arena, ExprCall* call, const ItemFn* specialized) {
    if (!call || !specialized) return;
    Span span = call->callee ? call->callee->span : call->span;
    LLVM_DEBUG(llvm::dbgs() << "mono: rewrite call at " << span.begin.line << ":" << span.begin.column << " -> "
                            << specialized->name << "\n");
    call->callee = arena.make<ExprIdent>(span, specialized->name);
    call->ct_args.clear();
}

}  // namespace forge
