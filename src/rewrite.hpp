#pragma once

#include "ast.hpp"
#include "mono.hpp"

namespace forge {

// The registered generic a call targets: non-null only for a call with
// compile-time arguments whose callee is a plain identifier naming a
// registered original. Computed callees are never rewritten.
ItemFn* rewrite_target(const ExprCall* call, const MonoContext& ctx);

// Points `call` at `specialized` and drops its compile-time arguments. The
// callee identifier is replaced, not mutated, since identifier nodes may be
// shared between trees.
void rewrite_call_site(AstArena& arena, ExprCall* call, const ItemFn* specialized);

}  // namespace forge
