#pragma once

#include <vector>

#include "ast.hpp"

namespace forge {

// Every call expression carrying compile-time arguments, in pre-order
// (outer call before the calls nested in its callee and arguments).
std::vector<ExprCall*> collect_calls(FileAst* file);
std::vector<ExprCall*> collect_calls(Item* item);
std::vector<ExprCall*> collect_calls(Block* block);
std::vector<ExprCall*> collect_calls(Stmt* stmt);
std::vector<ExprCall*> collect_calls(Expr* expr);

// Same traversal, but also lists calls without compile-time arguments.
std::vector<ExprCall*> collect_all_calls(Item* item);

}  // namespace forge
