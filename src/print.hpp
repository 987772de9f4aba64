#pragma once

#include <iosfwd>
#include <string>

#include "ast.hpp"

namespace forge {

// Renders `file` back to Pyrite source. Nested binary and ternary operands
// are parenthesized, so the output reparses to the same tree.
void print_program(std::ostream& os, const FileAst* file);
void print_item(std::ostream& os, const Item* item);
void print_expr(std::ostream& os, const Expr* expr);
void print_type(std::ostream& os, const Type* type);

std::string expr_to_string(const Expr* expr);

}  // namespace forge
