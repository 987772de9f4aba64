#pragma once

#include "ast.hpp"
#include "diag.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace forge {

// Layout tracking for the indentation-sensitive lexer.
struct LayoutState {
  std::vector<int> indents{0};
  int pending_dedents = 0;
  bool pending_indent = false;
  int paren_depth = 0;
  bool at_line_start = true;
};

struct ParseState {
  FileId file = 0;
  AstArena arena{};
  FileAst* root = nullptr;
  std::vector<Diagnostic> diags{};
  LayoutState layout{};
};

extern ParseState* g_parse_state;

std::string take_str(char* s);  // takes ownership and frees
std::string take_string(std::string* s);  // takes ownership and deletes
void push_error(Span span, std::string message);

// Literal decoding shared by the lexer. Each reports malformed input through
// push_error and returns empty.
std::optional<std::int64_t> decode_int(std::string_view text, Span span);
std::optional<double> decode_float(std::string_view text, Span span);
// `body` excludes the surrounding quotes. Non-ASCII code points from
// `\u{...}` are encoded as UTF-8.
std::optional<std::string> decode_string(std::string_view body, Span span);
std::optional<std::uint32_t> decode_char(std::string_view body, Span span);

template <typename T, typename... Args>
T* mk(Span span, Args&&... args) {
  if (!g_parse_state) return nullptr;
  return g_parse_state->arena.make<T>(std::move(span), std::forward<Args>(args)...);
}

// Takes ownership of a heap-allocated list built by the parser.
template <typename T>
std::vector<T> take_list(std::vector<T>* list) {
  if (!list) return {};
  std::vector<T> out = std::move(*list);
  delete list;
  return out;
}

}  // namespace forge
