#include "parse_state.hpp"

#include <charconv>
#include <cstdlib>

namespace forge {

ParseState* g_parse_state = nullptr;

std::string take_str(char* s) {
  if (!s) return {};
  std::string out{s};
  std::free(s);
  return out;
}

std::string take_string(std::string* s) {
  if (!s) return {};
  std::string out = std::move(*s);
  delete s;
  return out;
}

void push_error(Span span, std::string message) {
  if (!g_parse_state) return;
  g_parse_state->diags.push_back(Diagnostic{.severity = Severity::Error, .span = span, .message = std::move(message)});
}

namespace {

static std::string strip_underscores(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c != '_') out.push_back(c);
  }
  return out;
}

static void append_utf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Decodes one UTF-8 sequence starting at `i`; malformed bytes decode as
// themselves.
static std::uint32_t next_utf8(std::string_view s, size_t& i) {
  auto b0 = static_cast<unsigned char>(s[i++]);
  int extra = 0;
  std::uint32_t cp = b0;
  if ((b0 & 0xE0) == 0xC0) {
    extra = 1;
    cp = b0 & 0x1F;
  } else if ((b0 & 0xF0) == 0xE0) {
    extra = 2;
    cp = b0 & 0x0F;
  } else if ((b0 & 0xF8) == 0xF0) {
    extra = 3;
    cp = b0 & 0x07;
  }
  for (int k = 0; k < extra; k++) {
    if (i >= s.size()) return b0;
    auto b = static_cast<unsigned char>(s[i]);
    if ((b & 0xC0) != 0x80) return b0;
    cp = (cp << 6) | (b & 0x3F);
    i++;
  }
  return cp;
}

// One escape sequence; `i` points just past the backslash.
static std::optional<std::uint32_t> decode_escape(std::string_view s, size_t& i, Span span) {
  if (i >= s.size()) {
    push_error(span, "unterminated escape sequence");
    return std::nullopt;
  }
  char c = s[i++];
  switch (c) {
    case 'n':
      return '\n';
    case 't':
      return '\t';
    case 'r':
      return '\r';
    case '0':
      return 0;
    case '\\':
      return '\\';
    case '\'':
      return '\'';
    case '"':
      return '"';
    case 'u': {
      if (i >= s.size() || s[i] != '{') break;
      size_t close = s.find('}', i);
      if (close == std::string_view::npos) break;
      std::uint32_t cp = 0;
      std::string_view hex = s.substr(i + 1, close - i - 1);
      auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), cp, 16);
      if (hex.empty() || ec != std::errc{} || ptr != hex.data() + hex.size() || cp > 0x10FFFF) {
        push_error(span, "invalid unicode escape `\\u{" + std::string(hex) + "}`");
        return std::nullopt;
      }
      i = close + 1;
      return cp;
    }
    default:
      break;
  }
  push_error(span, std::string("unknown escape sequence `\\") + c + "`");
  return std::nullopt;
}

}  // namespace

std::optional<std::int64_t> decode_int(std::string_view text, Span span) {
  std::string digits = strip_underscores(text);
  int base = 10;
  std::string_view body = digits;
  if (body.size() > 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
    base = 16;
    body.remove_prefix(2);
  } else if (body.size() > 2 && body[0] == '0' && (body[1] == 'b' || body[1] == 'B')) {
    base = 2;
    body.remove_prefix(2);
  }
  std::int64_t value = 0;
  auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), value, base);
  if (ec == std::errc::result_out_of_range) {
    push_error(span, "integer literal `" + std::string(text) + "` is out of range");
    return std::nullopt;
  }
  if (ec != std::errc{} || ptr != body.data() + body.size()) {
    push_error(span, "malformed integer literal `" + std::string(text) + "`");
    return std::nullopt;
  }
  return value;
}

std::optional<double> decode_float(std::string_view text, Span span) {
  std::string digits = strip_underscores(text);
  char* end = nullptr;
  double value = std::strtod(digits.c_str(), &end);
  if (end != digits.c_str() + digits.size()) {
    push_error(span, "malformed float literal `" + std::string(text) + "`");
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> decode_string(std::string_view body, Span span) {
  std::string out;
  out.reserve(body.size());
  size_t i = 0;
  while (i < body.size()) {
    if (body[i] != '\\') {
      out.push_back(body[i++]);
      continue;
    }
    i++;
    std::optional<std::uint32_t> cp = decode_escape(body, i, span);
    if (!cp) return std::nullopt;
    append_utf8(out, *cp);
  }
  return out;
}

std::optional<std::uint32_t> decode_char(std::string_view body, Span span) {
  if (body.empty()) {
    push_error(span, "empty character literal");
    return std::nullopt;
  }
  size_t i = 0;
  std::optional<std::uint32_t> cp{};
  if (body[0] == '\\') {
    i = 1;
    cp = decode_escape(body, i, span);
    if (!cp) return std::nullopt;
  } else {
    cp = next_utf8(body, i);
  }
  if (i != body.size()) {
    push_error(span, "character literal must contain exactly one character");
    return std::nullopt;
  }
  return cp;
}

}  // namespace forge
