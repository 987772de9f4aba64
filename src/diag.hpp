#pragma once

#include "source.hpp"
#include "span.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace forge {

enum class Severity : std::uint8_t { Error, Warning, Note };

struct Diagnostic {
  Severity severity = Severity::Error;
  Span span{};
  std::string message{};
};

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d);
void emit_diagnostics(std::ostream& os, const SourceManager& sm,
                      const std::vector<Diagnostic>& diags);

}  // namespace forge
