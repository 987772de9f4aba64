#include "diag.hpp"

#include <ostream>
#include <sstream>

namespace forge {

static const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d) {
  std::ostringstream out;
  if (d.span.file < sm.size()) {
    out << sm.path(d.span.file) << ":" << d.span.begin.line << ":"
        << d.span.begin.column << ": ";
  } else {
    out << "<unknown>: ";
  }
  out << severity_name(d.severity) << ": " << d.message;
  return out.str();
}

void emit_diagnostics(std::ostream& os, const SourceManager& sm,
                      const std::vector<Diagnostic>& diags) {
  for (const Diagnostic& d : diags) {
    os << format_diagnostic(sm, d) << "\n";
    if (d.span.file >= sm.size()) continue;

    std::optional<std::string> line = sm.line_text(d.span.file, d.span.begin.line);
    if (!line) continue;
    std::string gutter = std::to_string(d.span.begin.line);
    os << "  " << gutter << " | " << *line << "\n";
    os << "  " << std::string(gutter.size(), ' ') << " | ";
    // Tabs are kept so the caret lines up with the echoed source.
    for (std::uint32_t col = 1; col < d.span.begin.column && col <= line->size(); col++)
      os << ((*line)[col - 1] == '\t' ? '\t' : ' ');
    os << std::string(span_width(d.span), '^') << "\n";
  }
}

}  // namespace forge
