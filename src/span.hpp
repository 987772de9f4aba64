#pragma once

#include <cstdint>

#include "source.hpp"

namespace forge {

struct SourceLoc {
    std::uint32_t line = 1;
    std::uint32_t column = 1;
};

struct Span {
    FileId file = 0;
    SourceLoc begin{};
    SourceLoc end{};
};

// Caret width for a single-line span; at least one column.
inline std::uint32_t span_width(const Span& span) {
    if (span.end.line != span.begin.line || span.end.column <= span.begin.column) return 1;
    return span.end.column - span.begin.column;
}

}  // namespace forge
