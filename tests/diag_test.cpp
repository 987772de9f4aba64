#include <gtest/gtest.h>

#include <sstream>

#include "session.hpp"

using namespace forge;

namespace {

Span at(FileId file, std::uint32_t line, std::uint32_t col, std::uint32_t end_col) {
    return Span{.file = file, .begin = SourceLoc{.line = line, .column = col},
                .end = SourceLoc{.line = line, .column = end_col}};
}

}  // namespace

TEST(Diagnostics, FormatHasLocationAndSeverity) {
    Session session;
    FileId file = session.add_buffer("demo.pyr", "fn main():\n    pass\n");
    session.warning(at(file, 2, 5, 9), "unused");
    EXPECT_EQ(format_diagnostic(session.sources, session.diags[0]), "demo.pyr:2:5: warning: unused");
}

TEST(Diagnostics, UnknownFileHasNoLocation) {
    Session session;
    session.error(Span{.file = 7}, "lost");
    EXPECT_EQ(format_diagnostic(session.sources, session.diags[0]), "<unknown>: error: lost");
}

TEST(Diagnostics, EmitShowsSourceLineAndCaret) {
    Session session;
    FileId file = session.add_buffer("demo.pyr", "fn main():\n    f[k]()\n");
    session.error(at(file, 2, 7, 8), "compile-time argument 1 in call to 'f' must be a literal");

    std::ostringstream out;
    emit_diagnostics(out, session.sources, session.diags);
    EXPECT_EQ(out.str(),
              "demo.pyr:2:7: error: compile-time argument 1 in call to 'f' must be a literal\n"
              "  2 |     f[k]()\n"
              "    |       ^\n");
}

TEST(Diagnostics, CaretCoversSingleLineSpan) {
    Session session;
    FileId file = session.add_buffer("demo.pyr", "let value = 1\n");
    session.note(at(file, 1, 5, 10), "declared here");

    std::ostringstream out;
    emit_diagnostics(out, session.sources, session.diags);
    EXPECT_EQ(out.str(),
              "demo.pyr:1:5: note: declared here\n"
              "  1 | let value = 1\n"
              "    |     ^^^^^\n");
}

TEST(Diagnostics, LineOutOfRangeIsSkipped) {
    Session session;
    FileId file = session.add_buffer("demo.pyr", "pass\n");
    EXPECT_FALSE(session.sources.line_text(file, 5).has_value());
    ASSERT_TRUE(session.sources.line_text(file, 1).has_value());
    EXPECT_EQ(*session.sources.line_text(file, 1), "pass");
}

TEST(Diagnostics, ErrorCountIgnoresWarnings) {
    Session session;
    session.warning(Span{}, "w");
    session.note(Span{}, "n");
    EXPECT_FALSE(session.has_errors());
    session.error(Span{}, "e");
    EXPECT_TRUE(session.has_errors());
    EXPECT_EQ(session.error_count(), 1u);
}
