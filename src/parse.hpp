#pragma once

#include <iosfwd>
#include <optional>
#include <string_view>

#include "parse_state.hpp"
#include "session.hpp"

namespace forge {

ParseState parse_file(FileId file, const char* path);
ParseState parse_source(FileId file, std::string_view text);
void dump_tokens(FileId file, const char* path, std::ostream& os);

// Parses a session file (on disk or an in-memory buffer) and moves the parse
// diagnostics into `session`. Empty when parsing reported an error.
std::optional<Program> load_program(Session& session, FileId file);

}  // namespace forge
