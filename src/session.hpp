#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "diag.hpp"
#include "source.hpp"

namespace forge {

std::filesystem::path normalize_path(std::filesystem::path path);

// Per-compilation state shared by every stage: the source table and the
// diagnostics reported so far.
struct Session {
    SourceManager sources{};
    std::vector<Diagnostic> diags{};

    FileId add_file(std::filesystem::path path);
    FileId add_buffer(std::string name, std::string text);

    void error(Span span, std::string message);
    void warning(Span span, std::string message);
    void note(Span span, std::string message);

    bool has_errors() const;
    size_t error_count() const;
};

}  // namespace forge
