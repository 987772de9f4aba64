#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <llvm/Support/Debug.h>

#include "ast.hpp"
#include "diag.hpp"
#include "monomorphize.hpp"
#include "parse.hpp"
#include "print.hpp"
#include "session.hpp"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--dump-tokens] [--dump-ast] [--emit-mono <out.pyr>] "
                 "[--debug-mono] [--max-specializations <n>] "
                 "[--no-generic-call-warnings] <file.pyr>\n";
}

static std::optional<size_t> parse_count(std::string_view text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

int main(int argc, char** argv) {
    bool dump_ast = false;
    bool dump_tokens = false;
    std::optional<std::string_view> emit_mono{};
    forge::MonoOptions options{};
    const char* input_path = nullptr;

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--dump-ast") {
            dump_ast = true;
            continue;
        }
        if (arg == "--dump-tokens") {
            dump_tokens = true;
            continue;
        }
        if (arg == "--debug-mono") {
            llvm::DebugFlag = true;
            continue;
        }
        if (arg == "--no-generic-call-warnings") {
            options.warn_generic_without_args = false;
            continue;
        }
        if (arg == "--emit-mono") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            emit_mono = std::string_view(argv[++i]);
            continue;
        }
        if (arg == "--max-specializations") {
            if (i + 1 >= argc) {
                usage(argv[0]);
                return 2;
            }
            std::optional<size_t> n = parse_count(argv[++i]);
            if (!n) {
                std::cerr << argv[0] << ": invalid value for --max-specializations: " << argv[i] << "\n";
                usage(argv[0]);
                return 2;
            }
            options.max_specializations = *n;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            usage(argv[0]);
            return 2;
        }
        if (input_path) {
            usage(argv[0]);
            return 2;
        }
        input_path = argv[i];
    }

    if (!input_path) {
        usage(argv[0]);
        return 2;
    }

    forge::Session session{};
    forge::FileId file = session.add_file(input_path);

    if (dump_tokens) {
        forge::dump_tokens(file, input_path, std::cout);
        return 0;
    }

    std::optional<forge::Program> program = forge::load_program(session, file);

    if (!session.has_errors() && program && dump_ast) forge::dump_ast(std::cout, program->root);

    std::optional<forge::Program> mono{};
    if (!session.has_errors() && program) mono = forge::monomorphize_program(session, std::move(*program), options);

    if (!session.has_errors() && mono) {
        if (emit_mono) {
            std::ofstream os{std::string(*emit_mono)};
            if (!os) {
                session.diags.push_back(forge::Diagnostic{
                    .severity = forge::Severity::Error,
                    .span = forge::Span{.file = file},
                    .message = "failed to open output file for --emit-mono",
                });
            } else {
                forge::print_program(os, mono->root);
            }
        } else if (!dump_ast) {
            forge::print_program(std::cout, mono->root);
        }
    }

    forge::emit_diagnostics(std::cerr, session.sources, session.diags);
    return session.has_errors() ? 1 : 0;
}
