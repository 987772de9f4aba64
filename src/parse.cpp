#include "parse.hpp"

#include <cctype>
#include <cstdio>
#include <ostream>
#include <string>

#include "parser.hpp"

int yyparse(void);
int yylex(void);
extern FILE* yyin;

typedef struct yy_buffer_state* YY_BUFFER_STATE;
extern YY_BUFFER_STATE yy_scan_bytes(const char* bytes, int len);
extern void yy_delete_buffer(YY_BUFFER_STATE buffer);

extern void yyrestart(FILE*);
extern int yylineno;
extern int yycolumn;
extern YYSTYPE yylval;
extern YYLTYPE yylloc;

namespace forge {

static void reset_lexer() {
    yylineno = 1;
    yycolumn = 1;
    yylloc.first_line = yylloc.last_line = 1;
    yylloc.first_column = yylloc.last_column = 1;
}

ParseState parse_file(FileId file_id, const char* path) {
    ParseState state{};
    state.file = file_id;
    g_parse_state = &state;

    FILE* input = std::fopen(path, "rb");
    if (!input) {
        push_error(Span{.file = state.file},
                   std::string("could not open file: ") + path);
        g_parse_state = nullptr;
        return state;
    }

    yyin = input;
    reset_lexer();
    yyrestart(input);

    (void)yyparse();

    std::fclose(input);
    g_parse_state = nullptr;
    return state;
}

ParseState parse_source(FileId file_id, std::string_view text) {
    ParseState state{};
    state.file = file_id;
    g_parse_state = &state;

    reset_lexer();
    YY_BUFFER_STATE buffer = yy_scan_bytes(text.data(), static_cast<int>(text.size()));
    (void)yyparse();
    yy_delete_buffer(buffer);

    g_parse_state = nullptr;
    return state;
}

static const char* token_name(int tok) {
    switch (tok) {
        case 0:
            return "EOF";
        case IDENT:
            return "IDENT";
        case INT:
            return "INT";
        case FLOAT:
            return "FLOAT";
        case STRING:
            return "STRING";
        case CHAR:
            return "CHAR";
        case NEWLINE:
            return "NEWLINE";
        case INDENT:
            return "INDENT";
        case DEDENT:
            return "DEDENT";

        case KW_FN:
            return "fn";
        case KW_LET:
            return "let";
        case KW_VAR:
            return "var";
        case KW_CONST:
            return "const";
        case KW_IF:
            return "if";
        case KW_ELIF:
            return "elif";
        case KW_ELSE:
            return "else";
        case KW_WHILE:
            return "while";
        case KW_FOR:
            return "for";
        case KW_IN:
            return "in";
        case KW_MATCH:
            return "match";
        case KW_CASE:
            return "case";
        case KW_RETURN:
            return "return";
        case KW_BREAK:
            return "break";
        case KW_CONTINUE:
            return "continue";
        case KW_STRUCT:
            return "struct";
        case KW_TRUE:
            return "true";
        case KW_FALSE:
            return "false";
        case KW_NONE:
            return "None";
        case KW_DEFER:
            return "defer";
        case KW_WITH:
            return "with";
        case KW_TRY:
            return "try";
        case KW_AND:
            return "and";
        case KW_OR:
            return "or";
        case KW_NOT:
            return "not";
        case KW_PASS:
            return "pass";
        case KW_MUT:
            return "mut";

        case ARROW:
            return "->";
        case EQEQ:
            return "==";
        case NEQ:
            return "!=";
        case LE:
            return "<=";
        case GE:
            return ">=";
        case ANDAND:
            return "&&";
        case OROR:
            return "||";
        case SHL:
            return "<<";
        case SHR:
            return ">>";
        case DOTDOT:
            return "..";
        case PLUS_EQ:
            return "+=";
        case MINUS_EQ:
            return "-=";
        case STAR_EQ:
            return "*=";
        case SLASH_EQ:
            return "/=";
    }
    return nullptr;
}

static void dump_string_lit(std::ostream& os, std::string_view s) {
    os << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            default:
                if (c >= 32 && c < 127) {
                    os << static_cast<char>(c);
                } else {
                    static constexpr char kHex[] = "0123456789abcdef";
                    os << "\\x" << kHex[(c >> 4) & 0xf] << kHex[c & 0xf];
                }
                break;
        }
    }
    os << '"';
}

void dump_tokens(FileId file_id, const char* path, std::ostream& os) {
    ParseState state{};
    state.file = file_id;
    g_parse_state = &state;

    FILE* input = std::fopen(path, "rb");
    if (!input) {
        push_error(Span{.file = state.file},
                   std::string("could not open file: ") + path);
        for (const auto& d : state.diags) os << d.message << "\n";
        g_parse_state = nullptr;
        return;
    }

    yyin = input;
    reset_lexer();
    yyrestart(input);

    while (true) {
        int tok = yylex();
        if (tok == 0) break;

        os << yylloc.first_line << ":" << yylloc.first_column << " ";
        if (const char* name = token_name(tok)) {
            os << name;
        } else if (tok >= 0 && tok < 128 && std::isprint(tok)) {
            os << "'" << static_cast<char>(tok) << "'";
        } else {
            os << "<tok " << tok << ">";
        }

        switch (tok) {
            case IDENT:
                os << " ";
                dump_string_lit(os, take_str(yylval.cstr));
                break;
            case STRING:
                os << " ";
                dump_string_lit(os, take_string(yylval.str_lit));
                break;
            case INT:
                os << " " << yylval.int_val;
                break;
            case FLOAT:
                os << " " << yylval.float_val;
                break;
            case CHAR:
                os << " U+" << std::hex << yylval.char_val << std::dec;
                break;
            default:
                break;
        }
        os << "\n";
    }
    for (const auto& d : state.diags) os << "error: " << d.message << "\n";

    std::fclose(input);
    g_parse_state = nullptr;
}

std::optional<Program> load_program(Session& session, FileId file) {
    const SourceFile& source = session.sources.file(file);
    ParseState state = source.text ? parse_source(file, *source.text) : parse_file(file, source.path.c_str());

    bool failed = !state.diags.empty() || !state.root;
    for (Diagnostic& d : state.diags) session.diags.push_back(std::move(d));
    if (failed) return std::nullopt;

    Program program{};
    program.arena = std::move(state.arena);
    program.root = state.root;
    return program;
}

}  // namespace forge
