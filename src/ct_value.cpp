#include "ct_value.hpp"

#include <cstring>
#include <sstream>

namespace forge {
namespace {

static std::uint64_t float_bits(double f) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(f));
    std::memcpy(&bits, &f, sizeof(f));
    return bits;
}

}  // namespace

bool operator==(const CtValue& a, const CtValue& b) {
    if (a.kind != b.kind) return false;
    switch (a.kind) {
        case CtValue::Kind::Int:
            return a.int_value == b.int_value;
        case CtValue::Kind::Bool:
            return a.bool_value == b.bool_value;
        case CtValue::Kind::Float:
            return float_bits(a.float_value) == float_bits(b.float_value);
        case CtValue::Kind::Char:
            return a.char_value == b.char_value;
        case CtValue::Kind::String:
            return a.string_value == b.string_value;
        case CtValue::Kind::None:
            return true;
    }
    return false;
}

llvm::hash_code hash_value(const CtValue& v) {
    auto kind = static_cast<unsigned>(v.kind);
    switch (v.kind) {
        case CtValue::Kind::Int:
            return llvm::hash_combine(kind, v.int_value);
        case CtValue::Kind::Bool:
            return llvm::hash_combine(kind, v.bool_value);
        case CtValue::Kind::Float:
            return llvm::hash_combine(kind, float_bits(v.float_value));
        case CtValue::Kind::Char:
            return llvm::hash_combine(kind, v.char_value);
        case CtValue::Kind::String:
            return llvm::hash_combine(kind, v.string_value);
        case CtValue::Kind::None:
            return llvm::hash_value(kind);
    }
    return llvm::hash_value(kind);
}

llvm::hash_code hash_value(const CtArgs& args) {
    llvm::hash_code h = llvm::hash_value(args.size());
    for (const CtValue& v : args) h = llvm::hash_combine(h, hash_value(v));
    return h;
}

std::string ct_value_to_string(const CtValue& v) {
    switch (v.kind) {
        case CtValue::Kind::Int:
            return std::to_string(v.int_value);
        case CtValue::Kind::Bool:
            return v.bool_value ? "true" : "false";
        case CtValue::Kind::Float: {
            std::ostringstream out;
            out << v.float_value;
            return out.str();
        }
        case CtValue::Kind::Char:
            return "char(" + std::to_string(v.char_value) + ")";
        case CtValue::Kind::String:
            return "\"" + v.string_value + "\"";
        case CtValue::Kind::None:
            return "none";
    }
    return "<value>";
}

std::string ct_args_to_string(const CtArgs& args) {
    std::string out = "[";
    for (size_t i = 0; i < args.size(); i++) {
        if (i) out += ", ";
        out += ct_value_to_string(args[i]);
    }
    out += "]";
    return out;
}

std::optional<CtValue> literal_value(const Expr* expr) {
    if (!expr) return std::nullopt;
    switch (expr->kind) {
        case AstNodeKind::ExprInt:
            return CtValue::int_(static_cast<const ExprInt*>(expr)->value);
        case AstNodeKind::ExprBool:
            return CtValue::bool_(static_cast<const ExprBool*>(expr)->value);
        case AstNodeKind::ExprFloat:
            return CtValue::float_(static_cast<const ExprFloat*>(expr)->value);
        case AstNodeKind::ExprChar:
            return CtValue::char_(static_cast<const ExprChar*>(expr)->value);
        case AstNodeKind::ExprString:
            return CtValue::string(static_cast<const ExprString*>(expr)->value);
        case AstNodeKind::ExprNone:
            return CtValue::none();
        default:
            break;
    }
    return std::nullopt;
}

Expr* make_literal(AstArena& arena, Span span, const CtValue& v) {
    switch (v.kind) {
        case CtValue::Kind::Int:
            return arena.make<ExprInt>(span, v.int_value);
        case CtValue::Kind::Bool:
            return arena.make<ExprBool>(span, v.bool_value);
        case CtValue::Kind::Float:
            return arena.make<ExprFloat>(span, v.float_value);
        case CtValue::Kind::Char:
            return arena.make<ExprChar>(span, v.char_value);
        case CtValue::Kind::String:
            return arena.make<ExprString>(span, v.string_value);
        case CtValue::Kind::None:
            return arena.make<ExprNone>(span);
    }
    return arena.make<ExprNone>(span);
}

}  // namespace forge
