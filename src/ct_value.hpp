#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <llvm/ADT/Hashing.h>

#include "ast.hpp"

namespace forge {

// A compile-time argument value. Only `Int` and `Bool` can be declared as
// compile-time parameter kinds; the remaining kinds reach the pass only when
// upstream checking is bypassed and exist so such input degrades gracefully.
struct CtValue {
    enum class Kind : std::uint8_t {
        Int,
        Bool,
        Float,
        Char,
        String,
        None,
    };

    Kind kind = Kind::Int;

    std::int64_t int_value = 0;
    bool bool_value = false;
    double float_value = 0.0;
    std::uint32_t char_value = 0;
    std::string string_value{};

    static CtValue int_(std::int64_t i) {
        return CtValue{.kind = Kind::Int, .int_value = i};
    }
    static CtValue bool_(bool b) {
        return CtValue{.kind = Kind::Bool, .bool_value = b};
    }
    static CtValue float_(double f) {
        return CtValue{.kind = Kind::Float, .float_value = f};
    }
    static CtValue char_(std::uint32_t c) {
        return CtValue{.kind = Kind::Char, .char_value = c};
    }
    static CtValue string(std::string s) {
        CtValue v{};
        v.kind = Kind::String;
        v.string_value = std::move(s);
        return v;
    }
    static CtValue none() { return CtValue{.kind = Kind::None}; }
};

using CtArgs = std::vector<CtValue>;

// Value equality; floats compare by bit pattern so that equality agrees with
// hashing.
bool operator==(const CtValue& a, const CtValue& b);
inline bool operator!=(const CtValue& a, const CtValue& b) { return !(a == b); }

llvm::hash_code hash_value(const CtValue& v);
llvm::hash_code hash_value(const CtArgs& args);

std::string ct_value_to_string(const CtValue& v);
std::string ct_args_to_string(const CtArgs& args);

// The value denoted by a literal expression; empty for anything else.
std::optional<CtValue> literal_value(const Expr* expr);

// Fresh literal node carrying `v`.
Expr* make_literal(AstArena& arena, Span span, const CtValue& v);

}  // namespace forge
