#pragma once

#include <cstddef>
#include <optional>

#include "ast.hpp"
#include "ct_value.hpp"
#include "session.hpp"

namespace forge {

struct MonoOptions {
    // Upper bound on specializations created for one program. Recursive
    // instantiation such as `f[N]` calling `f[N - 1]` stops here.
    size_t max_specializations = 4096;
    // Warn about calls that name a generic function without `[...]`.
    bool warn_generic_without_args = true;
};

// The literal value of every compile-time argument of `call`. Reports an
// error naming the callee and argument position on the first non-literal.
std::optional<CtArgs> extract_compile_time_args(Session& session, const ExprCall* call);

// Replaces every generic function of `program` by the specializations its
// call sites require. Returns empty, with errors in `session`, when any call
// cannot be specialized; no call site is rewritten in that case.
std::optional<Program> monomorphize_program(Session& session, Program program,
                                            const MonoOptions& options = MonoOptions{});

}  // namespace forge
