#include <gtest/gtest.h>

#include "ast_builder.hpp"
#include "monomorphize.hpp"
#include "rewrite.hpp"

using namespace forge;

namespace {

class RewriteTest : public ::testing::Test {
   protected:
    AstArena arena{};
    test::AstBuilder b{arena};
    MonoContext ctx{arena};

    ItemFn* register_generic(const std::string& name) {
        ItemFn* fn = b.fn(name, {b.ct_int("N")}, {b.ret(b.ident("N"))});
        ctx.register_original_function(fn);
        return fn;
    }
};

}  // namespace

TEST_F(RewriteTest, TargetIsRegisteredOriginal) {
    ItemFn* f = register_generic("f");
    EXPECT_EQ(rewrite_target(b.ct_call("f", {b.int_(1)}), ctx), f);
}

TEST_F(RewriteTest, NoTargetWithoutCompileTimeArgs) {
    register_generic("f");
    EXPECT_EQ(rewrite_target(b.call("f", {b.int_(1)}), ctx), nullptr);
}

TEST_F(RewriteTest, NoTargetForUnknownName) {
    register_generic("f");
    EXPECT_EQ(rewrite_target(b.ct_call("g", {b.int_(1)}), ctx), nullptr);
}

TEST_F(RewriteTest, NoTargetForComputedCallee) {
    register_generic("f");
    auto* callee = arena.make<ExprField>(Span{}, b.ident("obj"), "f");
    auto* call = arena.make<ExprCall>(Span{}, callee, std::vector<Expr*>{b.int_(1)}, std::vector<Expr*>{});
    EXPECT_EQ(rewrite_target(call, ctx), nullptr);
}

TEST_F(RewriteTest, CallSiteGetsFreshCallee) {
    ItemFn* f = register_generic("f");
    ExprCall* call = b.ct_call("f", {b.int_(10)}, {b.int_(3)});
    Expr* old_callee = call->callee;
    Expr* arg = call->args[0];

    ItemFn* spec = ctx.specialize_function(f, {CtValue::int_(10)});
    rewrite_call_site(arena, call, spec);

    ASSERT_EQ(call->callee->kind, AstNodeKind::ExprIdent);
    EXPECT_NE(call->callee, old_callee);
    EXPECT_EQ(static_cast<ExprIdent*>(call->callee)->name, "f_10");
    EXPECT_EQ(static_cast<ExprIdent*>(old_callee)->name, "f");
    EXPECT_TRUE(call->ct_args.empty());
    ASSERT_EQ(call->args.size(), 1u);
    EXPECT_EQ(call->args[0], arg);
}

TEST_F(RewriteTest, SharedCalleeIdentifierIsNotMutated) {
    ItemFn* f = register_generic("f");
    ExprIdent* shared = b.ident("f");
    auto* first = arena.make<ExprCall>(Span{}, shared, std::vector<Expr*>{b.int_(1)}, std::vector<Expr*>{});
    auto* second = arena.make<ExprCall>(Span{}, shared, std::vector<Expr*>{b.int_(2)}, std::vector<Expr*>{});

    rewrite_call_site(arena, first, ctx.specialize_function(f, {CtValue::int_(1)}));
    rewrite_call_site(arena, second, ctx.specialize_function(f, {CtValue::int_(2)}));

    EXPECT_EQ(shared->name, "f");
    EXPECT_EQ(static_cast<ExprIdent*>(first->callee)->name, "f_1");
    EXPECT_EQ(static_cast<ExprIdent*>(second->callee)->name, "f_2");
}

TEST(ExtractCompileTimeArgs, LiteralsInOrder) {
    AstArena arena;
    test::AstBuilder b(arena);
    Session session;

    std::optional<CtArgs> args =
        extract_compile_time_args(session, b.ct_call("f", {b.int_(4), b.bool_(true), b.int_(-2)}));
    ASSERT_TRUE(args.has_value());
    CtArgs expected{CtValue::int_(4), CtValue::bool_(true), CtValue::int_(-2)};
    EXPECT_EQ(*args, expected);
    EXPECT_TRUE(session.diags.empty());
}

TEST(ExtractCompileTimeArgs, NonLiteralIsReported) {
    AstArena arena;
    test::AstBuilder b(arena);
    Session session;

    std::optional<CtArgs> args = extract_compile_time_args(session, b.ct_call("f", {b.int_(1), b.ident("x")}));
    EXPECT_FALSE(args.has_value());
    ASSERT_EQ(session.error_count(), 1u);
    const std::string& msg = session.diags[0].message;
    EXPECT_NE(msg.find("'f'"), std::string::npos);
    EXPECT_NE(msg.find("argument 2"), std::string::npos);
}
