#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "ast_builder.hpp"
#include "mono.hpp"

using namespace forge;

namespace {

class MonoContextTest : public ::testing::Test {
   protected:
    AstArena arena{};
    test::AstBuilder b{arena};
    MonoContext ctx{arena};

    // fn name[N: int](): return <body>
    ItemFn* returning(const char* name, Expr* value) {
        return b.fn(name, {b.ct_int("N")}, {b.ret(value)});
    }

    Expr* fold(BinaryOp op, Expr* lhs, Expr* rhs) { return ctx.try_const_fold(b.bin(op, lhs, rhs)); }
};

std::int64_t int_of(const Expr* e) {
    EXPECT_EQ(e->kind, AstNodeKind::ExprInt);
    return static_cast<const ExprInt*>(e)->value;
}

}  // namespace

TEST(SpecializedName, EmptyArgsKeepName) {
    EXPECT_EQ(MonoContext::get_specialized_function_name("foo", {}), "foo");
}

TEST(SpecializedName, IntAndBoolSegments) {
    EXPECT_EQ(MonoContext::get_specialized_function_name("foo", {CtValue::int_(256)}), "foo_256");
    EXPECT_EQ(MonoContext::get_specialized_function_name("debug", {CtValue::bool_(true)}), "debug_true");
    EXPECT_EQ(MonoContext::get_specialized_function_name("configure", {CtValue::int_(512), CtValue::bool_(true)}),
              "configure_512_true");
}

TEST(SpecializedName, NegativeIntsUseNegPrefix) {
    EXPECT_EQ(MonoContext::get_specialized_function_name("offset", {CtValue::int_(-10)}), "offset_neg10");
    EXPECT_NE(MonoContext::get_specialized_function_name("offset", {CtValue::int_(-10)}),
              MonoContext::get_specialized_function_name("offset", {CtValue::int_(10)}));
    EXPECT_EQ(MonoContext::get_specialized_function_name("m", {CtValue::int_(std::numeric_limits<std::int64_t>::min())}),
              "m_neg9223372036854775808");
}

TEST(SpecializedName, UnsupportedKindsFallBackDeterministically) {
    CtArgs s1{CtValue::string("a b")};
    CtArgs s2{CtValue::string("a_b")};
    std::string n1 = MonoContext::get_specialized_function_name("f", s1);
    std::string n2 = MonoContext::get_specialized_function_name("f", s2);
    EXPECT_EQ(n1, MonoContext::get_specialized_function_name("f", s1));
    EXPECT_NE(n1, n2);
    EXPECT_EQ(n1.rfind("f_", 0), 0u);
    EXPECT_EQ(n1, "f_s3_ax20b");
    EXPECT_EQ(MonoContext::get_specialized_function_name("f", {CtValue::none()}), "f_none");
    EXPECT_EQ(MonoContext::get_specialized_function_name("f", {CtValue::char_('A')}), "f_c65");
    EXPECT_EQ(MonoContext::get_specialized_function_name("f", {CtValue::float_(1.0)}), "f_f3ff0000000000000");
}

TEST_F(MonoContextTest, NeedsSpecialization) {
    EXPECT_TRUE(MonoContext::needs_specialization(b.fn("f", {b.ct_int("N")}, {})));
    EXPECT_FALSE(MonoContext::needs_specialization(b.fn("g", {}, {})));
}

TEST_F(MonoContextTest, RegisterIsIdempotent) {
    ItemFn* first = returning("f", b.ident("N"));
    ItemFn* second = returning("f", b.int_(0));
    ctx.register_original_function(first);
    ctx.register_original_function(second);
    EXPECT_EQ(ctx.original_count(), 1u);
    EXPECT_EQ(ctx.find_original("f"), first);
    EXPECT_EQ(ctx.find_original("g"), nullptr);
}

TEST_F(MonoContextTest, CacheReturnsSameFunctionForEqualArgs) {
    ItemFn* f = returning("f", b.ident("N"));
    ItemFn* a = ctx.specialize_function(f, {CtValue::int_(10)});
    ItemFn* again = ctx.specialize_function(f, {CtValue::int_(10)});
    ItemFn* other = ctx.specialize_function(f, {CtValue::int_(20)});
    EXPECT_EQ(a, again);
    EXPECT_NE(a, other);
    EXPECT_EQ(ctx.specializations().size(), 2u);
    EXPECT_EQ(ctx.find_specialization("f", {CtValue::int_(20)}), other);
}

TEST_F(MonoContextTest, SpecializationHasNoCtParamsAndMangledName) {
    ItemFn* f = returning("f", b.ident("N"));
    ItemFn* spec = ctx.specialize_function(f, {CtValue::int_(42)});
    EXPECT_EQ(spec->name, "f_42");
    EXPECT_TRUE(spec->ct_params.empty());
    EXPECT_EQ(int_of(test::returned_expr(spec)), 42);
    // The original is untouched.
    EXPECT_EQ(f->ct_params.size(), 1u);
    EXPECT_EQ(test::returned_expr(f)->kind, AstNodeKind::ExprIdent);
}

TEST_F(MonoContextTest, SubstitutionFoldsArithmetic) {
    ItemFn* f = returning("f", b.bin(BinaryOp::Mul, b.ident("N"), b.int_(2)));
    ItemFn* spec = ctx.specialize_function(f, {CtValue::int_(10)});
    EXPECT_EQ(int_of(test::returned_expr(spec)), 20);
}

TEST_F(MonoContextTest, FoldingIsBottomUp) {
    // (N + 1) * (N - 1)
    Expr* body = b.bin(BinaryOp::Mul, b.bin(BinaryOp::Add, b.ident("N"), b.int_(1)),
                       b.bin(BinaryOp::Sub, b.ident("N"), b.int_(1)));
    ItemFn* spec = ctx.specialize_function(returning("f", body), {CtValue::int_(5)});
    EXPECT_EQ(int_of(test::returned_expr(spec)), 24);
}

TEST_F(MonoContextTest, UnrelatedIdentifiersAreShared) {
    ExprIdent* x = b.ident("x");
    ItemFn* spec = ctx.specialize_function(returning("f", x), {CtValue::int_(1)});
    EXPECT_EQ(test::returned_expr(spec), x);
}

TEST_F(MonoContextTest, BoolParameterSubstitution) {
    ItemFn* f = b.fn("f", {b.ct_bool("Debug")}, {b.ret(b.bin(BinaryOp::And, b.ident("Debug"), b.bool_(true)))});
    ItemFn* spec = ctx.specialize_function(f, {CtValue::bool_(false)});
    Expr* e = test::returned_expr(spec);
    ASSERT_EQ(e->kind, AstNodeKind::ExprBool);
    EXPECT_FALSE(static_cast<ExprBool*>(e)->value);
}

TEST_F(MonoContextTest, UnaryIsNotFolded) {
    ItemFn* spec =
        ctx.specialize_function(returning("f", b.unary(UnaryOp::Neg, b.ident("N"))), {CtValue::int_(3)});
    Expr* e = test::returned_expr(spec);
    ASSERT_EQ(e->kind, AstNodeKind::ExprUnary);
    EXPECT_EQ(int_of(static_cast<ExprUnary*>(e)->operand), 3);
}

TEST_F(MonoContextTest, FoldArithmetic) {
    EXPECT_EQ(int_of(fold(BinaryOp::Add, b.int_(2), b.int_(3))), 5);
    EXPECT_EQ(int_of(fold(BinaryOp::Sub, b.int_(2), b.int_(3))), -1);
    EXPECT_EQ(int_of(fold(BinaryOp::Mul, b.int_(-4), b.int_(3))), -12);
    EXPECT_EQ(int_of(fold(BinaryOp::Div, b.int_(7), b.int_(2))), 3);
    EXPECT_EQ(int_of(fold(BinaryOp::Div, b.int_(-7), b.int_(2))), -3);
    EXPECT_EQ(int_of(fold(BinaryOp::Mod, b.int_(7), b.int_(3))), 1);
    EXPECT_EQ(int_of(fold(BinaryOp::Mod, b.int_(-7), b.int_(3))), -1);
}

TEST_F(MonoContextTest, DivisionByZeroIsNotFolded) {
    ExprBinary* div = b.bin(BinaryOp::Div, b.int_(1), b.int_(0));
    EXPECT_EQ(ctx.try_const_fold(div), div);
    ExprBinary* mod = b.bin(BinaryOp::Mod, b.int_(1), b.int_(0));
    EXPECT_EQ(ctx.try_const_fold(mod), mod);
}

TEST_F(MonoContextTest, OverflowIsNotFolded) {
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
    ExprBinary* add = b.bin(BinaryOp::Add, b.int_(kMax), b.int_(1));
    EXPECT_EQ(ctx.try_const_fold(add), add);
    ExprBinary* mul = b.bin(BinaryOp::Mul, b.int_(kMax), b.int_(2));
    EXPECT_EQ(ctx.try_const_fold(mul), mul);
    ExprBinary* div = b.bin(BinaryOp::Div, b.int_(kMin), b.int_(-1));
    EXPECT_EQ(ctx.try_const_fold(div), div);
}

TEST_F(MonoContextTest, FoldBooleanLogic) {
    Expr* e = fold(BinaryOp::Or, b.bool_(false), b.bool_(true));
    ASSERT_EQ(e->kind, AstNodeKind::ExprBool);
    EXPECT_TRUE(static_cast<ExprBool*>(e)->value);
    e = fold(BinaryOp::And, b.bool_(true), b.bool_(false));
    ASSERT_EQ(e->kind, AstNodeKind::ExprBool);
    EXPECT_FALSE(static_cast<ExprBool*>(e)->value);
}

TEST_F(MonoContextTest, ComparisonsAndMixedOperandsAreNotFolded) {
    ExprBinary* lt = b.bin(BinaryOp::Lt, b.int_(1), b.int_(2));
    EXPECT_EQ(ctx.try_const_fold(lt), lt);
    ExprBinary* mixed = b.bin(BinaryOp::Add, b.int_(1), b.ident("x"));
    EXPECT_EQ(ctx.try_const_fold(mixed), mixed);
    ExprBinary* bool_add = b.bin(BinaryOp::Add, b.bool_(true), b.bool_(true));
    EXPECT_EQ(ctx.try_const_fold(bool_add), bool_add);
}

TEST_F(MonoContextTest, MissingOperandIsNotFolded) {
    ExprBinary* lhs_only = b.bin(BinaryOp::Add, b.int_(1), nullptr);
    EXPECT_EQ(ctx.try_const_fold(lhs_only), lhs_only);
    ExprBinary* rhs_only = b.bin(BinaryOp::Mul, nullptr, b.int_(2));
    EXPECT_EQ(ctx.try_const_fold(rhs_only), rhs_only);
}

TEST_F(MonoContextTest, SubstitutesControlFlowBodies) {
    // if N > 0: return N
    // while N: x = N
    // for i in items: print(N)
    // defer: print(N)
    auto* if_stmt = arena.make<StmtIf>(Span{}, b.bin(BinaryOp::Gt, b.ident("N"), b.int_(0)),
                                       b.block({b.ret(b.ident("N"))}), std::vector<ElifClause*>{}, nullptr);
    auto* while_stmt = arena.make<StmtWhile>(
        Span{}, b.ident("N"),
        b.block({arena.make<StmtAssign>(Span{}, AssignOp::Set, b.ident("x"), b.ident("N"))}));
    auto* for_stmt = arena.make<StmtFor>(Span{}, "N", b.ident("items"),
                                         b.block({b.expr_stmt(b.call("print", {b.ident("N")}))}));
    auto* defer_stmt = arena.make<StmtDefer>(Span{}, b.block({b.expr_stmt(b.call("print", {b.ident("N")}))}));
    ItemFn* f = b.fn("f", {b.ct_int("N")}, {if_stmt, while_stmt, for_stmt, defer_stmt});

    ItemFn* spec = ctx.specialize_function(f, {CtValue::int_(7)});
    ASSERT_EQ(spec->body->stmts.size(), 4u);

    auto* s_if = static_cast<StmtIf*>(spec->body->stmts[0]);
    ASSERT_EQ(s_if->cond->kind, AstNodeKind::ExprBinary);
    EXPECT_EQ(int_of(static_cast<ExprBinary*>(s_if->cond)->lhs), 7);
    EXPECT_EQ(int_of(static_cast<StmtReturn*>(s_if->then_block->stmts[0])->value), 7);

    auto* s_while = static_cast<StmtWhile*>(spec->body->stmts[1]);
    EXPECT_EQ(int_of(s_while->cond), 7);
    EXPECT_EQ(int_of(static_cast<StmtAssign*>(s_while->body->stmts[0])->value), 7);

    auto* s_for = static_cast<StmtFor*>(spec->body->stmts[2]);
    EXPECT_EQ(s_for->var, "N");
    auto* print_call = static_cast<ExprCall*>(static_cast<StmtExpr*>(s_for->body->stmts[0])->expr);
    EXPECT_EQ(int_of(print_call->args[0]), 7);

    auto* s_defer = static_cast<StmtDefer*>(spec->body->stmts[3]);
    print_call = static_cast<ExprCall*>(static_cast<StmtExpr*>(s_defer->body->stmts[0])->expr);
    EXPECT_EQ(int_of(print_call->args[0]), 7);
}

TEST_F(MonoContextTest, SubstitutesMatchAndWith) {
    auto* arm = arena.make<MatchArm>(Span{}, arena.make<PatWildcard>(Span{}),
                                     b.bin(BinaryOp::Gt, b.ident("N"), b.ident("y")),
                                     b.block({b.ret(b.ident("N"))}));
    auto* match = arena.make<StmtMatch>(Span{}, b.ident("N"), std::vector<MatchArm*>{arm});
    auto* with = arena.make<StmtWith>(Span{}, "r", b.call("open", {b.ident("N")}),
                                      b.block({b.expr_stmt(b.ident("N"))}));
    ItemFn* spec = ctx.specialize_function(b.fn("f", {b.ct_int("N")}, {match, with}), {CtValue::int_(3)});

    auto* s_match = static_cast<StmtMatch*>(spec->body->stmts[0]);
    EXPECT_EQ(int_of(s_match->scrutinee), 3);
    ASSERT_EQ(s_match->arms.size(), 1u);
    EXPECT_EQ(s_match->arms[0]->pat, arm->pat);
    EXPECT_EQ(int_of(static_cast<ExprBinary*>(s_match->arms[0]->guard)->lhs), 3);
    EXPECT_EQ(int_of(static_cast<StmtReturn*>(s_match->arms[0]->body->stmts[0])->value), 3);

    auto* s_with = static_cast<StmtWith*>(spec->body->stmts[1]);
    EXPECT_EQ(int_of(static_cast<ExprCall*>(s_with->value)->args[0]), 3);
    EXPECT_EQ(int_of(static_cast<StmtExpr*>(s_with->body->stmts[0])->expr), 3);
}

TEST_F(MonoContextTest, SubstitutesTypes) {
    // fn f[N: int](buf: [int; N]) -> Matrix[N, 2]:
    //     let tmp: [int; N * 2] = buf
    Param* buf = b.param("buf", b.array(b.type("int"), b.ident("N")));
    Type* ret = b.generic("Matrix", {b.type("N"), b.int_(2)});
    StmtLet* let = b.let("tmp", b.ident("buf"), b.array(b.type("int"), b.bin(BinaryOp::Mul, b.ident("N"), b.int_(2))));
    ItemFn* f = b.fn("f", {b.ct_int("N")}, {let}, {buf}, ret);

    ItemFn* spec = ctx.specialize_function(f, {CtValue::int_(4)});

    auto* p_type = static_cast<TypeArray*>(spec->params[0]->type);
    EXPECT_EQ(int_of(p_type->size), 4);

    auto* r_type = static_cast<TypeGeneric*>(spec->ret);
    ASSERT_EQ(r_type->args.size(), 2u);
    ASSERT_EQ(r_type->args[0]->kind, AstNodeKind::ExprInt);
    EXPECT_EQ(static_cast<ExprInt*>(r_type->args[0])->value, 4);
    EXPECT_EQ(static_cast<ExprInt*>(r_type->args[1])->value, 2);

    auto* l_type = static_cast<TypeArray*>(static_cast<StmtLet*>(spec->body->stmts[0])->type_ann);
    EXPECT_EQ(int_of(l_type->size), 8);
}
