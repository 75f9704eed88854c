#include <gtest/gtest.h>
#include <climits>
#include <string>
#include "komrad/eval.hpp"
#include "komrad/parser.hpp"
#include "test_env.hpp"

using namespace komrad;

namespace {

struct HostEval : ::testing::Test {
    TestRuntime t;
    Evaluator ev{*t.rt, nullptr};
    env_ptr env = std::make_shared<Env>(std::make_shared<Scope>(), t.rt->globals());

    value eval(const char* src){ return ev.evaluate(*Parser().parse_expression(src), env); }
    std::string error_code(const char* src){
        try { eval(src); } catch (const eval_error& e) { return e.code; }
        return {};
    }
};

} // namespace

TEST_F(HostEval, Arithmetic){
    EXPECT_EQ(std::get<std::int64_t>(eval("1 + 2 * 3").data), 7);
    EXPECT_EQ(std::get<std::int64_t>(eval("7 / 2").data), 3);
    EXPECT_EQ(std::get<std::int64_t>(eval("-7 % 3").data), -1);
    EXPECT_DOUBLE_EQ(std::get<double>(eval("7.0 / 2").data), 3.5);
    EXPECT_TRUE(std::get<bool>(eval("\"apple\" < \"banana\"").data));
    EXPECT_TRUE(std::get<bool>(eval("1 == 1.0").data));
    EXPECT_FALSE(std::get<bool>(eval("\"a\" == 1").data));
}

TEST_F(HostEval, IntegerArithmeticWraps){
    auto v = apply_binary(binary_op::Add, v_int(INT64_MAX), v_int(1));
    EXPECT_EQ(std::get<std::int64_t>(v.data), INT64_MIN);
    v = apply_binary(binary_op::Div, v_int(INT64_MIN), v_int(-1));
    EXPECT_EQ(std::get<std::int64_t>(v.data), INT64_MIN);
}

TEST_F(HostEval, Concatenation){
    EXPECT_EQ(std::get<std::string>(eval("\"n=\" + 4").data), "n=4");
    EXPECT_EQ(std::get<std::string>(eval("\"ok: \" + true").data), "ok: true");
    auto l = std::get<list_ptr>(eval("[1 2] + [3]").data);
    ASSERT_EQ(l->size(), 3u);
    EXPECT_EQ(std::get<std::int64_t>((*l)[2].data), 3);
}

TEST_F(HostEval, ErrorCodes){
    EXPECT_EQ(error_code("1 / 0"), codes::DivisionByZero);
    EXPECT_EQ(error_code("5 % 0"), codes::DivisionByZero);
    EXPECT_EQ(error_code("1 + true"), codes::TypeMismatch);
    EXPECT_EQ(error_code("!5"), codes::TypeMismatch);
    EXPECT_EQ(error_code("1 && true"), codes::TypeMismatch);
    EXPECT_EQ(error_code("missing + 1"), codes::UnresolvedVariable);
    EXPECT_EQ(error_code("*5"), codes::TypeMismatch);
    // A send to an unbound name has no instance to dispatch to on the host
    EXPECT_EQ(error_code("frobnicate 1"), codes::UnresolvedVariable);
    EXPECT_EQ(error_code("spawn Nowhere"), codes::UnknownAgent);
}

TEST_F(HostEval, ShortCircuit){
    // The right operand would fail if evaluated
    EXPECT_FALSE(std::get<bool>(eval("false && (1 / 0 == 1)").data));
    EXPECT_TRUE(std::get<bool>(eval("true || missing").data));
}

TEST_F(HostEval, BlockValueRunsOnEachCall){
    env->bind_local("k", v_int(20));
    value b = eval("{ k + 1 }");
    ASSERT_TRUE(is_block(b));
    EXPECT_EQ(std::get<std::int64_t>(ev.call_block(*as_block(b)).data), 21);
    EXPECT_EQ(std::get<std::int64_t>(eval("*{ 6 * 7 }").data), 42);
}

TEST_F(HostEval, DefinitionsCannotBeExecuted){
    auto p = Parser().parse("agent A { }");
    try {
        ev.execute(*p->statements.at(0), env);
        FAIL() << "expected eval_error";
    } catch (const eval_error& e) {
        EXPECT_EQ(e.code, codes::Arity);
    }
}

TEST(Env, CaptureSnapshotsLocalsAndSharesFields){
    auto fields = std::make_shared<Scope>();
    Env base(fields, nullptr);
    auto e = base.extend();
    e->bind_local("n", v_int(1));
    auto snap = e->capture();
    snap->assign("n", v_int(5));
    snap->assign("f", v_int(9));
    EXPECT_EQ(as_int(e->lookup("n")), 1);
    EXPECT_EQ(as_int(snap->lookup("n")), 5);
    EXPECT_EQ(as_int(fields->get("f")), 9);
    EXPECT_EQ(as_int(e->lookup("f")), 9);
}

TEST(Env, RedirectCollectsEveryAssignment){
    auto fields = std::make_shared<Scope>();
    fields->set("count", v_int(1));
    Env base(fields, nullptr);
    auto e = base.extend();
    e->bind_local("n", v_int(1));
    auto sink = std::make_shared<Scope>();
    auto r = e->redirect(sink);
    r->assign("n", v_int(3));
    r->assign("count", v_int(4));
    EXPECT_EQ(as_int(sink->get("n")), 3);
    EXPECT_EQ(as_int(sink->get("count")), 4);
    EXPECT_EQ(as_int(r->lookup("count")), 4);
    EXPECT_EQ(as_int(e->lookup("n")), 1);
    EXPECT_EQ(as_int(fields->get("count")), 1);
}

TEST(Env, LookupOrder){
    auto globals = std::make_shared<Scope>();
    globals->set("x", v_int(1));
    auto fields = std::make_shared<Scope>();
    Env base(fields, globals);
    EXPECT_EQ(as_int(base.lookup("x")), 1);
    fields->set("x", v_int(2));
    EXPECT_EQ(as_int(base.lookup("x")), 2);
    auto e = base.extend();
    e->bind_local("x", v_int(3));
    EXPECT_EQ(as_int(e->lookup("x")), 3);
    EXPECT_FALSE(e->bound("y"));
}

TEST(EvalPrograms, BlocksMutateFieldsOfTheDefiningInstance){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "counter = 0\n"
        "bump = { counter = counter + 1 }\n"
        "*bump\n"
        "*bump\n"
        "r = *{ counter * 10 }\n"));
    EXPECT_EQ(as_int(t.field("counter")), 2);
    EXPECT_EQ(as_int(t.field("r")), 20);
    EXPECT_EQ(t.rt->diagnostics().snapshot().size(), 0u);
}

TEST(EvalPrograms, BlockCannotRebindHoleOfItsCreator){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "[shadow _n] {\n"
        "  b = { n = n + 100; inner = n }\n"
        "  *b\n"
        "  seen = n\n"
        "}\n"
        "[main] { shadow 1 }\n"));
    EXPECT_EQ(as_int(t.field("inner")), 101);
    EXPECT_EQ(as_int(t.field("seen")), 1);
}

TEST(EvalPrograms, UnresolvedVariableAbortsOnlyThatHandler){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "[main] { before = 1; y = nope + 1; after = 1 }\n"));
    EXPECT_EQ(t.count(codes::UnresolvedVariable), 1u);
    EXPECT_EQ(as_int(t.field("before")), 1);
    EXPECT_FALSE(t.field("after").has_value());
}

TEST(EvalPrograms, DivisionByZeroIsReported){
    TestRuntime t;
    ASSERT_TRUE(t.run("a = 10\nb = a / (a - 10)\n"));
    EXPECT_EQ(t.count(codes::DivisionByZero), 1u);
    EXPECT_FALSE(t.field("b").has_value());
}
