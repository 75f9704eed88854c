#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include "komrad/runtime/native_agent.hpp"
#include "test_env.hpp"

using namespace komrad;
using namespace std::chrono_literals;

namespace {

bool eventually(const std::function<bool()>& cond){
    for(int i=0;i<200;++i){
        if(cond()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return cond();
}

std::string text_of(const std::optional<value>& v){ return v ? display(*v) : std::string("<missing>"); }

} // namespace

TEST(Runtime, CounterReceivesEveryMessage){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Counter {\n"
        "  count: Int = 0\n"
        "  [increment] { count = count + 1 }\n"
        "}\n"
        "c = spawn Counter\n"
        "c increment\n"
        "c increment\n"));
    EXPECT_EQ(as_int(t.field_of("c", "count")), 2);
}

TEST(Runtime, MessagesFromOneSenderArriveInOrder){
    TestRuntime t(4);
    ASSERT_TRUE(t.run(
        "agent Log {\n"
        "  items: List = []\n"
        "  [add _x] { items = List append items x }\n"
        "}\n"
        "l = spawn Log\n"
        "l add 1\n"
        "l add 10\n"
        "l add 2\n"
        "l add 20\n"));
    EXPECT_EQ(text_of(t.field_of("l", "items")), "[1 10 2 20]");
}

TEST(Runtime, ManyMessagesSpanSeveralBatches){
    TestRuntime t(4);
    ASSERT_TRUE(t.run(
        "agent Counter {\n"
        "  count: Int = 0\n"
        "  [increment] { count = count + 1 }\n"
        "}\n"
        "c = spawn Counter\n"
        "[pump _(n > 0)] { c increment; pump (n - 1) }\n"
        "[pump 0] { }\n"
        "[main] { pump 100 }\n"));
    EXPECT_EQ(as_int(t.field_of("c", "count")), 100);
}

TEST(Runtime, UnhandledMessagesAreWarnings){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Mute { }\n"
        "m = spawn Mute\n"
        "m hello\n"
        "m bye 2\n"));
    EXPECT_EQ(t.count(codes::UnhandledMessage), 2u);
    t.rt->send(t.ref("m"), {v_word("again")});
    ASSERT_TRUE(t.idle());
    EXPECT_EQ(t.count(codes::UnhandledMessage), 3u);
    EXPECT_FALSE(t.rt->diagnostics().has_errors());
}

TEST(Runtime, InstancesHaveSeparateFields){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Cell {\n"
        "  v: Int = 0\n"
        "  [set _n] { v = n }\n"
        "}\n"
        "a = spawn Cell\n"
        "b = spawn Cell\n"
        "a set 5\n"
        "b set 7\n"));
    EXPECT_EQ(as_int(t.field_of("a", "v")), 5);
    EXPECT_EQ(as_int(t.field_of("b", "v")), 7);
    EXPECT_FALSE(t.field("v").has_value());
}

TEST(Runtime, AssignmentToUnboundNameCreatesAField){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Memo {\n"
        "  [remember _v] { note = v }\n"
        "  [recall] { seen = note }\n"
        "}\n"
        "a = spawn Memo\n"
        "b = spawn Memo\n"
        "a remember 4\n"
        "a recall\n"
        "b recall\n"));
    EXPECT_EQ(as_int(t.field_of("a", "note")), 4);
    EXPECT_EQ(as_int(t.field_of("a", "seen")), 4);
    EXPECT_FALSE(t.field_of("b", "note").has_value());
    EXPECT_FALSE(t.field_of("b", "seen").has_value());
    EXPECT_EQ(t.count(codes::UnresolvedVariable), 1u);
    EXPECT_FALSE(t.field("note").has_value());
}

TEST(Runtime, TerminateDropsLaterMessages){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Worker {\n"
        "  [work] { Io println \"working\" }\n"
        "}\n"
        "w = spawn Worker\n"
        "w work\n"
        "w terminate\n"
        "w work\n"));
    EXPECT_EQ(t.out.str(), "working\n");
    EXPECT_EQ(t.count(codes::Delivery), 1u);
    t.rt->send(t.ref("w"), {v_word("work")});
    EXPECT_EQ(t.count(codes::Delivery), 2u);
    EXPECT_TRUE(eventually([&]{ return t.rt->live_instances() == 1; }));
}

TEST(Runtime, TerminateWithArgumentsIsAnOrdinaryMessage){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Job {\n"
        "  why: String = \"\"\n"
        "  [terminate _reason] { why = reason }\n"
        "}\n"
        "j = spawn Job\n"
        "j terminate \"done\"\n"));
    EXPECT_EQ(text_of(t.field_of("j", "why")), "done");
}

TEST(Runtime, RequestReply){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Sq { [square _n] { n * n } }\n"
        "s = spawn Sq\n"
        "r = s square 7\n"
        "p = 3 |> s square\n"
        "q = s cube 2\n"
        "after = 1\n"));
    EXPECT_EQ(as_int(t.field("r")), 49);
    EXPECT_EQ(as_int(t.field("p")), 9);
    EXPECT_EQ(t.count(codes::NoHandler), 1u);
    EXPECT_EQ(t.count(codes::UnhandledMessage), 1u);
    EXPECT_FALSE(t.field("q").has_value());
    EXPECT_FALSE(t.field("after").has_value());
}

TEST(Runtime, HostRequestAndSpawn){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Counter {\n"
        "  count: Int = 0\n"
        "  [increment] { count = count + 1 }\n"
        "  [get] { count }\n"
        "}\n"));
    value_map cfg;
    cfg.emplace_back(v_str("count"), v_int(10));
    auto c = t.rt->spawn("Counter", cfg);
    t.rt->send(c, {v_word("increment")});
    value v = t.rt->request(c, {v_word("get")});
    EXPECT_EQ(std::get<std::int64_t>(v.data), 11);
    try {
        t.rt->spawn("Missing");
        FAIL() << "expected eval_error";
    } catch (const eval_error& e) {
        EXPECT_EQ(e.code, codes::UnknownAgent);
    }
}

TEST(Runtime, RequestToSelfRunsInline){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Calc {\n"
        "  total: Int = 0\n"
        "  [double _n] { n * 2 }\n"
        "  [run] { total = self double 21 }\n"
        "}\n"
        "c = spawn Calc\n"
        "c run\n"));
    EXPECT_EQ(as_int(t.field_of("c", "total")), 42);
}

TEST(Runtime, SelfSendIsAsynchronous){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Pinger {\n"
        "  got: Int = 0\n"
        "  [ping] { self pong; got = got + 10 }\n"
        "  [pong] { got = got * 2 }\n"
        "}\n"
        "p = spawn Pinger\n"
        "p ping\n"));
    // pong is queued behind the running ping handler
    EXPECT_EQ(as_int(t.field_of("p", "got")), 20);
}

TEST(Runtime, SpawnConfiguration){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Greeter {\n"
        "  greeting: String = \"hello\"\n"
        "  name: String = \"world\"\n"
        "  line = greeting + \", \" + name\n"
        "}\n"
        "prefix = \"yo\"\n"
        "g1 = spawn Greeter\n"
        "g2 = spawn Greeter { name = \"komrad\" }\n"
        "g3 = spawn Greeter #{greeting: \"hey\"}\n"
        "g4 = spawn Greeter { greeting = prefix }\n"
        "cfg = #{name: \"map\"}\n"
        "g5 = spawn Greeter cfg\n"));
    EXPECT_EQ(text_of(t.field_of("g1", "line")), "hello, world");
    EXPECT_EQ(text_of(t.field_of("g2", "line")), "hello, komrad");
    EXPECT_EQ(text_of(t.field_of("g3", "line")), "hey, world");
    EXPECT_EQ(text_of(t.field_of("g4", "line")), "yo, world");
    EXPECT_EQ(text_of(t.field_of("g5", "line")), "hello, map");
    // The configuration block writes only to the new instance
    EXPECT_FALSE(t.field("greeting").has_value());
    EXPECT_TRUE(t.rt->diagnostics().snapshot().empty());
}

TEST(Runtime, SpawnConfigurationMustBeMapOrBlock){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent A { }\n"
        "a = spawn A (1 + 2)\n"));
    EXPECT_EQ(t.count(codes::TypeMismatch), 1u);
    EXPECT_FALSE(t.field("a").has_value());
}

TEST(Runtime, FieldDeclarationsAreTypeChecked){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Typed { n: Int = 0 }\n"
        "agent NeedsValue { n: Int }\n"
        "a = spawn Typed #{n: \"nope\"}\n"
        "b = spawn NeedsValue\n"
        "c = spawn NeedsValue #{n: 3}\n"
        "d = spawn Typed #{n: 4}\n"));
    EXPECT_EQ(t.count(codes::TypeMismatch), 1u);
    EXPECT_EQ(t.count(codes::UnresolvedVariable), 1u);
    EXPECT_EQ(as_int(t.field_of("c", "n")), 3);
    EXPECT_EQ(as_int(t.field_of("d", "n")), 4);
}

TEST(Runtime, ControlFlowThroughSelfSend){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Logic {\n"
        "  result: Int = 0\n"
        "  [if true then _{body}] { *body }\n"
        "  [if false then _] { }\n"
        "  [check _n] { if (n > 2) then { result = n } }\n"
        "}\n"
        "l = spawn Logic\n"
        "l check 7\n"
        "l check 1\n"));
    EXPECT_EQ(as_int(t.field_of("l", "result")), 7);
    EXPECT_TRUE(t.rt->diagnostics().snapshot().empty());
}

TEST(Runtime, PredicateSelfSendReceivesTheToken){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Sizer {\n"
        "  kind: String = \"none\"\n"
        "  [small _(x < 3)] { true }\n"
        "  [small _] { false }\n"
        "  [classify _(small n)] { kind = \"small\" }\n"
        "  [classify _] { kind = \"large\" }\n"
        "}\n"
        "a = spawn Sizer\n"
        "b = spawn Sizer\n"
        "a classify 1\n"
        "b classify 9\n"));
    EXPECT_EQ(text_of(t.field_of("a", "kind")), "small");
    EXPECT_EQ(text_of(t.field_of("b", "kind")), "large");
    EXPECT_TRUE(t.rt->diagnostics().snapshot().empty());
}

TEST(Runtime, BlockPassedThroughHoleRunsEachTime){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Twice {\n"
        "  first: Int = 0\n"
        "  second: Int = 0\n"
        "  [twice _{body}] { first = *body ; second = *body }\n"
        "}\n"
        "n = 0\n"
        "pure = spawn Twice\n"
        "impure = spawn Twice\n"
        "pure twice { 2 + 3 }\n"
        "impure twice { n = n + 1 ; n * 10 }\n"));
    EXPECT_EQ(as_int(t.field_of("pure", "first")), 5);
    EXPECT_EQ(as_int(t.field_of("pure", "second")), 5);
    EXPECT_EQ(as_int(t.field_of("impure", "first")), 10);
    EXPECT_EQ(as_int(t.field_of("impure", "second")), 20);
    EXPECT_EQ(as_int(t.field("n")), 2);
}

TEST(Runtime, FaultInPredicateKeepsTheInstanceRunning){
    TestRuntime t;
    auto gate = std::make_shared<NativeAgent>(*t.rt, "Gate");
    gate->on("open _x", [](const NativeCall&) -> value { throw std::runtime_error("gate jammed"); });
    t.rt->register_agent(gate);
    ASSERT_TRUE(t.run(
        "agent Door {\n"
        "  state: String = \"closed\"\n"
        "  [push _(Gate open x)] { state = \"open\" }\n"
        "  [push _] { state = \"stuck\" }\n"
        "  [paint] { state = \"painted\" }\n"
        "}\n"
        "d = spawn Door\n"
        "d push 1\n"));
    EXPECT_EQ(text_of(t.field_of("d", "state")), "stuck");
    t.rt->send(t.ref("d"), {v_word("paint")});
    ASSERT_TRUE(t.idle());
    EXPECT_EQ(text_of(t.field_of("d", "state")), "painted");
}

TEST(Runtime, SelfSendWithoutHandlerFailsTheStatement){
    TestRuntime t;
    ASSERT_TRUE(t.run("[main] { before = 1; undefined-thing; after = 1 }\n"));
    EXPECT_EQ(t.count(codes::NoHandler), 1u);
    EXPECT_EQ(as_int(t.field("before")), 1);
    EXPECT_FALSE(t.field("after").has_value());
}

TEST(Runtime, ErrorInOneHandlerDoesNotStopTheInstance){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Fragile {\n"
        "  ok: Int = 0\n"
        "  [boom] { x = 1 / 0 }\n"
        "  [fine] { ok = ok + 1 }\n"
        "}\n"
        "f = spawn Fragile\n"
        "f boom\n"
        "f fine\n"));
    EXPECT_EQ(t.count(codes::DivisionByZero), 1u);
    EXPECT_EQ(as_int(t.field_of("f", "ok")), 1);
    auto diags = t.rt->diagnostics().snapshot();
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].agent.rfind("Fragile#", 0), 0u);
    EXPECT_EQ(diags[0].line, 3);
}

TEST(Runtime, MainRunsAfterTopLevelStatements){
    TestRuntime t;
    ASSERT_TRUE(t.run("x = 1\n[main] { y = x + 1 }\n"));
    EXPECT_EQ(as_int(t.field("y")), 2);
}

TEST(Runtime, UnreachableInstancesAreCollected){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent Temp { x = 1 }\n"
        "spawn Temp\n"
        "spawn Temp\n"
        "kept = spawn Temp\n"));
    EXPECT_TRUE(eventually([&]{ return t.rt->live_instances() == 2; }));
}

TEST(Runtime, CyclicRequestsTimeOut){
    TestRuntime t(2, std::chrono::milliseconds(200));
    ASSERT_TRUE(t.run(
        "agent Peer {\n"
        "  [call _other] { r = other back self }\n"
        "  [back _x] { x done }\n"
        "  [done] { 1 }\n"
        "}\n"
        "a = spawn Peer\n"
        "b = spawn Peer\n"
        "a call b\n"));
    EXPECT_GE(t.count(codes::ReplyTimeout), 1u);
}

TEST(Runtime, ShutdownIsIdempotent){
    TestRuntime t;
    ASSERT_TRUE(t.run("agent A { [x] { } }\na = spawn A\n"));
    EXPECT_EQ(t.rt->live_instances(), 2u);
    t.rt->shutdown();
    t.rt->shutdown();
    EXPECT_EQ(t.rt->live_instances(), 0u);
    EXPECT_FALSE(t.rt->lookup("Io").has_value());
    try {
        t.rt->spawn("A");
        FAIL() << "expected eval_error";
    } catch (const eval_error& e) {
        EXPECT_EQ(e.code, codes::Delivery);
    }
}

TEST(Runtime, EndToEndCounterConfiguredAtSpawn){
    TestRuntime t;
    ASSERT_TRUE(t.run(
        "agent C { [inc] { count = count + 1 } }\n"
        "[main]{ c = spawn C { count = 0 } ; c inc ; c inc }\n"));
    EXPECT_EQ(as_int(t.field_of("c", "count")), 2);
    EXPECT_TRUE(t.rt->diagnostics().snapshot().empty());
}
