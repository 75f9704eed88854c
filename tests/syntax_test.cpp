// Syntax model: structural equality, traversal and printing
#include <cassert>
#include <iostream>
#include <string>
#include "komrad/syntax.hpp"

using namespace komrad;

static expr_ptr lit(std::int64_t i){ return make_expr(literal{i}); }
static expr_ptr var(const char* n, bool bare=false){ return make_expr(variable{n, bare}); }

static void test_equal_ignores_spans(){
    auto a = make_expr(binary{binary_op::Add, lit(1), lit(2)}, source_span{0, 1, 1});
    auto b = make_expr(binary{binary_op::Add, lit(1), lit(2)}, source_span{40, 3, 7});
    assert(equal(a, b));
    auto c = make_expr(binary{binary_op::Sub, lit(1), lit(2)});
    assert(!equal(a, c));
    // bare_arg is part of the node
    assert(!equal(var("x"), var("x", true)));
    (void)a; (void)b; (void)c;
}

static void test_walk_reaches_nested_blocks(){
    auto inner = std::make_shared<block_body>();
    inner->statements.push_back(make_statement(expr_statement{make_expr(send{var("Io"), {var("println", true), var("x", true)}})}));
    auto e = make_expr(send{var("if"), {var("c", true), var("then", true), make_expr(block_literal{inner})}});
    int sends = 0, vars = 0;
    walk(*e, [&](const expr& x){
        if(std::holds_alternative<send>(x.data)) ++sends;
        if(std::holds_alternative<variable>(x.data)) ++vars;
    });
    assert(sends == 2);
    assert(vars == 6);
    (void)sends; (void)vars;
}

static void test_printing(){
    auto e = make_expr(binary{binary_op::Add, lit(1), make_expr(binary{binary_op::Mul, lit(2), lit(3)})});
    assert(to_string(*e) == "(1 + (2 * 3))");
    auto s = make_expr(send{var("Io"), {var("println", true), make_expr(literal{std::string("hi\n")})}});
    assert(to_string(*s) == "(Io println \"hi\\n\")");
    assert(to_string(literal_value{2.0}) == "2.0");
    assert(to_string(literal_value{unit_t{}}) == "unit");

    pattern p;
    p.tokens.emplace_back(word_token{"if"});
    p.tokens.emplace_back(predicate_hole{"c", nullptr, "Boolean"});
    p.tokens.emplace_back(word_token{"then"});
    p.tokens.emplace_back(block_hole{"body"});
    p.tokens.emplace_back(discard_token{});
    assert(to_string(p) == "[if _(c: Boolean) then _{body} _]");
}

static void test_program_queries(){
    auto def = std::make_shared<agent_def>();
    def->name = "Counter";
    auto h = std::make_shared<handler>();
    h->pat.tokens.emplace_back(word_token{"main"});
    h->body = std::make_shared<block_body>();
    program p;
    p.statements.push_back(make_statement(assignment{"x", lit(1)}));
    p.statements.push_back(make_statement(agent_decl{def}));
    p.statements.push_back(make_statement(handler_decl{h}));
    assert(agent_defs(p).size() == 1 && agent_defs(p)[0]->name == "Counter");
    assert(module_handlers(p).size() == 1);
    assert(to_string(p) == "x = 1\nagent Counter { }\n[main] {}\n");
}

void run_syntax_tests(){
    std::cout << "[komrad] syntax tests...\n";
    test_equal_ignores_spans();
    test_walk_reaches_nested_blocks();
    test_printing();
    test_program_queries();
    std::cout << "[komrad] syntax tests passed\n";
}
