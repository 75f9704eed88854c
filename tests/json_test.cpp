#include <cassert>
#include <iostream>
#include <limits>
#include <string>
#include "komrad/runtime/json.hpp"

using namespace komrad;

static bool throws_json_error(const std::string& text){
    try { from_json(text); } catch (const json_error&) { return true; }
    return false;
}

static void test_encode(){
    value_map m;
    m = map_with(m, v_str("name"), v_word("alpha"));
    m = map_with(m, v_str("n"), v_int(3));
    m = map_with(m, v_int(7), v_list({v_float(2.5), v_bool(true), v_unit()}));
    assert(to_json(v_map(m)) == "{\"name\":\"alpha\",\"n\":3,\"7\":[2.5,true,null]}");
    assert(to_json(v_str("a\"b\n")) == "\"a\\\"b\\n\"");

    bool threw = false;
    try { to_json(v_block(block_value{})); } catch (const json_error&) { threw = true; }
    assert(threw);
    threw = false;
    try { to_json(v_float(std::numeric_limits<double>::infinity())); } catch (const json_error&) { threw = true; }
    assert(threw);
    (void)threw;
}

static void test_decode(){
    value v = from_json(" {\"a\": [1, -2.5e1, \"x\\u00e9\"], \"b\": null, \"c\": false} ");
    auto m = std::get_if<map_ptr>(&v.data);
    assert(m && (*m)->size() == 3);
    auto a = map_find(**m, v_str("a"));
    assert(a);
    auto l = std::get<list_ptr>(a->data);
    assert(std::get<std::int64_t>((*l)[0].data) == 1);
    assert(std::get<double>((*l)[1].data) == -25.0);
    assert(std::get<std::string>((*l)[2].data) == "x\xC3\xA9");
    assert(is_unit(*map_find(**m, v_str("b"))));
    // Surrogate pair
    assert(std::get<std::string>(from_json("\"\\ud83d\\ude00\"").data) == "\xF0\x9F\x98\x80");
    // Integers beyond Int range fall back to Float
    assert(std::holds_alternative<double>(from_json("123456789012345678901234").data));
    (void)m; (void)a;
}

static void test_decode_errors(){
    assert(throws_json_error("{\"a\": 1,}"));
    assert(throws_json_error("[1 2]"));
    assert(throws_json_error("\"open"));
    assert(throws_json_error("tru"));
    assert(throws_json_error("1 2"));
    assert(throws_json_error(""));
    assert(throws_json_error(std::string(600, '[') + std::string(600, ']')));
    try { from_json("[1, @]"); assert(false); }
    catch (const json_error& e) { assert(e.offset == 4); (void)e; }
}

void run_json_tests(){
    std::cout << "[komrad] json tests...\n";
    test_encode();
    test_decode();
    test_decode_errors();
    std::cout << "[komrad] json tests passed\n";
}
