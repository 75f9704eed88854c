// Runtime values: immutable data, blocks and agent references
#pragma once
#include "komrad/syntax.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace komrad
{

    class Env;
    class Agent;
    class AgentHandle;

    struct value;

    struct word
    {
        std::string text;
    };

    // Deferred code plus the environment captured where the block literal was evaluated.
    struct block_value
    {
        block_ptr body;
        std::shared_ptr<Env> env;
    };

    // Clonable handle to an agent. Copies share one AgentHandle, and each live handle counts as a sender of the target's mailbox.
    struct agent_ref
    {
        std::shared_ptr<AgentHandle> handle;
        Agent *get() const;
        explicit operator bool() const { return handle != nullptr; }
    };

    using value_list = std::vector<value>;
    using value_map = std::vector<std::pair<value, value>>; // ordered, keys unique
    using list_ptr = std::shared_ptr<const value_list>;
    using map_ptr = std::shared_ptr<const value_map>;

    using value_data = std::variant<std::monostate, bool, std::int64_t, double, std::string, word, list_ptr, map_ptr, agent_ref, block_value>;

    struct value
    {
        value_data data;
    };

    inline value v_unit() { return value{std::monostate{}}; }
    inline value v_bool(bool b) { return value{b}; }
    inline value v_int(std::int64_t i) { return value{i}; }
    inline value v_float(double d) { return value{d}; }
    inline value v_str(std::string s) { return value{std::move(s)}; }
    inline value v_word(std::string s) { return value{word{std::move(s)}}; }
    inline value v_list(value_list items) { return value{std::make_shared<const value_list>(std::move(items))}; }
    inline value v_map(value_map entries) { return value{std::make_shared<const value_map>(std::move(entries))}; }
    inline value v_ref(agent_ref r) { return value{std::move(r)}; }
    inline value v_block(block_value b) { return value{std::move(b)}; }
    value from_literal(const literal_value &lit);

    inline bool is_unit(const value &v) { return std::holds_alternative<std::monostate>(v.data); }
    inline bool is_number(const value &v) { return std::holds_alternative<std::int64_t>(v.data) || std::holds_alternative<double>(v.data); }
    inline bool is_block(const value &v) { return std::holds_alternative<block_value>(v.data); }
    inline const block_value *as_block(const value &v) { return std::get_if<block_value>(&v.data); }
    inline const agent_ref *as_ref(const value &v) { return std::get_if<agent_ref>(&v.data); }
    inline const std::string *as_string(const value &v) { return std::get_if<std::string>(&v.data); }
    std::optional<double> as_number(const value &v);
    // Text of a word or a string value.
    const std::string *as_text(const value &v);

    // Name of the value's type as used by type holes and field declarations.
    const char *type_name(const value &v);
    // Whether v satisfies the named type; returns nullopt for an unknown type name.
    std::optional<bool> type_matches(const value &v, const std::string &type);

    // Deep equality; ints and floats compare numerically, words and strings never equal each other.
    bool values_equal(const value &a, const value &b);

    // Map access with linear key search.
    const value *map_find(const value_map &m, const value &key);
    value_map map_with(const value_map &m, const value &key, value v);

    // Source-like rendering (strings quoted) and display rendering (strings raw) used by Io.
    std::string to_string(const value &v);
    std::string display(const value &v);

} // namespace komrad
