// Syntax model for komrad programs: expressions, statements, patterns, handlers, agent definitions
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace komrad
{

    struct source_span
    {
        std::size_t byte = 0;
        int line = 0;
        int col = 0;
    };

    struct expr;
    struct statement;
    struct block_body;
    struct handler;
    struct agent_def;

    using expr_ptr = std::shared_ptr<const expr>;
    using statement_ptr = std::shared_ptr<const statement>;
    using block_ptr = std::shared_ptr<const block_body>;
    using handler_ptr = std::shared_ptr<const handler>;
    using agent_def_ptr = std::shared_ptr<const agent_def>;

    struct unit_t
    {
    };
    inline bool operator==(unit_t, unit_t) { return true; }

    using literal_value = std::variant<unit_t, bool, std::int64_t, double, std::string>;

    enum class binary_op
    {
        Or,
        And,
        Eq,
        Ne,
        Lt,
        Le,
        Gt,
        Ge,
        Add,
        Sub,
        Mul,
        Div,
        Mod
    };

    // ---- expressions ----

    // tags are only set for fenced raw text segments
    struct literal
    {
        literal_value value;
        bool raw = false;
        std::vector<std::string> tags;
    };
    // bare_arg: the identifier appeared as a bare message argument and falls back to a word when unbound
    struct variable
    {
        std::string name;
        bool bare_arg = false;
    };
    struct self_ref
    {
    };
    // args[0] is the selector position
    struct send
    {
        expr_ptr target;
        std::vector<expr_ptr> args;
    };
    struct block_literal
    {
        block_ptr body;
    };
    struct list_literal
    {
        std::vector<expr_ptr> items;
    };
    struct map_literal
    {
        std::vector<std::pair<expr_ptr, expr_ptr>> entries;
    };
    struct binary
    {
        binary_op op;
        expr_ptr lhs;
        expr_ptr rhs;
    };
    struct unary_not
    {
        expr_ptr operand;
    };
    // *expr: runs a block value and yields its last statement's value
    struct block_call
    {
        expr_ptr block;
    };
    struct spawn_expr
    {
        std::string agent;
        expr_ptr config; // may be null
    };
    // stages[0] is any expression, the rest are sends receiving the previous result as last argument
    struct pipeline
    {
        std::vector<expr_ptr> stages;
    };

    using expr_data = std::variant<literal, variable, self_ref, send, block_literal, list_literal, map_literal, binary, unary_not, block_call, spawn_expr, pipeline>;

    struct expr
    {
        expr_data data;
        source_span span;
    };

    // ---- patterns ----

    struct word_token
    {
        std::string text;
    };
    struct literal_token
    {
        literal_value value;
    };
    struct value_hole
    {
        std::string name;
    };
    struct block_hole
    {
        std::string name;
    };
    // Either test (predicate form) or type_name (type-constraint form) is set.
    struct predicate_hole
    {
        std::string subject;
        expr_ptr test;
        std::string type_name;
        // When subject is empty and self_target is unbound at match time, the test is a self-send
        // and its first argument variable self_subject receives the token.
        std::string self_target;
        std::string self_subject;
    };
    struct discard_token
    {
    };

    using pattern_token = std::variant<word_token, literal_token, value_hole, block_hole, predicate_hole, discard_token>;

    struct pattern
    {
        std::vector<pattern_token> tokens;
        source_span span;
    };

    // ---- statements ----

    struct expr_statement
    {
        expr_ptr value;
    };
    struct assignment
    {
        std::string name;
        expr_ptr value;
    };
    struct field_decl
    {
        std::string name;
        std::string type_name;
        expr_ptr init; // may be null
    };
    struct handler_decl
    {
        handler_ptr decl;
    };
    struct agent_decl
    {
        agent_def_ptr decl;
    };

    using statement_data = std::variant<expr_statement, assignment, field_decl, handler_decl, agent_decl>;

    struct statement
    {
        statement_data data;
        source_span span;
    };

    struct block_body
    {
        std::vector<statement_ptr> statements;
    };

    struct handler
    {
        pattern pat;
        block_ptr body;
        source_span span;
    };

    // defaults: field declarations, assignments and any other non-handler statements of the body, in order
    struct agent_def
    {
        std::string name;
        std::vector<statement_ptr> defaults;
        std::vector<handler_ptr> handlers;
        source_span span;
    };

    struct program
    {
        std::string source_name;
        std::vector<statement_ptr> statements;
    };
    using program_ptr = std::shared_ptr<const program>;

    // factories
    inline expr_ptr make_expr(expr_data d, source_span s = {}) { return std::make_shared<expr>(expr{std::move(d), s}); }
    inline statement_ptr make_statement(statement_data d, source_span s = {}) { return std::make_shared<statement>(statement{std::move(d), s}); }

    // Structural equality; source spans are ignored.
    bool equal(const expr &a, const expr &b);
    bool equal(const expr_ptr &a, const expr_ptr &b);
    bool equal(const pattern &a, const pattern &b);
    bool equal(const statement &a, const statement &b);
    bool equal(const block_body &a, const block_body &b);
    bool equal(const program &a, const program &b);

    // Pre-order traversal of every expression reachable from the root, including nested blocks.
    void walk(const expr &root, const std::function<void(const expr &)> &fn);
    void walk(const statement &root, const std::function<void(const expr &)> &fn);

    // Agent definitions and module handlers declared at the top level of a program.
    std::vector<agent_def_ptr> agent_defs(const program &p);
    std::vector<handler_ptr> module_handlers(const program &p);

    const char *to_string(binary_op op);
    std::string to_string(const literal_value &v);
    std::string to_string(const expr &e);
    std::string to_string(const pattern &p);
    std::string to_string(const statement &s);
    std::string to_string(const program &p);

} // namespace komrad
