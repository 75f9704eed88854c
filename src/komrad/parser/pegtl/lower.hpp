#pragma once
#include "komrad/syntax.hpp"
#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/parse_tree.hpp>
#include <string>
#include <utility>

namespace komrad::pegtl_front {

using tree_node = tao::pegtl::parse_tree::node;

enum class scope_kind { module, agent_body, block };

// Converts a PEGTL parse tree into the syntax model. Structural checks the grammar
// cannot express (handler placement, pipeline stages, literal ranges) raise komrad::parse_error.
class Lowering {
public:
    explicit Lowering(std::string source) : source_(std::move(source)) {}

    program_ptr module(const tree_node& root) const;
    pattern pattern_of(const tree_node& n) const;
    expr_ptr expression(const tree_node& n) const;

private:
    statement_ptr statement(const tree_node& n, scope_kind k) const;
    block_ptr block(const tree_node& n) const;
    handler_ptr handler_of(const tree_node& n) const;
    expr_ptr argument(const tree_node& n) const;
    expr_ptr literal_of(const tree_node& n) const;
    literal_value literal_value_of(const tree_node& n) const;
    [[noreturn]] void fail(const tree_node& n, const std::string& message) const;

    std::string source_;
};

// First variable of a predicate that is neither a send target nor a selector.
std::string predicate_subject(const expr& e);

// Target and first argument of the first `name arg ...` send in a predicate, for tests that
// turn out to be self-sends.
std::pair<std::string, std::string> self_send_subject(const expr& e);

} // namespace komrad::pegtl_front
