// matcher.hpp - pattern matching of message tokens, calling back into the evaluator for predicate holes
#pragma once
#include "komrad/eval.hpp"
#include <optional>
#include <vector>

namespace komrad {

struct Match {
    handler_ptr handler;
    env_ptr env; // base environment extended with the hole bindings
};

class Matcher {
public:
    explicit Matcher(Evaluator& ev) : ev_(ev) {}

    // Binds tokens against one pattern on top of base; nullopt when it does not match.
    std::optional<env_ptr> bind(const pattern& p, const std::vector<value>& tokens, const env_ptr& base) const;
    // First handler in declaration order whose pattern matches.
    std::optional<Match> select(const std::vector<handler_ptr>& handlers, const std::vector<value>& tokens, const env_ptr& base) const;

private:
    bool test_predicate(const predicate_hole& h, const value& v, const env_ptr& env) const;

    Evaluator& ev_;
};

} // namespace komrad
