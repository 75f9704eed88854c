// eval.hpp - scopes, lexical environments and the expression/statement evaluator
#pragma once
#include "komrad/value.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace komrad {

class Runtime;
class Instance;

// Failure of a single statement; aborts the handler invocation that raised it.
struct eval_error : std::runtime_error {
    eval_error(std::string code_, const std::string& message, source_span at = {})
        : std::runtime_error(message), code(std::move(code_)), span(at) {}
    std::string code;
    source_span span;
};

// Ordered name -> value bindings. Field scopes are reachable from captured blocks running on other threads.
class Scope {
public:
    Scope() = default;
    Scope(const Scope& other);
    Scope& operator=(const Scope&) = delete;

    std::optional<value> get(const std::string& name) const;
    bool contains(const std::string& name) const;
    void set(const std::string& name, value v);
    std::vector<std::pair<std::string, value>> entries() const;
    std::size_t size() const;
    // Drops every binding. Values are destroyed after the lock is released.
    void clear();

private:
    mutable std::mutex mu_;
    std::vector<std::pair<std::string, value>> entries_;
};
using scope_ptr = std::shared_ptr<Scope>;

// Scope chain: call-local frames (innermost last), then instance fields, then read-only globals.
class Env {
public:
    Env(scope_ptr fields, std::shared_ptr<const Scope> globals);

    // Same chain plus a fresh innermost frame.
    std::shared_ptr<Env> extend() const;
    // Snapshot copy of the local frames; the field scope stays shared.
    std::shared_ptr<Env> capture() const;
    // Lookups see sink first and every assignment lands in sink.
    std::shared_ptr<Env> redirect(scope_ptr sink) const;

    std::optional<value> lookup(const std::string& name) const;
    bool bound(const std::string& name) const { return lookup(name).has_value(); }
    // Binds in the innermost frame, creating one if the chain has none.
    void bind_local(const std::string& name, value v);
    // Rebinds the innermost frame that already binds name, else the field scope.
    void assign(const std::string& name, value v);

    const scope_ptr& fields() const { return fields_; }
    const std::shared_ptr<const Scope>& globals() const { return globals_; }

private:
    std::vector<scope_ptr> locals_;
    scope_ptr fields_;
    std::shared_ptr<const Scope> globals_;
    scope_ptr sink_;
};
using env_ptr = std::shared_ptr<Env>;

value apply_binary(binary_op op, const value& a, const value& b, source_span at = {});

// Evaluates expressions on behalf of one executing instance (or the host when self is null).
class Evaluator {
public:
    Evaluator(Runtime& rt, std::shared_ptr<Instance> self);

    // want_value=false marks statement position: sends there do not wait for a reply.
    value evaluate(const expr& e, const env_ptr& env, bool want_value = true);
    value execute(const statement& s, const env_ptr& env);
    // Runs statements in order; the result is the last statement's value (unit when empty).
    value run(const block_body& b, const env_ptr& env);
    // Re-runs a block value from the top against a fresh copy of its captured environment.
    value call_block(const block_value& b);

    // Checks and binds a field declaration; override is an already-supplied value, if any.
    void declare_field(const field_decl& f, const env_ptr& env, const value* override_value, source_span at);

    Runtime& runtime() const { return rt_; }
    const std::shared_ptr<Instance>& self() const { return self_; }

private:
    value eval_send(const send& s, source_span at, const env_ptr& env, bool want_value, const value* piped);
    value self_send(std::vector<value> tokens, source_span at);
    value eval_spawn(const spawn_expr& s, source_span at, const env_ptr& env);
    bool boolean_operand(const expr& e, const env_ptr& env, const char* op);

    Runtime& rt_;
    std::shared_ptr<Instance> self_;
};

} // namespace komrad
