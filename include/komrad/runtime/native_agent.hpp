// native_agent.hpp - system agents whose handlers are C++ functions selected by ordinary patterns
#pragma once
#include "komrad/diagnostics.hpp"
#include "komrad/eval.hpp"
#include "komrad/runtime/agent.hpp"
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace komrad {

class NativeAgent;

// Arguments of one intrinsic invocation, addressed by hole name.
struct NativeCall {
    NativeAgent& agent;
    Runtime& rt;
    const Env& bindings;
    source_span at;

    value arg(const std::string& name) const;
    std::string text(const std::string& name) const; // String or Word
    std::int64_t integer(const std::string& name) const;
    double number(const std::string& name) const;
    list_ptr list(const std::string& name) const;
    map_ptr map(const std::string& name) const;
    [[noreturn]] void fail(const std::string& message, const char* code = codes::Intrinsic) const;
};

using NativeFn = std::function<value(const NativeCall&)>;

class NativeAgent : public Agent {
public:
    NativeAgent(Runtime& rt, std::string name);

    bool is_native() const override { return true; }

    // Adds a handler written in pattern syntax, e.g. "println _value".
    NativeAgent& on(std::string_view pattern_src, NativeFn fn);

    // Runs synchronously in the caller's thread. Intrinsic failures raise eval_error.
    value invoke(const std::vector<value>& tokens, bool want_reply, Evaluator& ev, source_span at);

    std::size_t handler_count() const { return table_.size(); }

private:
    std::vector<std::pair<pattern, NativeFn>> table_;
};

} // namespace komrad
