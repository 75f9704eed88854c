#include "komrad/runtime/native_agent.hpp"
#include "komrad/parser.hpp"
#include "komrad/runtime.hpp"
#include "komrad/runtime/matcher.hpp"

namespace komrad {

value NativeCall::arg(const std::string& name) const {
    auto v = bindings.lookup(name);
    if(!v) fail("missing argument '" + name + "'", codes::Arity);
    return *v;
}

std::string NativeCall::text(const std::string& name) const {
    value v = arg(name);
    auto t = as_text(v);
    if(!t) fail("'" + name + "' must be a String, got " + type_name(v), codes::TypeMismatch);
    return *t;
}

std::int64_t NativeCall::integer(const std::string& name) const {
    value v = arg(name);
    if(auto i = std::get_if<std::int64_t>(&v.data)) return *i;
    fail("'" + name + "' must be an Int, got " + type_name(v), codes::TypeMismatch);
}

double NativeCall::number(const std::string& name) const {
    value v = arg(name);
    if(auto d = as_number(v)) return *d;
    fail("'" + name + "' must be a Number, got " + type_name(v), codes::TypeMismatch);
}

list_ptr NativeCall::list(const std::string& name) const {
    value v = arg(name);
    if(auto l = std::get_if<list_ptr>(&v.data)) return *l;
    fail("'" + name + "' must be a List, got " + type_name(v), codes::TypeMismatch);
}

map_ptr NativeCall::map(const std::string& name) const {
    value v = arg(name);
    if(auto m = std::get_if<map_ptr>(&v.data)) return *m;
    fail("'" + name + "' must be a Map, got " + type_name(v), codes::TypeMismatch);
}

void NativeCall::fail(const std::string& message, const char* code) const {
    throw eval_error(code, agent.name() + ": " + message, at);
}

NativeAgent::NativeAgent(Runtime& rt, std::string name) : Agent(rt, std::move(name)) {}

NativeAgent& NativeAgent::on(std::string_view pattern_src, NativeFn fn){
    table_.emplace_back(Parser().parse_pattern(pattern_src), std::move(fn));
    return *this;
}

value NativeAgent::invoke(const std::vector<value>& tokens, bool want_reply, Evaluator& ev, source_span at){
    Matcher matcher(ev);
    // Intrinsics see only their own hole bindings.
    auto base = std::make_shared<Env>(std::make_shared<Scope>(), nullptr);
    for(const auto& entry : table_){
        auto env = matcher.bind(entry.first, tokens, base);
        if(!env) continue;
        NativeCall call{*this, rt_, **env, at};
        try {
            return entry.second(call);
        } catch (const eval_error&) {
            throw;
        } catch (const std::exception& e) {
            throw eval_error(codes::Intrinsic, name_ + ": " + e.what(), at);
        }
    }
    std::string msg = "no handler matches " + describe(tokens);
    std::string accepted;
    for(const auto& entry : table_) accepted += (accepted.empty() ? "" : " ") + to_string(entry.first);
    rt_.report(codes::UnhandledMessage, msg, this, at, Severity::Warning, accepted.empty() ? std::string() : "accepts " + accepted);
    if(want_reply) throw eval_error(codes::NoHandler, label() + ": " + msg, at);
    return v_unit();
}

} // namespace komrad
