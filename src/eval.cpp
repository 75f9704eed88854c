#include "komrad/eval.hpp"
#include "komrad/diagnostics.hpp"
#include "komrad/runtime.hpp"
#include "komrad/runtime/instance.hpp"
#include <cmath>
#include <cstdio>
#include <type_traits>

namespace komrad {

// ---- Scope ----

Scope::Scope(const Scope& other){
    std::lock_guard<std::mutex> lk(other.mu_);
    entries_ = other.entries_;
}

std::optional<value> Scope::get(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    for(const auto& kv : entries_) if(kv.first==name) return kv.second;
    return std::nullopt;
}

bool Scope::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    for(const auto& kv : entries_) if(kv.first==name) return true;
    return false;
}

void Scope::set(const std::string& name, value v){
    value old;
    std::lock_guard<std::mutex> lk(mu_);
    for(auto& kv : entries_){
        if(kv.first==name){ old = std::move(kv.second); kv.second = std::move(v); return; }
    }
    entries_.emplace_back(name, std::move(v));
}

std::vector<std::pair<std::string, value>> Scope::entries() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_;
}

std::size_t Scope::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

void Scope::clear(){
    std::vector<std::pair<std::string, value>> dropped;
    { std::lock_guard<std::mutex> lk(mu_); dropped.swap(entries_); }
}

// ---- Env ----

Env::Env(scope_ptr fields, std::shared_ptr<const Scope> globals) : fields_(std::move(fields)), globals_(std::move(globals)) {}

std::shared_ptr<Env> Env::extend() const {
    auto e = std::make_shared<Env>(*this);
    e->locals_.push_back(std::make_shared<Scope>());
    return e;
}

std::shared_ptr<Env> Env::capture() const {
    auto e = std::make_shared<Env>(fields_, globals_);
    if(!locals_.empty() || sink_){
        auto snap = std::make_shared<Scope>();
        for(const auto& frame : locals_) for(auto& kv : frame->entries()) snap->set(kv.first, std::move(kv.second));
        if(sink_) for(auto& kv : sink_->entries()) snap->set(kv.first, std::move(kv.second));
        e->locals_.push_back(std::move(snap));
    }
    return e;
}

std::shared_ptr<Env> Env::redirect(scope_ptr sink) const {
    auto e = std::make_shared<Env>(*this);
    e->locals_.push_back(sink);
    e->sink_ = std::move(sink);
    return e;
}

std::optional<value> Env::lookup(const std::string& name) const {
    for(auto it = locals_.rbegin(); it != locals_.rend(); ++it){
        if(auto v = (*it)->get(name)) return v;
    }
    if(fields_) if(auto v = fields_->get(name)) return v;
    if(globals_) return globals_->get(name);
    return std::nullopt;
}

void Env::bind_local(const std::string& name, value v){
    if(locals_.empty()) locals_.push_back(std::make_shared<Scope>());
    locals_.back()->set(name, std::move(v));
}

void Env::assign(const std::string& name, value v){
    if(sink_){ sink_->set(name, std::move(v)); return; }
    for(auto it = locals_.rbegin(); it != locals_.rend(); ++it){
        if((*it)->contains(name)){ (*it)->set(name, std::move(v)); return; }
    }
    if(!fields_) throw eval_error(codes::UnresolvedVariable, "no field scope to bind '" + name + "'");
    fields_->set(name, std::move(v));
}

// ---- operators ----

static std::int64_t wrap_add(std::int64_t a, std::int64_t b){ return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b)); }
static std::int64_t wrap_sub(std::int64_t a, std::int64_t b){ return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) - static_cast<std::uint64_t>(b)); }
static std::int64_t wrap_mul(std::int64_t a, std::int64_t b){ return static_cast<std::int64_t>(static_cast<std::uint64_t>(a) * static_cast<std::uint64_t>(b)); }

[[noreturn]] static void operand_mismatch(binary_op op, const value& a, const value& b, source_span at){
    throw eval_error(codes::TypeMismatch, std::string("operator ") + to_string(op) + " does not apply to " + type_name(a) + " and " + type_name(b), at);
}

static bool concatenable(const value& v){ return as_string(v) || is_number(v) || std::holds_alternative<bool>(v.data); }

value apply_binary(binary_op op, const value& a, const value& b, source_span at){
    auto ai = std::get_if<std::int64_t>(&a.data);
    auto bi = std::get_if<std::int64_t>(&b.data);
    bool both_int = ai && bi;
    bool both_num = is_number(a) && is_number(b);
    switch(op){
        case binary_op::Eq: return v_bool(values_equal(a, b));
        case binary_op::Ne: return v_bool(!values_equal(a, b));
        case binary_op::And:
        case binary_op::Or: {
            auto x = std::get_if<bool>(&a.data); auto y = std::get_if<bool>(&b.data);
            if(!x || !y) operand_mismatch(op, a, b, at);
            return v_bool(op==binary_op::And ? (*x && *y) : (*x || *y));
        }
        case binary_op::Add:
            if(both_int) return v_int(wrap_add(*ai, *bi));
            if(both_num) return v_float(*as_number(a) + *as_number(b));
            if((as_string(a) || as_string(b)) && concatenable(a) && concatenable(b)) return v_str(display(a) + display(b));
            if(std::holds_alternative<list_ptr>(a.data) && std::holds_alternative<list_ptr>(b.data)){
                value_list out = *std::get<list_ptr>(a.data);
                const auto& tail = *std::get<list_ptr>(b.data);
                out.insert(out.end(), tail.begin(), tail.end());
                return v_list(std::move(out));
            }
            operand_mismatch(op, a, b, at);
        case binary_op::Sub:
            if(both_int) return v_int(wrap_sub(*ai, *bi));
            if(both_num) return v_float(*as_number(a) - *as_number(b));
            operand_mismatch(op, a, b, at);
        case binary_op::Mul:
            if(both_int) return v_int(wrap_mul(*ai, *bi));
            if(both_num) return v_float(*as_number(a) * *as_number(b));
            operand_mismatch(op, a, b, at);
        case binary_op::Div:
        case binary_op::Mod: {
            if(!both_num) operand_mismatch(op, a, b, at);
            if(*as_number(b)==0.0) throw eval_error(codes::DivisionByZero, op==binary_op::Div ? "division by zero" : "modulo by zero", at);
            if(both_int){
                if(*ai==INT64_MIN && *bi==-1) return op==binary_op::Div ? v_int(INT64_MIN) : v_int(0);
                return v_int(op==binary_op::Div ? *ai / *bi : *ai % *bi);
            }
            double x = *as_number(a), y = *as_number(b);
            return v_float(op==binary_op::Div ? x / y : std::fmod(x, y));
        }
        case binary_op::Lt: case binary_op::Le: case binary_op::Gt: case binary_op::Ge: {
            int c = 0;
            if(both_int) c = *ai < *bi ? -1 : (*ai > *bi ? 1 : 0);
            else if(both_num){ double x = *as_number(a), y = *as_number(b); c = x < y ? -1 : (x > y ? 1 : 0); }
            else if(as_string(a) && as_string(b)) c = as_string(a)->compare(*as_string(b));
            else operand_mismatch(op, a, b, at);
            switch(op){
                case binary_op::Lt: return v_bool(c < 0);
                case binary_op::Le: return v_bool(c <= 0);
                case binary_op::Gt: return v_bool(c > 0);
                default: return v_bool(c >= 0);
            }
        }
    }
    operand_mismatch(op, a, b, at);
}

// ---- Evaluator ----

Evaluator::Evaluator(Runtime& rt, std::shared_ptr<Instance> self) : rt_(rt), self_(std::move(self)) {}

bool Evaluator::boolean_operand(const expr& e, const env_ptr& env, const char* op){
    value v = evaluate(e, env, true);
    auto b = std::get_if<bool>(&v.data);
    if(!b) throw eval_error(codes::TypeMismatch, std::string("operator ") + op + " expects Boolean, got " + type_name(v), e.span);
    return *b;
}

value Evaluator::evaluate(const expr& e, const env_ptr& env, bool want_value){
    struct Visitor {
        Evaluator& ev; const env_ptr& env; bool want_value; source_span at;
        value operator()(const literal& l) const { return from_literal(l.value); }
        value operator()(const variable& v) const {
            if(auto found = env->lookup(v.name)) return *found;
            if(v.bare_arg) return v_word(v.name);
            throw eval_error(codes::UnresolvedVariable, "unresolved variable '" + v.name + "'", at);
        }
        value operator()(const self_ref&) const {
            if(!ev.self_) throw eval_error(codes::UnresolvedVariable, "'self' used outside an agent", at);
            return v_ref(make_ref(ev.self_));
        }
        value operator()(const send& s) const { return ev.eval_send(s, at, env, want_value, nullptr); }
        value operator()(const block_literal& b) const { return v_block(block_value{b.body, env->capture()}); }
        value operator()(const list_literal& l) const {
            value_list items; items.reserve(l.items.size());
            for(const auto& i : l.items) items.push_back(ev.evaluate(*i, env, true));
            return v_list(std::move(items));
        }
        value operator()(const map_literal& m) const {
            value_map out;
            for(const auto& kv : m.entries){
                value k = ev.evaluate(*kv.first, env, true);
                out = map_with(out, k, ev.evaluate(*kv.second, env, true));
            }
            return v_map(std::move(out));
        }
        value operator()(const binary& b) const {
            if(b.op==binary_op::And) return v_bool(ev.boolean_operand(*b.lhs, env, "&&") && ev.boolean_operand(*b.rhs, env, "&&"));
            if(b.op==binary_op::Or) return v_bool(ev.boolean_operand(*b.lhs, env, "||") || ev.boolean_operand(*b.rhs, env, "||"));
            value l = ev.evaluate(*b.lhs, env, true);
            value r = ev.evaluate(*b.rhs, env, true);
            return apply_binary(b.op, l, r, at);
        }
        value operator()(const unary_not& u) const { return v_bool(!ev.boolean_operand(*u.operand, env, "!")); }
        value operator()(const block_call& c) const {
            value v = ev.evaluate(*c.block, env, true);
            auto b = as_block(v);
            if(!b) throw eval_error(codes::TypeMismatch, std::string("cannot run a value of type ") + type_name(v), at);
            return ev.call_block(*b);
        }
        value operator()(const spawn_expr& s) const { return ev.eval_spawn(s, at, env); }
        value operator()(const pipeline& p) const {
            value acc = ev.evaluate(*p.stages.at(0), env, true);
            for(size_t i=1;i<p.stages.size();++i){
                const auto& stage = *p.stages[i];
                acc = ev.eval_send(std::get<send>(stage.data), stage.span, env, true, &acc);
            }
            return acc;
        }
    };
    return std::visit(Visitor{*this, env, want_value, e.span}, e.data);
}

value Evaluator::self_send(std::vector<value> tokens, source_span at){
    if(!self_) throw eval_error(codes::UnresolvedVariable, "unresolved target " + describe(tokens) + " outside an agent", at);
    return self_->dispatch_inline(tokens, *this, at);
}

value Evaluator::eval_send(const send& s, source_span at, const env_ptr& env, bool want_value, const value* piped){
    std::vector<value> tokens;
    tokens.reserve(s.args.size() + 2);
    // An unbound target name is the selector of a send to the executing instance.
    if(auto var = std::get_if<variable>(&s.target->data); var && !env->bound(var->name)){
        tokens.push_back(v_word(var->name));
        for(const auto& a : s.args) tokens.push_back(evaluate(*a, env, true));
        if(piped) tokens.push_back(*piped);
        return self_send(std::move(tokens), at);
    }
    value target = evaluate(*s.target, env, true);
    auto ref = as_ref(target);
    if(!ref || !*ref) throw eval_error(codes::TypeMismatch, std::string("cannot send to a value of type ") + type_name(target), at);
    for(size_t i=0;i<s.args.size();++i){
        const auto& a = *s.args[i];
        auto sel = std::get_if<variable>(&a.data);
        if(i==0 && sel && sel->bare_arg) tokens.push_back(v_word(sel->name));
        else tokens.push_back(evaluate(a, env, true));
    }
    if(piped) tokens.push_back(*piped);
    agent_ref keep = *ref;
    return rt_.deliver(keep, std::move(tokens), want_value, this, at);
}

value Evaluator::eval_spawn(const spawn_expr& s, source_span at, const env_ptr& env){
    auto def = rt_.definition(s.agent);
    if(!def) throw eval_error(codes::UnknownAgent, "unknown agent definition '" + s.agent + "'", at);
    value_map overrides;
    if(s.config){
        if(auto bl = std::get_if<block_literal>(&s.config->data)){
            auto sink = std::make_shared<Scope>();
            run(*bl->body, env->redirect(sink));
            for(auto& kv : sink->entries()) overrides.emplace_back(v_str(kv.first), std::move(kv.second));
        } else {
            value cfg = evaluate(*s.config, env, true);
            auto m = std::get_if<map_ptr>(&cfg.data);
            if(!m) throw eval_error(codes::TypeMismatch, std::string("spawn configuration must be a Map, got ") + type_name(cfg), s.config->span);
            overrides = **m;
        }
    }
    return v_ref(rt_.spawn(def, std::move(overrides)));
}

void Evaluator::declare_field(const field_decl& f, const env_ptr& env, const value* override_value, source_span at){
    value v;
    if(override_value) v = *override_value;
    else if(f.init) v = evaluate(*f.init, env, true);
    else if(auto existing = env->lookup(f.name)) v = *existing;
    else throw eval_error(codes::UnresolvedVariable, "field '" + f.name + "' has no value", at);
    auto ok = type_matches(v, f.type_name);
    if(!ok) throw eval_error(codes::TypeMismatch, "unknown type '" + f.type_name + "' for field '" + f.name + "'", at);
    if(!*ok) throw eval_error(codes::TypeMismatch, "field '" + f.name + "' expects " + f.type_name + ", got " + type_name(v), at);
    env->assign(f.name, std::move(v));
}

value Evaluator::execute(const statement& s, const env_ptr& env){
    return std::visit([&](const auto& st) -> value {
        using T = std::decay_t<decltype(st)>;
        if constexpr (std::is_same_v<T, expr_statement>){
            // A lone unbound name is a selector-only self-send.
            if(auto var = std::get_if<variable>(&st.value->data); var && !env->bound(var->name) && self_){
                return self_send({v_word(var->name)}, st.value->span);
            }
            return evaluate(*st.value, env, false);
        }
        else if constexpr (std::is_same_v<T, assignment>){
            value v = evaluate(*st.value, env, true);
            env->assign(st.name, v);
            return v;
        }
        else if constexpr (std::is_same_v<T, field_decl>){
            declare_field(st, env, nullptr, s.span);
            return v_unit();
        }
        else {
            throw eval_error(codes::Arity, "definitions cannot be executed inside a block", s.span);
        }
    }, s.data);
}

value Evaluator::run(const block_body& b, const env_ptr& env){
    value last = v_unit();
    for(const auto& s : b.statements) last = execute(*s, env);
    return last;
}

value Evaluator::call_block(const block_value& b){
    if(!b.body || !b.env) throw eval_error(codes::TypeMismatch, "empty block value");
    return run(*b.body, b.env->capture());
}

} // namespace komrad
