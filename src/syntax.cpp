// Structural equality, traversal and printing for the syntax model.
#include "komrad/syntax.hpp"
#include <sstream>
#include <iomanip>
#include <type_traits>

namespace komrad {

static bool equal_literal(const literal_value& a, const literal_value& b){ return a == b; }

static bool equal_args(const std::vector<expr_ptr>& a, const std::vector<expr_ptr>& b){
    if(a.size()!=b.size()) return false;
    for(size_t i=0;i<a.size();++i) if(!equal(a[i], b[i])) return false;
    return true;
}

static bool equal_block(const block_ptr& a, const block_ptr& b){
    if(a.get()==b.get()) return true;
    if(!a || !b) return false;
    return equal(*a, *b);
}

bool equal(const expr_ptr& a, const expr_ptr& b){
    if(a.get()==b.get()) return true;
    if(!a || !b) return false;
    return equal(*a, *b);
}

bool equal(const expr& a, const expr& b){
    if(a.data.index()!=b.data.index()) return false;
    struct Visitor {
        const expr& b;
        bool operator()(const literal& l) const { const auto& r=std::get<literal>(b.data); return l.raw==r.raw && l.tags==r.tags && equal_literal(l.value, r.value); }
        bool operator()(const variable& v) const { const auto& r=std::get<variable>(b.data); return v.name==r.name && v.bare_arg==r.bare_arg; }
        bool operator()(const self_ref&) const { return true; }
        bool operator()(const send& s) const { const auto& r=std::get<send>(b.data); return equal(s.target, r.target) && equal_args(s.args, r.args); }
        bool operator()(const block_literal& bl) const { return equal_block(bl.body, std::get<block_literal>(b.data).body); }
        bool operator()(const list_literal& l) const { return equal_args(l.items, std::get<list_literal>(b.data).items); }
        bool operator()(const map_literal& m) const {
            const auto& r=std::get<map_literal>(b.data);
            if(m.entries.size()!=r.entries.size()) return false;
            for(size_t i=0;i<m.entries.size();++i){
                if(!equal(m.entries[i].first, r.entries[i].first) || !equal(m.entries[i].second, r.entries[i].second)) return false;
            }
            return true;
        }
        bool operator()(const binary& x) const { const auto& r=std::get<binary>(b.data); return x.op==r.op && equal(x.lhs, r.lhs) && equal(x.rhs, r.rhs); }
        bool operator()(const unary_not& u) const { return equal(u.operand, std::get<unary_not>(b.data).operand); }
        bool operator()(const block_call& c) const { return equal(c.block, std::get<block_call>(b.data).block); }
        bool operator()(const spawn_expr& s) const { const auto& r=std::get<spawn_expr>(b.data); return s.agent==r.agent && equal(s.config, r.config); }
        bool operator()(const pipeline& p) const { return equal_args(p.stages, std::get<pipeline>(b.data).stages); }
    };
    return std::visit(Visitor{b}, a.data);
}

static bool equal_token(const pattern_token& a, const pattern_token& b){
    if(a.index()!=b.index()) return false;
    if(auto w=std::get_if<word_token>(&a)) return w->text==std::get<word_token>(b).text;
    if(auto l=std::get_if<literal_token>(&a)) return l->value==std::get<literal_token>(b).value;
    if(auto h=std::get_if<value_hole>(&a)) return h->name==std::get<value_hole>(b).name;
    if(auto h=std::get_if<block_hole>(&a)) return h->name==std::get<block_hole>(b).name;
    if(auto p=std::get_if<predicate_hole>(&a)){
        const auto& r=std::get<predicate_hole>(b);
        return p->subject==r.subject && p->self_target==r.self_target && p->self_subject==r.self_subject
            && p->type_name==r.type_name && equal(p->test, r.test);
    }
    return true; // discard
}

bool equal(const pattern& a, const pattern& b){
    if(a.tokens.size()!=b.tokens.size()) return false;
    for(size_t i=0;i<a.tokens.size();++i) if(!equal_token(a.tokens[i], b.tokens[i])) return false;
    return true;
}

static bool equal_handler(const handler_ptr& a, const handler_ptr& b){
    if(a.get()==b.get()) return true;
    if(!a || !b) return false;
    return equal(a->pat, b->pat) && equal_block(a->body, b->body);
}

static bool equal_statements(const std::vector<statement_ptr>& a, const std::vector<statement_ptr>& b){
    if(a.size()!=b.size()) return false;
    for(size_t i=0;i<a.size();++i){
        if(a[i].get()==b[i].get()) continue;
        if(!a[i] || !b[i] || !equal(*a[i], *b[i])) return false;
    }
    return true;
}

bool equal(const statement& a, const statement& b){
    if(a.data.index()!=b.data.index()) return false;
    struct Visitor {
        const statement& b;
        bool operator()(const expr_statement& s) const { return equal(s.value, std::get<expr_statement>(b.data).value); }
        bool operator()(const assignment& s) const { const auto& r=std::get<assignment>(b.data); return s.name==r.name && equal(s.value, r.value); }
        bool operator()(const field_decl& s) const { const auto& r=std::get<field_decl>(b.data); return s.name==r.name && s.type_name==r.type_name && equal(s.init, r.init); }
        bool operator()(const handler_decl& s) const { return equal_handler(s.decl, std::get<handler_decl>(b.data).decl); }
        bool operator()(const agent_decl& s) const {
            const auto& l=s.decl; const auto& r=std::get<agent_decl>(b.data).decl;
            if(l.get()==r.get()) return true;
            if(!l || !r || l->name!=r->name || l->handlers.size()!=r->handlers.size()) return false;
            for(size_t i=0;i<l->handlers.size();++i) if(!equal_handler(l->handlers[i], r->handlers[i])) return false;
            return equal_statements(l->defaults, r->defaults);
        }
    };
    return std::visit(Visitor{b}, a.data);
}

bool equal(const block_body& a, const block_body& b){ return equal_statements(a.statements, b.statements); }

bool equal(const program& a, const program& b){ return equal_statements(a.statements, b.statements); }

// ---- traversal ----

static void walk_block(const block_ptr& b, const std::function<void(const expr&)>& fn){
    if(!b) return;
    for(const auto& s : b->statements) if(s) walk(*s, fn);
}

void walk(const expr& root, const std::function<void(const expr&)>& fn){
    fn(root);
    auto sub = [&](const expr_ptr& e){ if(e) walk(*e, fn); };
    struct Visitor {
        const std::function<void(const expr&)>& fn;
        std::function<void(const expr_ptr&)> sub;
        void operator()(const literal&) const {}
        void operator()(const variable&) const {}
        void operator()(const self_ref&) const {}
        void operator()(const send& s) const { sub(s.target); for(const auto& a : s.args) sub(a); }
        void operator()(const block_literal& b) const { walk_block(b.body, fn); }
        void operator()(const list_literal& l) const { for(const auto& i : l.items) sub(i); }
        void operator()(const map_literal& m) const { for(const auto& kv : m.entries){ sub(kv.first); sub(kv.second); } }
        void operator()(const binary& b) const { sub(b.lhs); sub(b.rhs); }
        void operator()(const unary_not& u) const { sub(u.operand); }
        void operator()(const block_call& c) const { sub(c.block); }
        void operator()(const spawn_expr& s) const { sub(s.config); }
        void operator()(const pipeline& p) const { for(const auto& s : p.stages) sub(s); }
    };
    std::visit(Visitor{fn, sub}, root.data);
}

static void walk_pattern(const pattern& p, const std::function<void(const expr&)>& fn){
    for(const auto& t : p.tokens) if(auto ph=std::get_if<predicate_hole>(&t); ph && ph->test) walk(*ph->test, fn);
}

void walk(const statement& root, const std::function<void(const expr&)>& fn){
    std::visit([&](const auto& s){
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, expr_statement>){ if(s.value) walk(*s.value, fn); }
        else if constexpr (std::is_same_v<T, assignment>){ if(s.value) walk(*s.value, fn); }
        else if constexpr (std::is_same_v<T, field_decl>){ if(s.init) walk(*s.init, fn); }
        else if constexpr (std::is_same_v<T, handler_decl>){ if(s.decl){ walk_pattern(s.decl->pat, fn); walk_block(s.decl->body, fn); } }
        else if constexpr (std::is_same_v<T, agent_decl>){
            if(!s.decl) return;
            for(const auto& d : s.decl->defaults) if(d) walk(*d, fn);
            for(const auto& h : s.decl->handlers){ walk_pattern(h->pat, fn); walk_block(h->body, fn); }
        }
    }, root.data);
}

std::vector<agent_def_ptr> agent_defs(const program& p){
    std::vector<agent_def_ptr> out;
    for(const auto& s : p.statements) if(auto a=std::get_if<agent_decl>(&s->data)) out.push_back(a->decl);
    return out;
}

std::vector<handler_ptr> module_handlers(const program& p){
    std::vector<handler_ptr> out;
    for(const auto& s : p.statements) if(auto h=std::get_if<handler_decl>(&s->data)) out.push_back(h->decl);
    return out;
}

// ---- printing ----

const char* to_string(binary_op op){
    switch(op){
        case binary_op::Or: return "||"; case binary_op::And: return "&&";
        case binary_op::Eq: return "=="; case binary_op::Ne: return "!=";
        case binary_op::Lt: return "<"; case binary_op::Le: return "<=";
        case binary_op::Gt: return ">"; case binary_op::Ge: return ">=";
        case binary_op::Add: return "+"; case binary_op::Sub: return "-";
        case binary_op::Mul: return "*"; case binary_op::Div: return "/";
        case binary_op::Mod: return "%";
    }
    return "?";
}

static std::string quote(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c : s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default: o<<c; break;
        }
    }
    o<<'"';
    return o.str();
}

std::string to_string(const literal_value& v){
    struct Visitor {
        std::string operator()(unit_t) const { return "unit"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const { std::ostringstream o; o<<std::setprecision(15)<<d; auto s=o.str(); if(s.find_first_of(".eEn")==std::string::npos) s+=".0"; return s; }
        std::string operator()(const std::string& s) const { return quote(s); }
    };
    return std::visit(Visitor{}, v);
}

static std::string block_to_string(const block_ptr& b){
    std::string out = "{";
    if(b){
        bool first=true;
        for(const auto& s : b->statements){ out += first ? " " : "; "; first=false; out += to_string(*s); }
        if(!b->statements.empty()) out += " ";
    }
    return out + "}";
}

std::string to_string(const expr& e){
    struct Visitor {
        std::string operator()(const literal& l) const { return to_string(l.value); }
        std::string operator()(const variable& v) const { return v.name; }
        std::string operator()(const self_ref&) const { return "self"; }
        std::string operator()(const send& s) const {
            std::string out = "(" + (s.target ? to_string(*s.target) : std::string("<self>"));
            for(const auto& a : s.args) out += " " + to_string(*a);
            return out + ")";
        }
        std::string operator()(const block_literal& b) const { return block_to_string(b.body); }
        std::string operator()(const list_literal& l) const {
            std::string out = "[";
            for(size_t i=0;i<l.items.size();++i){ if(i) out += " "; out += to_string(*l.items[i]); }
            return out + "]";
        }
        std::string operator()(const map_literal& m) const {
            std::string out = "#{";
            for(size_t i=0;i<m.entries.size();++i){ if(i) out += ", "; out += to_string(*m.entries[i].first) + ": " + to_string(*m.entries[i].second); }
            return out + "}";
        }
        std::string operator()(const binary& b) const { return "(" + to_string(*b.lhs) + " " + to_string(b.op) + " " + to_string(*b.rhs) + ")"; }
        std::string operator()(const unary_not& u) const { return "!" + to_string(*u.operand); }
        std::string operator()(const block_call& c) const { return "*" + to_string(*c.block); }
        std::string operator()(const spawn_expr& s) const { return "(spawn " + s.agent + (s.config ? " " + to_string(*s.config) : std::string()) + ")"; }
        std::string operator()(const pipeline& p) const {
            std::string out;
            for(size_t i=0;i<p.stages.size();++i){ if(i) out += " |> "; out += to_string(*p.stages[i]); }
            return out;
        }
    };
    return std::visit(Visitor{}, e.data);
}

std::string to_string(const pattern& p){
    std::string out = "[";
    for(size_t i=0;i<p.tokens.size();++i){
        if(i) out += " ";
        const auto& t = p.tokens[i];
        if(auto w=std::get_if<word_token>(&t)) out += w->text;
        else if(auto l=std::get_if<literal_token>(&t)) out += to_string(l->value);
        else if(auto h=std::get_if<value_hole>(&t)) out += "_" + h->name;
        else if(auto b=std::get_if<block_hole>(&t)) out += "_{" + b->name + "}";
        else if(auto ph=std::get_if<predicate_hole>(&t)) out += ph->test ? "_(" + to_string(*ph->test) + ")" : "_(" + ph->subject + ": " + ph->type_name + ")";
        else out += "_";
    }
    return out + "]";
}

std::string to_string(const statement& s){
    struct Visitor {
        std::string operator()(const expr_statement& s) const { return to_string(*s.value); }
        std::string operator()(const assignment& s) const { return s.name + " = " + to_string(*s.value); }
        std::string operator()(const field_decl& s) const { return s.name + ": " + s.type_name + (s.init ? " = " + to_string(*s.init) : std::string()); }
        std::string operator()(const handler_decl& s) const { return to_string(s.decl->pat) + " " + block_to_string(s.decl->body); }
        std::string operator()(const agent_decl& s) const {
            std::string out = "agent " + s.decl->name + " {";
            for(const auto& d : s.decl->defaults) out += " " + to_string(*d) + ";";
            for(const auto& h : s.decl->handlers) out += " " + to_string(h->pat) + " " + block_to_string(h->body) + ";";
            return out + " }";
        }
    };
    return std::visit(Visitor{}, s.data);
}

std::string to_string(const program& p){
    std::string out;
    for(const auto& s : p.statements){ out += to_string(*s); out += "\n"; }
    return out;
}

} // namespace komrad
