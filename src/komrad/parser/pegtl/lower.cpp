#include "lower.hpp"
#include "grammar.hpp"
#include "komrad/parser.hpp"

namespace komrad::pegtl_front {

namespace g = grammar;

static source_span span_of(const tree_node& n){
    auto p = n.begin();
    return source_span{p.byte, static_cast<int>(p.line), static_cast<int>(p.column)};
}

static std::string unescape(std::string_view raw){
    std::string out; out.reserve(raw.size());
    for(size_t i=0;i<raw.size();++i){
        char c = raw[i];
        if(c!='\\' || i+1>=raw.size()){ out += c; continue; }
        char e = raw[++i];
        switch(e){
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case '0': out += '\0'; break;
            default: out += e; break; // \\ \" \' and unknown escapes keep the character
        }
    }
    return out;
}

void Lowering::fail(const tree_node& n, const std::string& message) const {
    throw parse_error(source_, span_of(n), message);
}

program_ptr Lowering::module(const tree_node& root) const {
    auto p = std::make_shared<program>();
    p->source_name = source_;
    for(const auto& c : root.children) p->statements.push_back(statement(*c, scope_kind::module));
    return p;
}

block_ptr Lowering::block(const tree_node& n) const {
    auto b = std::make_shared<block_body>();
    for(const auto& c : n.children) b->statements.push_back(statement(*c, scope_kind::block));
    return b;
}

handler_ptr Lowering::handler_of(const tree_node& n) const {
    // handler_def := pattern handler_body
    auto h = std::make_shared<handler>();
    h->pat = pattern_of(*n.children.at(0));
    h->body = block(*n.children.at(1));
    h->span = span_of(n);
    return h;
}

statement_ptr Lowering::statement(const tree_node& n, scope_kind k) const {
    auto at = span_of(n);
    if(n.is_type<g::agent_def>()){
        if(k!=scope_kind::module) fail(n, "agent definitions are only allowed at module level");
        auto def = std::make_shared<agent_def>();
        def->name = n.children.at(0)->string();
        def->span = at;
        for(const auto& c : n.children.at(1)->children){
            auto s = statement(*c, scope_kind::agent_body);
            if(auto h = std::get_if<handler_decl>(&s->data)) def->handlers.push_back(h->decl);
            else def->defaults.push_back(s);
        }
        return make_statement(agent_decl{def}, at);
    }
    if(n.is_type<g::handler_def>()){
        if(k==scope_kind::block) fail(n, "handlers are only allowed at module level or inside an agent definition");
        return make_statement(handler_decl{handler_of(n)}, at);
    }
    if(n.is_type<g::field_decl>()){
        field_decl f;
        f.name = n.children.at(0)->string();
        f.type_name = n.children.at(1)->string();
        if(n.children.size() > 2) f.init = expression(*n.children[2]);
        return make_statement(std::move(f), at);
    }
    if(n.is_type<g::assignment>()){
        return make_statement(assignment{n.children.at(0)->string(), expression(*n.children.at(1))}, at);
    }
    if(n.is_type<g::expr_stmt>()){
        return make_statement(expr_statement{expression(*n.children.at(0))}, at);
    }
    fail(n, "unexpected statement node " + std::string(n.type));
}

static binary_op op_of(const tree_node& n){
    auto s = n.string();
    if(n.is_type<g::or_op>()) return binary_op::Or;
    if(n.is_type<g::and_op>()) return binary_op::And;
    if(n.is_type<g::eq_op>()) return s=="==" ? binary_op::Eq : binary_op::Ne;
    if(n.is_type<g::rel_op>()){
        if(s=="<=") return binary_op::Le;
        if(s==">=") return binary_op::Ge;
        return s=="<" ? binary_op::Lt : binary_op::Gt;
    }
    if(n.is_type<g::add_op>()) return s=="+" ? binary_op::Add : binary_op::Sub;
    if(s=="*") return binary_op::Mul;
    return s=="/" ? binary_op::Div : binary_op::Mod;
}

literal_value Lowering::literal_value_of(const tree_node& n) const {
    if(n.is_type<g::int_lit>()){
        try { return static_cast<std::int64_t>(std::stoll(n.string())); }
        catch(const std::exception&){ fail(n, "integer literal out of range: " + n.string()); }
    }
    if(n.is_type<g::float_lit>()){
        try { return std::stod(n.string()); }
        catch(const std::exception&){ fail(n, "float literal out of range: " + n.string()); }
    }
    if(n.is_type<g::dq_body>() || n.is_type<g::sq_body>() || n.is_type<g::triple_body>()) return unescape(n.string());
    if(n.is_type<g::kw_true>()) return true;
    if(n.is_type<g::kw_false>()) return false;
    if(n.is_type<g::kw_unit>()) return unit_t{};
    fail(n, "expected literal");
}

expr_ptr Lowering::literal_of(const tree_node& n) const {
    if(n.is_type<g::embedded_text>()){
        literal lit;
        lit.raw = true;
        lit.value = std::string();
        for(const auto& c : n.children){
            if(c->is_type<g::embed_tag>()) lit.tags.push_back(c->string());
            else if(c->is_type<g::embed_body>()) lit.value = c->string();
        }
        return make_expr(std::move(lit), span_of(n));
    }
    return make_expr(literal{literal_value_of(n)}, span_of(n));
}

expr_ptr Lowering::argument(const tree_node& n) const {
    if(n.is_type<g::identifier>()) return make_expr(variable{n.string(), true}, span_of(n));
    return expression(n);
}

expr_ptr Lowering::expression(const tree_node& n) const {
    auto at = span_of(n);
    if(n.is_type<g::pipeline>()){
        if(n.children.size()==1) return expression(*n.children[0]);
        pipeline p;
        p.stages.push_back(expression(*n.children[0]));
        for(size_t i=1;i<n.children.size();++i){
            auto stage = expression(*n.children[i]);
            if(!std::holds_alternative<send>(stage->data)) fail(*n.children[i], "pipeline stage must be a message send");
            p.stages.push_back(std::move(stage));
        }
        return make_expr(std::move(p), at);
    }
    if(n.is_type<g::or_expr>() || n.is_type<g::and_expr>() || n.is_type<g::eq_expr>() ||
       n.is_type<g::rel_expr>() || n.is_type<g::add_expr>() || n.is_type<g::mul_expr>()){
        auto lhs = expression(*n.children.at(0));
        for(size_t i=1;i+1<n.children.size();i+=2){
            auto rhs = expression(*n.children[i+1]);
            lhs = make_expr(binary{op_of(*n.children[i]), lhs, rhs}, span_of(*n.children[i]));
        }
        return lhs;
    }
    if(n.is_type<g::not_expr>()) return make_expr(unary_not{expression(*n.children.at(0))}, at);
    if(n.is_type<g::block_call>()) return make_expr(block_call{expression(*n.children.at(0))}, at);
    if(n.is_type<g::send_expr>()){
        if(n.children.size()==1) return expression(*n.children[0]);
        send s;
        s.target = expression(*n.children[0]);
        for(size_t i=1;i<n.children.size();++i) s.args.push_back(argument(*n.children[i]));
        return make_expr(std::move(s), at);
    }
    if(n.is_type<g::spawn_expr>()){
        spawn_expr s;
        s.agent = n.children.at(0)->string();
        if(n.children.size() > 1) s.config = expression(*n.children[1]);
        return make_expr(std::move(s), at);
    }
    if(n.is_type<g::paren_expr>()) return expression(*n.children.at(0));
    if(n.is_type<g::block_lit>()) return make_expr(block_literal{block(n)}, at);
    if(n.is_type<g::list_lit>()){
        list_literal l;
        for(const auto& c : n.children) l.items.push_back(argument(*c));
        return make_expr(std::move(l), at);
    }
    if(n.is_type<g::map_lit>()){
        map_literal m;
        for(const auto& e : n.children){
            const auto& k = *e->children.at(0);
            expr_ptr key = k.is_type<g::map_key_word>() ? make_expr(literal{k.string()}, span_of(k)) : literal_of(k);
            m.entries.emplace_back(std::move(key), expression(*e->children.at(1)));
        }
        return make_expr(std::move(m), at);
    }
    if(n.is_type<g::kw_self>()) return make_expr(self_ref{}, at);
    if(n.is_type<g::identifier>()) return make_expr(variable{n.string(), false}, at);
    return literal_of(n);
}

pattern Lowering::pattern_of(const tree_node& n) const {
    pattern p;
    p.span = span_of(n);
    for(const auto& c : n.children){
        if(c->is_type<g::pattern_word>()) p.tokens.emplace_back(word_token{c->string()});
        else if(c->is_type<g::value_hole>()) p.tokens.emplace_back(value_hole{c->children.at(0)->string()});
        else if(c->is_type<g::block_hole>()) p.tokens.emplace_back(block_hole{c->children.at(0)->string()});
        else if(c->is_type<g::discard_hole>()) p.tokens.emplace_back(discard_token{});
        else if(c->is_type<g::predicate_hole>()){
            const auto& inner = *c->children.at(0);
            predicate_hole ph;
            if(inner.is_type<g::type_constraint>()){
                ph.subject = inner.children.at(0)->string();
                ph.type_name = inner.children.at(1)->string();
            } else {
                ph.test = expression(*inner.children.at(0));
                ph.subject = predicate_subject(*ph.test);
                if(ph.subject.empty()){
                    auto [target, arg] = self_send_subject(*ph.test);
                    ph.self_target = std::move(target);
                    ph.self_subject = std::move(arg);
                }
            }
            p.tokens.emplace_back(std::move(ph));
        }
        else p.tokens.emplace_back(literal_token{literal_value_of(*c)});
    }
    return p;
}

std::string predicate_subject(const expr& e){
    struct Visitor {
        std::string operator()(const literal&) const { return {}; }
        std::string operator()(const variable& v) const { return v.name; }
        std::string operator()(const self_ref&) const { return {}; }
        std::string operator()(const send& s) const {
            if(s.target && !std::holds_alternative<variable>(s.target->data)){
                if(auto r = predicate_subject(*s.target); !r.empty()) return r;
            }
            for(size_t i=0;i<s.args.size();++i){
                if(i==0 && std::holds_alternative<variable>(s.args[i]->data)) continue;
                if(auto r = predicate_subject(*s.args[i]); !r.empty()) return r;
            }
            return {};
        }
        std::string operator()(const block_literal&) const { return {}; }
        std::string operator()(const list_literal& l) const {
            for(const auto& i : l.items) if(auto r = predicate_subject(*i); !r.empty()) return r;
            return {};
        }
        std::string operator()(const map_literal& m) const {
            for(const auto& kv : m.entries) if(auto r = predicate_subject(*kv.second); !r.empty()) return r;
            return {};
        }
        std::string operator()(const binary& b) const {
            if(auto r = predicate_subject(*b.lhs); !r.empty()) return r;
            return predicate_subject(*b.rhs);
        }
        std::string operator()(const unary_not& u) const { return predicate_subject(*u.operand); }
        std::string operator()(const block_call& c) const { return predicate_subject(*c.block); }
        std::string operator()(const spawn_expr&) const { return {}; }
        std::string operator()(const pipeline& p) const {
            for(const auto& s : p.stages) if(auto r = predicate_subject(*s); !r.empty()) return r;
            return {};
        }
    };
    return std::visit(Visitor{}, e.data);
}

std::pair<std::string, std::string> self_send_subject(const expr& e){
    if(auto s = std::get_if<send>(&e.data)){
        if(!s->target || s->args.empty()) return {};
        auto t = std::get_if<variable>(&s->target->data);
        auto a = std::get_if<variable>(&s->args[0]->data);
        if(t && a) return {t->name, a->name};
        return {};
    }
    if(auto b = std::get_if<binary>(&e.data)){
        auto r = self_send_subject(*b->lhs);
        if(!r.first.empty()) return r;
        return self_send_subject(*b->rhs);
    }
    if(auto u = std::get_if<unary_not>(&e.data)) return self_send_subject(*u->operand);
    return {};
}

} // namespace komrad::pegtl_front
