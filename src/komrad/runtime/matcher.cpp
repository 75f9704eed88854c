#include "komrad/runtime/matcher.hpp"
#include "komrad/runtime.hpp"
#include <cstdio>
#include <type_traits>

namespace komrad {

bool Matcher::test_predicate(const predicate_hole& h, const value& v, const env_ptr& env) const {
    if(!h.type_name.empty()){
        auto ok = type_matches(v, h.type_name);
        if(!ok || !*ok) return false;
        if(!h.subject.empty()) env->bind_local(h.subject, v);
        return true;
    }
    std::string subject = h.subject;
    if(subject.empty() && !h.self_subject.empty() && !env->bound(h.self_target)) subject = h.self_subject;
    if(!subject.empty()) env->bind_local(subject, v);
    if(!h.test) return true;
    try {
        value r = ev_.evaluate(*h.test, env, true);
        auto b = std::get_if<bool>(&r.data);
        return b && *b;
    } catch (const eval_error& e) {
        // A failing predicate is a non-match.
        if(ev_.runtime().env().debug) std::fprintf(stderr, "[dbg][dispatch] predicate %s failed: %s\n", to_string(*h.test).c_str(), e.what());
        return false;
    }
}

std::optional<env_ptr> Matcher::bind(const pattern& p, const std::vector<value>& tokens, const env_ptr& base) const {
    if(p.tokens.size()!=tokens.size()) return std::nullopt;
    auto env = base->extend();
    for(size_t i=0;i<tokens.size();++i){
        const value& v = tokens[i];
        bool ok = std::visit([&](const auto& t) -> bool {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, word_token>){
                auto text = as_text(v);
                return text && *text==t.text;
            }
            else if constexpr (std::is_same_v<T, literal_token>){
                if(auto s = std::get_if<std::string>(&t.value)){
                    auto text = as_text(v);
                    return text && *text==*s;
                }
                return values_equal(from_literal(t.value), v);
            }
            else if constexpr (std::is_same_v<T, value_hole>){ env->bind_local(t.name, v); return true; }
            else if constexpr (std::is_same_v<T, block_hole>){
                if(!is_block(v)) return false;
                env->bind_local(t.name, v);
                return true;
            }
            else if constexpr (std::is_same_v<T, predicate_hole>){ return test_predicate(t, v, env); }
            else { return true; }
        }, p.tokens[i]);
        if(!ok) return std::nullopt;
    }
    return env;
}

std::optional<Match> Matcher::select(const std::vector<handler_ptr>& handlers, const std::vector<value>& tokens, const env_ptr& base) const {
    for(const auto& h : handlers){
        if(auto env = bind(h->pat, tokens, base)) return Match{h, *env};
    }
    return std::nullopt;
}

} // namespace komrad
