#include "komrad/value.hpp"
#include "komrad/runtime/agent.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace komrad {

Agent* agent_ref::get() const { return handle ? handle->agent().get() : nullptr; }

value from_literal(const literal_value& lit){
    struct Visitor {
        value operator()(unit_t) const { return v_unit(); }
        value operator()(bool b) const { return v_bool(b); }
        value operator()(std::int64_t i) const { return v_int(i); }
        value operator()(double d) const { return v_float(d); }
        value operator()(const std::string& s) const { return v_str(s); }
    };
    return std::visit(Visitor{}, lit);
}

std::optional<double> as_number(const value& v){
    if(auto i=std::get_if<std::int64_t>(&v.data)) return static_cast<double>(*i);
    if(auto d=std::get_if<double>(&v.data)) return *d;
    return std::nullopt;
}

const std::string* as_text(const value& v){
    if(auto s=std::get_if<std::string>(&v.data)) return s;
    if(auto w=std::get_if<word>(&v.data)) return &w->text;
    return nullptr;
}

const char* type_name(const value& v){
    static const char* names[] = {"Unit", "Boolean", "Int", "Float", "String", "Word", "List", "Map", "Agent", "Block"};
    return names[v.data.index()];
}

std::optional<bool> type_matches(const value& v, const std::string& type){
    if(type=="Any") return true;
    if(type=="Number") return is_number(v);
    if(type=="Bool") return std::holds_alternative<bool>(v.data);
    if(type=="Dict") return std::holds_alternative<map_ptr>(v.data);
    for(const char* n : {"Unit", "Boolean", "Int", "Float", "String", "Word", "List", "Map", "Agent", "Block"}){
        if(type==n) return type==type_name(v);
    }
    return std::nullopt;
}

bool values_equal(const value& a, const value& b){
    if(is_number(a) && is_number(b)){
        auto ai=std::get_if<std::int64_t>(&a.data); auto bi=std::get_if<std::int64_t>(&b.data);
        if(ai && bi) return *ai==*bi;
        return *as_number(a)==*as_number(b);
    }
    if(a.data.index()!=b.data.index()) return false;
    struct Visitor {
        const value& b;
        bool operator()(std::monostate) const { return true; }
        bool operator()(bool x) const { return x==std::get<bool>(b.data); }
        bool operator()(std::int64_t) const { return false; }
        bool operator()(double) const { return false; }
        bool operator()(const std::string& s) const { return s==std::get<std::string>(b.data); }
        bool operator()(const word& w) const { return w.text==std::get<word>(b.data).text; }
        bool operator()(const list_ptr& l) const {
            const auto& r=std::get<list_ptr>(b.data);
            if(l==r) return true;
            if(l->size()!=r->size()) return false;
            for(size_t i=0;i<l->size();++i) if(!values_equal((*l)[i], (*r)[i])) return false;
            return true;
        }
        bool operator()(const map_ptr& m) const {
            const auto& r=std::get<map_ptr>(b.data);
            if(m==r) return true;
            if(m->size()!=r->size()) return false;
            for(const auto& kv : *m){
                auto found = map_find(*r, kv.first);
                if(!found || !values_equal(kv.second, *found)) return false;
            }
            return true;
        }
        bool operator()(const agent_ref& r) const { return r.get()==std::get<agent_ref>(b.data).get(); }
        bool operator()(const block_value& bl) const { const auto& r=std::get<block_value>(b.data); return bl.body==r.body && bl.env==r.env; }
    };
    return std::visit(Visitor{b}, a.data);
}

const value* map_find(const value_map& m, const value& key){
    for(const auto& kv : m) if(values_equal(kv.first, key)) return &kv.second;
    return nullptr;
}

value_map map_with(const value_map& m, const value& key, value v){
    value_map out = m;
    for(auto& kv : out){
        if(values_equal(kv.first, key)){ kv.second = std::move(v); return out; }
    }
    out.emplace_back(key, std::move(v));
    return out;
}

static std::string render(const value& v, bool quoted){
    struct Visitor {
        bool quoted;
        std::string operator()(std::monostate) const { return "unit"; }
        std::string operator()(bool b) const { return b ? "true" : "false"; }
        std::string operator()(std::int64_t i) const { return std::to_string(i); }
        std::string operator()(double d) const {
            if(std::isfinite(d) && d==std::floor(d) && std::fabs(d) < 1e15){ std::ostringstream o; o<<std::fixed<<std::setprecision(1)<<d; return o.str(); }
            std::ostringstream o; o<<std::setprecision(15)<<d; return o.str();
        }
        std::string operator()(const std::string& s) const { return quoted ? to_string(literal_value{s}) : s; }
        std::string operator()(const word& w) const { return w.text; }
        std::string operator()(const list_ptr& l) const {
            std::string out = "[";
            for(size_t i=0;i<l->size();++i){ if(i) out += " "; out += render((*l)[i], true); }
            return out + "]";
        }
        std::string operator()(const map_ptr& m) const {
            std::string out = "#{";
            for(size_t i=0;i<m->size();++i){ if(i) out += ", "; out += render((*m)[i].first, true) + ": " + render((*m)[i].second, true); }
            return out + "}";
        }
        std::string operator()(const agent_ref& r) const {
            auto* a = r.get();
            return a ? "<agent " + a->name() + "#" + std::to_string(a->id()) + ">" : std::string("<agent ?>");
        }
        std::string operator()(const block_value&) const { return "<block>"; }
    };
    return std::visit(Visitor{quoted}, v.data);
}

std::string to_string(const value& v){ return render(v, true); }
std::string display(const value& v){ return render(v, false); }

} // namespace komrad
