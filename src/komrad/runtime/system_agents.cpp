#include "komrad/runtime/system_agents.hpp"
#include "komrad/runtime.hpp"
#include "komrad/runtime/json.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace komrad {

namespace fs = std::filesystem;

namespace {

// Words and strings address the same map entry.
value key_of(const value& v){
    if(auto w = std::get_if<word>(&v.data)) return v_str(w->text);
    return v;
}

// Integral doubles outside [-2^63, 2^63) have no Int.
value rounded(const NativeCall& c, double d){
    if(!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0){
        c.fail("cannot round " + display(v_float(d)) + " to an Int", codes::TypeMismatch);
    }
    return v_int(static_cast<std::int64_t>(d));
}

std::optional<value> parse_number(const std::string& s){
    if(s.empty()) return std::nullopt;
    const char* b = s.c_str();
    char* end = nullptr;
    errno = 0;
    long long i = std::strtoll(b, &end, 10);
    if(end && *end=='\0' && errno!=ERANGE) return v_int(static_cast<std::int64_t>(i));
    errno = 0;
    double d = std::strtod(b, &end);
    if(end && *end=='\0' && errno!=ERANGE) return v_float(d);
    return std::nullopt;
}

value numeric_pick(const value& a, const value& b, bool want_min){
    bool a_less = *as_number(a) < *as_number(b);
    return (a_less==want_min) ? a : b;
}

} // namespace

std::shared_ptr<NativeAgent> make_io_agent(Runtime& rt){
    auto a = std::make_shared<NativeAgent>(rt, "Io");
    a->on("println _value", [](const NativeCall& c){
        std::lock_guard<std::mutex> lk(c.rt.out_mutex());
        c.rt.out()<<display(c.arg("value"))<<'\n'<<std::flush;
        return v_unit();
    });
    a->on("print _value", [](const NativeCall& c){
        std::lock_guard<std::mutex> lk(c.rt.out_mutex());
        c.rt.out()<<display(c.arg("value"))<<std::flush;
        return v_unit();
    });
    a->on("println", [](const NativeCall& c){
        std::lock_guard<std::mutex> lk(c.rt.out_mutex());
        c.rt.out()<<'\n'<<std::flush;
        return v_unit();
    });
    return a;
}

std::shared_ptr<NativeAgent> make_fs_agent(Runtime& rt){
    auto a = std::make_shared<NativeAgent>(rt, "Fs");
    a->on("read-all _path", [](const NativeCall& c){
        auto path = c.text("path");
        std::ifstream in(path, std::ios::binary);
        if(!in) c.fail("cannot open '" + path + "'");
        std::ostringstream ss; ss<<in.rdbuf();
        return v_str(ss.str());
    });
    a->on("read-lines _path", [](const NativeCall& c){
        auto path = c.text("path");
        std::ifstream in(path);
        if(!in) c.fail("cannot open '" + path + "'");
        value_list lines;
        for(std::string line; std::getline(in, line);){
            if(!line.empty() && line.back()=='\r') line.pop_back();
            lines.push_back(v_str(std::move(line)));
        }
        return v_list(std::move(lines));
    });
    a->on("write _path _content", [](const NativeCall& c){
        auto path = c.text("path");
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if(!out) c.fail("cannot write '" + path + "'");
        out<<display(c.arg("content"));
        if(!out) c.fail("write to '" + path + "' failed");
        return v_bool(true);
    });
    a->on("exists _path", [](const NativeCall& c){
        std::error_code ec;
        return v_bool(fs::exists(c.text("path"), ec));
    });
    a->on("list-dir _path", [](const NativeCall& c){
        auto path = c.text("path");
        std::error_code ec;
        fs::directory_iterator it(path, ec);
        if(ec) c.fail("cannot list '" + path + "': " + ec.message());
        std::vector<std::string> names;
        for(const auto& entry : it) names.push_back(entry.path().filename().string());
        std::sort(names.begin(), names.end());
        value_list out;
        for(auto& n : names) out.push_back(v_str(std::move(n)));
        return v_list(std::move(out));
    });
    return a;
}

std::shared_ptr<NativeAgent> make_number_agent(Runtime& rt){
    auto a = std::make_shared<NativeAgent>(rt, "Number");
    a->on("parse _text", [](const NativeCall& c){
        auto v = c.arg("text");
        if(is_number(v)) return v;
        auto s = c.text("text");
        auto n = parse_number(s);
        if(!n) c.fail("not a number: '" + s + "'", codes::TypeMismatch);
        return *n;
    });
    a->on("to-string _n", [](const NativeCall& c){
        auto v = c.arg("n");
        if(!is_number(v)) c.fail(std::string("expected a Number, got ") + type_name(v), codes::TypeMismatch);
        return v_str(display(v));
    });
    a->on("is-number _v", [](const NativeCall& c){ return v_bool(is_number(c.arg("v"))); });
    a->on("is-int _v", [](const NativeCall& c){ return v_bool(std::holds_alternative<std::int64_t>(c.arg("v").data)); });
    a->on("is-float _v", [](const NativeCall& c){ return v_bool(std::holds_alternative<double>(c.arg("v").data)); });
    a->on("abs _n", [](const NativeCall& c){
        auto v = c.arg("n");
        if(auto i = std::get_if<std::int64_t>(&v.data)){
            if(*i==INT64_MIN) return v_int(INT64_MIN);
            return v_int(*i < 0 ? -*i : *i);
        }
        return v_float(std::fabs(c.number("n")));
    });
    a->on("floor _n", [](const NativeCall& c){ return rounded(c, std::floor(c.number("n"))); });
    a->on("ceil _n", [](const NativeCall& c){ return rounded(c, std::ceil(c.number("n"))); });
    a->on("min _a _b", [](const NativeCall& c){ c.number("a"); c.number("b"); return numeric_pick(c.arg("a"), c.arg("b"), true); });
    a->on("max _a _b", [](const NativeCall& c){ c.number("a"); c.number("b"); return numeric_pick(c.arg("a"), c.arg("b"), false); });
    return a;
}

std::shared_ptr<NativeAgent> make_json_agent(Runtime& rt){
    auto a = std::make_shared<NativeAgent>(rt, "Json");
    a->on("encode _value", [](const NativeCall& c){
        try { return v_str(to_json(c.arg("value"))); }
        catch(const json_error& e){ c.fail(std::string("encode: ") + e.what()); }
    });
    a->on("decode _text", [](const NativeCall& c){
        try { return from_json(c.text("text")); }
        catch(const json_error& e){ c.fail(std::string("decode: ") + e.what()); }
    });
    return a;
}

std::shared_ptr<NativeAgent> make_dict_agent(Runtime& rt){
    auto a = std::make_shared<NativeAgent>(rt, "Dict");
    a->on("new", [](const NativeCall&){ return v_map({}); });
    a->on("get _map _key", [](const NativeCall& c){
        auto m = c.map("map");
        auto found = map_find(*m, key_of(c.arg("key")));
        return found ? *found : v_unit();
    });
    a->on("set _map _key _value", [](const NativeCall& c){ return v_map(map_with(*c.map("map"), key_of(c.arg("key")), c.arg("value"))); });
    a->on("remove _map _key", [](const NativeCall& c){
        auto m = c.map("map");
        auto k = key_of(c.arg("key"));
        value_map out;
        for(const auto& kv : *m) if(!values_equal(kv.first, k)) out.push_back(kv);
        return v_map(std::move(out));
    });
    a->on("has _map _key", [](const NativeCall& c){ return v_bool(map_find(*c.map("map"), key_of(c.arg("key")))!=nullptr); });
    a->on("keys _map", [](const NativeCall& c){
        value_list out;
        for(const auto& kv : *c.map("map")) out.push_back(kv.first);
        return v_list(std::move(out));
    });
    a->on("values _map", [](const NativeCall& c){
        value_list out;
        for(const auto& kv : *c.map("map")) out.push_back(kv.second);
        return v_list(std::move(out));
    });
    a->on("size _map", [](const NativeCall& c){ return v_int(static_cast<std::int64_t>(c.map("map")->size())); });
    return a;
}

std::shared_ptr<NativeAgent> make_list_agent(Runtime& rt){
    auto a = std::make_shared<NativeAgent>(rt, "List");
    a->on("new", [](const NativeCall&){ return v_list({}); });
    a->on("get _list _index", [](const NativeCall& c){
        auto l = c.list("list");
        auto i = c.integer("index");
        if(i < 0 || static_cast<std::size_t>(i) >= l->size()) c.fail("index " + std::to_string(i) + " out of range for list of size " + std::to_string(l->size()), codes::Arity);
        return (*l)[static_cast<std::size_t>(i)];
    });
    a->on("append _list _value", [](const NativeCall& c){
        value_list out = *c.list("list");
        out.push_back(c.arg("value"));
        return v_list(std::move(out));
    });
    a->on("size _list", [](const NativeCall& c){ return v_int(static_cast<std::int64_t>(c.list("list")->size())); });
    a->on("first _list", [](const NativeCall& c){
        auto l = c.list("list");
        return l->empty() ? v_unit() : l->front();
    });
    a->on("rest _list", [](const NativeCall& c){
        auto l = c.list("list");
        if(l->empty()) return v_list({});
        return v_list(value_list(l->begin() + 1, l->end()));
    });
    a->on("join _list _sep", [](const NativeCall& c){
        auto l = c.list("list");
        auto sep = c.text("sep");
        std::string out;
        for(size_t i=0;i<l->size();++i){ if(i) out += sep; out += display((*l)[i]); }
        return v_str(std::move(out));
    });
    return a;
}

std::shared_ptr<NativeAgent> make_assert_agent(Runtime& rt){
    auto a = std::make_shared<NativeAgent>(rt, "Assert");
    a->on("equal _expected _actual", [](const NativeCall& c){
        auto e = c.arg("expected"), v = c.arg("actual");
        if(!values_equal(e, v)) c.fail("expected " + to_string(e) + ", got " + to_string(v));
        return v_bool(true);
    });
    a->on("_(condition: Boolean)", [](const NativeCall& c){
        if(!std::get<bool>(c.arg("condition").data)) c.fail("assertion failed");
        return v_bool(true);
    });
    return a;
}

void install_system_agents(Runtime& rt){
    rt.register_agent(make_io_agent(rt));
    rt.register_agent(make_fs_agent(rt));
    rt.register_agent(make_number_agent(rt));
    rt.register_agent(make_json_agent(rt));
    rt.register_agent(make_dict_agent(rt));
    rt.register_agent(make_list_agent(rt));
    rt.register_agent(make_assert_agent(rt));
}

} // namespace komrad
