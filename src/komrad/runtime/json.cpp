#include "komrad/runtime/json.hpp"
#include "komrad/diagnostics_json.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace komrad {

namespace detail {

struct json_reader {
    std::string_view d;
    size_t p = 0;
    explicit json_reader(std::string_view s) : d(s) {}
    bool eof() const { return p >= d.size(); }
    char peek() const { return eof() ? '\0' : d[p]; }
    char get() { return eof() ? '\0' : d[p++]; }
    void skip_ws(){ while(!eof() && (d[p]==' ' || d[p]=='\t' || d[p]=='\r' || d[p]=='\n')) ++p; }
    [[noreturn]] void fail(const std::string& m) const { throw json_error(m, p); }
    void expect(char c){ if(get()!=c) { --p; fail(std::string("expected '") + c + "'"); } }
    void keyword(std::string_view k){ if(d.substr(p, k.size())!=k) fail("invalid literal"); p += k.size(); }
};

value parse_json_value(json_reader& r, int depth);

static void append_utf8(std::string& out, unsigned cp){
    if(cp < 0x80) out += static_cast<char>(cp);
    else if(cp < 0x800){ out += static_cast<char>(0xC0 | (cp >> 6)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else if(cp < 0x10000){ out += static_cast<char>(0xE0 | (cp >> 12)); out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
    else { out += static_cast<char>(0xF0 | (cp >> 18)); out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F)); out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F)); out += static_cast<char>(0x80 | (cp & 0x3F)); }
}

static unsigned parse_hex4(json_reader& r){
    unsigned cp = 0;
    for(int i=0;i<4;++i){
        char c = r.get(); cp <<= 4;
        if(c>='0' && c<='9') cp |= static_cast<unsigned>(c - '0');
        else if(c>='a' && c<='f') cp |= static_cast<unsigned>(c - 'a' + 10);
        else if(c>='A' && c<='F') cp |= static_cast<unsigned>(c - 'A' + 10);
        else r.fail("invalid \\u escape");
    }
    return cp;
}

static std::string parse_json_string(json_reader& r){
    r.expect('"');
    std::string out;
    for(;;){
        if(r.eof()) r.fail("unterminated string");
        char c = r.get();
        if(c=='"') break;
        if(static_cast<unsigned char>(c) < 0x20) r.fail("control character in string");
        if(c!='\\'){ out += c; continue; }
        char e = r.get();
        switch(e){
            case '"': out += '"'; break; case '\\': out += '\\'; break; case '/': out += '/'; break;
            case 'b': out += '\b'; break; case 'f': out += '\f'; break; case 'n': out += '\n'; break;
            case 'r': out += '\r'; break; case 't': out += '\t'; break;
            case 'u': {
                unsigned cp = parse_hex4(r);
                if(cp>=0xD800 && cp<0xDC00 && r.peek()=='\\'){
                    r.get();
                    if(r.get()!='u') r.fail("expected low surrogate");
                    unsigned lo = parse_hex4(r);
                    if(lo < 0xDC00 || lo >= 0xE000) r.fail("invalid low surrogate");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                }
                append_utf8(out, cp);
                break;
            }
            default: r.fail("invalid escape");
        }
    }
    return out;
}

static value parse_json_number(json_reader& r){
    size_t start = r.p;
    bool integral = true;
    if(r.peek()=='-') r.get();
    if(!std::isdigit(static_cast<unsigned char>(r.peek()))) r.fail("invalid number");
    while(std::isdigit(static_cast<unsigned char>(r.peek()))) r.get();
    if(r.peek()=='.'){
        integral = false; r.get();
        if(!std::isdigit(static_cast<unsigned char>(r.peek()))) r.fail("invalid fraction");
        while(std::isdigit(static_cast<unsigned char>(r.peek()))) r.get();
    }
    if(r.peek()=='e' || r.peek()=='E'){
        integral = false; r.get();
        if(r.peek()=='+' || r.peek()=='-') r.get();
        if(!std::isdigit(static_cast<unsigned char>(r.peek()))) r.fail("invalid exponent");
        while(std::isdigit(static_cast<unsigned char>(r.peek()))) r.get();
    }
    std::string tok(r.d.substr(start, r.p - start));
    if(integral){
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(tok.c_str(), &end, 10);
        if(errno!=ERANGE) return v_int(static_cast<std::int64_t>(v));
    }
    return v_float(std::strtod(tok.c_str(), nullptr));
}

value parse_json_value(json_reader& r, int depth){
    if(depth > 512) r.fail("nesting too deep");
    r.skip_ws();
    char c = r.peek();
    if(c=='{'){
        r.get();
        value_map out;
        r.skip_ws();
        if(r.peek()=='}'){ r.get(); return v_map(std::move(out)); }
        for(;;){
            r.skip_ws();
            std::string k = parse_json_string(r);
            r.skip_ws(); r.expect(':');
            value v = parse_json_value(r, depth + 1);
            out = map_with(out, v_str(std::move(k)), std::move(v));
            r.skip_ws();
            if(r.peek()==','){ r.get(); continue; }
            r.expect('}');
            return v_map(std::move(out));
        }
    }
    if(c=='['){
        r.get();
        value_list out;
        r.skip_ws();
        if(r.peek()==']'){ r.get(); return v_list(std::move(out)); }
        for(;;){
            out.push_back(parse_json_value(r, depth + 1));
            r.skip_ws();
            if(r.peek()==','){ r.get(); continue; }
            r.expect(']');
            return v_list(std::move(out));
        }
    }
    if(c=='"') return v_str(parse_json_string(r));
    if(c=='t'){ r.keyword("true"); return v_bool(true); }
    if(c=='f'){ r.keyword("false"); return v_bool(false); }
    if(c=='n'){ r.keyword("null"); return v_unit(); }
    if(c=='-' || std::isdigit(static_cast<unsigned char>(c))) return parse_json_number(r);
    if(r.eof()) r.fail("unexpected end of input");
    r.fail(std::string("unexpected character '") + c + "'");
}

static void write_json(std::ostringstream& os, const value& v){
    struct Visitor {
        std::ostringstream& os;
        void operator()(std::monostate) const { os<<"null"; }
        void operator()(bool b) const { os<<(b?"true":"false"); }
        void operator()(std::int64_t i) const { os<<i; }
        void operator()(double d) const {
            if(!std::isfinite(d)) throw json_error("cannot encode non-finite number");
            char buf[32]; std::snprintf(buf, sizeof(buf), "%.17g", d); os<<buf;
        }
        void operator()(const std::string& s) const { os<<json_escape(s); }
        void operator()(const word& w) const { os<<json_escape(w.text); }
        void operator()(const list_ptr& l) const {
            os<<'[';
            for(size_t i=0;i<l->size();++i){ if(i) os<<','; write_json(os, (*l)[i]); }
            os<<']';
        }
        void operator()(const map_ptr& m) const {
            os<<'{';
            bool first = true;
            for(const auto& kv : *m){
                auto key = as_text(kv.first);
                if(!key && !is_number(kv.first)) throw json_error(std::string("cannot encode ") + type_name(kv.first) + " map key");
                if(!first) os<<','; first = false;
                os<<json_escape(key ? *key : display(kv.first))<<':';
                write_json(os, kv.second);
            }
            os<<'}';
        }
        void operator()(const agent_ref&) const { throw json_error("cannot encode an Agent"); }
        void operator()(const block_value&) const { throw json_error("cannot encode a Block"); }
    };
    std::visit(Visitor{os}, v.data);
}

} // namespace detail

std::string to_json(const value& v){
    std::ostringstream os;
    detail::write_json(os, v);
    return os.str();
}

value from_json(std::string_view text){
    detail::json_reader r(text);
    value v = detail::parse_json_value(r, 0);
    r.skip_ws();
    if(!r.eof()) r.fail("trailing characters");
    return v;
}

} // namespace komrad
