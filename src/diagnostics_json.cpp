#include "komrad/diagnostics_json.hpp"
#include "komrad/config.hpp"
#include <sstream>
#include <cstdio>

namespace komrad {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_entry(std::ostringstream& os, const Diagnostic& d){
    os<<"{"
        "\"code\":"<<json_escape(d.code)
        <<",\"message\":"<<json_escape(d.message)
        <<",\"hint\":"<<json_escape(d.hint)
        <<",\"agent\":"<<json_escape(d.agent)
        <<",\"line\":"<<d.line
        <<",\"col\":"<<d.col
        <<"}";
}

std::string diagnostics_to_json(const std::vector<Diagnostic>& diags){
    std::ostringstream os;
    bool success = true;
    for(const auto& d : diags) if(d.severity==Severity::Error) success = false;
    os<<"{\"success\":"<<(success?"true":"false")<<",\"errors\":[";
    bool first = true;
    for(const auto& d : diags){
        if(d.severity!=Severity::Error) continue;
        if(!first) os<<","; first = false;
        append_entry(os, d);
    }
    os<<"],\"warnings\":[";
    first = true;
    for(const auto& d : diags){
        if(d.severity!=Severity::Warning) continue;
        if(!first) os<<","; first = false;
        append_entry(os, d);
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const DiagnosticSink& sink, const RuntimeEnv& env){
    if(env.diagJson){
        auto js = diagnostics_to_json(sink.snapshot());
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace komrad
