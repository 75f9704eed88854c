#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include "komrad/diagnostics_json.hpp"
#include "komrad/parser.hpp"
#include "komrad/runtime.hpp"

using namespace komrad;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path, std::ios::binary); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: komrad_driver <file> [--timeout-ms N] [--dump-ast]\n"; return 1; }
    std::string file = argv[1];
    long timeoutMs = 10000; bool dumpAst = false;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a=="--dump-ast") dumpAst = true;
        else if(a=="--timeout-ms" && i+1<argc){
            char* end = nullptr; timeoutMs = std::strtol(argv[++i], &end, 10);
            if(!end || *end!='\0' || timeoutMs<=0){ std::cerr << "invalid --timeout-ms value\n"; return 1; }
        }
        else { std::cerr << "unknown option: " << a << "\n"; return 1; }
    }
    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read file: " << file << "\n"; return 1; }

    RuntimeEnv env = detect_env();
    Parser parser;
    auto res = parser.parse_string(src, file);
    if(!res.success){
        std::cerr << file << ":" << res.line << ":" << res.column << ": error: " << res.detail << "\n";
        if(env.diagJson){
            Diagnostic d; d.code = codes::Parse; d.message = res.error_message; d.line = res.line; d.col = res.column;
            std::cerr << diagnostics_to_json({d}) << "\n";
        }
        return 1;
    }
    if(dumpAst){ std::cout << to_string(*res.program) << "\n"; return 0; }

    Runtime rt(env);
    try {
        rt.load(res.program);
    } catch(const eval_error& e){
        std::cerr << file << ": error[" << e.code << "]: " << e.what() << "\n";
        return 2;
    }
    bool idle = rt.wait_idle(std::chrono::milliseconds(timeoutMs));
    rt.shutdown();
    maybe_print_json(rt.diagnostics(), rt.env());
    if(!idle){ std::cerr << "Hang detected: program still busy after " << timeoutMs << " ms; stopping.\n"; return 124; }
    return rt.diagnostics().has_errors() ? 2 : 0;
}
