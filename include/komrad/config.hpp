#pragma once
#include <chrono>
#include <cstdlib>
#include <string>

namespace komrad {

// Runtime settings sourced from KOMRAD_* environment variables.
struct RuntimeEnv {
    unsigned workers = 0;                              // 0 = pick from hardware concurrency
    std::chrono::milliseconds replyTimeout{5000};     // request/reply wait limit
    bool debug = false;                                // [dbg] traces on stderr
    bool quiet = false;                                // collect diagnostics without printing
    bool diagJson = false;                             // dump diagnostics JSON at driver exit
};

namespace detail {
// Feature flags sourced from environment
inline bool env_flag_enabled(const char* name){
    const char* v = std::getenv(name);
    return v && (v[0]=='1' || v[0]=='t' || v[0]=='T' || v[0]=='y' || v[0]=='Y');
}
}

// Reads process env vars and constructs a RuntimeEnv.
RuntimeEnv detect_env();

// Number of worker threads the scheduler should start for this env.
unsigned effective_workers(const RuntimeEnv& e);

} // namespace komrad
