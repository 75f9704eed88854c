#include "komrad/config.hpp"
#include <cstdlib>
#include <string>
#include <thread>

namespace komrad {

RuntimeEnv detect_env(){
    RuntimeEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("KOMRAD_WORKERS")) {
        char* end = nullptr; long n = std::strtol(v, &end, 10);
        if (end && *end == '\0' && n > 0 && n <= 256) e.workers = static_cast<unsigned>(n);
    }
    if (const char* v = get("KOMRAD_REPLY_TIMEOUT_MS")) {
        char* end = nullptr; long n = std::strtol(v, &end, 10);
        if (end && *end == '\0' && n > 0) e.replyTimeout = std::chrono::milliseconds(n);
    }
    e.debug = detail::env_flag_enabled("KOMRAD_DEBUG");
    e.quiet = detail::env_flag_enabled("KOMRAD_QUIET");
    e.diagJson = detail::env_flag_enabled("KOMRAD_DIAG_JSON");
    return e;
}

unsigned effective_workers(const RuntimeEnv& e){
    if (e.workers) return e.workers;
    unsigned hw = std::thread::hardware_concurrency();
    return hw < 2 ? 2u : hw;
}

} // namespace komrad
