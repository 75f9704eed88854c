#include <cassert>
#include <iostream>
#include "komrad/config.hpp"
#include "test_env.hpp"

using namespace komrad;

static void test_defaults(){
    ScopedEnv w("KOMRAD_WORKERS", nullptr), t("KOMRAD_REPLY_TIMEOUT_MS", nullptr), d("KOMRAD_DEBUG", nullptr),
              q("KOMRAD_QUIET", nullptr), j("KOMRAD_DIAG_JSON", nullptr);
    auto e = detect_env();
    assert(e.workers == 0);
    assert(e.replyTimeout.count() == 5000);
    assert(!e.debug && !e.quiet && !e.diagJson);
    assert(effective_workers(e) >= 2);
}

static void test_overrides(){
    ScopedEnv w("KOMRAD_WORKERS", "3"), t("KOMRAD_REPLY_TIMEOUT_MS", "250"), q("KOMRAD_QUIET", "1"), j("KOMRAD_DIAG_JSON", "true");
    auto e = detect_env();
    assert(e.workers == 3);
    assert(effective_workers(e) == 3);
    assert(e.replyTimeout.count() == 250);
    assert(e.quiet && e.diagJson);
}

static void test_invalid_values_ignored(){
    ScopedEnv w("KOMRAD_WORKERS", "lots"), t("KOMRAD_REPLY_TIMEOUT_MS", "-5"), d("KOMRAD_DEBUG", "0");
    auto e = detect_env();
    assert(e.workers == 0);
    assert(e.replyTimeout.count() == 5000);
    assert(!e.debug);
}

void run_config_tests(){
    std::cout << "[komrad] config tests...\n";
    test_defaults();
    test_overrides();
    test_invalid_values_ignored();
    std::cout << "[komrad] config tests passed\n";
}
