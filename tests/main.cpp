#include <iostream>
#include "test_env.hpp"
#include <exception>
// Only GTest::gtest is linked (not gtest_main): the assert-style harness runs first, then any
// GoogleTest cases compiled into this binary.
#include <gtest/gtest.h>

void run_syntax_tests();
void run_parser_tests();
void run_json_tests();
int run_diagnostics_json_tests();
void run_config_tests();

int main(int argc, char** argv){
    try{
        run_syntax_tests();
    // Parser and lowering
    run_parser_tests();
    // JSON codec used by the Json agent
    run_json_tests();
    // Diagnostics serialization
    run_diagnostics_json_tests();
    // KOMRAD_* environment
    run_config_tests();
    }catch(const std::exception& e){ std::cerr << "[komrad] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    int gtest_result = RUN_ALL_TESTS();
    return gtest_result;
}
