#include <iostream>
#include <exception>
// We link GTest::gtest, not gtest_main, so the grammar smoke harness can run before the
// GoogleTest suites compiled into this binary.
#include <gtest/gtest.h>

int run_grammar_smoke_test();

int main(int argc, char** argv){
    try{
        if(int rc = run_grammar_smoke_test(); rc != 0){
            std::cerr << "[grammar] smoke test failed\n";
            return rc;
        }
    }catch(const std::exception& e){ std::cerr << "[grammar] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
