#include <iostream>
#include <exception>
// The assert-based smoke harness runs first, then every GoogleTest case linked into this binary.
#include <gtest/gtest.h>

void run_smoke_tests();

int main(int argc, char** argv){
    try{
        run_smoke_tests();
    }catch(const std::exception& e){ std::cerr << "[smoke] exception: " << e.what() << "\n"; return 1; }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
