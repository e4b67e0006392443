/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Each test file registers its tests through TEST(); this file only runs them.
 *
 * Build: cmake --build . --target recon_tests
 * Run:   ./recon_tests
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
