/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Every test file registers its cases through TEST(); this file only
 * hands control to the runner.
 *
 * Build: cmake --build . --target overlay_tests
 * Run:   ./overlay_tests
 */

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
