/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Runs the merge engine, strategy and attribute source tests. Library
 * logging is kept at warn so debug merge traces stay out of the output.
 *
 * Build: cmake --build . --target persondir_tests
 * Run:   ./persondir_tests
 */

#include <gtest/gtest.h>
#include "persondir/Log.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    persondir::set_log_level(spdlog::level::warn);
    return RUN_ALL_TESTS();
}
