#include <gtest/gtest.h>

/**
 * @brief Main entry point for gitquery unit tests
 *
 * All test files are automatically registered with GoogleTest.
 * Run with: ./gitquery_tests
 *
 * Or with CMake CTest: ctest --output-on-failure
 * Set GITQUERY_LOG=debug to see which lines the decoders skip.
 */

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
