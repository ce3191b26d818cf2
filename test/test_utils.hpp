#pragma once

#include <filesystem>
#include <initializer_list>
#include <string>

namespace gitquery::test {

/**
 * @brief Test utilities for gitquery tests
 *
 * Helpers for building captured git output and writing it to temporary
 * files for the --file code path.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Path to temporary directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @param baseDir Base directory
 * @param filename File name
 * @param content File content
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Join lines into a git output blob, each terminated by '\n'
 *
 * Example: lines({"a", "b"}) -> "a\nb\n"
 */
std::string lines(std::initializer_list<std::string> items);

} // namespace utils

} // namespace gitquery::test
