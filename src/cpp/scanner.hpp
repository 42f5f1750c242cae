#pragma once
#include <vector>
#include <string_view>
#include <string>
#include <cstdint>
#include "matcher.hpp"

namespace dotstar {

/**
 * @brief A window of the text that fully matches the pattern.
 *
 * Positions count code points, not bytes, so a window over "café" ending
 * after the 'é' has end == 4.
 */
struct Match {
    uint64_t start;    /**< First code point of the window (inclusive) */
    uint64_t end;      /**< One past the last code point of the window (exclusive) */
    std::string text;  /**< UTF-8 encoding of the window */
};

inline bool operator==(const Match& a, const Match& b) {
    return a.start == b.start && a.end == b.end && a.text == b.text;
}

/**
 * @brief Finds every window of a text that fully matches a pattern.
 *
 * Tests every pair 0 <= start <= end <= length of the text, so overlapping
 * and nested windows are all reported. This is exhaustive enumeration, not
 * leftmost-longest search: "a*" over "aa" yields six windows.
 *
 * @param pattern UTF-8 pattern
 * @param text UTF-8 text
 * @return Matches ordered by start, then by end
 *
 * @note O(n^2) windows, each matched independently
 * @see count_matches() when only the number of windows is needed
 */
std::vector<Match> find_all(std::string_view pattern, std::string_view text);

/// find_all() over an already compiled pattern and decoded text.
std::vector<Match> find_all(const Pattern& pattern, std::u32string_view text);

/**
 * @brief Counts the windows find_all() would return, without building them.
 *
 * @param pattern UTF-8 pattern
 * @param text UTF-8 text
 * @return Number of matching windows
 */
size_t count_matches(std::string_view pattern, std::string_view text);
size_t count_matches(const Pattern& pattern, std::u32string_view text);

// File-based scanning

/**
 * @brief Finds every matching window in the contents of a file.
 *
 * The file is read fully into memory first; gzip-compressed files are
 * decompressed transparently.
 *
 * @param pattern UTF-8 pattern
 * @param path Path to the input file
 * @param reserve_hint Optional hint for reserving space in the output vector (0 = no hint)
 * @return Matches ordered by start, then by end
 * @throws std::runtime_error If the file cannot be read
 */
std::vector<Match> find_all_file(std::string_view pattern, const std::string& path, size_t reserve_hint = 0);
std::vector<Match> find_all_file(const Pattern& pattern, const std::string& path, size_t reserve_hint = 0);

/**
 * @brief Counts matching windows in the contents of a file.
 *
 * @throws std::runtime_error If the file cannot be read
 */
size_t count_matches_file(std::string_view pattern, const std::string& path);
size_t count_matches_file(const Pattern& pattern, const std::string& path);

/**
 * @brief Scans a file and writes the matching windows to a binary file.
 *
 * @param pattern UTF-8 pattern
 * @param in_path Path to the input file (plain or gzipped)
 * @param out_path Path to the output file
 * @return Number of matches written
 * @throws std::runtime_error If either file cannot be opened or the write fails
 *
 * @note Binary format: each match is 16 bytes (2 × uint64_t: start, end), host byte order
 * @warning This function overwrites the output file if it exists
 */
size_t write_matches_binary_file(std::string_view pattern, const std::string& in_path, const std::string& out_path);
size_t write_matches_binary_file(const Pattern& pattern, const std::string& in_path, const std::string& out_path);

} // namespace dotstar
