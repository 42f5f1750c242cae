#include "scanner.hpp"
#include "matcher.hpp"
#include "utf8.hpp"
#include "gzip_io.hpp"
#include <fstream>
#include <stdexcept>
#include <utility>

namespace dotstar {

/**
 * @brief Core window enumeration.
 *
 * Visits every (start, end) window in ascending order of start, then end,
 * and hands each accepted window to the sink as (start, end, window). The
 * pattern is compiled once; every window is still matched from scratch.
 *
 * @tparam Sink Callable taking (uint64_t start, uint64_t end, std::u32string_view window)
 * @return Number of windows passed to the sink
 */
template<class Sink>
static size_t scan(const Pattern& pattern, std::u32string_view text, Sink&& sink) {
    const size_t n = text.size();
    size_t count = 0;
    for (size_t start = 0; start <= n; ++start) {
        for (size_t end = start; end <= n; ++end) {
            auto window = text.substr(start, end - start);
            if (is_match(pattern, window)) {
                sink(static_cast<uint64_t>(start), static_cast<uint64_t>(end), window);
                ++count;
            }
        }
    }
    return count;
}

/**
 * @brief Enumerates matching windows of an in-memory text.
 *
 * @tparam Sink Callable taking (uint64_t start, uint64_t end, std::u32string_view window)
 * @param pattern Compiled pattern
 * @param text Text code points
 * @param sink Callable that receives each matching window
 * @return Number of windows passed to the sink
 *
 * @see find_all() for the version that collects Match objects
 */
template<class Sink>
size_t find_all_stream(const Pattern& pattern, std::u32string_view text, Sink&& sink) {
    return scan(pattern, text, std::forward<Sink>(sink));
}

/**
 * @brief Enumerates matching windows of a file's contents.
 *
 * The file is read fully into memory and decoded as UTF-8; malformed bytes
 * become U+DC80..U+DCFF characters and come back out unchanged in Match::text.
 *
 * @tparam Sink Callable taking (uint64_t start, uint64_t end, std::u32string_view window)
 * @param pattern Compiled pattern
 * @param path Path to a plain or gzipped input file
 * @param sink Callable that receives each matching window
 * @return Number of windows passed to the sink
 * @throws std::runtime_error If the file cannot be read
 *
 * @see find_all_file() for the version that collects Match objects
 */
template<class Sink>
size_t find_all_file_stream(const Pattern& pattern, const std::string& path, Sink&& sink) {
    const std::u32string contents = decode_utf8(read_text_file(path));
    return find_all_stream(pattern, contents, std::forward<Sink>(sink));
}

std::vector<Match> find_all(const Pattern& pattern, std::u32string_view text) {
    std::vector<Match> out;
    find_all_stream(pattern, text, [&](uint64_t start, uint64_t end, std::u32string_view window) {
        out.push_back(Match{start, end, encode_utf8(window)});
    });
    return out;
}

std::vector<Match> find_all(std::string_view pattern, std::string_view text) {
    return find_all(Pattern::compile(pattern), decode_utf8(text));
}

size_t count_matches(const Pattern& pattern, std::u32string_view text) {
    return find_all_stream(pattern, text, [](uint64_t, uint64_t, std::u32string_view) {});
}

size_t count_matches(std::string_view pattern, std::string_view text) {
    return count_matches(Pattern::compile(pattern), decode_utf8(text));
}

std::vector<Match> find_all_file(const Pattern& pattern, const std::string& path, size_t reserve_hint) {
    std::vector<Match> out;
    if (reserve_hint) out.reserve(reserve_hint);
    find_all_file_stream(pattern, path, [&](uint64_t start, uint64_t end, std::u32string_view window) {
        out.push_back(Match{start, end, encode_utf8(window)});
    });
    return out;
}

std::vector<Match> find_all_file(std::string_view pattern, const std::string& path, size_t reserve_hint) {
    return find_all_file(Pattern::compile(pattern), path, reserve_hint);
}

size_t count_matches_file(const Pattern& pattern, const std::string& path) {
    return find_all_file_stream(pattern, path, [](uint64_t, uint64_t, std::u32string_view) {});
}

size_t count_matches_file(std::string_view pattern, const std::string& path) {
    return count_matches_file(Pattern::compile(pattern), path);
}

size_t write_matches_binary_file(const Pattern& pattern, const std::string& in_path, const std::string& out_path) {
    // The buffer must outlive the stream that writes through it
    std::vector<char> buf(1<<20);
    std::ofstream os;
    os.rdbuf()->pubsetbuf(buf.data(), static_cast<std::streamsize>(buf.size()));
    os.open(out_path, std::ios::binary);
    if (!os.is_open()) {
        throw std::runtime_error("Cannot create output file: " + out_path);
    }

    size_t n = find_all_file_stream(pattern, in_path, [&](uint64_t start, uint64_t end, std::u32string_view) {
        const uint64_t record[2] = {start, end};
        os.write(reinterpret_cast<const char*>(record), sizeof(record));
    });

    os.flush();
    if (!os) {
        throw std::runtime_error("Failed to write matches to: " + out_path);
    }
    return n;
}

size_t write_matches_binary_file(std::string_view pattern, const std::string& in_path, const std::string& out_path) {
    return write_matches_binary_file(Pattern::compile(pattern), in_path, out_path);
}

} // namespace dotstar
