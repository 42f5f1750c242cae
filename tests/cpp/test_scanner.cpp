#include <gtest/gtest.h>
#include <zlib.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "scanner.hpp"
#include "gzip_io.hpp"
#include "utf8.hpp"

using dotstar::Match;
using dotstar::find_all;
using dotstar::count_matches;

namespace {

bool contains_text(const std::vector<Match>& matches, const std::string& text) {
    for (const auto& m : matches) {
        if (m.text == text) return true;
    }
    return false;
}

class ScannerFileTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / (std::string("dotstar_") + info->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write_plain(const std::string& name, const std::string& contents) {
        const auto path = (dir_ / name).string();
        std::ofstream os(path, std::ios::binary);
        os << contents;
        return path;
    }

    std::string write_gzip(const std::string& name, const std::string& contents) {
        const auto path = (dir_ / name).string();
        gzFile f = gzopen(path.c_str(), "wb");
        EXPECT_NE(f, nullptr);
        EXPECT_EQ(gzwrite(f, contents.data(), static_cast<unsigned int>(contents.size())),
                  static_cast<int>(contents.size()));
        EXPECT_EQ(gzclose(f), Z_OK);
        return path;
    }
};

}

TEST(ScannerTest, FindsSeparatedMatches) {
    auto results = find_all("a.c", "abc xyz abc");
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0], (Match{0, 3, "abc"}));
    EXPECT_EQ(results[1], (Match{8, 11, "abc"}));
}

TEST(ScannerTest, RepetitionFindsEveryWindow) {
    auto results = find_all("a*b", "aab b ab");
    EXPECT_TRUE(contains_text(results, "aab"));
    EXPECT_TRUE(contains_text(results, "b"));
    EXPECT_TRUE(contains_text(results, "ab"));

    const std::vector<Match> expected = {
        {0, 3, "aab"}, {1, 3, "ab"}, {2, 3, "b"}, {4, 5, "b"}, {6, 8, "ab"}, {7, 8, "b"},
    };
    EXPECT_EQ(results, expected);
}

TEST(ScannerTest, EmptyPatternMatchesEmptyWindowAtEveryPosition) {
    for (const std::string text : {"", "x", "abc", "caf\xC3\xA9"}) {
        auto results = find_all("", text);
        const size_t length = (text == "caf\xC3\xA9") ? 4 : text.size();
        ASSERT_EQ(results.size(), length + 1) << text;
        for (size_t i = 0; i < results.size(); ++i) {
            EXPECT_EQ(results[i].start, i);
            EXPECT_EQ(results[i].end, i);
            EXPECT_TRUE(results[i].text.empty());
        }
    }
}

TEST(ScannerTest, OverlappingAndNestedWindows) {
    auto results = find_all("a*", "aa");
    const std::vector<Match> expected = {
        {0, 0, ""}, {0, 1, "a"}, {0, 2, "aa"}, {1, 1, ""}, {1, 2, "a"}, {2, 2, ""},
    };
    EXPECT_EQ(results, expected);

    // every window of "abc" matches ".*"
    EXPECT_EQ(find_all(".*", "abc").size(), 10u);
}

TEST(ScannerTest, ResultsAreOrderedByStartThenEnd) {
    auto results = find_all(".*a.*", "banana bandana");
    ASSERT_FALSE(results.empty());
    for (size_t i = 1; i < results.size(); ++i) {
        const auto& prev = results[i - 1];
        const auto& cur = results[i];
        EXPECT_TRUE(prev.start < cur.start || (prev.start == cur.start && prev.end < cur.end)) << i;
    }
}

TEST(ScannerTest, NoMatches) {
    EXPECT_TRUE(find_all("xyz", "abc").empty());
    EXPECT_TRUE(find_all("a", "").empty());
}

TEST(ScannerTest, PositionsCountCodePoints) {
    auto results = find_all("\xC3\xA9.", "caf\xC3\xA9s caf\xC3\xA9!");
    const std::vector<Match> expected = {
        {3, 5, "\xC3\xA9s"}, {9, 11, "\xC3\xA9!"},
    };
    EXPECT_EQ(results, expected);
}

TEST(ScannerTest, CountMatchesAgreesWithFindAll) {
    const std::pair<const char*, const char*> cases[] = {
        {"a.c", "abc xyz abc"}, {"a*b", "aab b ab"}, {"", "hello"}, {".*", "abcd"}, {"q", "abc"},
    };
    for (const auto& [pattern, text] : cases) {
        EXPECT_EQ(count_matches(pattern, text), find_all(pattern, text).size()) << pattern;
    }
}

TEST(ScannerTest, CompiledPatternKeepsLoneSurrogates) {
    const char32_t surrogate = 0xD800;
    const std::u32string text = {U'x', surrogate, U'y'};

    auto results = find_all(dotstar::Pattern::compile(std::u32string{U'x', surrogate}), text);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].start, 0u);
    EXPECT_EQ(results[0].end, 2u);

    EXPECT_EQ(count_matches(dotstar::Pattern::compile(U"."), text), 3u);
    EXPECT_TRUE(dotstar::is_match(dotstar::Pattern::compile(std::u32string{surrogate}), std::u32string{surrogate}));
}

TEST_F(ScannerFileTest, PlainAndGzipFilesGiveSameResults) {
    const std::string contents = "abc xyz abc\naxc";
    const auto plain = write_plain("input.txt", contents);
    const auto gz = write_gzip("input.txt.gz", contents);

    EXPECT_FALSE(dotstar::is_gzipped_file(plain));
    EXPECT_TRUE(dotstar::is_gzipped_file(gz));
    EXPECT_EQ(dotstar::read_text_file(gz), contents);

    const auto expected = find_all("a.c", contents);
    ASSERT_EQ(expected.size(), 3u);
    EXPECT_EQ(dotstar::find_all_file("a.c", plain), expected);
    EXPECT_EQ(dotstar::find_all_file("a.c", gz, 16), expected);
    EXPECT_EQ(dotstar::count_matches_file("a.c", plain), 3u);
    EXPECT_EQ(dotstar::count_matches_file("a.c", gz), 3u);
}

TEST_F(ScannerFileTest, WritesBinaryMatchRecords) {
    const auto in = write_plain("input.txt", "aab b ab");
    const auto out = (dir_ / "matches.bin").string();

    size_t n = dotstar::write_matches_binary_file("a*b", in, out);
    ASSERT_EQ(n, 6u);
    ASSERT_EQ(std::filesystem::file_size(out), n * 2 * sizeof(uint64_t));

    std::ifstream is(out, std::ios::binary);
    std::vector<uint64_t> records(n * 2);
    is.read(reinterpret_cast<char*>(records.data()), static_cast<std::streamsize>(records.size() * sizeof(uint64_t)));
    ASSERT_TRUE(is);
    const std::vector<uint64_t> expected = {0, 3, 1, 3, 2, 3, 4, 5, 6, 8, 7, 8};
    EXPECT_EQ(records, expected);
}

TEST_F(ScannerFileTest, InvalidUtf8BytesComeBackUnchanged) {
    // latin-1 "a\xE9" is not valid UTF-8
    const auto path = write_plain("latin1.txt", "a\xE9");

    auto results = dotstar::find_all_file("a.", path);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0], (Match{0, 2, "a\xE9"}));
    EXPECT_EQ(dotstar::decode_utf8(results[0].text),
              (std::u32string{U'a', dotstar::RAW_BYTE_BASE + 0xE9}));

    const auto compiled = dotstar::Pattern::compile(std::u32string{U'a', dotstar::RAW_BYTE_BASE + 0xE9});
    EXPECT_EQ(dotstar::count_matches_file(compiled, path), 1u);
}

TEST_F(ScannerFileTest, CorruptGzipIsReported) {
    // gzip magic followed by an unknown compression method
    const auto path = write_plain("broken.gz", std::string("\x1f\x8b\x07", 3) + "not compressed");
    ASSERT_TRUE(dotstar::is_gzipped_file(path));

    try {
        dotstar::read_text_file(path);
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Corrupt gzip file"), std::string::npos) << e.what();
    }
    EXPECT_THROW(dotstar::find_all_file("a", path), std::runtime_error);
}

TEST_F(ScannerFileTest, MissingInputThrows) {
    const auto missing = (dir_ / "missing.txt").string();
    EXPECT_THROW(dotstar::find_all_file("a", missing), std::runtime_error);
    EXPECT_THROW(dotstar::count_matches_file("a", missing), std::runtime_error);
    EXPECT_THROW(dotstar::write_matches_binary_file("a", missing, (dir_ / "out.bin").string()), std::runtime_error);
}

TEST_F(ScannerFileTest, UnwritableOutputThrows) {
    const auto in = write_plain("input.txt", "abc");
    const auto out = (dir_ / "no_such_dir" / "out.bin").string();
    EXPECT_THROW(dotstar::write_matches_binary_file("a", in, out), std::runtime_error);
}
