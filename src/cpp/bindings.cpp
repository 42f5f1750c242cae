/**
 * @file bindings.cpp
 * @brief Python bindings for the dotstar pattern matching library.
 *
 * Patterns are made of literal characters, the '.' wildcard and the postfix
 * '*' repetition operator. Python str arguments are matched per code point,
 * lone surrogates included, and file contents that are not valid UTF-8 come
 * back with each stray byte as a surrogateescape code point.
 *
 * The module exposes the following functions:
 * - is_match(): Full-string match of a text against a pattern
 * - find_all(): Every matching window of a text
 * - count_matches(): Number of matching windows
 * - find_all_file(): Every matching window of a file's contents
 * - count_matches_file(): Number of matching windows in a file
 * - write_matches_binary_file(): Write matching windows of a file to a binary file
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <string_view>
#include "matcher.hpp"
#include "scanner.hpp"
#include "utf8.hpp"
#include "version.hpp"

namespace py = pybind11;

/**
 * @brief Copies a Python str into code points.
 *
 * Works on the code points directly rather than through UTF-8, so strings
 * holding lone surrogates (such as those produced by surrogateescape) are
 * accepted unchanged.
 */
static std::u32string to_code_points(const py::str& s) {
    const Py_ssize_t len = PyUnicode_GetLength(s.ptr());
    if (len < 0) throw py::error_already_set();
    std::u32string out(static_cast<size_t>(len), U'\0');
    if (len > 0 && PyUnicode_AsUCS4(s.ptr(), reinterpret_cast<Py_UCS4*>(&out[0]), len, 0) == nullptr) {
        throw py::error_already_set();
    }
    return out;
}

/**
 * @brief Builds a Python str from code points.
 *
 * Raw bytes carried as U+DC80..U+DCFF come out as the same lone surrogates
 * Python's surrogateescape error handler produces.
 */
static py::str to_py_str(std::u32string_view s) {
    PyObject* obj = PyUnicode_FromKindAndData(PyUnicode_4BYTE_KIND, s.data(), static_cast<Py_ssize_t>(s.size()));
    if (obj == nullptr) throw py::error_already_set();
    return py::reinterpret_steal<py::str>(obj);
}

/// Match::text holds UTF-8 with raw bytes restored; decode it the same way.
static py::str match_text(const dotstar::Match& match) {
    return to_py_str(dotstar::decode_utf8(match.text));
}

static py::list to_tuples(const std::vector<dotstar::Match>& matches) {
    py::list out;
    for (auto& m : matches) out.append(py::make_tuple(m.start, m.end, match_text(m)));
    return out;
}

PYBIND11_MODULE(_dotstar, m) {
    m.doc() = "Minimal pattern matching with literals, '.' and '*'\n\n"
              "Matching is full-string and works on Unicode code points.";

    py::class_<dotstar::Match>(m, "Match", "A window of the text that fully matches the pattern")
        .def_readonly("start", &dotstar::Match::start, "First code point of the window (inclusive)")
        .def_readonly("end", &dotstar::Match::end, "One past the last code point of the window (exclusive)")
        .def_property_readonly("text", &match_text, "The matched substring")
        .def("__repr__", [](const dotstar::Match& match) {
            return py::str("Match(start={}, end={}, text={!r})").format(match.start, match.end, match_text(match));
        });

    m.def("is_match", [](const py::str& pattern, const py::str& text) {
        const auto compiled = dotstar::Pattern::compile(to_code_points(pattern));
        const std::u32string chars = to_code_points(text);
        py::gil_scoped_release release;
        return dotstar::is_match(compiled, chars);
    }, py::arg("pattern"), py::arg("text"), R"doc(Check whether text fully matches pattern.

Rules:
    - literal characters must match exactly
    - '.' matches any single character
    - '*' means zero or more of the preceding character
    - a leading '*' is an ordinary character

Args:
    pattern: The pattern
    text: The text to check

Returns:
    True if the whole text matches the whole pattern
)doc");

    m.def("find_all", [](const py::str& pattern, const py::str& text) {
        const auto compiled = dotstar::Pattern::compile(to_code_points(pattern));
        const std::u32string chars = to_code_points(text);
        std::vector<dotstar::Match> matches;
        {
            py::gil_scoped_release release;
            matches = dotstar::find_all(compiled, chars);
        }
        // Slice the original code points so lone surrogates in text come back unchanged
        py::list out;
        for (auto& match : matches) {
            out.append(py::make_tuple(match.start, match.end,
                                      to_py_str(std::u32string_view(chars).substr(match.start, match.end - match.start))));
        }
        return out;
    }, py::arg("pattern"), py::arg("text"), R"doc(Find every substring of text that fully matches pattern.

Overlapping and nested windows are all included.

Args:
    pattern: The pattern
    text: The text to search

Returns:
    List of (start, end, substring) tuples ordered by start, then end.
    start is inclusive and end exclusive, both in code points.
)doc");

    m.def("count_matches", [](const py::str& pattern, const py::str& text) {
        const auto compiled = dotstar::Pattern::compile(to_code_points(pattern));
        const std::u32string chars = to_code_points(text);
        py::gil_scoped_release release;
        return dotstar::count_matches(compiled, chars);
    }, py::arg("pattern"), py::arg("text"), R"doc(Count the substrings find_all() would return.

Args:
    pattern: The pattern
    text: The text to search

Returns:
    Number of matching windows
)doc");

    m.def("find_all_file", [](const py::str& pattern, const std::string& path, size_t reserve_hint) {
        const auto compiled = dotstar::Pattern::compile(to_code_points(pattern));
        std::vector<dotstar::Match> matches;
        {
            py::gil_scoped_release release;
            matches = dotstar::find_all_file(compiled, path, reserve_hint);
        }
        return to_tuples(matches);
    }, py::arg("pattern"), py::arg("path"), py::arg("reserve_hint") = 0, R"doc(Find every matching substring in a file.

The file may be gzip-compressed; it is read fully into memory.

Args:
    pattern: The pattern
    path: Path to the input file
    reserve_hint: Optional hint for reserving space in output vector (0 = no hint)

Returns:
    List of (start, end, substring) tuples. Bytes that are not valid UTF-8
    appear in substring as lone surrogates, as with errors="surrogateescape".

Raises:
    RuntimeError: if the file cannot be read
)doc");

    m.def("count_matches_file", [](const py::str& pattern, const std::string& path) {
        const auto compiled = dotstar::Pattern::compile(to_code_points(pattern));
        py::gil_scoped_release release;
        return dotstar::count_matches_file(compiled, path);
    }, py::arg("pattern"), py::arg("path"), R"doc(Count matching substrings in a file.

Raises:
    RuntimeError: if the file cannot be read
)doc");

    m.def("write_matches_binary_file", [](const py::str& pattern, const std::string& in_path, const std::string& out_path) {
        const auto compiled = dotstar::Pattern::compile(to_code_points(pattern));
        py::gil_scoped_release release;
        return dotstar::write_matches_binary_file(compiled, in_path, out_path);
    }, py::arg("pattern"), py::arg("in_path"), py::arg("out_path"), R"doc(Write matching windows of a file to a binary file.

Args:
    pattern: The pattern
    in_path: Path to the input file
    out_path: Path to the output file

Returns:
    Number of matches written

Note:
    Binary format: each match is 16 bytes (2 × uint64_t: start, end).
    This function overwrites the output file if it exists.
)doc");

    m.attr("__version__") = std::to_string(dotstar::VERSION_MAJOR) + "." + std::to_string(dotstar::VERSION_MINOR) + "." + std::to_string(dotstar::VERSION_PATCH);
}
