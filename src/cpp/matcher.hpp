#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>

namespace dotstar {

constexpr char32_t WILDCARD = U'.';
constexpr char32_t REPETITION_MARKER = U'*';

/**
 * @brief One positional unit of a compiled pattern.
 *
 * A unit matches a single text character: the literal `ch`, or any character
 * when `wildcard` is set. A repeated unit matches zero or more consecutive
 * such characters.
 */
struct Unit {
    char32_t ch;     /**< Literal character (WILDCARD for the wildcard unit) */
    bool wildcard;   /**< True if the unit accepts any character */
    bool repeated;   /**< True if the unit was followed by the repetition marker */

    bool accepts(char32_t c) const { return wildcard || ch == c; }
};

/**
 * @brief A pattern split into units.
 *
 * Units are read left to right. A character followed by '*' becomes one
 * repeated unit. A '*' with no preceding unit is an ordinary literal, so
 * "*a" is the literal '*' followed by the literal 'a', and "a**" is a
 * repeated 'a' followed by a literal '*'.
 */
class Pattern {
public:
    Pattern() = default;

    /**
     * @brief Splits a pattern into units.
     *
     * @param pattern Pattern code points
     * @return The compiled pattern; every input compiles
     */
    static Pattern compile(std::u32string_view pattern);

    /// UTF-8 variant of compile().
    static Pattern compile(std::string_view pattern);

    const std::vector<Unit>& units() const { return units_; }
    size_t size() const { return units_.size(); }
    bool empty() const { return units_.empty(); }

private:
    std::vector<Unit> units_;
};

/**
 * @brief Decides whether a text fully matches a pattern.
 *
 * The entire text must be consumed by the entire pattern. Repeated units
 * try consuming another character before trying zero further occurrences;
 * either choice is backtracked on failure, so the order never changes the
 * result.
 *
 * @param pattern Compiled pattern
 * @param text Text code points
 * @return true if the whole text matches the whole pattern
 *
 * @note Runs in O(units * text) time using (units+1)*(text+1) bits of state
 */
bool is_match(const Pattern& pattern, std::u32string_view text);

/**
 * @brief UTF-8 convenience overload of is_match().
 *
 * Both arguments are decoded with decode_utf8(), so the wildcard and
 * repetition operate on code points rather than bytes.
 *
 * @param pattern UTF-8 pattern
 * @param text UTF-8 text
 * @return true if the whole text matches the whole pattern
 */
bool is_match(std::string_view pattern, std::string_view text);

} // namespace dotstar
