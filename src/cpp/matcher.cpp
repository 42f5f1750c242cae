#include "matcher.hpp"
#include "utf8.hpp"
#include <sdsl/int_vector.hpp>
#include <utility>

namespace dotstar {

Pattern Pattern::compile(std::u32string_view pattern) {
    Pattern out;
    out.units_.reserve(pattern.size());
    for (size_t i = 0; i < pattern.size(); ++i) {
        const char32_t c = pattern[i];
        const bool repeated = i + 1 < pattern.size() && pattern[i + 1] == REPETITION_MARKER;
        out.units_.push_back(Unit{c, c == WILDCARD, repeated});
        if (repeated) ++i;
    }
    return out;
}

Pattern Pattern::compile(std::string_view pattern) {
    return compile(decode_utf8(pattern));
}

/**
 * Depth-first search over (unit, text position) states. A state (p, t) means
 * units[p..] still have to match text[t..]. The search succeeds on reaching
 * (units, text.size()). Since success ends the search, a state seen a second
 * time is known not to lead to success, so each state is expanded once.
 */
bool is_match(const Pattern& pattern, std::u32string_view text) {
    const auto& units = pattern.units();
    const size_t m = units.size();
    const size_t n = text.size();
    const size_t cols = n + 1;

    sdsl::bit_vector visited((m + 1) * cols, 0);
    std::vector<std::pair<size_t, size_t>> pending;
    pending.emplace_back(0, 0);

    while (!pending.empty()) {
        const auto [p, t] = pending.back();
        pending.pop_back();

        const size_t state = p * cols + t;
        if (visited[state]) continue;
        visited[state] = 1;

        if (p == m) {
            if (t == n) return true;
            continue;
        }

        const Unit& unit = units[p];
        const bool consumes = t < n && unit.accepts(text[t]);
        if (unit.repeated) {
            // LIFO: push zero-occurrence first so another occurrence is tried first
            pending.emplace_back(p + 1, t);
            if (consumes) pending.emplace_back(p, t + 1);
        } else if (consumes) {
            pending.emplace_back(p + 1, t + 1);
        }
    }
    return false;
}

bool is_match(std::string_view pattern, std::string_view text) {
    return is_match(Pattern::compile(pattern), decode_utf8(text));
}

} // namespace dotstar
