#include "utf8.hpp"

namespace dotstar {

static bool is_continuation(unsigned char b, unsigned char lo = 0x80, unsigned char hi = 0xBF) {
    return b >= lo && b <= hi;
}

/**
 * @brief Measures the well-formed sequence starting at bytes[i].
 *
 * Follows the table of well-formed byte sequences in the Unicode standard,
 * which rules out overlong forms, surrogates and values above U+10FFFF.
 *
 * @return Sequence length in bytes, or 0 if bytes[i] does not start one
 */
static size_t sequence_length(std::string_view bytes, size_t i) {
    const auto b0 = static_cast<unsigned char>(bytes[i]);
    const size_t remaining = bytes.size() - i;
    auto at = [&](size_t k) { return static_cast<unsigned char>(bytes[i + k]); };

    if (b0 < 0x80) return 1;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        return (remaining >= 2 && is_continuation(at(1))) ? 2 : 0;
    }
    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (remaining < 3) return 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
        return (is_continuation(at(1), lo, hi) && is_continuation(at(2))) ? 3 : 0;
    }
    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (remaining < 4) return 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
        return (is_continuation(at(1), lo, hi) && is_continuation(at(2)) && is_continuation(at(3))) ? 4 : 0;
    }
    return 0;
}

std::u32string decode_utf8(std::string_view bytes) {
    std::u32string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const auto b0 = static_cast<unsigned char>(bytes[i]);
        const size_t len = sequence_length(bytes, i);
        char32_t cp;
        switch (len) {
            case 1:
                cp = b0;
                break;
            case 2:
                cp = (char32_t(b0 & 0x1F) << 6) | (static_cast<unsigned char>(bytes[i + 1]) & 0x3F);
                break;
            case 3:
                cp = (char32_t(b0 & 0x0F) << 12)
                   | (char32_t(static_cast<unsigned char>(bytes[i + 1]) & 0x3F) << 6)
                   | (static_cast<unsigned char>(bytes[i + 2]) & 0x3F);
                break;
            case 4:
                cp = (char32_t(b0 & 0x07) << 18)
                   | (char32_t(static_cast<unsigned char>(bytes[i + 1]) & 0x3F) << 12)
                   | (char32_t(static_cast<unsigned char>(bytes[i + 2]) & 0x3F) << 6)
                   | (static_cast<unsigned char>(bytes[i + 3]) & 0x3F);
                break;
            default:
                // Malformed: carry the lone byte and resynchronize on the next one
                out.push_back(RAW_BYTE_BASE + b0);
                ++i;
                continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string encode_utf8(std::u32string_view text) {
    std::string out;
    out.reserve(text.size());

    for (char32_t cp : text) {
        if (cp >= RAW_BYTE_BASE + 0x80 && cp <= RAW_BYTE_BASE + 0xFF) {
            out.push_back(static_cast<char>(cp - RAW_BYTE_BASE));
        } else if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

} // namespace dotstar
