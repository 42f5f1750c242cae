#pragma once
#include <string>
#include <string_view>

namespace dotstar {

/// First code point used to carry a byte that is not part of well-formed UTF-8.
constexpr char32_t RAW_BYTE_BASE = 0xDC00;

/**
 * @brief Decodes a UTF-8 byte string into code points.
 *
 * Well-formed sequences decode to their code points. Every other byte
 * (stray continuation byte, truncated or overlong sequence, encoded surrogate,
 * value above U+10FFFF) decodes on its own to RAW_BYTE_BASE + byte, so that
 * distinct malformed bytes remain distinct characters.
 *
 * @param bytes Input bytes
 * @return One char32_t per decoded character
 *
 * @note Never throws except std::bad_alloc
 * @see encode_utf8() for the inverse
 */
std::u32string decode_utf8(std::string_view bytes);

/**
 * @brief Encodes code points as UTF-8.
 *
 * Code points in U+DC80..U+DCFF are written back as the raw byte they were
 * decoded from, so encode_utf8(decode_utf8(b)) == b for any byte string b.
 *
 * @param text Code points to encode
 * @return UTF-8 byte string
 */
std::string encode_utf8(std::u32string_view text);

} // namespace dotstar
