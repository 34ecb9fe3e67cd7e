#ifndef PIIGUARD_UTIL_UTF8_HPP
#define PIIGUARD_UTIL_UTF8_HPP

#include <string>
#include <stdexcept>
#include <cstdint>

/**
 * @file utf8.hpp
 * @brief Conversion between UTF-8 byte strings and codepoint strings.
 *
 * Every offset the engine reports is a codepoint index into the decoded string.
 * Patterns run over std::wstring with a 32-bit wchar_t, so one element is exactly one
 * codepoint and slicing a span can never split a multi-byte character.
 *
 * USAGE:
 *   @code
 *   std::wstring text = piiguard::util::utf8::decode(bytes);
 *   // ... scan, slice ...
 *   std::string out = piiguard::util::utf8::encode(text);
 *   @endcode
 */

static_assert(sizeof(wchar_t) >= 4,
              "piiguard requires a 32-bit wchar_t so that one wchar_t holds one codepoint");

namespace piiguard {
namespace util {
namespace utf8 {

/**
 * @brief How decode() treats malformed input.
 */
enum class DecodeMode {
    Strict,  ///< throw std::runtime_error on the first malformed sequence
    Lenient  ///< drop malformed bytes and continue
};

namespace detail {

inline bool isContinuation(unsigned char c)
{
    return (c & 0xC0) == 0x80;
}

} // namespace detail

/**
 * @brief Decode UTF-8 into codepoints.
 *
 * Overlong forms, surrogates and values above U+10FFFF are malformed.
 * @throw std::runtime_error in Strict mode on malformed input.
 */
inline std::wstring decode(const std::string &bytes, DecodeMode mode = DecodeMode::Strict)
{
    std::wstring out;
    out.reserve(bytes.size());

    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);
        uint32_t cp = 0;
        size_t len = 0;
        uint32_t minValue = 0;

        if (lead < 0x80) {
            out.push_back(static_cast<wchar_t>(lead));
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2; cp = lead & 0x1F; minValue = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3; cp = lead & 0x0F; minValue = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4; cp = lead & 0x07; minValue = 0x10000;
        }

        bool valid = len != 0 && i + len <= n;
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char c = static_cast<unsigned char>(bytes[i + k]);
            if (!detail::isContinuation(c)) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (valid && (cp < minValue || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        if (!valid) {
            if (mode == DecodeMode::Strict) {
                throw std::runtime_error("utf8: malformed sequence at byte offset " + std::to_string(i));
            }
            ++i;
            continue;
        }

        out.push_back(static_cast<wchar_t>(cp));
        i += len;
    }
    return out;
}

/**
 * @brief Encode codepoints as UTF-8.
 * @throw std::runtime_error for surrogates or values outside the Unicode range.
 */
inline std::string encode(const std::wstring &text)
{
    std::string out;
    out.reserve(text.size());
    for (wchar_t wc : text) {
        uint32_t cp = static_cast<uint32_t>(wc);
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            if (cp >= 0xD800 && cp <= 0xDFFF) {
                throw std::runtime_error("utf8: cannot encode surrogate codepoint");
            }
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp <= 0x10FFFF) {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            throw std::runtime_error("utf8: codepoint out of range");
        }
    }
    return out;
}

} // namespace utf8
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_UTF8_HPP
