#ifndef PIIGUARD_DETECTION_MATCH_HPP
#define PIIGUARD_DETECTION_MATCH_HPP

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <utility>
#include <stdexcept>
#include <cstddef>
#include <cstdint>
#include <unicode/regex.h>
#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include "util/utf8.hpp"

/**
 * @file match.hpp
 * @brief Compiled patterns, pattern matches over codepoint strings, and the
 *        search/substitute loops shared by the scanners and the redactor.
 *
 * Patterns run on the ICU regex engine. Its backtracking state lives on the heap,
 * so a long run of word characters costs time, never stack. \b, \w, \d and \s are
 * Unicode-aware: Hangul is a word character and a digit glued to a Hangul particle
 * has no word boundary in front of it.
 *
 * ICU matches over UTF-16. Offsets handed back to callers are always codepoint
 * indices into the full text, even when the search ran over a sub-range.
 */

namespace piiguard {
namespace detection {

namespace detail {

/// Append one codepoint; values outside Unicode become U+FFFD.
inline void appendCodepoint(icu::UnicodeString &units, wchar_t c)
{
    uint32_t cp = static_cast<uint32_t>(c);
    units.append(static_cast<UChar32>(cp > 0x10FFFF ? 0xFFFD : cp));
}

inline icu::UnicodeString toUnicodeString(const std::wstring &text)
{
    icu::UnicodeString units;
    for (wchar_t c : text) {
        appendCodepoint(units, c);
    }
    return units;
}

/**
 * @brief UTF-16 copy of text[from, to) and, for each code unit offset, the codepoint
 *        offset into the full text (one extra entry for the end).
 */
struct Utf16Slice
{
    icu::UnicodeString units;
    std::vector<size_t> codepointAt;
};

inline Utf16Slice toUtf16(const std::wstring &text, size_t from, size_t to)
{
    Utf16Slice slice;
    slice.codepointAt.reserve(to - from + 1);
    for (size_t i = from; i < to; ++i) {
        const int32_t before = slice.units.length();
        appendCodepoint(slice.units, text[i]);
        for (int32_t u = before; u < slice.units.length(); ++u) {
            slice.codepointAt.push_back(i);
        }
    }
    slice.codepointAt.push_back(to);
    return slice;
}

inline void checkStatus(UErrorCode status, const char *what)
{
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("findAll: ") + what + ": " + u_errorName(status));
    }
}

} // namespace detail

/**
 * @brief An immutable compiled pattern. Copies share the compiled form, which ICU
 *        allows any number of threads to match with concurrently.
 */
class Pattern
{
public:
    /**
     * @param source  pattern text (ICU / Perl syntax)
     * @param flags   URegexpFlag bits, e.g. UREGEX_CASE_INSENSITIVE
     * @throw std::runtime_error if the pattern does not compile
     */
    explicit Pattern(std::wstring source, uint32_t flags = 0)
        : source_(std::move(source))
    {
        UParseError parseError;
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::RegexPattern> compiled(
            icu::RegexPattern::compile(detail::toUnicodeString(source_), flags, parseError, status));
        if (U_FAILURE(status) || !compiled) {
            throw std::runtime_error("Pattern: cannot compile '" + piiguard::util::utf8::encode(source_)
                + "': " + u_errorName(status) + " at offset " + std::to_string(parseError.offset));
        }
        compiled_ = std::shared_ptr<const icu::RegexPattern>(compiled.release());
    }

    const std::wstring& source() const { return source_; }

    /**
     * @brief A fresh matcher over @p input. @p input must outlive the matcher.
     * @throw std::runtime_error if ICU cannot create it
     */
    std::unique_ptr<icu::RegexMatcher> matcher(const icu::UnicodeString &input) const
    {
        UErrorCode status = U_ZERO_ERROR;
        std::unique_ptr<icu::RegexMatcher> m(compiled_->matcher(input, status));
        if (U_FAILURE(status) || !m) {
            throw std::runtime_error(std::string("Pattern: cannot create matcher: ") + u_errorName(status));
        }
        // 0 = no cap on the heap backtrack stack
        m->setStackLimit(0, status);
        if (U_FAILURE(status)) {
            throw std::runtime_error(std::string("Pattern: cannot lift stack limit: ") + u_errorName(status));
        }
        return m;
    }

private:
    std::wstring source_;
    std::shared_ptr<const icu::RegexPattern> compiled_;
};

struct Match
{
    std::wstring text;
    size_t start = 0;
    size_t end = 0;
    /// Capture groups 1..n; an unmatched group is an empty string.
    std::vector<std::wstring> groups;

    /// Group i (1-based), empty when out of range.
    std::wstring group(size_t i) const
    {
        return (i >= 1 && i <= groups.size()) ? groups[i - 1] : std::wstring();
    }
};

/**
 * @brief Every non-overlapping leftmost match of @p pattern within text[begin, end).
 *
 * The range end behaves as the end of input. The codepoint before @p begin, when
 * there is one, is visible to \b at the first position.
 * @throw std::runtime_error on an ICU matching failure
 */
inline std::vector<Match> findAll(const std::wstring &text, const Pattern &pattern,
                                  size_t begin = 0, size_t end = std::wstring::npos)
{
    std::vector<Match> out;
    if (end > text.size()) {
        end = text.size();
    }
    if (begin >= end) {
        return out;
    }

    // one codepoint of left context, searched through a transparent region bound
    const size_t from = begin > 0 ? begin - 1 : 0;
    const detail::Utf16Slice slice = detail::toUtf16(text, from, end);
    const int32_t regionStart = begin == from ? 0 : slice.units.moveIndex32(0, 1);

    std::unique_ptr<icu::RegexMatcher> m = pattern.matcher(slice.units);
    UErrorCode status = U_ZERO_ERROR;
    m->region(regionStart, slice.units.length(), status);
    detail::checkStatus(status, "region");
    m->useTransparentBounds(true);
    m->useAnchoringBounds(false);

    const int32_t groupCount = m->groupCount();
    while (m->find(status)) {
        const size_t s = slice.codepointAt[static_cast<size_t>(m->start(status))];
        const size_t e = slice.codepointAt[static_cast<size_t>(m->end(status))];
        if (e == s) {
            continue;
        }
        Match match;
        match.start = s;
        match.end = e;
        match.text = text.substr(s, e - s);
        for (int32_t g = 1; g <= groupCount; ++g) {
            int32_t gs = m->start(g, status);
            if (gs < 0) {
                match.groups.emplace_back();
                continue;
            }
            size_t cs = slice.codepointAt[static_cast<size_t>(gs)];
            size_t ce = slice.codepointAt[static_cast<size_t>(m->end(g, status))];
            match.groups.push_back(text.substr(cs, ce - cs));
        }
        out.push_back(std::move(match));
    }
    detail::checkStatus(status, "find");
    return out;
}

/**
 * @brief Replace every match of @p pattern in @p text with @p render(match).
 *
 * The whole string is the search range; a renderer that returns match.text leaves
 * that occurrence untouched.
 */
inline std::wstring substitute(const std::wstring &text, const Pattern &pattern,
                               const std::function<std::wstring(const Match&)> &render)
{
    std::wstring out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (const Match &m : findAll(text, pattern)) {
        out.append(text, cursor, m.start - cursor);
        out += render(m);
        cursor = m.end;
    }
    out.append(text, cursor, std::wstring::npos);
    return out;
}

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_MATCH_HPP
