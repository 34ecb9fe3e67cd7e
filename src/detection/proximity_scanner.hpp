#ifndef PIIGUARD_DETECTION_PROXIMITY_SCANNER_HPP
#define PIIGUARD_DETECTION_PROXIMITY_SCANNER_HPP

#include <string>
#include <vector>
#include "detection/match.hpp"
#include "detection/span.hpp"
#include "detection/rule.hpp"
#include "detection/validators.hpp"
#include "util/logger.hpp"

/**
 * @file proximity_scanner.hpp
 * @brief Keyword-anchored detection of loosely shaped numbers.
 *
 * A bare 10-14 digit run is too weak a signal on its own. It is only reported when
 * it sits within a window that starts right after an anchor keyword such as
 * "account" or "계좌". The window is a search range over the full text, not a copy:
 * \b sees the codepoint before the window, and the window end acts as end of input.
 *
 * Each anchor opens its own window; overlapping windows may report the same number
 * twice and the resolver keeps one.
 */

namespace piiguard {
namespace detection {

/**
 * @brief Anchor and number patterns used by both the ProximityScanner and the
 *        Redactor's account pass.
 */
struct ProximityPatterns
{
    static const Pattern& accountKeyword()
    {
        static const Pattern re(L"(계좌|account|입금|송금|bank)", UREGEX_CASE_INSENSITIVE);
        return re;
    }

    static const Pattern& accountNumber()
    {
        static const Pattern re(LR"(\b\d{10,14}\b|\b\d{2,6}\-\d{2,6}\-\d{2,6}\b)");
        return re;
    }

    static const Pattern& corporateKeyword()
    {
        static const Pattern re(LR"((법인등록번호|법인번호|corporate\s*registration))", UREGEX_CASE_INSENSITIVE);
        return re;
    }

    static const Pattern& corporateNumber()
    {
        static const Pattern re(LR"(\b\d{6}[\-\s]?\d{7}\b)");
        return re;
    }
};

/**
 * @brief End of the window of @p window codepoints that opens at @p anchorEnd,
 *        clamped to @p textSize without overflowing.
 */
inline size_t windowEnd(size_t anchorEnd, size_t window, size_t textSize)
{
    if (anchorEnd >= textSize || window >= textSize - anchorEnd) {
        return textSize;
    }
    return anchorEnd + window;
}

class ProximityScanner
{
public:
    static constexpr size_t kCorporateWindow = 50;

    /**
     * @param window codepoints searched after the end of each anchor
     */
    explicit ProximityScanner(size_t window = 50)
        : window_(window)
    {
    }

    size_t window() const { return window_; }

    /**
     * @brief Account-number spans, labelled labels::kAccount.
     */
    std::vector<Span> scanAccounts(const std::wstring &text) const
    {
        std::vector<Span> spans;
        size_t anchors = 0;
        for (const Match &anchor : findAll(text, ProximityPatterns::accountKeyword())) {
            ++anchors;
            const size_t end = windowEnd(anchor.end, window_, text.size());
            for (const Match &m : findAll(text, ProximityPatterns::accountNumber(), anchor.end, end)) {
                spans.push_back(Span{labels::kAccount, m.start, m.end});
            }
        }
        piiguard::util::logger::debug("ProximityScanner: account anchors=" + std::to_string(anchors)
            + " spans=" + std::to_string(spans.size()));
        return spans;
    }

    /**
     * @brief Corporate registration numbers near a corporate keyword, labelled
     *        labels::kCorporateKeyword. Date-shaped numbers are skipped.
     */
    std::vector<Span> scanCorporate(const std::wstring &text) const
    {
        std::vector<Span> spans;
        for (const Match &anchor : findAll(text, ProximityPatterns::corporateKeyword())) {
            const size_t end = windowEnd(anchor.end, kCorporateWindow, text.size());
            for (const Match &m : findAll(text, ProximityPatterns::corporateNumber(), anchor.end, end)) {
                if (looksLikeResidentDate(m.text)) {
                    continue;
                }
                spans.push_back(Span{labels::kCorporateKeyword, m.start, m.end});
            }
        }
        piiguard::util::logger::debug("ProximityScanner: corporate keyword spans=" + std::to_string(spans.size()));
        return spans;
    }

private:
    size_t window_;
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_PROXIMITY_SCANNER_HPP
