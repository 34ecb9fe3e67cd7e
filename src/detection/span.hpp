#ifndef PIIGUARD_DETECTION_SPAN_HPP
#define PIIGUARD_DETECTION_SPAN_HPP

#include <string>
#include <vector>
#include <cstddef>

/**
 * @file span.hpp
 * @brief Detected regions of text.
 *
 * A Span is the half-open range [start, end) of codepoints attributed to one label
 * (a rule name or a proximity label). Spans are produced by the scanners, filtered by
 * the resolver and consumed by the formatter; nothing mutates them afterwards.
 */

namespace piiguard {
namespace detection {

struct Span
{
    std::string label;
    size_t start = 0;
    size_t end = 0;

    size_t length() const { return end - start; }

    bool overlaps(const Span &other) const
    {
        return start < other.end && other.start < end;
    }

    bool operator==(const Span &other) const
    {
        return label == other.label && start == other.start && end == other.end;
    }

    bool operator!=(const Span &other) const { return !(*this == other); }
};

/**
 * Spans sorted by start with no overlap and no nesting:
 * spans[i].end <= spans[i + 1].start for every adjacent pair.
 */
using ResolvedSpanSet = std::vector<Span>;

/**
 * @brief Check the ResolvedSpanSet ordering invariant (and start < end per span).
 */
inline bool isResolved(const std::vector<Span> &spans)
{
    for (size_t i = 0; i < spans.size(); ++i) {
        if (spans[i].start >= spans[i].end) {
            return false;
        }
        if (i > 0 && spans[i - 1].end > spans[i].start) {
            return false;
        }
    }
    return true;
}

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_SPAN_HPP
