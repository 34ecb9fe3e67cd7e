#ifndef PIIGUARD_DETECTION_SPAN_RESOLVER_HPP
#define PIIGUARD_DETECTION_SPAN_RESOLVER_HPP

#include <vector>
#include <algorithm>
#include "detection/span.hpp"
#include "util/logger.hpp"

/**
 * @file span_resolver.hpp
 * @brief Reduces overlapping candidate spans to a ResolvedSpanSet.
 *
 * Policy: stable sort by (start, end), then sweep left to right keeping a candidate
 * only if it starts at or after the end of the last kept span. The earliest start
 * wins, then the shortest; a later candidate that overlaps is dropped whole, even if
 * it is longer or comes from a more specific rule. Candidates with equal (start, end)
 * keep their input order, so the earlier-registered rule wins the tie.
 *
 * EXAMPLE:
 *   candidates  card[0,19)  rrn[0,14)  account[20,30)  email[25,40)
 *   resolved    rrn[0,14)   account[20,30)
 */

namespace piiguard {
namespace detection {

class SpanResolver
{
public:
    SpanResolver() = default;

    ResolvedSpanSet resolve(std::vector<Span> candidates) const
    {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const Span &a, const Span &b) {
                             if (a.start != b.start) {
                                 return a.start < b.start;
                             }
                             return a.end < b.end;
                         });

        ResolvedSpanSet resolved;
        resolved.reserve(candidates.size());
        size_t lastEnd = 0;
        for (Span &candidate : candidates) {
            if (candidate.start >= lastEnd) {
                lastEnd = candidate.end;
                resolved.push_back(std::move(candidate));
            }
        }

        piiguard::util::logger::debug("SpanResolver: candidates=" + std::to_string(candidates.size())
            + " kept=" + std::to_string(resolved.size()));
        return resolved;
    }
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_SPAN_RESOLVER_HPP
