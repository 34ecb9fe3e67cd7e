#ifndef PIIGUARD_DETECTION_PRIMARY_SCANNER_HPP
#define PIIGUARD_DETECTION_PRIMARY_SCANNER_HPP

#include <string>
#include <vector>
#include "detection/rule.hpp"
#include "detection/span.hpp"
#include "util/thread_pool.hpp"
#include "util/logger.hpp"

/**
 * @file primary_scanner.hpp
 * @brief Applies each enabled rule's pattern to the whole text and keeps the matches
 *        its validator accepts.
 *
 * Matches from different rules may overlap; the SpanResolver sorts that out.
 * Output order is rule order, then position within a rule, whether or not a pool is
 * used, which keeps the resolver's tie-break deterministic.
 */

namespace piiguard {
namespace detection {

class PrimaryScanner
{
public:
    PrimaryScanner() = default;

    /**
     * @brief Spans of one rule over @p text.
     */
    std::vector<Span> scanRule(const std::wstring &text, const Rule &rule) const
    {
        std::vector<Span> spans;
        size_t rejected = 0;
        for (const Match &m : findAll(text, rule.pattern())) {
            if (!rule.accepts(m)) {
                ++rejected;
                continue;
            }
            spans.push_back(Span{rule.name(), m.start, m.end});
        }
        if (piiguard::util::logger::isEnabled(piiguard::util::logger::LogLevel::DEBUG)) {
            piiguard::util::logger::debug("PrimaryScanner: rule=" + rule.name()
                + " accepted=" + std::to_string(spans.size())
                + " rejected=" + std::to_string(rejected));
        }
        return spans;
    }

    /**
     * @brief Spans of every rule in @p rules. When @p pool is non-null each rule is
     *        scanned on its own pool slot.
     */
    std::vector<Span> scan(const std::wstring &text, const RuleSet &rules,
                           piiguard::util::ThreadPool *pool = nullptr) const
    {
        std::vector<Span> spans;
        if (pool == nullptr || rules.size() < 2) {
            for (const Rule *rule : rules) {
                auto ruleSpans = scanRule(text, *rule);
                spans.insert(spans.end(), ruleSpans.begin(), ruleSpans.end());
            }
            return spans;
        }

        // results come back in rule order; map rethrows the first rule's exception
        std::vector<std::vector<Span>> perRule = pool->map<std::vector<Span>>(
            rules.size(), [this, &text, &rules](size_t i) { return scanRule(text, *rules[i]); });
        for (const auto &ruleSpans : perRule) {
            spans.insert(spans.end(), ruleSpans.begin(), ruleSpans.end());
        }
        return spans;
    }
};

} // namespace detection
} // namespace piiguard

#endif // PIIGUARD_DETECTION_PRIMARY_SCANNER_HPP
