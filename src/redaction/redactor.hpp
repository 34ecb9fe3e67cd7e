#ifndef PIIGUARD_REDACTION_REDACTOR_HPP
#define PIIGUARD_REDACTION_REDACTOR_HPP

#include <string>
#include <vector>
#include "detection/match.hpp"
#include "detection/rule.hpp"
#include "detection/mask_renderer.hpp"
#include "detection/proximity_scanner.hpp"
#include "util/logger.hpp"

/**
 * @file redactor.hpp
 * @brief Produces the fully masked copy of a text.
 *
 * The redactor does not consume the resolver's span set. It runs rule by rule in
 * registration order, each pass substituting every accepted match of the text left
 * by the previous pass, and then runs the account pass. Consequences:
 *   - a later rule sees earlier mask tokens, not the original text;
 *   - where two rules overlap, the earlier rule's token wins the region, which can
 *     differ from the label detection reports for it.
 *
 * Account pass: find an anchor, keep everything up to and including it, mask every
 * account-shaped number inside the following window, resume searching for anchors
 * at the window end. The window is masked as an isolated slice, so \b treats both
 * window edges as text boundaries, and an anchor inside a processed window does not
 * open a new one.
 *
 * USAGE:
 *   @code
 *   piiguard::redaction::Redactor redactor(50);
 *   std::wstring out = redactor.redact(text, registry.all(), true);
 *   @endcode
 */

namespace piiguard {
namespace redaction {

class Redactor
{
public:
    explicit Redactor(size_t window = 50)
        : window_(window)
    {
    }

    size_t window() const { return window_; }

    /**
     * @brief Sequential rule substitution; rules without a mask format are skipped.
     */
    std::wstring applyRules(const std::wstring &text, const detection::RuleSet &rules) const
    {
        std::wstring out = text;
        for (const detection::Rule *rule : rules) {
            if (!rule->hasMask()) {
                continue;
            }
            size_t masked = 0;
            out = detection::substitute(out, rule->pattern(),
                [rule, &masked](const detection::Match &m) {
                    std::wstring token = rule->render(m);
                    if (token != m.text) {
                        ++masked;
                    }
                    return token;
                });
            piiguard::util::logger::debug("Redactor: rule=" + rule->name()
                + " masked=" + std::to_string(masked));
        }
        return out;
    }

    /**
     * @brief The keyword-anchored account pass.
     */
    std::wstring maskAccounts(const std::wstring &text) const
    {
        const detection::Pattern &number = detection::ProximityPatterns::accountNumber();
        // keywords never overlap one another, so the first anchor at or after the
        // cursor is the one a fresh search from the cursor would find
        const std::vector<detection::Match> anchors =
            detection::findAll(text, detection::ProximityPatterns::accountKeyword());

        std::wstring out;
        out.reserve(text.size());
        size_t cursor = 0;
        size_t windows = 0;
        for (const detection::Match &anchor : anchors) {
            if (anchor.start < cursor) {
                continue;
            }
            out.append(text, cursor, anchor.end - cursor);

            const size_t end = detection::windowEnd(anchor.end, window_, text.size());
            const std::wstring slice = text.substr(anchor.end, end - anchor.end);
            out += detection::substitute(slice, number, [](const detection::Match &m) {
                return detection::maskAccount(m);
            });
            cursor = end;
            ++windows;
        }
        if (cursor < text.size()) {
            out.append(text, cursor, std::wstring::npos);
        }

        piiguard::util::logger::debug("Redactor: account windows=" + std::to_string(windows));
        return out;
    }

    std::wstring redact(const std::wstring &text, const detection::RuleSet &rules,
                        bool accountProximity) const
    {
        std::wstring out = applyRules(text, rules);
        if (accountProximity) {
            out = maskAccounts(out);
        }
        return out;
    }

private:
    size_t window_;
};

} // namespace redaction
} // namespace piiguard

#endif // PIIGUARD_REDACTION_REDACTOR_HPP
