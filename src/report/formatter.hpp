#ifndef PIIGUARD_REPORT_FORMATTER_HPP
#define PIIGUARD_REPORT_FORMATTER_HPP

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <utility>
#include "detection/span.hpp"
#include "detection/rule_registry.hpp"
#include "util/utf8.hpp"

/**
 * @file formatter.hpp
 * @brief Presentation of detection results: highlight markup, a JSON span list and
 *        per-label counts.
 *
 * Span offsets are codepoints, so every function here slices the decoded text and
 * re-encodes to UTF-8 only for output.
 *
 * USAGE EXAMPLE:
 *   @code
 *   auto spans = engine.detect(text, rules, options);
 *   std::string html = piiguard::report::annotateHtml(decoded, spans, registry);
 *   std::string json = piiguard::report::spansToJson(decoded, spans, true);
 *   @endcode
 */

namespace piiguard {
namespace report {

/// (label, count) in order of first appearance.
using LabelCounts = std::vector<std::pair<std::string, size_t>>;

/**
 * @brief Escape &, < and > for inclusion in HTML text.
 */
inline std::string escapeHtml(const std::string &in)
{
    std::string out;
    out.reserve(in.size());
    for (char c : in) {
        switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;";  break;
        case '>': out += "&gt;";  break;
        default:  out.push_back(c); break;
        }
    }
    return out;
}

/**
 * @brief Escape a UTF-8 string for a JSON string literal. Non-ASCII passes through.
 */
inline std::string escapeJson(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

/**
 * @brief The text with each span wrapped in a coloured <mark> titled with the
 *        label's display name.
 */
inline std::string annotateHtml(const std::wstring &text,
                                const detection::ResolvedSpanSet &spans,
                                const detection::RuleRegistry &registry)
{
    using piiguard::util::utf8::encode;

    std::string html;
    size_t cursor = 0;
    for (const detection::Span &sp : spans) {
        html += escapeHtml(encode(text.substr(cursor, sp.start - cursor)));
        html += "<mark style=\"background:" + registry.displayTagFor(sp.label)
              + ";padding:0 .2em;border-radius:.2em\" title=\""
              + escapeHtml(registry.displayNameFor(sp.label)) + "\">";
        html += escapeHtml(encode(text.substr(sp.start, sp.end - sp.start)));
        html += "</mark>";
        cursor = sp.end;
    }
    if (cursor < text.size()) {
        html += escapeHtml(encode(text.substr(cursor)));
    }
    return html;
}

/**
 * @brief annotateHtml() inside a preformatted monospace container, ready to save as
 *        a standalone page.
 */
inline std::string annotateDocument(const std::wstring &text,
                                    const detection::ResolvedSpanSet &spans,
                                    const detection::RuleRegistry &registry)
{
    return "<div style='white-space:pre-wrap; font-family:ui-monospace, Menlo, Consolas, monospace; line-height:1.6;'>"
         + annotateHtml(text, spans, registry)
         + "</div>";
}

/**
 * @brief [{"type":..,"start":..,"end":..,"text":..}, ...] with codepoint offsets.
 * @param pretty indent by two spaces, one key per line
 */
inline std::string spansToJson(const std::wstring &text,
                               const detection::ResolvedSpanSet &spans,
                               bool pretty = false)
{
    if (spans.empty()) {
        return "[]";
    }

    const std::string nl = pretty ? "\n" : "";
    const std::string in1 = pretty ? "  " : "";
    const std::string in2 = pretty ? "    " : "";
    const std::string sep = ": ";
    const std::string comma = pretty ? "," : ", ";

    std::ostringstream oss;
    oss << "[" << nl;
    for (size_t i = 0; i < spans.size(); ++i) {
        const detection::Span &sp = spans[i];
        std::string matched = piiguard::util::utf8::encode(text.substr(sp.start, sp.end - sp.start));
        oss << in1 << "{" << nl
            << in2 << "\"type\"" << sep << "\"" << escapeJson(sp.label) << "\"" << comma << nl
            << in2 << "\"start\"" << sep << sp.start << comma << nl
            << in2 << "\"end\"" << sep << sp.end << comma << nl
            << in2 << "\"text\"" << sep << "\"" << escapeJson(matched) << "\"" << nl
            << in1 << "}";
        if (i + 1 < spans.size()) {
            oss << (pretty ? "," : ", ");
        }
        oss << nl;
    }
    oss << "]";
    return oss.str();
}

/**
 * @brief Occurrences per label, in order of first appearance.
 */
inline LabelCounts countByLabel(const detection::ResolvedSpanSet &spans)
{
    LabelCounts counts;
    for (const detection::Span &sp : spans) {
        bool found = false;
        for (auto &entry : counts) {
            if (entry.first == sp.label) {
                ++entry.second;
                found = true;
                break;
            }
        }
        if (!found) {
            counts.emplace_back(sp.label, 1);
        }
    }
    return counts;
}

/**
 * @brief "전화번호: 2건, 이메일: 1건", or "검출된 항목 없음" for no detections.
 */
inline std::string formatSummary(const LabelCounts &counts,
                                 const detection::RuleRegistry &registry)
{
    if (counts.empty()) {
        return "검출된 항목 없음";
    }
    std::string out;
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += registry.displayNameFor(counts[i].first) + ": " + std::to_string(counts[i].second) + "건";
    }
    return out;
}

} // namespace report
} // namespace piiguard

#endif // PIIGUARD_REPORT_FORMATTER_HPP
