// test/unit/test_formatter.cpp
// -----------------------------------------------------------
// Highlight markup, JSON span list and label summary.

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "report/formatter.hpp"

namespace {

using namespace piiguard::report;
using piiguard::detection::RuleRegistry;
using piiguard::detection::Span;

const RuleRegistry& registry() {
    return RuleRegistry::defaultRegistry();
}

TEST(FormatterTest, EscapeHtml) {
    EXPECT_EQ(escapeHtml("a<b>&c"), "a&lt;b&gt;&amp;c");
    EXPECT_EQ(escapeHtml("\"quoted\""), "\"quoted\"");
}

TEST(FormatterTest, EscapeJson) {
    EXPECT_EQ(escapeJson("say \"hi\"\n"), "say \\\"hi\\\"\\n");
    EXPECT_EQ(escapeJson("a\\b"), "a\\\\b");
    EXPECT_EQ(escapeJson(std::string("\x01", 1)), "\\u0001");
    EXPECT_EQ(escapeJson("계좌"), "계좌");
}

TEST(FormatterTest, AnnotateHtmlWrapsSpans) {
    std::wstring text = L"연락처 010-1234-5678, email: a@b.com";
    std::vector<Span> spans = {{"mobile_phone", 4, 17}, {"email", 26, 33}};
    std::string expected =
        "연락처 <mark style=\"background:#c8e6c9;padding:0 .2em;border-radius:.2em\" title=\"전화번호\">"
        "010-1234-5678</mark>, email: "
        "<mark style=\"background:#bbdefb;padding:0 .2em;border-radius:.2em\" title=\"이메일\">"
        "a@b.com</mark>";
    EXPECT_EQ(annotateHtml(text, spans, registry()), expected);
}

TEST(FormatterTest, AnnotateHtmlEscapesSurroundingText) {
    std::wstring text = L"<b>계좌 1234567890</b>";
    std::vector<Span> spans = {{"account", 6, 16}};
    std::string expected =
        "&lt;b&gt;계좌 <mark style=\"background:#ffe082;padding:0 .2em;border-radius:.2em\" "
        "title=\"계좌(키워드근접)\">1234567890</mark>&lt;/b&gt;";
    EXPECT_EQ(annotateHtml(text, spans, registry()), expected);
}

TEST(FormatterTest, AnnotateHtmlWithoutSpans) {
    EXPECT_EQ(annotateHtml(L"plain & simple", {}, registry()), "plain &amp; simple");
    EXPECT_EQ(annotateHtml(L"", {}, registry()), "");
}

TEST(FormatterTest, AnnotateDocumentWrapsMarkup) {
    std::string doc = annotateDocument(L"x", {}, registry());
    EXPECT_EQ(doc, "<div style='white-space:pre-wrap; font-family:ui-monospace, Menlo, Consolas, "
                   "monospace; line-height:1.6;'>x</div>");
}

TEST(FormatterTest, CompactJson) {
    std::wstring text = L"연락처 010-1234-5678, email: a@b.com";
    std::vector<Span> spans = {{"mobile_phone", 4, 17}, {"email", 26, 33}};
    EXPECT_EQ(spansToJson(text, spans),
              "[{\"type\": \"mobile_phone\", \"start\": 4, \"end\": 17, \"text\": \"010-1234-5678\"}, "
              "{\"type\": \"email\", \"start\": 26, \"end\": 33, \"text\": \"a@b.com\"}]");
}

TEST(FormatterTest, PrettyJson) {
    std::vector<Span> spans = {{"email", 2, 9}};
    EXPECT_EQ(spansToJson(L"> a@b.com", spans, true),
              "[\n"
              "  {\n"
              "    \"type\": \"email\",\n"
              "    \"start\": 2,\n"
              "    \"end\": 9,\n"
              "    \"text\": \"a@b.com\"\n"
              "  }\n"
              "]");
}

TEST(FormatterTest, JsonKeepsKoreanText) {
    std::vector<Span> spans = {{"account", 0, 2}};
    EXPECT_EQ(spansToJson(L"계좌", spans), "[{\"type\": \"account\", \"start\": 0, \"end\": 2, \"text\": \"계좌\"}]");
}

TEST(FormatterTest, EmptyJson) {
    EXPECT_EQ(spansToJson(L"nothing here", {}), "[]");
    EXPECT_EQ(spansToJson(L"nothing here", {}, true), "[]");
}

TEST(FormatterTest, Summary) {
    std::vector<Span> spans = {{"mobile_phone", 0, 13}, {"email", 14, 21}, {"mobile_phone", 22, 35}};
    LabelCounts counts = countByLabel(spans);
    EXPECT_EQ(formatSummary(counts, registry()), "전화번호: 2건, 이메일: 1건");
    EXPECT_EQ(formatSummary({}, registry()), "검출된 항목 없음");
}

TEST(FormatterTest, SummaryUsesKeywordLabelNames) {
    LabelCounts counts = {{"account", 1}, {"corporate_reg_no_keyword", 3}, {"unknown_label", 1}};
    EXPECT_EQ(formatSummary(counts, registry()),
              "계좌(키워드근접): 1건, 법인등록번호(CRN): 3건, unknown_label: 1건");
}

} // anonymous namespace
