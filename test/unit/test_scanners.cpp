// test/unit/test_scanners.cpp
// -----------------------------------------------------------
// PrimaryScanner and ProximityScanner: matches, validators, windows and offsets.

#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <vector>

#include "detection/primary_scanner.hpp"
#include "detection/proximity_scanner.hpp"
#include "detection/rule_registry.hpp"
#include "util/thread_pool.hpp"

namespace {

using namespace piiguard::detection;

const RuleRegistry& registry() {
    return RuleRegistry::defaultRegistry();
}

TEST(PrimaryScannerTest, ValidCardProducesSpan) {
    PrimaryScanner scanner;
    auto spans = scanner.scan(L"card: 4111 1111 1111 1111, ok", registry().select({"card"}));
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].label, "card");
    EXPECT_EQ(spans[0].start, (size_t)6);
    EXPECT_EQ(spans[0].end, (size_t)25);
}

TEST(PrimaryScannerTest, ValidatorRejectionProducesNoSpan) {
    PrimaryScanner scanner;
    auto spans = scanner.scan(L"card: 4111 1111 1111 1112, ok", registry().select({"card"}));
    EXPECT_TRUE(spans.empty());
}

TEST(PrimaryScannerTest, CardSeparatorBeforeWordIsPartOfMatch) {
    // the optional separator after the last digit is consumed when a word follows
    PrimaryScanner scanner;
    auto spans = scanner.scan(L"card 4111 1111 1111 1111 end", registry().select({"card"}));
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)5);
    EXPECT_EQ(spans[0].end, (size_t)25);
}

TEST(PrimaryScannerTest, OffsetsAreCodepoints) {
    PrimaryScanner scanner;
    auto spans = scanner.scan(L"연락처 010-1234-5678", registry().select({"mobile_phone"}));
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)4);
    EXPECT_EQ(spans[0].end, (size_t)17);
}

TEST(PrimaryScannerTest, DifferentRulesMayOverlap) {
    PrimaryScanner scanner;
    // a resident number also fits the 13-digit card shape; only luhn decides
    auto spans = scanner.scan(L"주민 900101-1234567 법인 999999-1234567", registry().all());
    ASSERT_EQ(spans.size(), (size_t)2);
    EXPECT_EQ(spans[0].label, "rrn");
    EXPECT_EQ(spans[0].start, (size_t)3);
    EXPECT_EQ(spans[0].end, (size_t)17);
    EXPECT_EQ(spans[1].label, "corporate_reg_no");
    EXPECT_EQ(spans[1].start, (size_t)21);
    EXPECT_EQ(spans[1].end, (size_t)35);
}

TEST(PrimaryScannerTest, ParallelScanMatchesSequentialScan) {
    const std::wstring text =
        L"연락처 010-1234-5678, email: alice@example.com, 카드 4111-1111-1111-1111, "
        L"사업자 220-81-62517, 여권 M12345678, 면허 12-34-567890-12, 과제 202300012A";
    PrimaryScanner scanner;
    piiguard::util::ThreadPool pool(4);
    auto sequential = scanner.scan(text, registry().all());
    auto parallel = scanner.scan(text, registry().all(), &pool);
    EXPECT_EQ(sequential, parallel);
    EXPECT_EQ(sequential.size(), (size_t)7);
}

TEST(ProximityScannerTest, NumberAfterKeyword) {
    ProximityScanner scanner(50);
    auto spans = scanner.scanAccounts(L"account: 1234567890");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].label, "account");
    EXPECT_EQ(spans[0].start, (size_t)9);
    EXPECT_EQ(spans[0].end, (size_t)19);
}

TEST(ProximityScannerTest, KeywordIsCaseInsensitive) {
    ProximityScanner scanner(50);
    EXPECT_EQ(scanner.scanAccounts(L"ACCOUNT 1234567890").size(), (size_t)1);
    EXPECT_EQ(scanner.scanAccounts(L"Bank 1234567890").size(), (size_t)1);
}

TEST(ProximityScannerTest, NoKeywordNoSpan) {
    ProximityScanner scanner(50);
    EXPECT_TRUE(scanner.scanAccounts(L"number 1234567890").empty());
}

TEST(ProximityScannerTest, KoreanKeywordAndDashedNumber) {
    ProximityScanner scanner(50);
    auto spans = scanner.scanAccounts(L"입금 계좌: 110-123-456789");
    // both anchors see the same number
    ASSERT_EQ(spans.size(), (size_t)2);
    for (const Span& sp : spans) {
        EXPECT_EQ(sp.start, (size_t)7);
        EXPECT_EQ(sp.end, (size_t)21);
    }
}

TEST(ProximityScannerTest, WindowBoundary) {
    ProximityScanner scanner(50);
    // "account" ends at 7; the window is [7, 57)
    std::wstring inside = L"account" + std::wstring(40, L' ') + L"1234567890";
    auto spans = scanner.scanAccounts(inside);
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)47);
    EXPECT_EQ(spans[0].end, (size_t)57);

    std::wstring outside = L"account" + std::wstring(41, L' ') + L"1234567890";
    EXPECT_TRUE(scanner.scanAccounts(outside).empty());
}

TEST(ProximityScannerTest, WindowSizeIsConfigurable) {
    std::wstring text = L"account" + std::wstring(20, L' ') + L"1234567890";
    EXPECT_TRUE(ProximityScanner(25).scanAccounts(text).empty());
    EXPECT_EQ(ProximityScanner(30).scanAccounts(text).size(), (size_t)1);
}

TEST(ProximityScannerTest, WordCharacterBeforeWindowBlocksBoundary) {
    ProximityScanner scanner(50);
    EXPECT_TRUE(scanner.scanAccounts(L"account1234567890").empty());
}

TEST(ProximityScannerTest, HangulBeforeWindowBlocksBoundary) {
    ProximityScanner scanner(50);
    EXPECT_TRUE(scanner.scanAccounts(L"계좌1234567890").empty());
    EXPECT_EQ(scanner.scanAccounts(L"계좌 1234567890").size(), (size_t)1);
}

TEST(PrimaryScannerTest, HangulIsAWordCharacter) {
    PrimaryScanner scanner;
    EXPECT_TRUE(scanner.scan(L"전화010-1234-5678로 연락", registry().select({"mobile_phone"})).empty());
    EXPECT_EQ(scanner.scan(L"전화 010-1234-5678 연락", registry().select({"mobile_phone"})).size(), (size_t)1);
}

TEST(PrimaryScannerTest, LongWordRunDoesNotExhaustStack) {
    PrimaryScanner scanner;
    EXPECT_TRUE(scanner.scan(std::wstring(500000, L'a'), registry().all()).empty());
    EXPECT_TRUE(scanner.scan(std::wstring(500000, L'1'), registry().all()).empty());
}

TEST(ProximityScannerTest, WindowEndSaturatesAtTextSize) {
    EXPECT_EQ(windowEnd(4, 50, 100), (size_t)54);
    EXPECT_EQ(windowEnd(4, 50, 30), (size_t)30);
    EXPECT_EQ(windowEnd(4, SIZE_MAX, 30), (size_t)30);
    EXPECT_EQ(windowEnd(30, 0, 30), (size_t)30);
}

TEST(ProximityScannerTest, UnboundedWindowCoversRestOfText) {
    ProximityScanner scanner(SIZE_MAX);
    auto spans = scanner.scanAccounts(L"bank 1234567890 tail");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].start, (size_t)5);
    EXPECT_EQ(spans[0].end, (size_t)15);
}

TEST(ProximityScannerTest, CorporateKeywordSkipsDateShapedNumbers) {
    ProximityScanner scanner(50);
    auto spans = scanner.scanCorporate(L"법인등록번호: 131313-1234567");
    ASSERT_EQ(spans.size(), (size_t)1);
    EXPECT_EQ(spans[0].label, "corporate_reg_no_keyword");
    EXPECT_EQ(spans[0].start, (size_t)8);
    EXPECT_EQ(spans[0].end, (size_t)22);

    EXPECT_TRUE(scanner.scanCorporate(L"법인번호 110111-1234567").empty());
    EXPECT_EQ(scanner.scanCorporate(L"Corporate Registration 999999-1234567").size(), (size_t)1);
}

} // anonymous namespace
