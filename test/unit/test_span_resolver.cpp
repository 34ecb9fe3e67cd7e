// test/unit/test_span_resolver.cpp
// -----------------------------------------------------------
// Greedy earliest-start overlap resolution.

#include <gtest/gtest.h>
#include <random>
#include <string>
#include <vector>

#include "detection/span_resolver.hpp"

namespace {

using piiguard::detection::Span;
using piiguard::detection::SpanResolver;

bool keyLess(const Span& a, const Span& b) {
    return a.start != b.start ? a.start < b.start : a.end < b.end;
}

TEST(SpanResolverTest, EarliestThenShortestWins) {
    SpanResolver resolver;
    auto resolved = resolver.resolve({{"card", 0, 19}, {"rrn", 0, 14}, {"account", 20, 30}, {"email", 25, 40}});
    ASSERT_EQ(resolved.size(), (size_t)2);
    EXPECT_EQ(resolved[0], (Span{"rrn", 0, 14}));
    EXPECT_EQ(resolved[1], (Span{"account", 20, 30}));
}

TEST(SpanResolverTest, LongerLaterCandidateIsDroppedWhole) {
    SpanResolver resolver;
    auto resolved = resolver.resolve({{"short", 0, 5}, {"long", 3, 40}, {"tail", 10, 12}});
    ASSERT_EQ(resolved.size(), (size_t)2);
    EXPECT_EQ(resolved[0].label, "short");
    EXPECT_EQ(resolved[1].label, "tail");
}

TEST(SpanResolverTest, IdenticalRangesKeepInputOrder) {
    SpanResolver resolver;
    auto resolved = resolver.resolve({{"rrn", 0, 14}, {"card", 0, 14}});
    ASSERT_EQ(resolved.size(), (size_t)1);
    EXPECT_EQ(resolved[0].label, "rrn");
}

TEST(SpanResolverTest, AdjacentSpansAreBothKept) {
    SpanResolver resolver;
    auto resolved = resolver.resolve({{"b", 5, 10}, {"a", 0, 5}});
    ASSERT_EQ(resolved.size(), (size_t)2);
    EXPECT_EQ(resolved[0].label, "a");
    EXPECT_EQ(resolved[1].label, "b");
}

TEST(SpanResolverTest, NestedSpanIsDropped) {
    SpanResolver resolver;
    auto resolved = resolver.resolve({{"inner", 5, 10}, {"outer", 0, 20}});
    ASSERT_EQ(resolved.size(), (size_t)1);
    EXPECT_EQ(resolved[0].label, "outer");
}

TEST(SpanResolverTest, EmptyInput) {
    SpanResolver resolver;
    EXPECT_TRUE(resolver.resolve({}).empty());
}

TEST(SpanResolverTest, RandomCandidatesSatisfyInvariants) {
    std::mt19937 rng(20241019);
    std::uniform_int_distribution<size_t> startDist(0, 200);
    std::uniform_int_distribution<size_t> lenDist(1, 25);
    SpanResolver resolver;

    for (int round = 0; round < 50; ++round) {
        std::vector<Span> candidates;
        for (int i = 0; i < 40; ++i) {
            size_t start = startDist(rng);
            candidates.push_back(Span{"s" + std::to_string(i), start, start + lenDist(rng)});
        }
        auto resolved = resolver.resolve(candidates);
        ASSERT_TRUE(piiguard::detection::isResolved(resolved));

        // every dropped candidate overlaps a kept span with a smaller or equal key
        for (const Span& c : candidates) {
            bool kept = false;
            bool beaten = false;
            for (const Span& r : resolved) {
                if (r == c) {
                    kept = true;
                } else if (r.overlaps(c) && !keyLess(c, r)) {
                    beaten = true;
                }
            }
            EXPECT_TRUE(kept || beaten) << c.label;
        }
    }
}

} // anonymous namespace
