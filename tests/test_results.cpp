#include <gtest/gtest.h>
#include <parex/results.hpp>
#include <chrono>
#include <limits>

using namespace parex;
using namespace std::chrono_literals;

TEST(ScanStats, ZeroDurationGivesZeroRate) {
    auto stats = ScanStats::compute(10, 5, std::chrono::nanoseconds(0));

    EXPECT_EQ(stats.files, 10u);
    EXPECT_EQ(stats.dirs, 5u);
    EXPECT_EQ(stats.entries_per_sec, 0u);
}

TEST(ScanStats, NegativeDurationGivesZeroRate) {
    auto stats = ScanStats::compute(10, 5, std::chrono::nanoseconds(-1000));
    EXPECT_EQ(stats.entries_per_sec, 0u);
}

TEST(ScanStats, RateIsFloored) {
    EXPECT_EQ(ScanStats::compute(6, 1, 2s).entries_per_sec, 3u);
    EXPECT_EQ(ScanStats::compute(1000, 0, 1s).entries_per_sec, 1000u);
    EXPECT_EQ(ScanStats::compute(1, 0, 3s).entries_per_sec, 0u);
    EXPECT_EQ(ScanStats::compute(3, 0, 500ms).entries_per_sec, 6u);
}

TEST(ScanStats, RateSaturates) {
    const auto huge = std::numeric_limits<std::size_t>::max() / 2;
    auto stats = ScanStats::compute(huge, huge, std::chrono::nanoseconds(1));
    EXPECT_EQ(stats.entries_per_sec, std::numeric_limits<std::size_t>::max());
}

TEST(Finalize, ClampsMatchesAndPathsToLimit) {
    AggregationState::Totals totals;
    totals.matches = 7;
    totals.files = 20;
    totals.dirs = 2;
    totals.paths = {"a", "b", "c", "d", "e"};

    auto results = finalize(std::move(totals), LimitArbiter(3), 1s);

    EXPECT_EQ(results.matches, 3u);
    EXPECT_EQ(results.paths.size(), 3u);
    EXPECT_EQ(results.stats.files, 20u);
    EXPECT_EQ(results.stats.dirs, 2u);
    EXPECT_EQ(results.stats.entries_per_sec, 22u);
}

TEST(Finalize, NoLimitKeepsEverything) {
    AggregationState::Totals totals;
    totals.matches = 4;
    totals.paths = {"a", "b", "c", "d"};
    totals.errors.push_back(ParexError::not_found("/gone"));

    auto results = finalize(std::move(totals), LimitArbiter(), 0ns);

    EXPECT_EQ(results.matches, 4u);
    EXPECT_EQ(results.paths.size(), 4u);
    EXPECT_EQ(results.errors.size(), 1u);
    EXPECT_EQ(results.stats.entries_per_sec, 0u);
}
