#include <gtest/gtest.h>
#include <parex/aggregation_state.hpp>
#include <algorithm>
#include <set>
#include <thread>
#include <vector>

using namespace parex;

TEST(AggregationState, CountsFilesAndDirectoriesOnly) {
    AggregationState state(false, false);

    state.count_entry(EntryKind::File);
    state.count_entry(EntryKind::File);
    state.count_entry(EntryKind::Directory);
    state.count_entry(EntryKind::Symlink);
    state.count_entry(EntryKind::Other);

    EXPECT_EQ(state.file_count(), 2u);
    EXPECT_EQ(state.dir_count(), 1u);
}

TEST(AggregationState, CollectionsAreOptIn) {
    AggregationState off(false, false);
    EXPECT_FALSE(off.collects_paths());
    EXPECT_FALSE(off.collects_errors());
    off.append_path("a.txt");
    off.append_error(ParexError::permission_denied("/secret"));

    auto totals = off.drain();
    EXPECT_TRUE(totals.paths.empty());
    EXPECT_TRUE(totals.errors.empty());

    AggregationState on(true, true);
    EXPECT_TRUE(on.collects_paths());
    EXPECT_TRUE(on.collects_errors());
    on.append_path("a.txt");
    on.append_error(ParexError::permission_denied("/secret"));

    totals = on.drain();
    ASSERT_EQ(totals.paths.size(), 1u);
    EXPECT_EQ(totals.paths[0].string(), "a.txt");
    ASSERT_EQ(totals.errors.size(), 1u);
    EXPECT_EQ(totals.errors[0].kind(), ErrorKind::PermissionDenied);
}

TEST(AggregationState, FatalErrorsAreNotCollectedAsRecoverable) {
    AggregationState state(false, true);
    state.append_error(ParexError::producer_error("broken"));

    EXPECT_TRUE(state.drain().errors.empty());
}

TEST(AggregationState, FirstFatalWins) {
    AggregationState state(false, false);
    EXPECT_FALSE(state.has_fatal());

    state.record_fatal(ParexError::producer_error("first"));
    state.record_fatal(ParexError::predicate_error("second"));

    EXPECT_TRUE(state.has_fatal());
    auto fatal = state.take_fatal();
    ASSERT_TRUE(fatal.has_value());
    EXPECT_EQ(fatal->kind(), ErrorKind::ProducerError);
}

TEST(AggregationState, ConcurrentMatchesGetDistinctPostIncrementValues) {
    AggregationState state(true, false);
    const int num_threads = 8;
    const int per_thread = 2000;

    std::vector<std::vector<std::size_t>> seen(num_threads);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&state, &seen, t]() {
            for (int i = 0; i < per_thread; ++i) {
                seen[t].push_back(state.record_match());
                state.count_entry(i % 2 == 0 ? EntryKind::File : EntryKind::Directory);
                state.append_path("p" + std::to_string(t) + "_" + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::size_t> all;
    for (const auto& values : seen) {
        all.insert(values.begin(), values.end());
    }

    const std::size_t total = static_cast<std::size_t>(num_threads) * per_thread;
    EXPECT_EQ(all.size(), total);
    EXPECT_EQ(*all.begin(), 1u);
    EXPECT_EQ(*all.rbegin(), total);

    auto totals = state.drain();
    EXPECT_EQ(totals.matches, total);
    EXPECT_EQ(totals.files + totals.dirs, total);
    EXPECT_EQ(totals.paths.size(), total);
}
