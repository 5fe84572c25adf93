#include <gtest/gtest.h>
#include <parex/match_engine.hpp>
#include <parex/sources/vector_source.hpp>
#include "test_helpers.hpp"

#include <stdexcept>

using namespace parex;
using namespace test_utils;

namespace {

EngineOptions options_with(std::shared_ptr<const Matcher> matcher, std::size_t threads = 1) {
    EngineOptions options;
    options.config.threads = threads;
    options.matcher = std::move(matcher);
    return options;
}

} // namespace

class MatchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        invoice_matcher_ = std::make_shared<SubstringMatcher>("invoice");
    }

    std::shared_ptr<const Matcher> invoice_matcher_;
};

TEST_F(MatchEngineTest, PullRunCountsEverything) {
    VectorSource source(invoice_entries());
    auto options = options_with(invoice_matcher_);
    options.collect_paths = true;

    auto results = run(source, options);

    EXPECT_EQ(results.matches, 3u);
    EXPECT_EQ(results.stats.files, 6u);
    EXPECT_EQ(results.stats.dirs, 1u);
    ASSERT_EQ(results.paths.size(), 3u);
    EXPECT_EQ(count_names_containing(results.paths, "invoice"), 3u);
    EXPECT_TRUE(results.errors.empty());
}

TEST_F(MatchEngineTest, ProcessReportsVerdictsDirectly) {
    EngineOptions options = options_with(invoice_matcher_);
    options.config.limit = 2;
    MatchEngine engine(options);

    EXPECT_EQ(engine.process(make_file("a/report.txt")), WalkVerdict::Continue);
    EXPECT_EQ(engine.process(make_file("a/invoice_1.txt")), WalkVerdict::Continue);
    EXPECT_EQ(engine.process(make_file("a/invoice_2.txt")), WalkVerdict::Quit);
    EXPECT_EQ(engine.process(make_file("a/invoice_3.txt")), WalkVerdict::Quit);
    EXPECT_EQ(engine.state().match_count(), 3u);
    EXPECT_EQ(engine.state().file_count(), 4u);
}

TEST_F(MatchEngineTest, RecoverableErrorsContinue) {
    MatchEngine engine(options_with(invoice_matcher_));

    EXPECT_EQ(engine.process(ParexError::permission_denied("/locked")), WalkVerdict::Continue);
    EXPECT_EQ(engine.process(ParexError::not_found("/gone")), WalkVerdict::Continue);
    EXPECT_FALSE(engine.state().has_fatal());
}

TEST_F(MatchEngineTest, FatalErrorItemQuits) {
    MatchEngine engine(options_with(invoice_matcher_));

    EXPECT_EQ(engine.process(ParexError::producer_error("disk vanished")), WalkVerdict::Quit);
    EXPECT_TRUE(engine.state().has_fatal());

    // Everything after the fatal error is refused
    EXPECT_EQ(engine.process(make_file("a/invoice.txt")), WalkVerdict::Quit);
    EXPECT_EQ(engine.state().match_count(), 0u);
}

TEST_F(MatchEngineTest, SymlinksAreMatchedButNotTallied) {
    std::vector<EntryResult> items = {
        Entry::from_path("root/invoice_link", EntryKind::Symlink, 1),
        Entry::from_path("root/invoice_fifo", EntryKind::Other, 1),
        make_file("root/invoice.txt"),
    };
    VectorSource source(std::move(items));

    auto results = run(source, options_with(invoice_matcher_));

    EXPECT_EQ(results.matches, 3u);
    EXPECT_EQ(results.stats.files, 1u);
    EXPECT_EQ(results.stats.dirs, 0u);
}

TEST_F(MatchEngineTest, PredicateExceptionIsFatal) {
    VectorSource source(invoice_entries());
    auto matcher = make_matcher([](const Entry& entry) -> bool {
        if (entry.name() == "report.txt") {
            throw std::logic_error("bad predicate");
        }
        return true;
    });

    try {
        run(source, options_with(matcher));
        FAIL() << "expected PredicateError";
    } catch (const ParexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PredicateError);
        EXPECT_NE(e.describe().find("bad predicate"), std::string::npos);
        EXPECT_TRUE(e.cause() != nullptr);
    }
}

TEST_F(MatchEngineTest, RecoverableErrorFromPredicateIsCollected) {
    VectorSource source(invoice_entries());
    auto matcher = make_matcher([](const Entry& entry) -> bool {
        if (entry.name() == "notes.md") {
            throw ParexError::permission_denied(entry.path());
        }
        return entry.name().find("invoice") != std::string::npos;
    });
    auto options = options_with(matcher);
    options.collect_errors = true;

    auto results = run(source, options);

    EXPECT_EQ(results.matches, 3u);
    ASSERT_EQ(results.errors.size(), 1u);
    EXPECT_EQ(results.errors[0].kind(), ErrorKind::PermissionDenied);
}

TEST_F(MatchEngineTest, RunTwiceThrows) {
    VectorSource source(invoice_entries());
    MatchEngine engine(options_with(invoice_matcher_));

    engine.run(source);
    EXPECT_THROW(engine.run(source), std::runtime_error);
}

TEST_F(MatchEngineTest, ZeroThreadsRejected) {
    VectorSource source(invoice_entries());

    try {
        run(source, options_with(invoice_matcher_, 0));
        FAIL() << "expected InvalidThreadCount";
    } catch (const ParexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidThreadCount);
    }
}

TEST_F(MatchEngineTest, ThreadCountAboveMaximumRejected) {
    ProbePullSource source(invoice_entries());

    try {
        run(source, options_with(invoice_matcher_, max_thread_count + 1));
        FAIL() << "expected InvalidThreadCount";
    } catch (const ParexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidThreadCount);
    }
    EXPECT_FALSE(source.opened());
}

TEST_F(MatchEngineTest, FatalItemAbortsPullRun) {
    std::vector<EntryResult> items = invoice_entries();
    items.insert(items.begin() + 2, ParexError::producer_error("corrupt index"));
    ProbePullSource source(std::move(items));

    try {
        run(source, options_with(invoice_matcher_));
        FAIL() << "expected ProducerError";
    } catch (const ParexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProducerError);
        EXPECT_NE(std::string(e.what()).find("corrupt index"), std::string::npos);
    }
    EXPECT_EQ(source.pulled(), 3u);
}

TEST_F(MatchEngineTest, PullStopsPullingAtLimit) {
    std::vector<EntryResult> items;
    for (int i = 0; i < 100; ++i) {
        items.emplace_back(make_file("data/invoice_" + std::to_string(i) + ".txt"));
    }
    ProbePullSource source(std::move(items));
    auto options = options_with(invoice_matcher_);
    options.config.limit = 5;
    options.collect_paths = true;

    auto results = run(source, options);

    EXPECT_EQ(results.matches, 5u);
    EXPECT_EQ(results.paths.size(), 5u);
    EXPECT_EQ(source.pulled(), 5u);
}

TEST_F(MatchEngineTest, ZeroLimitPullsNothing) {
    ProbePullSource source(invoice_entries());
    auto options = options_with(invoice_matcher_);
    options.config.limit = 0;

    auto results = run(source, options);

    EXPECT_TRUE(source.opened());
    EXPECT_EQ(source.pulled(), 0u);
    EXPECT_EQ(results.matches, 0u);
    EXPECT_EQ(results.stats.files, 0u);
}

TEST_F(MatchEngineTest, ExceptionFromStreamBecomesProducerError) {
    ProbePullSource source(invoice_entries(), []() {
        throw std::runtime_error("stream broke");
    }, 4);

    try {
        run(source, options_with(invoice_matcher_));
        FAIL() << "expected ProducerError";
    } catch (const ParexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ProducerError);
        EXPECT_TRUE(e.cause() != nullptr);
        EXPECT_NE(e.describe().find("stream broke"), std::string::npos);
    }
}

TEST_F(MatchEngineTest, MissingMatcherMatchesEverything) {
    VectorSource source(invoice_entries());
    auto results = run(source, options_with(nullptr));

    EXPECT_EQ(results.matches, 7u);
}
