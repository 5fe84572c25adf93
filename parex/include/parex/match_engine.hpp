#ifndef PAREX_MATCH_ENGINE_HPP
#define PAREX_MATCH_ENGINE_HPP

#include <parex/aggregation_state.hpp>
#include <parex/limit_arbiter.hpp>
#include <parex/matcher.hpp>
#include <parex/results.hpp>
#include <parex/source.hpp>
#include <parex/walk_config.hpp>
#include <chrono>
#include <memory>

namespace parex {

struct EngineOptions {
    WalkConfig config;
    std::shared_ptr<const Matcher> matcher;
    bool collect_paths{false};
    bool collect_errors{false};
};

/**
 * One search run: owns the aggregation state for its lifetime and
 * drives a source in either shape.
 *
 * process() is the per-item step and is safe to call from any number of
 * producer threads at once. run() may be called once per engine.
 */
class MatchEngine {
public:
    explicit MatchEngine(EngineOptions options);

    MatchEngine(const MatchEngine&) = delete;
    MatchEngine& operator=(const MatchEngine&) = delete;

    /**
     * Traverse source, block until it has quiesced, then return the
     * finalized result. Fatal errors are thrown as ParexError and no
     * partial result is produced.
     */
    Results run(const Source& source);

    WalkVerdict process(EntryResult&& item);

    const AggregationState& state() const { return state_; }
    const LimitArbiter& arbiter() const { return arbiter_; }

private:
    void run_pull(const PullSource& source);
    void run_push(const PushSource& source);

    WalkVerdict on_entry(const Entry& entry);
    WalkVerdict on_error(const ParexError& error);
    WalkVerdict on_match(const Entry& entry);

    [[noreturn]] void raise_fatal();

    EngineOptions options_;
    AggregationState state_;
    LimitArbiter arbiter_;
    bool started_{false};
};

// Convenience: one engine, one run
Results run(const Source& source, EngineOptions options);

} // namespace parex

#endif // PAREX_MATCH_ENGINE_HPP
