#include <parex/match_engine.hpp>
#include <parex/debug_log.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

namespace parex {

namespace {

[[maybe_unused]] const char* shape_name(SourceShape shape) {
    return shape == SourceShape::Pull ? "pull" : "push";
}

/**
 * Exceptions escaping a producer end the run. Fatal ParexErrors keep their
 * identity, anything else becomes a ProducerError carrying the original.
 * Must be called from inside a catch block.
 */
[[noreturn]] void rethrow_producer_failure() {
    try {
        throw;
    } catch (const ParexError& e) {
        if (e.is_fatal()) throw;
        throw ParexError::producer_error(e.what(), std::current_exception());
    } catch (const std::exception& e) {
        throw ParexError::producer_error(e.what(), std::current_exception());
    } catch (...) {
        throw ParexError::producer_error("non-standard exception", std::current_exception());
    }
}

} // namespace

MatchEngine::MatchEngine(EngineOptions options)
    : options_(std::move(options)),
      state_(options_.collect_paths, options_.collect_errors),
      arbiter_(options_.config.limit) {
    if (!options_.matcher) {
        options_.matcher = std::make_shared<AllMatcher>();
    }
}

Results MatchEngine::run(const Source& source) {
    if (started_) {
        throw std::runtime_error("MatchEngine can only run once");
    }
    started_ = true;

    if (!valid_thread_count(options_.config.threads)) {
        throw ParexError::invalid_thread_count(options_.config.threads);
    }

    PAREX_DEBUG_LOG(Engine, "Starting %s run: threads=%zu limit=%zu paths=%d errors=%d",
                    shape_name(source.shape()), options_.config.threads,
                    options_.config.limit.value_or(0),
                    options_.collect_paths ? 1 : 0, options_.collect_errors ? 1 : 0);

    const auto start = std::chrono::steady_clock::now();

    switch (source.shape()) {
        case SourceShape::Pull: {
            const auto* pull = dynamic_cast<const PullSource*>(&source);
            if (!pull) {
                throw ParexError::invalid_source("pull-shaped source is not a PullSource");
            }
            run_pull(*pull);
            break;
        }
        case SourceShape::Push: {
            const auto* push = dynamic_cast<const PushSource*>(&source);
            if (!push) {
                throw ParexError::invalid_source("push-shaped source is not a PushSource");
            }
            run_push(*push);
            break;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start);

    if (state_.has_fatal()) {
        raise_fatal();
    }

    return finalize(state_.drain(), arbiter_, elapsed);
}

void MatchEngine::run_pull(const PullSource& source) {
    std::unique_ptr<EntryStream> stream;
    try {
        stream = source.walk(options_.config);
    } catch (...) {
        rethrow_producer_failure();
    }

    if (!stream) {
        throw ParexError::producer_error("source returned no entry stream");
    }

    // Only this thread observes the count, so stopping here is exact
    while (!arbiter_.reached(state_.match_count())) {
        std::optional<EntryResult> item;
        try {
            item = stream->next();
        } catch (...) {
            rethrow_producer_failure();
        }

        if (!item) break;

        if (process(std::move(*item)) == WalkVerdict::Quit) break;
    }
}

void MatchEngine::run_push(const PushSource& source) {
    const EntryVisitor visitor = [this](EntryResult&& item) {
        return process(std::move(item));
    };

    try {
        source.walk(options_.config, visitor);
    } catch (...) {
        // A fatal item reported before the throw is the root cause
        if (state_.has_fatal()) {
            raise_fatal();
        }
        rethrow_producer_failure();
    }
}

WalkVerdict MatchEngine::process(EntryResult&& item) {
    if (state_.has_fatal()) {
        return WalkVerdict::Quit;
    }

    if (const auto* error = std::get_if<ParexError>(&item)) {
        return on_error(*error);
    }
    return on_entry(std::get<Entry>(item));
}

WalkVerdict MatchEngine::on_error(const ParexError& error) {
    if (error.is_recoverable()) {
        state_.append_error(error);
        return WalkVerdict::Continue;
    }

    PAREX_DEBUG_LOG(Engine, "Fatal error reported: %s", error.what());
    state_.record_fatal(error);
    return WalkVerdict::Quit;
}

WalkVerdict MatchEngine::on_entry(const Entry& entry) {
    state_.count_entry(entry.kind());

    bool matched = false;
    try {
        matched = options_.matcher->is_match(entry);
    } catch (const ParexError& e) {
        return on_error(e);
    } catch (const std::exception& e) {
        return on_error(ParexError::predicate_error(e.what(), std::current_exception()));
    } catch (...) {
        return on_error(ParexError::predicate_error("non-standard exception",
                                                    std::current_exception()));
    }

    if (!matched) {
        return WalkVerdict::Continue;
    }
    return on_match(entry);
}

WalkVerdict MatchEngine::on_match(const Entry& entry) {
    const std::size_t count = state_.record_match();

    // Early guard: someone else already reached the limit
    if (arbiter_.exceeded(count)) {
        PAREX_DEBUG_LOG(Engine, "Early guard: match %zu past limit %zu",
                        count, *arbiter_.limit());
        return WalkVerdict::Quit;
    }

    state_.append_path(entry.path());

    // Late guard: this match reached the limit
    if (arbiter_.reached(count)) {
        PAREX_DEBUG_LOG(Engine, "Late guard: limit %zu reached", *arbiter_.limit());
        return WalkVerdict::Quit;
    }

    return WalkVerdict::Continue;
}

void MatchEngine::raise_fatal() {
    std::optional<ParexError> fatal = state_.take_fatal();
    if (fatal) {
        throw std::move(*fatal);
    }
    throw ParexError::producer_error("run aborted without a recorded error");
}

Results run(const Source& source, EngineOptions options) {
    MatchEngine engine(std::move(options));
    return engine.run(source);
}

} // namespace parex
