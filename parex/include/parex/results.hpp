#ifndef PAREX_RESULTS_HPP
#define PAREX_RESULTS_HPP

#include <parex/aggregation_state.hpp>
#include <parex/error.hpp>
#include <parex/limit_arbiter.hpp>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <vector>

namespace parex {

struct ScanStats {
    std::size_t files{0};   // every file seen, matched or not
    std::size_t dirs{0};
    std::chrono::nanoseconds duration{0};
    std::size_t entries_per_sec{0};

    /**
     * entries_per_sec = floor((files + dirs) / seconds), or 0 when the
     * duration is zero or negative. Saturates at the size_t maximum.
     */
    static ScanStats compute(std::size_t files, std::size_t dirs, std::chrono::nanoseconds duration);

    double duration_seconds() const {
        return std::chrono::duration<double>(duration).count();
    }
};

/**
 * Outcome of a completed search. paths and errors stay empty unless
 * their collection was requested.
 */
struct Results {
    std::size_t matches{0};
    std::vector<std::filesystem::path> paths;
    ScanStats stats;
    std::vector<ParexError> errors;
};

/**
 * Turn drained run state into the reported result: matches and paths are
 * clamped to the limit, the rate is derived from the elapsed time.
 * Runs once, on one thread, after the producer has quiesced.
 */
Results finalize(AggregationState::Totals&& totals, const LimitArbiter& arbiter,
                 std::chrono::nanoseconds duration);

} // namespace parex

#endif // PAREX_RESULTS_HPP
