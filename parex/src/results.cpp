#include <parex/results.hpp>
#include <parex/debug_log.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace parex {

ScanStats ScanStats::compute(std::size_t files, std::size_t dirs, std::chrono::nanoseconds duration) {
    ScanStats stats;
    stats.files = files;
    stats.dirs = dirs;
    stats.duration = duration;

    const double seconds = std::chrono::duration<double>(duration).count();
    if (seconds > 0.0) {
        const double rate = std::floor(static_cast<double>(files + dirs) / seconds);
        constexpr auto max_rate = std::numeric_limits<std::size_t>::max();
        stats.entries_per_sec = rate >= static_cast<double>(max_rate)
            ? max_rate
            : static_cast<std::size_t>(rate);
    }

    return stats;
}

Results finalize(AggregationState::Totals&& totals, const LimitArbiter& arbiter,
                 std::chrono::nanoseconds duration) {
    Results results;
    results.matches = arbiter.clamp(totals.matches);

    results.paths = std::move(totals.paths);
    if (results.paths.size() > results.matches) {
        results.paths.resize(results.matches);
    }

    results.errors = std::move(totals.errors);
    results.stats = ScanStats::compute(totals.files, totals.dirs, duration);

    PAREX_DEBUG_LOG(Finalize, "raw matches=%zu reported=%zu files=%zu dirs=%zu errors=%zu",
                    totals.matches, results.matches, totals.files, totals.dirs,
                    results.errors.size());

    return results;
}

} // namespace parex
