#include <parex/aggregation_state.hpp>

#include <utility>

namespace parex {

void AggregationState::append_path(const std::filesystem::path& path) {
    if (!collect_paths_) return;

    std::lock_guard<std::mutex> lock(paths_mutex_);
    paths_.push_back(path);
}

void AggregationState::append_error(const ParexError& error) {
    if (!collect_errors_ || !error.is_recoverable()) return;

    std::lock_guard<std::mutex> lock(errors_mutex_);
    errors_.push_back(error);
}

void AggregationState::record_fatal(const ParexError& error) {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    if (!fatal_) {
        fatal_.emplace(error);
        failed_.store(true, std::memory_order_release);
    }
}

std::optional<ParexError> AggregationState::take_fatal() {
    std::lock_guard<std::mutex> lock(fatal_mutex_);
    std::optional<ParexError> taken;
    taken.swap(fatal_);
    return taken;
}

AggregationState::Totals AggregationState::drain() {
    Totals totals;
    totals.matches = match_count_.load(std::memory_order_acquire);
    totals.files = files_.load(std::memory_order_acquire);
    totals.dirs = dirs_.load(std::memory_order_acquire);

    {
        std::lock_guard<std::mutex> lock(paths_mutex_);
        totals.paths = std::move(paths_);
        paths_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(errors_mutex_);
        totals.errors = std::move(errors_);
        errors_.clear();
    }

    return totals;
}

} // namespace parex
