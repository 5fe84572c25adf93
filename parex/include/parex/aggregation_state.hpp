#ifndef PAREX_AGGREGATION_STATE_HPP
#define PAREX_AGGREGATION_STATE_HPP

#include <parex/entry.hpp>
#include <parex/error.hpp>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <vector>

namespace parex {

/**
 * Counters and collections shared by every worker during one run.
 *
 * Counters are relaxed atomics: only their final sums and each worker's
 * own post-increment value matter. The path and error collections each
 * have their own mutex, held for a single push. Insertion order across
 * workers is whatever order the pushes happened in.
 *
 * drain() hands everything over once the producer has quiesced; the
 * state must not be touched by workers after that.
 */
class AggregationState {
public:
    struct Totals {
        std::size_t matches{0};
        std::size_t files{0};
        std::size_t dirs{0};
        std::vector<std::filesystem::path> paths;
        std::vector<ParexError> errors;
    };

    AggregationState(bool collect_paths, bool collect_errors)
        : collect_paths_(collect_paths), collect_errors_(collect_errors) {}

    AggregationState(const AggregationState&) = delete;
    AggregationState& operator=(const AggregationState&) = delete;

    bool collects_paths() const noexcept { return collect_paths_; }
    bool collects_errors() const noexcept { return collect_errors_; }

    void count_entry(EntryKind kind) {
        switch (kind) {
            case EntryKind::File:
                files_.fetch_add(1, std::memory_order_relaxed);
                break;
            case EntryKind::Directory:
                dirs_.fetch_add(1, std::memory_order_relaxed);
                break;
            default:
                break;
        }
    }

    // Returns the post-increment match count as seen by this worker
    std::size_t record_match() {
        return match_count_.fetch_add(1, std::memory_order_relaxed) + 1;
    }

    std::size_t match_count() const { return match_count_.load(std::memory_order_relaxed); }
    std::size_t file_count() const { return files_.load(std::memory_order_relaxed); }
    std::size_t dir_count() const { return dirs_.load(std::memory_order_relaxed); }

    void append_path(const std::filesystem::path& path);

    // Keeps recoverable errors only, and only when collecting
    void append_error(const ParexError& error);

    // The first fatal error wins; later ones are dropped
    void record_fatal(const ParexError& error);

    bool has_fatal() const { return failed_.load(std::memory_order_acquire); }

    std::optional<ParexError> take_fatal();

    Totals drain();

private:
    const bool collect_paths_;
    const bool collect_errors_;

    std::atomic<std::size_t> match_count_{0};
    std::atomic<std::size_t> files_{0};
    std::atomic<std::size_t> dirs_{0};

    std::mutex paths_mutex_;
    std::vector<std::filesystem::path> paths_;

    std::mutex errors_mutex_;
    std::vector<ParexError> errors_;

    std::atomic<bool> failed_{false};
    std::mutex fatal_mutex_;
    std::optional<ParexError> fatal_;
};

} // namespace parex

#endif // PAREX_AGGREGATION_STATE_HPP
