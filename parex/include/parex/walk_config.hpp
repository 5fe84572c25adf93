#ifndef PAREX_WALK_CONFIG_HPP
#define PAREX_WALK_CONFIG_HPP

#include <cstddef>
#include <optional>
#include <thread>

namespace parex {

// Logical core count, or 4 when the platform cannot tell
inline std::size_t default_thread_count() {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : static_cast<std::size_t>(hw);
}

// Largest worker count a run accepts; anything above is a configuration error
constexpr std::size_t max_thread_count = 4096;

inline bool valid_thread_count(std::size_t threads) {
    return threads != 0 && threads <= max_thread_count;
}

/**
 * Traversal parameters shared by the engine and the source. Fixed once
 * a run starts.
 */
struct WalkConfig {
    std::size_t threads{default_thread_count()};  // advisory for the producer
    std::optional<std::size_t> max_depth;         // inclusive, root = 0
    std::optional<std::size_t> limit;             // maximum matches to report

    bool within_depth(std::size_t depth) const {
        return !max_depth || depth <= *max_depth;
    }

    // Whether children of an entry at this depth may still be visited
    bool may_descend(std::size_t depth) const {
        return !max_depth || depth < *max_depth;
    }
};

} // namespace parex

#endif // PAREX_WALK_CONFIG_HPP
