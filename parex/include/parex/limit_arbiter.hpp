#ifndef PAREX_LIMIT_ARBITER_HPP
#define PAREX_LIMIT_ARBITER_HPP

#include <algorithm>
#include <cstddef>
#include <optional>

namespace parex {

/**
 * Two-guard limit enforcement for concurrent matching.
 *
 * Each worker that finds a match increments the shared counter and asks
 * the arbiter about its own post-increment value m:
 *
 *   exceeded(m)  early guard, m > limit: another worker already reached
 *                the limit, quit without recording this match
 *   reached(m)   late guard, m >= limit: this worker hit the boundary,
 *                record the match and quit
 *
 * Workers never wait for each other, so up to threads - 1 extra matches
 * may be counted before everyone has observed a Quit. clamp() turns the
 * raw count into the exact reported one once the producer has quiesced.
 * Without a limit every guard is false and clamp() is the identity.
 */
class LimitArbiter {
public:
    explicit LimitArbiter(std::optional<std::size_t> limit = std::nullopt) : limit_(limit) {}

    bool has_limit() const noexcept { return limit_.has_value(); }

    std::optional<std::size_t> limit() const noexcept { return limit_; }

    bool exceeded(std::size_t post_increment) const noexcept {
        return limit_ && post_increment > *limit_;
    }

    bool reached(std::size_t post_increment) const noexcept {
        return limit_ && post_increment >= *limit_;
    }

    std::size_t clamp(std::size_t raw) const noexcept {
        return limit_ ? std::min(raw, *limit_) : raw;
    }

private:
    std::optional<std::size_t> limit_;
};

} // namespace parex

#endif // PAREX_LIMIT_ARBITER_HPP
