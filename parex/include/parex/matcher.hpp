#ifndef PAREX_MATCHER_HPP
#define PAREX_MATCHER_HPP

#include <parex/entry.hpp>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace parex {

/**
 * Decides whether an entry is a match. Called concurrently from every
 * worker thread without external synchronization.
 *
 * A matcher may throw: a recoverable ParexError (for example from
 * Entry::metadata()) skips just that entry, anything else aborts the run
 * with a PredicateError.
 */
class Matcher {
public:
    virtual ~Matcher() = default;

    virtual bool is_match(const Entry& entry) const = 0;
};

// Matches every entry. Used when no matcher is configured.
class AllMatcher final : public Matcher {
public:
    bool is_match(const Entry&) const override { return true; }
};

/**
 * Entries whose name contains the pattern, ignoring case. Both sides are
 * lowercased with Unicode rules, so "RÉSUMÉ" finds "résumé.pdf".
 * An empty pattern matches everything.
 */
class SubstringMatcher final : public Matcher {
public:
    explicit SubstringMatcher(const std::string& pattern);

    bool is_match(const Entry& entry) const override;

    const std::string& pattern() const { return pattern_; }

private:
    std::string pattern_;  // already lowercased
};

/**
 * Entries whose path has the given extension, ignoring case.
 * Accepts "rs" or ".rs". Throws InvalidPattern for an empty extension or
 * one containing a path separator.
 */
class ExtensionMatcher final : public Matcher {
public:
    explicit ExtensionMatcher(const std::string& extension);

    bool is_match(const Entry& entry) const override;

private:
    std::string extension_;  // lowercased, with leading dot
};

// Adapts any `bool(const Entry&)` callable
template<typename Func>
class FunctionMatcher final : public Matcher {
public:
    template<typename F>
    explicit FunctionMatcher(F&& func) : function_(std::forward<F>(func)) {}

    bool is_match(const Entry& entry) const override {
        return static_cast<bool>(function_(entry));
    }

private:
    Func function_;
};

template<typename Func>
std::shared_ptr<const Matcher> make_matcher(Func&& func) {
    static_assert(std::is_invocable_r_v<bool, const std::decay_t<Func>&, const Entry&>,
                  "Predicate must be callable as bool(const Entry&)");
    return std::make_shared<FunctionMatcher<std::decay_t<Func>>>(std::forward<Func>(func));
}

// Locale-independent Unicode lowercase of UTF-8 text. Invalid sequences
// become U+FFFD.
std::string unicode_lowercase(const std::string& text);

} // namespace parex

#endif // PAREX_MATCHER_HPP
