#ifndef PAREX_SEARCH_HPP
#define PAREX_SEARCH_HPP

#include <parex/match_engine.hpp>
#include <parex/matcher.hpp>
#include <parex/results.hpp>
#include <parex/source.hpp>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace parex {

/**
 * Configure and execute a search.
 *
 *   auto results = parex::search()
 *       .source(DirectorySource("/srv/data"))
 *       .matching("invoice")
 *       .limit(10)
 *       .collect_paths(true)
 *       .run();
 *
 * Without a matcher every entry matches. Paths and errors are only
 * collected when asked for.
 */
class SearchBuilder {
public:
    SearchBuilder();

    SearchBuilder& source(std::shared_ptr<const Source> source);

    template<typename S, typename = std::enable_if_t<std::is_base_of_v<Source, std::decay_t<S>>>>
    SearchBuilder& source(S&& source) {
        return this->source(std::shared_ptr<const Source>(
            std::make_shared<std::decay_t<S>>(std::forward<S>(source))));
    }

    SearchBuilder& with_matcher(std::shared_ptr<const Matcher> matcher);

    template<typename M, typename = std::enable_if_t<std::is_base_of_v<Matcher, std::decay_t<M>>>>
    SearchBuilder& with_matcher(M&& matcher) {
        return with_matcher(std::shared_ptr<const Matcher>(
            std::make_shared<std::decay_t<M>>(std::forward<M>(matcher))));
    }

    // Any `bool(const Entry&)` callable
    template<typename F>
    SearchBuilder& with_predicate(F&& predicate) {
        return with_matcher(make_matcher(std::forward<F>(predicate)));
    }

    // Case-insensitive substring over the entry name
    SearchBuilder& matching(const std::string& pattern);

    SearchBuilder& limit(std::size_t n);
    SearchBuilder& threads(std::size_t n);
    SearchBuilder& max_depth(std::size_t depth);
    SearchBuilder& collect_paths(bool yes);
    SearchBuilder& collect_errors(bool yes);

    const EngineOptions& options() const { return options_; }

    /**
     * Validate the configuration, then search and block until done.
     * Throws ParexError: InvalidSource without a source, InvalidThreadCount
     * for zero threads, or whatever fatal error ended the traversal.
     */
    Results run() const;

private:
    std::shared_ptr<const Source> source_;
    EngineOptions options_;
};

inline SearchBuilder search() {
    return SearchBuilder();
}

} // namespace parex

#endif // PAREX_SEARCH_HPP
