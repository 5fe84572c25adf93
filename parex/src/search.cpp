#include <parex/search.hpp>

#include <utility>

namespace parex {

SearchBuilder::SearchBuilder() {
    options_.config.threads = default_thread_count();
}

SearchBuilder& SearchBuilder::source(std::shared_ptr<const Source> source) {
    source_ = std::move(source);
    return *this;
}

SearchBuilder& SearchBuilder::with_matcher(std::shared_ptr<const Matcher> matcher) {
    options_.matcher = std::move(matcher);
    return *this;
}

SearchBuilder& SearchBuilder::matching(const std::string& pattern) {
    options_.matcher = std::make_shared<SubstringMatcher>(pattern);
    return *this;
}

SearchBuilder& SearchBuilder::limit(std::size_t n) {
    options_.config.limit = n;
    return *this;
}

SearchBuilder& SearchBuilder::threads(std::size_t n) {
    options_.config.threads = n;
    return *this;
}

SearchBuilder& SearchBuilder::max_depth(std::size_t depth) {
    options_.config.max_depth = depth;
    return *this;
}

SearchBuilder& SearchBuilder::collect_paths(bool yes) {
    options_.collect_paths = yes;
    return *this;
}

SearchBuilder& SearchBuilder::collect_errors(bool yes) {
    options_.collect_errors = yes;
    return *this;
}

Results SearchBuilder::run() const {
    if (!source_) {
        throw ParexError::invalid_source("no source provided");
    }
    if (!valid_thread_count(options_.config.threads)) {
        throw ParexError::invalid_thread_count(options_.config.threads);
    }

    return parex::run(*source_, options_);
}

} // namespace parex
