#ifndef PAREX_SOURCE_HPP
#define PAREX_SOURCE_HPP

#include <parex/entry.hpp>
#include <parex/error.hpp>
#include <parex/walk_config.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <variant>

namespace parex {

// One item from a producer: an entry, or an error about some entry
using EntryResult = std::variant<Entry, ParexError>;

enum class WalkVerdict {
    Continue,
    Quit
};

enum class SourceShape {
    Pull,   // the engine consumes one sequence on the calling thread
    Push    // the source calls back from its own worker pool
};

/**
 * Something traversable. Implement PullSource or PushSource, never this
 * class directly.
 */
class Source {
public:
    virtual ~Source() = default;

    virtual SourceShape shape() const noexcept = 0;
};

/**
 * Lazily produced sequence of items. next() returns std::nullopt once
 * the source is exhausted.
 */
class EntryStream {
public:
    virtual ~EntryStream() = default;

    virtual std::optional<EntryResult> next() = 0;
};

class PullSource : public Source {
public:
    SourceShape shape() const noexcept final { return SourceShape::Pull; }

    /**
     * Open a traversal. A fatal problem with the source itself (missing
     * root, unusable handle) is thrown here, before any item is produced.
     */
    virtual std::unique_ptr<EntryStream> walk(const WalkConfig& config) const = 0;
};

// Called concurrently from producer threads, one call per item
using EntryVisitor = std::function<WalkVerdict(EntryResult&&)>;

class PushSource : public Source {
public:
    SourceShape shape() const noexcept final { return SourceShape::Push; }

    /**
     * Traverse, calling visitor for every item from any number of worker
     * threads. Implementations must honor config.max_depth, stop
     * dispatching new work after any call returns Quit, and join all of
     * their workers before returning. Recoverable failures are reported
     * through the visitor; fatal ones may be reported through the visitor
     * or thrown.
     */
    virtual void walk(const WalkConfig& config, const EntryVisitor& visitor) const = 0;
};

} // namespace parex

#endif // PAREX_SOURCE_HPP
