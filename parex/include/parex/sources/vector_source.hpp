#ifndef PAREX_SOURCES_VECTOR_SOURCE_HPP
#define PAREX_SOURCES_VECTOR_SOURCE_HPP

#include <parex/source.hpp>
#include <cstddef>
#include <memory>
#include <vector>

namespace parex {

/**
 * In-memory items consumed in order on the calling thread. Entries deeper
 * than config.max_depth are skipped; errors are always delivered.
 */
class VectorSource final : public PullSource {
public:
    explicit VectorSource(std::vector<EntryResult> items);

    std::unique_ptr<EntryStream> walk(const WalkConfig& config) const override;

    std::size_t size() const { return items_->size(); }

private:
    std::shared_ptr<const std::vector<EntryResult>> items_;
};

/**
 * In-memory items fanned out over a worker pool in batches, so the visitor
 * is called from config.threads threads at once. Same depth rule as
 * VectorSource.
 */
class ParallelVectorSource final : public PushSource {
public:
    explicit ParallelVectorSource(std::vector<EntryResult> items, std::size_t batch_size = 16);

    void walk(const WalkConfig& config, const EntryVisitor& visitor) const override;

    std::size_t size() const { return items_->size(); }

private:
    std::shared_ptr<const std::vector<EntryResult>> items_;
    std::size_t batch_size_;
};

} // namespace parex

#endif // PAREX_SOURCES_VECTOR_SOURCE_HPP
