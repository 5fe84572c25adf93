#include <parex/sources/vector_source.hpp>
#include <parex/sources/walk_pool.hpp>
#include <parex/debug_log.hpp>

#include <algorithm>
#include <utility>

namespace parex {

namespace {

bool deliverable(const EntryResult& item, const WalkConfig& config) {
    const auto* entry = std::get_if<Entry>(&item);
    return !entry || config.within_depth(entry->depth());
}

class VectorStream final : public EntryStream {
public:
    VectorStream(std::shared_ptr<const std::vector<EntryResult>> items, const WalkConfig& config)
        : items_(std::move(items)), config_(config) {}

    std::optional<EntryResult> next() override {
        while (position_ < items_->size()) {
            const EntryResult& item = (*items_)[position_++];
            if (deliverable(item, config_)) {
                return item;
            }
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<const std::vector<EntryResult>> items_;
    WalkConfig config_;
    std::size_t position_{0};
};

} // namespace

VectorSource::VectorSource(std::vector<EntryResult> items)
    : items_(std::make_shared<const std::vector<EntryResult>>(std::move(items))) {}

std::unique_ptr<EntryStream> VectorSource::walk(const WalkConfig& config) const {
    return std::make_unique<VectorStream>(items_, config);
}

ParallelVectorSource::ParallelVectorSource(std::vector<EntryResult> items, std::size_t batch_size)
    : items_(std::make_shared<const std::vector<EntryResult>>(std::move(items))),
      batch_size_(std::max<std::size_t>(1, batch_size)) {}

void ParallelVectorSource::walk(const WalkConfig& config, const EntryVisitor& visitor) const {
    const auto& items = *items_;

    run_walk_pool(config.threads, [&](WalkPool& pool) {
        for (std::size_t begin = 0; begin < items.size(); begin += batch_size_) {
            const std::size_t end = std::min(items.size(), begin + batch_size_);

            auto job = job_system::make_job([&items, &config, &visitor, &pool, begin, end]() {
                for (std::size_t i = begin; i < end; ++i) {
                    if (pool.stop_requested()) return;
                    if (!deliverable(items[i], config)) continue;

                    EntryResult item = items[i];
                    if (visitor(std::move(item)) == WalkVerdict::Quit) {
                        PAREX_DEBUG_LOG(VectorSource, "Quit at item %zu, stopping pool", i);
                        pool.request_stop();
                        return;
                    }
                }
            }, WalkJobType::VISIT);

            // FIFO keeps batches roughly in input order
            if (!pool.submit(std::move(job), job_system::ScheduleMode::FIFO)) {
                return;
            }
        }
    });
}

} // namespace parex
