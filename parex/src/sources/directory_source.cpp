#include <parex/sources/directory_source.hpp>
#include <parex/sources/walk_pool.hpp>
#include <parex/debug_log.hpp>

#include <deque>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace parex {

EntryKind kind_from_status(const fs::file_status& status) {
    if (fs::is_symlink(status)) return EntryKind::Symlink;
    if (fs::is_directory(status)) return EntryKind::Directory;
    if (fs::is_regular_file(status)) return EntryKind::File;
    return EntryKind::Other;
}

namespace {

void require_directory(const fs::path& root) {
    std::error_code ec;
    const fs::file_status status = fs::status(root, ec);
    if (ec || !fs::is_directory(status)) {
        throw ParexError::invalid_source(root);
    }
}

/**
 * Shared by every ENUMERATE job of one walk. Lives on the stack of
 * DirectorySource::walk(), so it outlives the pool and all of its jobs.
 */
struct ParallelWalk {
    const WalkConfig& config;
    const EntryVisitor& visitor;
    WalkPool* pool{nullptr};

    // Returns false once the walk must stop
    bool deliver(EntryResult&& item) {
        if (visitor(std::move(item)) == WalkVerdict::Quit) {
            pool->request_stop();
            return false;
        }
        return true;
    }

    bool schedule(fs::path directory, std::size_t depth) {
        PAREX_DEBUG_LOG(DirectorySource, "Scheduling %s at depth %zu", directory.c_str(), depth);

        auto job = job_system::make_job([this, directory = std::move(directory), depth]() {
            enumerate(directory, depth);
        }, WalkJobType::ENUMERATE);

        return pool->submit(std::move(job), job_system::ScheduleMode::LIFO);
    }

    void enumerate(const fs::path& directory, std::size_t depth) {
        if (pool->stop_requested()) return;

        std::error_code ec;
        fs::directory_iterator it(directory, ec);
        if (ec) {
            deliver(ParexError::from_error_code(directory, ec));
            return;
        }

        const std::size_t child_depth = depth + 1;
        for (const fs::directory_iterator end; it != end;) {
            if (pool->stop_requested()) return;

            const fs::path child = it->path();
            const fs::file_status status = it->symlink_status(ec);
            if (ec) {
                if (!deliver(ParexError::from_error_code(child, ec))) return;
            } else {
                const EntryKind kind = kind_from_status(status);
                if (!deliver(Entry::from_path(child, kind, child_depth))) return;

                if (kind == EntryKind::Directory && config.may_descend(child_depth)) {
                    if (!schedule(child, child_depth)) return;
                }
            }

            it.increment(ec);
            if (ec) {
                deliver(ParexError::from_error_code(directory, ec));
                return;
            }
        }
    }
};

class DirectoryStream final : public EntryStream {
public:
    DirectoryStream(const fs::path& root, const WalkConfig& config) : config_(config) {
        if (config_.may_descend(0)) {
            open(root, 0);
        }
    }

    std::optional<EntryResult> next() override {
        if (!queued_.empty()) {
            EntryResult item = std::move(queued_.front());
            queued_.pop_front();
            return item;
        }

        while (!stack_.empty()) {
            Frame& top = stack_.back();
            if (top.it == fs::directory_iterator()) {
                stack_.pop_back();
                continue;
            }

            const fs::path child = top.it->path();
            std::error_code status_ec;
            const fs::file_status status = top.it->symlink_status(status_ec);
            const std::size_t child_depth = top.depth + 1;

            std::error_code ec;
            top.it.increment(ec);
            if (ec) {
                queued_.emplace_back(ParexError::from_error_code(top.directory, ec));
                stack_.pop_back();
            }

            if (status_ec) {
                return EntryResult(ParexError::from_error_code(child, status_ec));
            }

            const EntryKind kind = kind_from_status(status);
            if (kind == EntryKind::Directory && config_.may_descend(child_depth)) {
                open(child, child_depth);
            }
            return EntryResult(Entry::from_path(child, kind, child_depth));
        }

        return std::nullopt;
    }

private:
    struct Frame {
        fs::path directory;
        fs::directory_iterator it;
        std::size_t depth;
    };

    // Unreadable directories are reported after their own entry
    void open(const fs::path& directory, std::size_t depth) {
        std::error_code ec;
        fs::directory_iterator it(directory, ec);
        if (ec) {
            queued_.emplace_back(ParexError::from_error_code(directory, ec));
            return;
        }
        stack_.push_back(Frame{directory, std::move(it), depth});
    }

    WalkConfig config_;
    std::vector<Frame> stack_;
    std::deque<EntryResult> queued_;
};

} // namespace

DirectorySource::DirectorySource(fs::path root) : root_(std::move(root)) {}

void DirectorySource::walk(const WalkConfig& config, const EntryVisitor& visitor) const {
    require_directory(root_);

    ParallelWalk walk{config, visitor};

    run_walk_pool(config.threads, [&](WalkPool& pool) {
        walk.pool = &pool;
        if (config.may_descend(0)) {
            walk.schedule(root_, 0);
        }
    });
}

SequentialDirectorySource::SequentialDirectorySource(fs::path root) : root_(std::move(root)) {}

std::unique_ptr<EntryStream> SequentialDirectorySource::walk(const WalkConfig& config) const {
    require_directory(root_);
    return std::make_unique<DirectoryStream>(root_, config);
}

} // namespace parex
