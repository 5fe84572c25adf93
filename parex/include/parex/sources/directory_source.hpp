#ifndef PAREX_SOURCES_DIRECTORY_SOURCE_HPP
#define PAREX_SOURCES_DIRECTORY_SOURCE_HPP

#include <parex/source.hpp>
#include <filesystem>
#include <memory>

namespace parex {

// Classify without following symlinks
EntryKind kind_from_status(const std::filesystem::file_status& status);

/**
 * Parallel filesystem walk: every directory is one job on a work-stealing
 * pool of config.threads workers.
 *
 * The root itself is not emitted; its children have depth 1. Directories
 * at config.max_depth are emitted but not read. Symlinks are reported as
 * such and never followed. Unreadable entries are reported as
 * recoverable errors. A root that is missing or not a directory throws
 * InvalidSource before any worker starts.
 */
class DirectorySource final : public PushSource {
public:
    explicit DirectorySource(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    void walk(const WalkConfig& config, const EntryVisitor& visitor) const override;

private:
    std::filesystem::path root_;
};

/**
 * Same traversal rules as DirectorySource, produced depth-first on the
 * calling thread.
 */
class SequentialDirectorySource final : public PullSource {
public:
    explicit SequentialDirectorySource(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::unique_ptr<EntryStream> walk(const WalkConfig& config) const override;

private:
    std::filesystem::path root_;
};

} // namespace parex

#endif // PAREX_SOURCES_DIRECTORY_SOURCE_HPP
