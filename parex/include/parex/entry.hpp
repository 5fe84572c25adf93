#ifndef PAREX_ENTRY_HPP
#define PAREX_ENTRY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace parex {

/**
 * Producer-assigned classification. Only File and Directory are tallied
 * in the scan statistics; every kind is still offered to the matcher.
 */
enum class EntryKind : uint8_t {
    File,
    Directory,
    Symlink,
    Other   // devices, pipes, sockets, records without a file analogue
};

const char* to_string(EntryKind kind);

struct EntryMetadata {
    std::uintmax_t size{0};
    std::filesystem::file_time_type modified{};
    std::filesystem::perms permissions{std::filesystem::perms::unknown};
};

/**
 * One traversed item.
 *
 * The locator and label are fixed at construction. Metadata is a lazy
 * side channel: the engine never touches it, a matcher that needs it
 * loads it on first access and the value stays cached on this instance.
 * An Entry is handed to exactly one matcher call and is never shared
 * between threads.
 */
class Entry {
public:
    Entry(std::filesystem::path path, std::string name, EntryKind kind, std::size_t depth);

    // Builds an entry whose name is the last component of path
    static Entry from_path(std::filesystem::path path, EntryKind kind, std::size_t depth);

    const std::filesystem::path& path() const noexcept { return path_; }
    const std::string& name() const noexcept { return name_; }
    EntryKind kind() const noexcept { return kind_; }
    std::size_t depth() const noexcept { return depth_; }

    bool is_file() const noexcept { return kind_ == EntryKind::File; }
    bool is_directory() const noexcept { return kind_ == EntryKind::Directory; }

    bool has_metadata() const noexcept { return metadata_.has_value(); }

    /**
     * Returns the cached metadata, reading it from the filesystem on the
     * first call (symlinks are not followed). Throws a recoverable
     * ParexError when the path cannot be inspected.
     */
    const EntryMetadata& metadata() const;

    // Seed the cache, for producers or matchers with their own metadata
    void cache_metadata(const EntryMetadata& metadata) const { metadata_ = metadata; }

private:
    std::filesystem::path path_;
    std::string name_;
    EntryKind kind_;
    std::size_t depth_;
    mutable std::optional<EntryMetadata> metadata_;
};

} // namespace parex

#endif // PAREX_ENTRY_HPP
