#include <parex/entry.hpp>
#include <parex/error.hpp>

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace parex {

const char* to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::File: return "file";
        case EntryKind::Directory: return "directory";
        case EntryKind::Symlink: return "symlink";
        case EntryKind::Other: return "other";
    }
    return "unknown";
}

Entry::Entry(fs::path path, std::string name, EntryKind kind, std::size_t depth)
    : path_(std::move(path)), name_(std::move(name)), kind_(kind), depth_(depth) {}

Entry Entry::from_path(fs::path path, EntryKind kind, std::size_t depth) {
    std::string name = path.filename().string();
    return Entry(std::move(path), std::move(name), kind, depth);
}

const EntryMetadata& Entry::metadata() const {
    if (metadata_) {
        return *metadata_;
    }

    std::error_code ec;
    const fs::file_status status = fs::symlink_status(path_, ec);
    if (ec) {
        throw ParexError::from_error_code(path_, ec);
    }

    EntryMetadata loaded;
    loaded.permissions = status.permissions();

    if (fs::is_regular_file(status)) {
        loaded.size = fs::file_size(path_, ec);
        if (ec) {
            throw ParexError::from_error_code(path_, ec);
        }
    }

    // last_write_time follows symlinks; a dangling link has no target time
    if (!fs::is_symlink(status)) {
        loaded.modified = fs::last_write_time(path_, ec);
        if (ec) {
            throw ParexError::from_error_code(path_, ec);
        }
    }

    metadata_ = loaded;
    return *metadata_;
}

} // namespace parex
