#include <gtest/gtest.h>
#include <parex/entry.hpp>
#include <parex/error.hpp>
#include "test_helpers.hpp"

using namespace parex;
using namespace test_utils;

TEST(Entry, FromPathUsesLastComponent) {
    auto entry = Entry::from_path("root/subdir/invoice_mar.txt", EntryKind::File, 2);

    EXPECT_EQ(entry.name(), "invoice_mar.txt");
    EXPECT_EQ(entry.path().string(), "root/subdir/invoice_mar.txt");
    EXPECT_EQ(entry.depth(), 2u);
    EXPECT_TRUE(entry.is_file());
    EXPECT_FALSE(entry.is_directory());
}

TEST(Entry, ExplicitNameIsKept) {
    Entry entry("db://table/42", "row-42", EntryKind::Other, 1);

    EXPECT_EQ(entry.name(), "row-42");
    EXPECT_EQ(entry.kind(), EntryKind::Other);
}

TEST(Entry, KindNames) {
    EXPECT_STREQ(to_string(EntryKind::File), "file");
    EXPECT_STREQ(to_string(EntryKind::Directory), "directory");
    EXPECT_STREQ(to_string(EntryKind::Symlink), "symlink");
    EXPECT_STREQ(to_string(EntryKind::Other), "other");
}

TEST(Entry, MetadataIsLoadedLazily) {
    TempDirectory dir;
    write_file(dir.path() / "data.txt", "12345");

    auto entry = Entry::from_path(dir.path() / "data.txt", EntryKind::File, 1);
    EXPECT_FALSE(entry.has_metadata());

    const EntryMetadata& metadata = entry.metadata();
    EXPECT_TRUE(entry.has_metadata());
    EXPECT_EQ(metadata.size, 5u);
    EXPECT_NE(metadata.permissions, std::filesystem::perms::unknown);

    // Cached: later changes on disk are not observed
    write_file(dir.path() / "data.txt", "1234567890");
    EXPECT_EQ(entry.metadata().size, 5u);
}

TEST(Entry, DirectoryMetadataHasNoSize) {
    TempDirectory dir;
    auto entry = Entry::from_path(dir.path(), EntryKind::Directory, 0);

    EXPECT_EQ(entry.metadata().size, 0u);
}

TEST(Entry, MissingPathIsNotFound) {
    TempDirectory dir;
    auto entry = Entry::from_path(dir.path() / "missing.txt", EntryKind::File, 1);

    try {
        entry.metadata();
        FAIL() << "expected NotFound";
    } catch (const ParexError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_TRUE(e.is_recoverable());
        ASSERT_TRUE(e.path().has_value());
        EXPECT_EQ(e.path()->string(), (dir.path() / "missing.txt").string());
    }
    EXPECT_FALSE(entry.has_metadata());
}

TEST(Entry, CachedMetadataSkipsFilesystem) {
    auto entry = make_file("remote/object.bin");

    EntryMetadata metadata;
    metadata.size = 4096;
    entry.cache_metadata(metadata);

    EXPECT_TRUE(entry.has_metadata());
    EXPECT_EQ(entry.metadata().size, 4096u);
}
