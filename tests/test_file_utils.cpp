#include <gtest/gtest.h>
#include "utils/FileUtils.hpp"
#include "core/Errors.hpp"
#include "support/TempDir.hpp"

TEST(FileUtilsTest, ParentDirectory) {
    EXPECT_EQ(FileUtils::parent_directory("file.iso"), ".");
    EXPECT_EQ(FileUtils::parent_directory("/file.iso"), "/");
    EXPECT_EQ(FileUtils::parent_directory("a/b/file.iso"), "a/b");
    EXPECT_EQ(FileUtils::parent_directory("/srv/isos/file.iso"), "/srv/isos");
}

TEST(FileUtilsTest, CreatesNestedDirectoriesIdempotently) {
    TempDir dir;
    std::string nested = dir.file("one/two/three");

    FileUtils::make_directories(nested);
    EXPECT_TRUE(std::filesystem::is_directory(nested));
    EXPECT_NO_THROW(FileUtils::make_directories(nested));
}

TEST(FileUtilsTest, ParentOfBareNameNeedsNothing) {
    EXPECT_NO_THROW(FileUtils::make_parent_directories("file.iso"));
}

TEST(FileUtilsTest, FileInTheWayIsAStorageError) {
    TempDir dir;
    write_file(dir.file("blocker"), "x");
    EXPECT_THROW(FileUtils::make_parent_directories(dir.file("blocker/sub/file.iso")), StorageError);
}
