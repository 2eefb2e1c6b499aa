// tests/common/io_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "common/io/io.hpp"
#include "test_utils.hpp"

using namespace common::io;
using ::testing::ElementsAre;

class IoTest : public ::testing::Test {
protected:
    test_utils::TemporaryDirectory directory;
};

TEST_F(IoTest, ImageExtensionsAreCaseInsensitive) {
    EXPECT_TRUE(isImageFile("a/b/cat.jpg"));
    EXPECT_TRUE(isImageFile("a/b/cat.JPEG"));
    EXPECT_TRUE(isImageFile("cat.Png"));
    EXPECT_FALSE(isImageFile("cat.gif"));
    EXPECT_FALSE(isImageFile("notes.txt"));
    EXPECT_FALSE(isImageFile("jpg"));
}

TEST_F(IoTest, HiddenEntriesAreDetected) {
    EXPECT_TRUE(isHidden(".DS_Store"));
    EXPECT_TRUE(isHidden("dataset/.cache"));
    EXPECT_FALSE(isHidden("dataset/cat"));
}

TEST_F(IoTest, ListingsSkipHiddenEntriesAndAreSorted) {
    test_utils::touch(directory / "b.jpg");
    test_utils::touch(directory / "a.jpg");
    test_utils::touch(directory / ".hidden.jpg");
    std::filesystem::create_directories(directory / "zeta");
    std::filesystem::create_directories(directory / "alpha");
    std::filesystem::create_directories(directory / ".git");

    EXPECT_THAT(listFiles(directory.path()), ElementsAre(directory / "a.jpg", directory / "b.jpg"));
    EXPECT_THAT(listDirectories(directory.path()), ElementsAre(directory / "alpha", directory / "zeta"));
}

TEST_F(IoTest, ListingMissingDirectoryThrows) {
    EXPECT_THROW(listFiles(directory / "missing"), std::runtime_error);
    EXPECT_THROW(listDirectories(directory / "missing"), std::runtime_error);
}

TEST_F(IoTest, CreateDirectoryIsIdempotent) {
    const auto nested = directory / "x" / "y";
    EXPECT_NO_THROW(createDirectory(nested));
    EXPECT_NO_THROW(createDirectory(nested));
    EXPECT_TRUE(directoryExists(nested));
}

TEST_F(IoTest, CopyFileRespectsOverwriteFlag) {
    const auto source = test_utils::touch(directory / "source.png", "new");
    const auto destination = test_utils::touch(directory / "destination.png", "old");

    EXPECT_THROW(copyFile(source, destination), std::runtime_error);
    EXPECT_EQ(readFile(destination), "old");

    EXPECT_NO_THROW(copyFile(source, destination, true));
    EXPECT_EQ(readFile(destination), "new");
}

TEST_F(IoTest, WriteAndReadRoundTrip) {
    const auto file = directory / "report.csv";
    writeStringToFile(file, "a,b\n1,2\n");
    writeStringToFile(file, "c\n");
    EXPECT_EQ(readFile(file), "c\n");
}

TEST_F(IoTest, RemoveDirectoryToleratesMissingTree) {
    test_utils::touch(directory / "tree" / "leaf" / "file.jpg");
    EXPECT_NO_THROW(removeDirectory(directory / "tree"));
    EXPECT_FALSE(directoryExists(directory / "tree"));
    EXPECT_NO_THROW(removeDirectory(directory / "tree"));
}
