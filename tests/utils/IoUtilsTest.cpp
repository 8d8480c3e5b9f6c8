#include <gtest/gtest.h>
#include "utils/io_utils.h"
#include "support/TempDirectory.h"

#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

TEST(IoUtilsTest, ReadLinesSkipsEmptyLinesAndCarriageReturns) {
    TempDirectory tempDir;
    auto filePath = tempDir.file("tasks.txt", "first\r\n\nsecond; third\n\n");

    std::vector<std::string> lines;
    utils::readLines(filePath, lines);

    EXPECT_EQ(lines, (std::vector<std::string>{ "first", "second; third" }));
}

TEST(IoUtilsTest, ReadLinesOfMissingFileThrows) {
    TempDirectory tempDir;

    std::vector<std::string> lines;

    EXPECT_THROW(utils::readLines((tempDir.path() / "missing.txt").string(), lines), std::runtime_error);
}

TEST(IoUtilsTest, WriteFileReplacesContent) {
    TempDirectory tempDir;
    auto filePath = tempDir.file("out.txt", "old content that is longer\n");

    utils::writeFile(filePath, "a\nb c\n");

    EXPECT_EQ(readText(filePath), "a\nb c\n");
}

TEST(IoUtilsTest, WriteIntoMissingDirectoryThrows) {
    TempDirectory tempDir;
    auto filePath = (tempDir.path() / "no" / "such" / "file").string();

    EXPECT_THROW(utils::writeFile(filePath, "x"), std::runtime_error);
}

TEST(IoUtilsTest, MakeExecutableAddsExecuteBits) {
    TempDirectory tempDir;
    auto filePath = tempDir.file("script.sh", "#!/bin/sh\n");

    utils::makeExecutable(filePath);

    auto permissions = fs::status(filePath).permissions();
    EXPECT_NE(permissions & fs::perms::owner_exec, fs::perms::none);
    EXPECT_NE(permissions & fs::perms::others_exec, fs::perms::none);
}
