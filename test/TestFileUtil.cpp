#include "BaseTestFixture.h"
#include <chrono>
#include <set>
#include <thread>
#include <unistd.h>

class FileUtilTest : public BaseTestFixture {};

// --- Reading ---

TEST_F(FileUtilTest, ToStringReadsWholeFile) {
    ASSERT_EQ(FileUtil::toString(textFile), "first\nsecond\nthird\n");
    ASSERT_EQ(FileUtil::toString(emptyFile), "");
}

TEST_F(FileUtilTest, ToByteArray) {
    createFile(tempDir / "bytes.bin", std::string("\x00\x01\xff", 3));
    auto bytes = FileUtil::toByteArray(tempDir / "bytes.bin");
    ASSERT_EQ(bytes.size(), 3u);
    ASSERT_EQ(bytes[0], 0x00);
    ASSERT_EQ(bytes[1], 0x01);
    ASSERT_EQ(bytes[2], 0xff);
}

TEST_F(FileUtilTest, ToLines) {
    auto lines = FileUtil::toLines(textFile);
    ASSERT_EQ(lines, (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(FileUtilTest, ToLinesMixedTerminators) {
    createFile(tempDir / "mixed.txt", "a\r\nb\rc\n\nd");
    auto lines = FileUtil::toLines(tempDir / "mixed.txt");
    ASSERT_EQ(lines, (std::vector<std::string>{"a", "b", "c", "", "d"}));
}

TEST_F(FileUtilTest, ToLinesEmptyFile) {
    ASSERT_TRUE(FileUtil::toLines(emptyFile).empty());
}

TEST_F(FileUtilTest, ReadMissingFileThrows) {
    ASSERT_THROW(FileUtil::toString(missingFile), fs::filesystem_error);
    ASSERT_THROW(FileUtil::toByteArray(missingFile), fs::filesystem_error);
    ASSERT_THROW(FileUtil::toLines(missingFile), fs::filesystem_error);
    try {
        FileUtil::toString(missingFile);
        FAIL() << "expected filesystem_error";
    } catch (const fs::filesystem_error& e) {
        ASSERT_TRUE(e.code() == std::errc::no_such_file_or_directory);
        ASSERT_EQ(e.path1(), missingFile);
    }
}

// --- Writing ---

TEST_F(FileUtilTest, WriteThenReadIsIdentical) {
    const std::string content = "h\xC3\xA9llo w\xC3\xB6rld \xE4\xB8\xAD\xE6\x96\x87\r\nline two\n";
    fs::path file = tempDir / "utf8.txt";
    FileUtil::write(content, file);
    ASSERT_EQ(FileUtil::toString(file), content);
    ASSERT_EQ(readFile(file), content);
}

TEST_F(FileUtilTest, WriteOverwrites) {
    FileUtil::write("short", textFile);
    ASSERT_EQ(readFile(textFile), "short");
}

TEST_F(FileUtilTest, AppendAddsToEnd) {
    FileUtil::append("fourth\n", textFile);
    ASSERT_EQ(readFile(textFile), "first\nsecond\nthird\nfourth\n");

    fs::path fresh = tempDir / "fresh.txt";
    FileUtil::append("new", fresh);
    ASSERT_EQ(readFile(fresh), "new");
}

TEST_F(FileUtilTest, WriteIntoMissingDirectoryThrows) {
    ASSERT_THROW(FileUtil::write("x", tempDir / "no_such_dir" / "file.txt"), fs::filesystem_error);
}

// --- Copy / Move ---

TEST_F(FileUtilTest, Copy) {
    fs::path target = subdirPath / "copy.txt";
    FileUtil::copy(textFile, target);
    ASSERT_TRUE(fs::exists(textFile));
    ASSERT_EQ(readFile(target), readFile(textFile));
}

TEST_F(FileUtilTest, CopyOverwritesTarget) {
    fs::path target = subdirPath / "copy.txt";
    createFile(target, "old content that is longer than the source");
    createFile(textFile, "new");
    FileUtil::copy(textFile, target);
    ASSERT_EQ(readFile(target), "new");
}

TEST_F(FileUtilTest, CopyOntoItselfThrows) {
    ASSERT_THROW(FileUtil::copy(textFile, textFile), UtilToolException);
    ASSERT_EQ(readFile(textFile), "first\nsecond\nthird\n");
}

TEST_F(FileUtilTest, CopyMissingSourceThrows) {
    ASSERT_THROW(FileUtil::copy(missingFile, tempDir / "target.txt"), fs::filesystem_error);
}

TEST_F(FileUtilTest, Move) {
    fs::path target = subdirPath / "moved.txt";
    FileUtil::move(textFile, target);
    ASSERT_FALSE(fs::exists(textFile));
    ASSERT_EQ(readFile(target), "first\nsecond\nthird\n");
}

TEST_F(FileUtilTest, MoveByCopy) {
    fs::path target = subdirPath / "copied_then_deleted.txt";
    FileUtil::moveByCopy(textFile, target);
    ASSERT_FALSE(fs::exists(textFile));
    ASSERT_EQ(readFile(target), "first\nsecond\nthird\n");
}

TEST_F(FileUtilTest, MoveByCopyRemovesCopyWhenSourceCannotBeDeleted) {
    fs::path lockedDir = tempDir / "locked";
    fs::create_directory(lockedDir);
    fs::path source = lockedDir / "source.txt";
    createFile(source, "payload");
    fs::permissions(lockedDir, fs::perms::owner_read | fs::perms::owner_exec);

    if (::access(lockedDir.c_str(), W_OK) == 0) {
        fs::permissions(lockedDir, fs::perms::owner_all);
        GTEST_SKIP() << "running with permission to delete from read-only directories";
    }

    fs::path target = subdirPath / "target.txt";
    ASSERT_THROW(FileUtil::moveByCopy(source, target), fs::filesystem_error);
    fs::permissions(lockedDir, fs::perms::owner_all);

    ASSERT_TRUE(fs::exists(source));
    ASSERT_EQ(readFile(source), "payload");
    ASSERT_FALSE(fs::exists(target));
}

TEST_F(FileUtilTest, MoveMissingSourceThrows) {
    ASSERT_THROW(FileUtil::move(missingFile, tempDir / "target.txt"), fs::filesystem_error);
}

// --- Creation ---

TEST_F(FileUtilTest, TouchCreatesEmptyFile) {
    fs::path file = tempDir / "touched.txt";
    ASSERT_FALSE(fs::exists(file));
    FileUtil::touch(file);
    ASSERT_TRUE(fs::exists(file));
    ASSERT_EQ(fs::file_size(file), 0u);
}

TEST_F(FileUtilTest, TouchUpdatesTimestampKeepsContent) {
    auto old = fs::file_time_type::clock::now() - std::chrono::hours(1);
    fs::last_write_time(textFile, old);

    FileUtil::touch(textFile);

    ASSERT_TRUE(fs::last_write_time(textFile) > old);
    ASSERT_EQ(readFile(textFile), "first\nsecond\nthird\n");
}

TEST_F(FileUtilTest, CreateTempDir) {
    fs::path dir = FileUtil::createTempDir();
    ASSERT_TRUE(fs::is_directory(dir));
    ASSERT_TRUE(fs::is_empty(dir));
    fs::remove(dir);
}

TEST_F(FileUtilTest, CreateTempDirTwiceGivesDistinctDirectories) {
    fs::path first = FileUtil::createTempDir();
    fs::path second = FileUtil::createTempDir();

    ASSERT_NE(first, second);
    ASSERT_TRUE(fs::is_directory(first));
    ASSERT_TRUE(fs::is_directory(second));
    ASSERT_TRUE(fs::is_empty(first));
    ASSERT_TRUE(fs::is_empty(second));

    fs::remove(first);
    fs::remove(second);
}

TEST_F(FileUtilTest, CreateTempDirConcurrently) {
    std::vector<fs::path> dirs(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < dirs.size(); i++) {
        threads.emplace_back([&dirs, i]() { dirs[i] = FileUtil::createTempDir(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<fs::path> unique(dirs.begin(), dirs.end());
    ASSERT_EQ(unique.size(), dirs.size());
    for (const auto& dir : dirs) {
        ASSERT_TRUE(fs::is_directory(dir));
        fs::remove(dir);
    }
}

TEST_F(FileUtilTest, CreateParentDirs) {
    fs::path file = tempDir / "a" / "b" / "c" / "file.txt";
    FileUtil::createParentDirs(file);
    ASSERT_TRUE(fs::is_directory(tempDir / "a" / "b" / "c"));
    ASSERT_FALSE(fs::exists(file));

    // Already there: nothing to do
    FileUtil::createParentDirs(file);
    ASSERT_TRUE(fs::is_directory(tempDir / "a" / "b" / "c"));
}

TEST_F(FileUtilTest, CreateParentDirsBlockedByFileThrows) {
    ASSERT_THROW(FileUtil::createParentDirs(textFile / "child" / "file.txt"), fs::filesystem_error);
}

// --- Streams ---

TEST_F(FileUtilTest, NewReader) {
    std::ifstream reader = FileUtil::newReader(textFile);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(reader, line)) {
        lines.push_back(line);
    }
    ASSERT_EQ(lines, (std::vector<std::string>{"first", "second", "third"}));
}

TEST_F(FileUtilTest, NewWriterTruncates) {
    {
        std::ofstream writer = FileUtil::newWriter(textFile);
        writer << "replaced\n";
    }
    ASSERT_EQ(readFile(textFile), "replaced\n");
}

TEST_F(FileUtilTest, NewReaderMissingFileThrows) {
    ASSERT_THROW(FileUtil::newReader(missingFile), fs::filesystem_error);
}
