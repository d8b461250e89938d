#include <gtest/gtest.h>
#include <xpipe/streams.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class FileStreamTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "xpipe_cli_streams_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST(StringSourceTest, ReadsInChunks) {
    xpipe::StringSource source("abcdefg");
    EXPECT_EQ(source.size(), 7u);
    EXPECT_EQ(source.read(3), "abc");
    EXPECT_EQ(source.read(3), "def");
    EXPECT_EQ(source.read(3), "g");
    EXPECT_FALSE(source.read(3).has_value());
}

TEST(StreamSourceTest, StopsAtEnd) {
    std::istringstream input("0123456789");
    xpipe::StreamSource source(input);
    EXPECT_EQ(xpipe::read_all(source, 4), "0123456789");
    EXPECT_FALSE(source.read(4).has_value());
}

TEST(StreamSinkTest, WritesThrough) {
    std::ostringstream output;
    xpipe::StreamSink sink(output);
    sink.write("ab");
    sink.write(std::string("\0c", 2));
    sink.flush();
    EXPECT_EQ(output.str(), std::string("ab\0c", 4));
}

TEST_F(FileStreamTest, FileRoundTripKeepsBinaryContent) {
    const auto path = test_dir / "blob.bin";
    std::string content;
    for (int i = 0; i < 3000; ++i) {
        content += static_cast<char>(i % 256);
    }
    {
        xpipe::FileSink sink(path);
        sink.write(content.substr(0, 1000));
        sink.write(content.substr(1000));
        sink.flush();
    }
    xpipe::FileSource source(path);
    EXPECT_EQ(source.size(), 3000u);
    EXPECT_EQ(xpipe::read_all(source, 1024), content);
}

TEST_F(FileStreamTest, SinkTruncatesExistingFile) {
    const auto path = test_dir / "existing.txt";
    std::ofstream(path) << "old content that is long";
    {
        xpipe::FileSink sink(path);
        sink.write("new");
    }
    xpipe::FileSource source(path);
    EXPECT_EQ(xpipe::read_all(source, 64), "new");
}

TEST_F(FileStreamTest, MissingSourceThrows) {
    EXPECT_THROW(xpipe::FileSource(test_dir / "missing"), std::runtime_error);
}

TEST_F(FileStreamTest, UnwritableSinkThrowsOnFirstWrite) {
    xpipe::FileSink sink(test_dir / "no-such-dir" / "file");
    EXPECT_THROW(sink.write("x"), std::runtime_error);
}

TEST_F(FileStreamTest, SinkLeavesFileAloneUntilWritten) {
    const auto path = test_dir / "keep.txt";
    std::ofstream(path) << "precious";
    {
        xpipe::FileSink sink(path);
        EXPECT_FALSE(sink.is_open());
    }
    xpipe::FileSource source(path);
    EXPECT_EQ(xpipe::read_all(source, 64), "precious");
}

TEST_F(FileStreamTest, FlushCreatesEmptyFile) {
    const auto path = test_dir / "empty.bin";
    {
        xpipe::FileSink sink(path);
        sink.flush();
    }
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(fs::file_size(path), 0u);
}
