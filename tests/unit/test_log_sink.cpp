#include <gtest/gtest.h>

#include "LogSink.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

class LogSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = test_support::makeTempDir("logsink");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    std::string numberedLines(int count) {
        std::string text;
        for (int i = 1; i <= count; ++i) {
            text += "line " + std::to_string(i) + "\n";
        }
        return text;
    }

    fs::path root_;
};

// ─── Tail ───────────────────────────────────────────────────────────────────

TEST_F(LogSinkTest, MissingLogIsUnavailable) {
    LogSink sink(root_.string());
    auto tail = sink.tail("never_started", 1000);

    ASSERT_TRUE(tail.ok());
    EXPECT_FALSE(tail.value->available);
    EXPECT_TRUE(tail.value->text.empty());
}

TEST_F(LogSinkTest, LongLogReturnsLastLines) {
    LogSink sink(root_.string());
    test_support::writeFile(sink.logPath("bot"), numberedLines(1500));

    auto tail = sink.tail("bot", 1000);
    ASSERT_TRUE(tail.ok());
    ASSERT_TRUE(tail.value->available);

    const std::string& text = tail.value->text;
    EXPECT_EQ(text.rfind("line 501\n", 0), 0u);
    EXPECT_EQ(text, numberedLines(1500).substr(numberedLines(500).size()));
    EXPECT_EQ(text.back(), '\n');
}

TEST_F(LogSinkTest, ShortLogReturnedWhole) {
    LogSink sink(root_.string());
    test_support::writeFile(sink.logPath("bot"), numberedLines(3));

    auto tail = sink.tail("bot", 1000);
    ASSERT_TRUE(tail.ok());
    EXPECT_EQ(tail.value->text, "line 1\nline 2\nline 3\n");
}

TEST_F(LogSinkTest, UnterminatedLastLineCounts) {
    LogSink sink(root_.string());
    test_support::writeFile(sink.logPath("bot"), "a\nb\nc");

    auto tail = sink.tail("bot", 2);
    ASSERT_TRUE(tail.ok());
    EXPECT_EQ(tail.value->text, "b\nc");
}

TEST_F(LogSinkTest, EmptyLogIsAvailable) {
    LogSink sink(root_.string());
    test_support::writeFile(sink.logPath("bot"), "");

    auto tail = sink.tail("bot", 10);
    ASSERT_TRUE(tail.ok());
    EXPECT_TRUE(tail.value->available);
    EXPECT_TRUE(tail.value->text.empty());
}

TEST_F(LogSinkTest, TailSpansReadChunks) {
    // Lines long enough that the scan crosses several 64 KiB chunks
    const std::string filler(1000, 'x');
    std::string text;
    for (int i = 0; i < 300; ++i) {
        text += std::to_string(i) + filler + "\n";
    }
    test_support::writeFile(root_ / "big.log", text);

    auto tail = LogSink::tailFile((root_ / "big.log").string(), 200);
    ASSERT_TRUE(tail.ok());
    EXPECT_EQ(tail.value->text.rfind("100" + filler + "\n", 0), 0u);
    EXPECT_EQ(tail.value->text.size(), text.size() - text.find("100" + filler));
}

// ─── Run files ──────────────────────────────────────────────────────────────

TEST_F(LogSinkTest, OpenForRunTruncatesPreviousRun) {
    LogSink sink(root_.string());
    test_support::writeFile(sink.logPath("bot"), "old run output\n");

    std::string error;
    int fd = sink.openForRun("bot", error);
    ASSERT_GE(fd, 0) << error;
    const std::string fresh = "new run\n";
    ASSERT_EQ(write(fd, fresh.data(), fresh.size()), static_cast<ssize_t>(fresh.size()));
    close(fd);

    EXPECT_EQ(test_support::readFile(sink.logPath("bot")), "new run\n");
}

TEST_F(LogSinkTest, OpenForRunReportsMissingDirectory) {
    LogSink sink((root_ / "does" / "not" / "exist").string());
    std::string error;
    EXPECT_LT(sink.openForRun("bot", error), 0);
    EXPECT_FALSE(error.empty());
}

TEST_F(LogSinkTest, RemoveIsBestEffort) {
    LogSink sink(root_.string());
    test_support::writeFile(sink.logPath("bot"), "x\n");

    sink.remove("bot");
    EXPECT_FALSE(fs::exists(sink.logPath("bot")));

    // Removing again is harmless
    sink.remove("bot");
    EXPECT_FALSE(fs::exists(sink.logPath("bot")));
}
