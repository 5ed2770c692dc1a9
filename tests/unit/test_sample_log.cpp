/**
 * @file test_sample_log.cpp
 * @brief Unit tests for the sample log writer and reader.
 * @author Dimitris Kafetzis
 */

#include "log_store/sample_log.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

using namespace exec_profiler;

class SampleLogTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "ep_test_sample_log";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    std::filesystem::path write_raw(const std::string& content) {
        std::filesystem::create_directories(dir_);
        auto path = dir_ / "raw.log";
        std::ofstream(path) << content;
        return path;
    }
};

// ─── Writer ──────────────────────────────────

TEST_F(SampleLogTest, CreateMakesParentDirectories) {
    auto path = dir_ / "nested" / "deeper" / "exec.log";
    auto writer = SampleLogWriter::create(path);
    ASSERT_TRUE(writer.has_value()) << writer.error().message;
    EXPECT_TRUE(writer->is_open());
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(writer->path().string(), path.string());
}

TEST_F(SampleLogTest, AppendedSamplesReadBackInOrder) {
    auto path = dir_ / "exec.log";
    {
        auto writer = SampleLogWriter::create(path);
        ASSERT_TRUE(writer.has_value());
        ASSERT_TRUE(writer->append({100, 10}).has_value());
        ASSERT_TRUE(writer->append({200, 30}).has_value());
        ASSERT_TRUE(writer->append({300, 0}).has_value());
        EXPECT_EQ(writer->appended(), 3u);
        ASSERT_TRUE(writer->close().has_value());
    }

    auto contents = read_sample_log(path);
    ASSERT_TRUE(contents.has_value());
    ASSERT_EQ(contents->samples.size(), 3u);
    EXPECT_EQ(contents->samples[0], (Sample{100, 10}));
    EXPECT_EQ(contents->samples[1], (Sample{200, 30}));
    EXPECT_EQ(contents->samples[2], (Sample{300, 0}));
    EXPECT_EQ(contents->skipped_entries, 0u);
}

TEST_F(SampleLogTest, CreateTruncatesExistingLog) {
    auto path = write_raw("1 1\n2 2\n");
    auto writer = SampleLogWriter::create(path);
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer->close().has_value());

    auto contents = read_sample_log(path);
    ASSERT_TRUE(contents.has_value());
    EXPECT_TRUE(contents->samples.empty());
}

TEST_F(SampleLogTest, AppendAfterCloseFails) {
    auto writer = SampleLogWriter::create(dir_ / "exec.log");
    ASSERT_TRUE(writer.has_value());
    ASSERT_TRUE(writer->close().has_value());
    EXPECT_TRUE(writer->close().has_value());  // idempotent

    auto r = writer->append({1, 1});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LogIoFailure);
}

TEST_F(SampleLogTest, CreateInUnwritableLocationFails) {
    auto blocker = write_raw("not a directory");
    auto writer = SampleLogWriter::create(blocker / "exec.log");
    ASSERT_FALSE(writer.has_value());
    EXPECT_EQ(writer.error().code, ErrorCode::LogIoFailure);
}

// ─── Reader ──────────────────────────────────

TEST_F(SampleLogTest, MissingFileIsError) {
    auto r = read_sample_log(dir_ / "absent.log");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LogIoFailure);
}

TEST_F(SampleLogTest, MalformedLinesAreSkippedAndCounted) {
    auto path = write_raw("10 1\n"
                          "garbage\n"
                          "\n"
                          "20 2 extra\n"
                          "30 -4\n"
                          "40 4\n"
                          "50");  // torn final line
    auto r = read_sample_log(path);
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->samples.size(), 2u);
    EXPECT_EQ(r->samples[0], (Sample{10, 1}));
    EXPECT_EQ(r->samples[1], (Sample{40, 4}));
    EXPECT_EQ(r->skipped_entries, 4u);
}

TEST(SampleLineTest, ParseAcceptsSurroundingWhitespace) {
    auto s = parse_sample_line("  123\t456  \r");
    ASSERT_TRUE(s.has_value());
    EXPECT_EQ(s->timestamp_ns, 123);
    EXPECT_EQ(s->resident_memory_kb, 456u);
}

TEST(SampleLineTest, ParseRejectsJoinedFields) {
    EXPECT_FALSE(parse_sample_line("123456").has_value());
    EXPECT_FALSE(parse_sample_line("12x 4").has_value());
    EXPECT_FALSE(parse_sample_line("").has_value());
}

TEST(SampleLineTest, ParseRejectsNegativeFields) {
    EXPECT_FALSE(parse_sample_line("-5 10").has_value());
    EXPECT_FALSE(parse_sample_line("5 -10").has_value());
}

TEST_F(SampleLogTest, NegativeTimestampLineIsSkipped) {
    auto r = read_sample_log(write_raw("-5 10\n20 30\n"));
    ASSERT_TRUE(r.has_value());
    ASSERT_EQ(r->samples.size(), 1u);
    EXPECT_EQ(r->samples[0], (Sample{20, 30}));
    EXPECT_EQ(r->skipped_entries, 1u);
}

TEST(SampleLineTest, FormatMatchesWriter) {
    EXPECT_EQ(format_sample_line({1700000000123456789, 3072}), "1700000000123456789 3072");
}

// ─── SampleBuffer ────────────────────────────

TEST(SampleBufferTest, CollectsSamples) {
    SampleBuffer buffer;
    ASSERT_TRUE(buffer.append({1, 2}).has_value());
    ASSERT_TRUE(buffer.append({3, 4}).has_value());
    ASSERT_EQ(buffer.samples().size(), 2u);
    buffer.clear();
    EXPECT_TRUE(buffer.samples().empty());
}

// ─── make_log_path ───────────────────────────

TEST(LogPathTest, PathsAreUniqueAndUnderDir) {
    std::set<std::filesystem::path> seen;
    for (int i = 0; i < 1000; ++i) {
        auto path = make_log_path("/tmp/profiles", "run");
        EXPECT_EQ(path.parent_path().string(), "/tmp/profiles");
        EXPECT_TRUE(path.filename().string().starts_with("run-"));
        EXPECT_EQ(path.extension().string(), ".log");
        EXPECT_TRUE(seen.insert(path).second);
    }
}
