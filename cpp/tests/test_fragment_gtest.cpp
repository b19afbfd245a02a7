// ==============================================================================
// test_fragment_gtest.cpp - Тесты сборки фрагментов (GoogleTest)
// ==============================================================================

#include <fireup/fragment.hpp>
#include <fireup/output.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fireup::leveldb::test {

using fireup::test::payload_text;
using fireup::test::TempDirTest;

namespace {

RawRecord make_record(RecordType type, const std::string& payload, std::uint64_t block = 0,
                      std::size_t offset = 0) {
    RawRecord record;
    record.header.type = type;
    record.header.length = static_cast<std::uint16_t>(payload.size());
    record.payload.assign(payload.begin(), payload.end());
    record.block_index = block;
    record.offset = offset;
    return record;
}

}  // namespace

TEST(FragmentReconstructorTest, FullRecordIsEmittedImmediately) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    ASSERT_TRUE(fragments.push(make_record(RecordType::Full, "whole"), out));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(payload_text(out[0].payload), "whole");
    EXPECT_EQ(out[0].fragments, 1u);
    EXPECT_FALSE(fragments.accumulating());
}

TEST(FragmentReconstructorTest, FirstMiddleLastConcatenateInOrder) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    ASSERT_TRUE(fragments.push(make_record(RecordType::First, "alpha-", 0, 100), out));
    EXPECT_TRUE(fragments.accumulating());
    ASSERT_TRUE(fragments.push(make_record(RecordType::Middle, "beta-", 1, 0), out));
    EXPECT_TRUE(out.empty());
    ASSERT_TRUE(fragments.push(make_record(RecordType::Last, "gamma", 2, 0), out));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(payload_text(out[0].payload), "alpha-beta-gamma");
    EXPECT_EQ(out[0].fragments, 3u);
    EXPECT_EQ(out[0].block_index, 0u);
    EXPECT_EQ(out[0].offset, 100u);
    EXPECT_FALSE(fragments.accumulating());
}

TEST(FragmentReconstructorTest, FirstLastWithoutMiddle) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    ASSERT_TRUE(fragments.push(make_record(RecordType::First, "ab"), out));
    ASSERT_TRUE(fragments.push(make_record(RecordType::Last, "cd"), out));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(payload_text(out[0].payload), "abcd");
}

TEST(FragmentReconstructorTest, MiddleWithoutFirstIsFatal) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    ASSERT_TRUE(fragments.push(make_record(RecordType::Full, "ok"), out));
    EXPECT_FALSE(fragments.push(make_record(RecordType::Middle, "orphan", 0, 9), out));

    ASSERT_TRUE(fragments.last_error().has_value());
    EXPECT_EQ(fragments.last_error()->type, RecordType::Middle);
    EXPECT_EQ(fragments.last_error()->offset, 9u);

    // После фатальной ошибки записи не принимаются
    EXPECT_FALSE(fragments.push(make_record(RecordType::Full, "later"), out));
    EXPECT_EQ(out.size(), 1u);
}

TEST(FragmentReconstructorTest, LastWithoutFirstIsFatal) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    EXPECT_FALSE(fragments.push(make_record(RecordType::Last, "orphan"), out));
    ASSERT_TRUE(fragments.last_error().has_value());
    EXPECT_EQ(fragments.last_error()->type, RecordType::Last);
    EXPECT_TRUE(out.empty());
}

TEST(FragmentReconstructorTest, FullDiscardsOpenFragment) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    ASSERT_TRUE(fragments.push(make_record(RecordType::First, "lost"), out));
    ASSERT_TRUE(fragments.push(make_record(RecordType::Full, "kept"), out));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(payload_text(out[0].payload), "kept");
    EXPECT_EQ(fragments.abandoned_fragments(), 1u);
    EXPECT_FALSE(fragments.accumulating());
}

TEST(FragmentReconstructorTest, FirstRestartsOpenFragment) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    ASSERT_TRUE(fragments.push(make_record(RecordType::First, "old-"), out));
    ASSERT_TRUE(fragments.push(make_record(RecordType::First, "new-"), out));
    ASSERT_TRUE(fragments.push(make_record(RecordType::Last, "end"), out));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(payload_text(out[0].payload), "new-end");
    EXPECT_EQ(fragments.abandoned_fragments(), 1u);
}

TEST(FragmentReconstructorTest, OpenFragmentAtEndIsDropped) {
    FragmentReconstructor fragments;
    std::vector<LogicalRecord> out;

    ASSERT_TRUE(fragments.push(make_record(RecordType::First, "start"), out));
    ASSERT_TRUE(fragments.push(make_record(RecordType::Middle, "more"), out));
    fragments.finish();

    EXPECT_TRUE(out.empty());
    EXPECT_EQ(fragments.dropped_fragments(), 1u);
    EXPECT_FALSE(fragments.accumulating());
    EXPECT_FALSE(fragments.last_error().has_value());
}

TEST(FragmentReconstructorTest, FinishWithoutOpenFragmentIsNoop) {
    FragmentReconstructor fragments;
    fragments.finish();
    EXPECT_EQ(fragments.dropped_fragments(), 0u);
}

class FragmentLoggingTest : public TempDirTest {};

TEST_F(FragmentLoggingTest, WarningsGoToWriter) {
    auto log_path = test_dir_ / "fireup.log";
    {
        output::OutputConfig cfg;
        cfg.log_path = log_path;
        output::Writer writer(cfg);

        FragmentReconstructor fragments(&writer);
        std::vector<LogicalRecord> out;
        ASSERT_TRUE(fragments.push(make_record(RecordType::First, "a"), out));
        ASSERT_TRUE(fragments.push(make_record(RecordType::Full, "b"), out));
        ASSERT_TRUE(fragments.push(make_record(RecordType::First, "c"), out));
        fragments.finish();
    }

    std::ifstream in(log_path);
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();

    EXPECT_NE(text.find("[!] discarding incomplete fragment"), std::string::npos);
    EXPECT_NE(text.find("[!] dropping incomplete fragment at end of input"), std::string::npos);
}

}  // namespace fireup::leveldb::test
