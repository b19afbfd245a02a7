// ==============================================================================
// test_format_detect_gtest.cpp - Тесты определения формата (GoogleTest)
// ==============================================================================

#include <fireup/format_detect.hpp>
#include <fireup/leveldb_log.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>

namespace fireup::test {

// ==============================================================================
// detect_format
// ==============================================================================

TEST(DetectFormatTest, JsonLinesPrefix) {
    EXPECT_EQ(detect_format("{\"a\":1}\n{\"b\":2}\n"), InputFormat::JsonLines);
}

TEST(DetectFormatTest, ArrayLinesAreJsonLines) {
    EXPECT_EQ(detect_format("[1,2]\r\n[3]\r\n"), InputFormat::JsonLines);
}

TEST(DetectFormatTest, EmptyPrefixIsLevelDb) {
    EXPECT_EQ(detect_format(""), InputFormat::LevelDbLog);
}

TEST(DetectFormatTest, NoNewlineIsLevelDb) {
    EXPECT_EQ(detect_format("{\"a\":1}"), InputFormat::LevelDbLog);
}

TEST(DetectFormatTest, NoBracketIsLevelDb) {
    EXPECT_EQ(detect_format("plain text\nmore text\n"), InputFormat::LevelDbLog);
}

TEST(DetectFormatTest, InvalidUtf8IsLevelDb) {
    std::string sample = "{\"a\":1}\n";
    sample.push_back(static_cast<char>(0xFF));
    EXPECT_EQ(detect_format(sample), InputFormat::LevelDbLog);
}

TEST(DetectFormatTest, MultibyteTextIsJsonLines) {
    EXPECT_EQ(detect_format("{\"name\":\"Ёжик в тумане\"}\n"), InputFormat::JsonLines);
}

TEST(DetectFormatTest, TooManyControlCharactersIsLevelDb) {
    // 10 управляющих символов из 30: 67% печатаемых
    std::string sample = "{\"a\":1}\n";
    sample.append(10, '\x01');
    sample.append(12, 'x');
    EXPECT_EQ(detect_format(sample), InputFormat::LevelDbLog);
}

TEST(DetectFormatTest, PrintableRatioThresholdIsInclusive) {
    // 19 печатаемых + 1 управляющий = ровно 95%
    std::string sample = "{\"k\":\"abcdefghij\"}\n";
    ASSERT_EQ(sample.size(), 19u);
    sample.push_back('\x02');
    EXPECT_EQ(detect_format(sample), InputFormat::JsonLines);

    sample.push_back('\x02');
    EXPECT_EQ(detect_format(sample), InputFormat::LevelDbLog);
}

TEST(DetectFormatTest, BinaryLogBlockIsLevelDb) {
    LogBuilder log;
    log.add(leveldb::RecordType::Full, "{\"name\":\"users/u1\"}\n");
    auto bytes = log.bytes();
    std::string sample(bytes.begin(), bytes.begin() + 8192);

    EXPECT_EQ(detect_format(sample), InputFormat::LevelDbLog);
}

TEST(DetectFormatTest, FormatNames) {
    EXPECT_STREQ(input_format_to_string(InputFormat::LevelDbLog), "leveldb-log");
    EXPECT_STREQ(input_format_to_string(InputFormat::JsonLines), "json-lines");
}

// ==============================================================================
// UTF-8
// ==============================================================================

TEST(DecodeUtf8Test, DecodesAllSequenceLengths) {
    auto cps = decode_utf8("a\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
    ASSERT_TRUE(cps.has_value());
    ASSERT_EQ(cps->size(), 4u);
    EXPECT_EQ((*cps)[0], U'a');
    EXPECT_EQ((*cps)[1], U'é');
    EXPECT_EQ((*cps)[2], U'€');
    EXPECT_EQ((*cps)[3], U'\U0001F600');
}

TEST(DecodeUtf8Test, RejectsOverlongAndSurrogates) {
    EXPECT_FALSE(decode_utf8("\xC0\xAF").has_value());
    EXPECT_FALSE(decode_utf8("\xE0\x80\xAF").has_value());
    EXPECT_FALSE(decode_utf8("\xED\xA0\x80").has_value());
    EXPECT_FALSE(decode_utf8("\xF4\x90\x80\x80").has_value());
}

TEST(DecodeUtf8Test, RejectsTruncatedSequence) {
    EXPECT_FALSE(decode_utf8("ok\xE2\x82").has_value());
}

TEST(Utf8CompletePrefixTest, DropsCutSequenceOnly) {
    EXPECT_EQ(utf8_complete_prefix("ab\xE2\x82"), 2u);
    EXPECT_EQ(utf8_complete_prefix("ab\xE2\x82\xAC"), 5u);
    EXPECT_EQ(utf8_complete_prefix("abc"), 3u);
    EXPECT_EQ(utf8_complete_prefix(""), 0u);
}

// ==============================================================================
// detect_file_format
// ==============================================================================

class DetectFileFormatTest : public TempDirTest {};

TEST_F(DetectFileFormatTest, JsonLinesFile) {
    auto path = write_file("export.jsonl", "{\"a\":1}\n{\"b\":2}\n");
    EXPECT_EQ(detect_file_format(path), InputFormat::JsonLines);
}

TEST_F(DetectFileFormatTest, LevelDbFile) {
    LogBuilder log;
    log.add(leveldb::RecordType::Full, "{\"name\":\"users/u1\"}");
    auto path = write_file("output-0", log.bytes());
    EXPECT_EQ(detect_file_format(path), InputFormat::LevelDbLog);
}

TEST_F(DetectFileFormatTest, MissingFileDefaultsToLevelDb) {
    EXPECT_EQ(detect_file_format(test_dir_ / "missing"), InputFormat::LevelDbLog);
}

TEST_F(DetectFileFormatTest, MultibyteCharacterCutBySampleWindow) {
    // "{"v":"é"}\n": окно в 7 байт режет двухбайтовый символ
    auto path = write_file("cut.jsonl", "{\"v\":\"\xC3\xA9\"}\n{\"w\":1}\n");
    EXPECT_EQ(detect_file_format(path, 7), InputFormat::LevelDbLog);  // нет перевода строки
    EXPECT_EQ(detect_file_format(path, 11), InputFormat::JsonLines);
    EXPECT_EQ(detect_file_format(path, 12), InputFormat::JsonLines);
}

}  // namespace fireup::test
