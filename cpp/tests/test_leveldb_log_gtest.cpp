// ==============================================================================
// test_leveldb_log_gtest.cpp - Тесты блоков и записей журнала (GoogleTest)
// ==============================================================================

#include <fireup/leveldb_log.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace fireup::leveldb::test {

using fireup::test::LogBuilder;
using fireup::test::make_block;
using fireup::test::payload_text;
using fireup::test::TempDirTest;

// ==============================================================================
// Типы и кодирование записей
// ==============================================================================

TEST(RecordTypeTest, FromByteAcceptsOnlyOneToFour) {
    EXPECT_EQ(record_type_from_byte(1), RecordType::Full);
    EXPECT_EQ(record_type_from_byte(2), RecordType::First);
    EXPECT_EQ(record_type_from_byte(3), RecordType::Middle);
    EXPECT_EQ(record_type_from_byte(4), RecordType::Last);
    EXPECT_FALSE(record_type_from_byte(0).has_value());
    EXPECT_FALSE(record_type_from_byte(5).has_value());
    EXPECT_FALSE(record_type_from_byte(0xFF).has_value());
}

TEST(RecordChecksumTest, CoversTypeByteThenPayload) {
    const std::string payload = "abc";
    const auto* data = reinterpret_cast<const std::uint8_t*>(payload.data());

    EXPECT_EQ(record_checksum(RecordType::Full, data, payload.size()), 0x539d20a9u);
    EXPECT_EQ(record_checksum(RecordType::Full, nullptr, 0), 0xa505df1bu);
    // Тип входит в сумму
    EXPECT_NE(record_checksum(RecordType::First, data, payload.size()),
              record_checksum(RecordType::Full, data, payload.size()));
}

TEST(EncodeRecordTest, HeaderIsLittleEndian) {
    auto bytes = encode_record(RecordType::Full, "abc");

    ASSERT_EQ(bytes.size(), HEADER_SIZE + 3);
    EXPECT_EQ(bytes[0], 0xa9);
    EXPECT_EQ(bytes[1], 0x20);
    EXPECT_EQ(bytes[2], 0x9d);
    EXPECT_EQ(bytes[3], 0x53);
    EXPECT_EQ(bytes[4], 3);
    EXPECT_EQ(bytes[5], 0);
    EXPECT_EQ(bytes[6], 1);
    EXPECT_EQ(bytes[7], 'a');

    auto header = decode_header(bytes.data());
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->checksum, 0x539d20a9u);
    EXPECT_EQ(header->length, 3);
    EXPECT_EQ(header->type, RecordType::Full);
}

// ==============================================================================
// parse_block
// ==============================================================================

TEST(ParseBlockTest, FullRecordsComeOutInOrderWithIdenticalPayloads) {
    const std::vector<std::string> payloads = {"first payload", "second", "third and last one"};
    LogBuilder log;
    for (const auto& p : payloads) {
        log.add(RecordType::Full, p);
    }

    auto scan = parse_block(make_block(log.bytes()));

    EXPECT_TRUE(scan.errors.empty());
    ASSERT_EQ(scan.records.size(), payloads.size());
    for (std::size_t i = 0; i < payloads.size(); ++i) {
        EXPECT_EQ(payload_text(scan.records[i].payload), payloads[i]);
        EXPECT_EQ(scan.records[i].header.type, RecordType::Full);
        EXPECT_EQ(scan.records[i].block_index, 0u);
    }
    EXPECT_EQ(scan.records[0].offset, 0u);
    EXPECT_EQ(scan.records[1].offset, HEADER_SIZE + payloads[0].size());
}

TEST(ParseBlockTest, CorruptedChecksumDropsOnlyThatRecord) {
    auto a = encode_record(RecordType::Full, R"({"name":"users/a"})");
    auto b = encode_record(RecordType::Full, R"({"name":"users/b"})");
    auto c = encode_record(RecordType::Full, R"({"name":"users/c"})");
    b[0] ^= 0xFF;

    LogBuilder log;
    log.add_raw(a).add_raw(b).add_raw(c);

    auto scan = parse_block(make_block(log.bytes()));

    ASSERT_EQ(scan.records.size(), 2u);
    EXPECT_EQ(payload_text(scan.records[0].payload), R"({"name":"users/a"})");
    EXPECT_EQ(payload_text(scan.records[1].payload), R"({"name":"users/c"})");

    ASSERT_EQ(scan.errors.size(), 1u);
    EXPECT_EQ(scan.errors[0].kind, DecodeErrorKind::ChecksumMismatch);
    EXPECT_EQ(scan.errors[0].offset, a.size());
    EXPECT_EQ(scan.errors[0].block_index, 0u);
    EXPECT_EQ(scan.records[1].offset, a.size() + b.size());
}

TEST(ParseBlockTest, AdjacentCorruptedRecordsReportOneErrorEach) {
    auto a = encode_record(RecordType::Full, R"({"name":"users/a"})");
    auto b = encode_record(RecordType::Full, R"({"name":"users/b"})");
    auto c = encode_record(RecordType::Full, R"({"name":"users/c"})");
    a[0] ^= 0xFF;
    b[0] ^= 0xFF;

    LogBuilder log;
    log.add_raw(a).add_raw(b).add_raw(c);

    auto scan = parse_block(make_block(log.bytes()));

    ASSERT_EQ(scan.records.size(), 1u);
    EXPECT_EQ(payload_text(scan.records[0].payload), R"({"name":"users/c"})");
    EXPECT_EQ(scan.records[0].offset, a.size() + b.size());

    ASSERT_EQ(scan.errors.size(), 2u);
    EXPECT_EQ(scan.errors[0].kind, DecodeErrorKind::ChecksumMismatch);
    EXPECT_EQ(scan.errors[0].offset, 0u);
    EXPECT_EQ(scan.errors[1].kind, DecodeErrorKind::ChecksumMismatch);
    EXPECT_EQ(scan.errors[1].offset, a.size());
    EXPECT_EQ(scan.skipped_bytes, a.size() + b.size());
}

TEST(ParseBlockTest, TrailingZeroPaddingIsNotAnError) {
    LogBuilder log;
    log.add(RecordType::Full, "payload");
    auto bytes = log.bytes();
    ASSERT_EQ(bytes.size(), BLOCK_SIZE);

    auto scan = parse_block(make_block(bytes));

    EXPECT_EQ(scan.records.size(), 1u);
    EXPECT_TRUE(scan.errors.empty());
    EXPECT_EQ(scan.skipped_bytes, 0u);
}

TEST(ParseBlockTest, AllZeroBlockIsEmpty) {
    auto scan = parse_block(make_block(std::vector<std::uint8_t>(BLOCK_SIZE, 0)));

    EXPECT_TRUE(scan.records.empty());
    EXPECT_TRUE(scan.errors.empty());
}

TEST(ParseBlockTest, EmptyBlockIsEmpty) {
    auto scan = parse_block(make_block({}));

    EXPECT_TRUE(scan.records.empty());
    EXPECT_TRUE(scan.errors.empty());
}

TEST(ParseBlockTest, InvalidTypeByteResynchronisesToNextRecord) {
    auto bad = encode_record(RecordType::Full, "garbage payload");
    bad[6] = 9;
    auto good = encode_record(RecordType::Full, "good payload");

    LogBuilder log;
    log.add_raw(bad).add_raw(good);

    auto scan = parse_block(make_block(log.bytes()));

    ASSERT_EQ(scan.errors.size(), 1u);
    EXPECT_EQ(scan.errors[0].kind, DecodeErrorKind::InvalidRecordType);
    EXPECT_EQ(scan.errors[0].offset, 0u);
    ASSERT_EQ(scan.records.size(), 1u);
    EXPECT_EQ(payload_text(scan.records[0].payload), "good payload");
    EXPECT_EQ(scan.records[0].offset, bad.size());
    EXPECT_EQ(scan.skipped_bytes, bad.size());
}

TEST(ParseBlockTest, LengthPastBlockEndIsTruncatedRecord) {
    auto record = encode_record(RecordType::Full, "0123456789");
    record[4] = 100;  // длина больше, чем есть в блоке

    auto scan = parse_block(make_block(record));

    EXPECT_TRUE(scan.records.empty());
    ASSERT_EQ(scan.errors.size(), 1u);
    EXPECT_EQ(scan.errors[0].kind, DecodeErrorKind::TruncatedRecord);
}

TEST(ParseBlockTest, ShortNonZeroTailIsTruncatedHeader) {
    auto bytes = encode_record(RecordType::Full, "complete record");
    const std::size_t record_size = bytes.size();
    bytes.push_back(0x11);
    bytes.push_back(0x22);
    bytes.push_back(0x33);

    auto scan = parse_block(make_block(bytes));

    ASSERT_EQ(scan.records.size(), 1u);
    ASSERT_EQ(scan.errors.size(), 1u);
    EXPECT_EQ(scan.errors[0].kind, DecodeErrorKind::TruncatedHeader);
    EXPECT_EQ(scan.errors[0].offset, record_size);
}

TEST(ParseBlockTest, ErrorsCarryBlockIndex) {
    auto bad = encode_record(RecordType::Full, "payload");
    bad[6] = 0x7F;

    auto scan = parse_block(make_block(bad, 3));

    ASSERT_FALSE(scan.errors.empty());
    EXPECT_EQ(scan.errors[0].block_index, 3u);
    EXPECT_NE(scan.errors[0].format().find("block 3"), std::string::npos);
}

// ==============================================================================
// BlockReader
// ==============================================================================

class BlockReaderTest : public TempDirTest {};

TEST_F(BlockReaderTest, SplitsFileIntoBlocksWithShortLastBlock) {
    std::vector<std::uint8_t> content(2 * BLOCK_SIZE + 100, 0x5A);
    auto path = write_file("log", content);

    BlockReader reader;
    ASSERT_TRUE(reader.open(path));
    EXPECT_EQ(reader.file_size(), content.size());

    std::vector<RawBlock> blocks;
    RawBlock block;
    while (reader.next(block)) {
        blocks.push_back(block);
    }

    EXPECT_FALSE(reader.last_error().has_value());
    EXPECT_TRUE(reader.eof());
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].data.size(), BLOCK_SIZE);
    EXPECT_EQ(blocks[1].data.size(), BLOCK_SIZE);
    EXPECT_EQ(blocks[2].data.size(), 100u);
    EXPECT_EQ(blocks[2].index, 2u);
    EXPECT_EQ(blocks[2].offset, 2 * BLOCK_SIZE);
    EXPECT_EQ(reader.blocks_read(), 3u);
}

TEST_F(BlockReaderTest, EmptyFileYieldsNoBlocks) {
    auto path = write_file("empty", std::string());

    BlockReader reader;
    ASSERT_TRUE(reader.open(path));
    RawBlock block;
    EXPECT_FALSE(reader.next(block));
    EXPECT_FALSE(reader.last_error().has_value());
    EXPECT_EQ(reader.file_size(), 0u);
    EXPECT_EQ(reader.blocks_read(), 0u);
}

TEST_F(BlockReaderTest, MissingFileIsFileNotFound) {
    BlockReader reader;
    EXPECT_FALSE(reader.open(test_dir_ / "missing"));
    ASSERT_TRUE(reader.last_error().has_value());
    EXPECT_EQ(reader.last_error()->kind, ReadErrorKind::FileNotFound);
}

TEST_F(BlockReaderTest, DirectoryCannotBeOpened) {
    BlockReader reader;
    EXPECT_FALSE(reader.open(test_dir_));
    ASSERT_TRUE(reader.last_error().has_value());
    EXPECT_EQ(reader.last_error()->kind, ReadErrorKind::OpenFailed);
}

TEST_F(BlockReaderTest, ReadAllBlocksHonoursBlockSize) {
    auto path = write_file("small_blocks", std::string(50, 'x'));

    auto result = read_all_blocks(path, 16);

    ASSERT_TRUE(result);
    EXPECT_EQ(result.file_size, 50u);
    ASSERT_EQ(result.blocks.size(), 4u);
    EXPECT_EQ(result.blocks[3].data.size(), 2u);
    EXPECT_EQ(result.blocks[3].offset, 48u);
}

TEST_F(BlockReaderTest, ReadAllBlocksReportsMissingFile) {
    auto result = read_all_blocks(test_dir_ / "nope");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.kind, ReadErrorKind::FileNotFound);
}

}  // namespace fireup::leveldb::test
