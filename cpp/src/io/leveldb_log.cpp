// ==============================================================================
// leveldb_log.cpp - Чтение блоков и разбор записей журнала
// ==============================================================================

#include <fireup/leveldb_log.hpp>

#include <zlib.h>

#include <algorithm>
#include <cstdio>
#include <system_error>

namespace fireup::leveldb {

namespace {

std::uint32_t read_u32_le(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint16_t read_u16_le(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::string hex32(std::uint32_t value) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%08x", value);
    return buf;
}

}  // namespace

// ============================================================================
// Типы записей
// ============================================================================

std::optional<RecordType> record_type_from_byte(std::uint8_t byte) {
    switch (byte) {
    case 1:
        return RecordType::Full;
    case 2:
        return RecordType::First;
    case 3:
        return RecordType::Middle;
    case 4:
        return RecordType::Last;
    default:
        return std::nullopt;
    }
}

const char* record_type_to_string(RecordType type) {
    switch (type) {
    case RecordType::Full:
        return "FULL";
    case RecordType::First:
        return "FIRST";
    case RecordType::Middle:
        return "MIDDLE";
    case RecordType::Last:
        return "LAST";
    }
    return "UNKNOWN";
}

// ============================================================================
// Контрольная сумма и заголовок
// ============================================================================

std::uint32_t record_checksum(RecordType type, const std::uint8_t* data, std::size_t size) {
    const Bytef type_byte = static_cast<Bytef>(type);
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, &type_byte, 1);
    if (size > 0) {
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(size));
    }
    return static_cast<std::uint32_t>(crc);
}

std::optional<RecordHeader> decode_header(const std::uint8_t* bytes) {
    auto type = record_type_from_byte(bytes[6]);
    if (!type) {
        return std::nullopt;
    }
    RecordHeader header;
    header.checksum = read_u32_le(bytes);
    header.length = read_u16_le(bytes + 4);
    header.type = *type;
    return header;
}

std::vector<std::uint8_t> encode_record(RecordType type, std::string_view payload) {
    const auto* data = reinterpret_cast<const std::uint8_t*>(payload.data());
    const std::size_t length = std::min(payload.size(), MAX_RECORD_PAYLOAD);
    const std::uint32_t crc = record_checksum(type, data, length);

    std::vector<std::uint8_t> out;
    out.reserve(HEADER_SIZE + length);
    out.push_back(static_cast<std::uint8_t>(crc & 0xFF));
    out.push_back(static_cast<std::uint8_t>((crc >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((crc >> 16) & 0xFF));
    out.push_back(static_cast<std::uint8_t>((crc >> 24) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(length & 0xFF));
    out.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(type));
    out.insert(out.end(), data, data + length);
    return out;
}

// ============================================================================
// Разбор блока
// ============================================================================

BlockScan parse_block(const RawBlock& block) {
    BlockScan scan;
    const auto& data = block.data;
    const std::size_t size = data.size();

    // После end только нули (заполнение)
    std::size_t end = size;
    while (end > 0 && data[end - 1] == 0) {
        --end;
    }

    std::size_t offset = 0;
    // Ошибки подавляются до следующей целой записи (повреждённый заголовок)
    bool resyncing = false;
    // Ошибки подавляются внутри записи с неверной контрольной суммой
    std::size_t resync_until = 0;

    auto suppressed = [&]() { return resyncing || offset < resync_until; };

    auto report = [&](DecodeErrorKind kind, std::string message) {
        DecodeError err;
        err.kind = kind;
        err.message = std::move(message);
        err.block_index = block.index;
        err.offset = offset;
        scan.errors.push_back(std::move(err));
    };

    auto fail = [&](DecodeErrorKind kind, std::string message) {
        if (!suppressed()) {
            report(kind, std::move(message));
            resyncing = true;
        }
        ++scan.skipped_bytes;
        ++offset;
    };

    while (offset < end) {
        const std::size_t remaining = size - offset;
        if (remaining < HEADER_SIZE) {
            if (!suppressed()) {
                report(DecodeErrorKind::TruncatedHeader,
                       std::to_string(remaining) + " trailing bytes");
            }
            scan.skipped_bytes += remaining;
            break;
        }

        const std::uint8_t* p = data.data() + offset;
        auto header = decode_header(p);
        if (!header) {
            fail(DecodeErrorKind::InvalidRecordType,
                 "type byte " + std::to_string(static_cast<unsigned>(p[6])));
            continue;
        }

        if (header->length > remaining - HEADER_SIZE) {
            fail(DecodeErrorKind::TruncatedRecord,
                 "length " + std::to_string(header->length) + " exceeds " +
                     std::to_string(remaining - HEADER_SIZE) + " available bytes");
            continue;
        }

        const std::uint8_t* payload = p + HEADER_SIZE;
        const std::uint32_t actual = record_checksum(header->type, payload, header->length);
        if (actual != header->checksum) {
            if (!suppressed()) {
                report(DecodeErrorKind::ChecksumMismatch,
                       "stored " + hex32(header->checksum) + ", computed " + hex32(actual));
                resync_until = offset + HEADER_SIZE + header->length;
            }
            ++scan.skipped_bytes;
            ++offset;
            continue;
        }

        RawRecord record;
        record.header = *header;
        record.payload.assign(payload, payload + header->length);
        record.block_index = block.index;
        record.offset = offset;
        scan.records.push_back(std::move(record));

        offset += HEADER_SIZE + header->length;
        resyncing = false;
        resync_until = 0;
    }

    return scan;
}

// ============================================================================
// BlockReader
// ============================================================================

BlockReader::BlockReader(std::size_t block_size) : block_size_(block_size) {}

bool BlockReader::open(const std::filesystem::path& path) {
    path_ = path;
    error_.reset();
    file_size_ = 0;
    position_ = 0;
    blocks_read_ = 0;
    eof_ = false;
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        error_ = ReadError{ReadErrorKind::FileNotFound, "file does not exist", 0};
        return false;
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        error_ = ReadError{ReadErrorKind::OpenFailed, "not a regular file", 0};
        return false;
    }

    file_size_ = std::filesystem::file_size(path, ec);
    if (ec) {
        error_ = ReadError{ReadErrorKind::OpenFailed, "could not stat file: " + ec.message(), 0};
        return false;
    }

    file_.open(path, std::ios::binary);
    if (!file_.is_open()) {
        error_ = ReadError{ReadErrorKind::OpenFailed, "could not open file", 0};
        return false;
    }

    eof_ = (file_size_ == 0);
    return true;
}

bool BlockReader::next(RawBlock& block) {
    if (eof_ || error_ || !file_.is_open()) {
        return false;
    }

    const std::uint64_t remaining = file_size_ - position_;
    if (remaining == 0) {
        eof_ = true;
        return false;
    }

    const std::size_t want =
        static_cast<std::size_t>(std::min<std::uint64_t>(remaining, block_size_));
    block.index = blocks_read_;
    block.offset = position_;
    block.data.resize(want);

    file_.read(reinterpret_cast<char*>(block.data.data()), static_cast<std::streamsize>(want));
    if (static_cast<std::size_t>(file_.gcount()) != want) {
        error_ = ReadError{ReadErrorKind::ReadFailed,
                           "short read: expected " + std::to_string(want) + " bytes, got " +
                               std::to_string(file_.gcount()),
                           position_};
        block.data.clear();
        return false;
    }

    position_ += want;
    ++blocks_read_;
    if (position_ >= file_size_) {
        eof_ = true;
    }
    return true;
}

BlockReadResult read_all_blocks(const std::filesystem::path& path, std::size_t block_size) {
    BlockReadResult result;
    BlockReader reader(block_size);
    if (!reader.open(path)) {
        result.error = *reader.last_error();
        return result;
    }

    RawBlock block;
    while (reader.next(block)) {
        result.blocks.push_back(std::move(block));
        block = RawBlock{};
    }
    if (reader.last_error()) {
        result.error = *reader.last_error();
        return result;
    }

    result.file_size = reader.file_size();
    result.ok = true;
    return result;
}

}  // namespace fireup::leveldb
