// ==============================================================================
// fireup/leveldb_log.hpp - Журнал формата LevelDB log
// ==============================================================================
//
// Назначение:
// - Чтение файла блоками фиксированного размера
// - Разбор заголовков записей и проверка CRC-32
// - Построение записей (для тестов и генерации журналов)
//
// Формат:
// - Файл: последовательность блоков по 32768 байт, последний может быть короче
// - Запись: заголовок 7 байт + данные
//     [0..4)  CRC-32 (little-endian) по байту типа и данным
//     [4..6)  длина данных (little-endian)
//     [6]     тип: 1 Full, 2 First, 3 Middle, 4 Last
// - Запись не пересекает границу блока
// - Остаток блока из одних нулей: заполнение
//
// ==============================================================================

#ifndef FIREUP_LEVELDB_LOG_HPP
#define FIREUP_LEVELDB_LOG_HPP

#include <fireup/errors.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fireup::leveldb {

// ============================================================================
// Константы формата
// ============================================================================

constexpr std::size_t BLOCK_SIZE = 32768;
constexpr std::size_t HEADER_SIZE = 7;

/// Максимальная длина данных одной записи (поле u16)
constexpr std::size_t MAX_RECORD_PAYLOAD = 0xFFFF;

// ============================================================================
// Структуры
// ============================================================================

enum class RecordType : std::uint8_t { Full = 1, First = 2, Middle = 3, Last = 4 };

/// Тип по байту заголовка; nullopt для значений вне 1..4
std::optional<RecordType> record_type_from_byte(std::uint8_t byte);

const char* record_type_to_string(RecordType type);

struct RecordHeader {
    std::uint32_t checksum = 0;
    std::uint16_t length = 0;
    RecordType type = RecordType::Full;
};

/// Блок файла
struct RawBlock {
    std::uint64_t index = 0;   // номер блока с нуля
    std::uint64_t offset = 0;  // смещение блока в файле
    std::vector<std::uint8_t> data;
};

/// Физическая запись с проверенной контрольной суммой
struct RawRecord {
    RecordHeader header;
    std::vector<std::uint8_t> payload;
    std::uint64_t block_index = 0;
    std::size_t offset = 0;  // смещение заголовка внутри блока
};

/// Результат разбора одного блока
struct BlockScan {
    std::vector<RawRecord> records;
    std::vector<DecodeError> errors;

    /// Байты, пропущенные при ресинхронизации
    std::size_t skipped_bytes = 0;
};

// ============================================================================
// Разбор записей
// ============================================================================

/// CRC-32 (IEEE, zlib) по байту типа и данным
std::uint32_t record_checksum(RecordType type, const std::uint8_t* data, std::size_t size);

/// Разобрать заголовок по указателю на 7 байт; nullopt при недопустимом типе
std::optional<RecordHeader> decode_header(const std::uint8_t* bytes);

/// Разобрать блок в последовательность записей.
///
/// Сканирование идёт с начала блока. На каждой позиции:
/// - остаток из нулей завершает блок без ошибок
/// - остаток короче заголовка (и не нули) даёт TruncatedHeader и завершает блок
/// - недопустимый тип, выход данных за границу блока или неверный CRC
///   дают локальную ошибку, сканирование продолжается со смещения +1
///
/// Ошибки, возникшие при ресинхронизации (до первой корректной записи),
/// не дублируются: одна повреждённая запись даёт одну ошибку.
BlockScan parse_block(const RawBlock& block);

/// Закодировать запись (заголовок + данные)
std::vector<std::uint8_t> encode_record(RecordType type, std::string_view payload);

// ============================================================================
// BlockReader - последовательное чтение блоков
// ============================================================================

enum class ReadErrorKind { FileNotFound, OpenFailed, ReadFailed };

struct ReadError {
    ReadErrorKind kind = ReadErrorKind::ReadFailed;
    std::string message;
    std::uint64_t offset = 0;
};

class BlockReader {
public:
    explicit BlockReader(std::size_t block_size = BLOCK_SIZE);
    ~BlockReader() = default;

    // Non-copyable
    BlockReader(const BlockReader&) = delete;
    BlockReader& operator=(const BlockReader&) = delete;

    // Movable
    BlockReader(BlockReader&&) noexcept = default;
    BlockReader& operator=(BlockReader&&) noexcept = default;

    /// Открыть файл
    /// @return true при успехе, иначе см. last_error()
    bool open(const std::filesystem::path& path);

    /// Прочитать следующий блок
    /// @param block Блок (заполняется при успехе); последний блок может быть короче
    /// @return false в конце файла или при ошибке (тогда last_error() задан)
    bool next(RawBlock& block);

    const std::optional<ReadError>& last_error() const { return error_; }

    std::uint64_t file_size() const { return file_size_; }
    std::uint64_t blocks_read() const { return blocks_read_; }
    std::size_t block_size() const { return block_size_; }
    bool eof() const { return eof_; }

private:
    std::size_t block_size_;
    std::filesystem::path path_;
    std::ifstream file_;
    std::optional<ReadError> error_;

    std::uint64_t file_size_ = 0;
    std::uint64_t position_ = 0;
    std::uint64_t blocks_read_ = 0;
    bool eof_ = false;
};

/// Все блоки файла
struct BlockReadResult {
    bool ok = false;
    std::vector<RawBlock> blocks;
    std::uint64_t file_size = 0;
    ReadError error;

    explicit operator bool() const { return ok; }
};

/// Прочитать файл целиком блоками
BlockReadResult read_all_blocks(const std::filesystem::path& path,
                                std::size_t block_size = BLOCK_SIZE);

}  // namespace fireup::leveldb

#endif  // FIREUP_LEVELDB_LOG_HPP
