// ==============================================================================
// fireup/errors.hpp - Ошибки разбора резервной копии
// ==============================================================================
//
// Две категории:
// - DecodeError: локальная ошибка отдельной записи. Собирается в
//   ParseResult::errors, разбор продолжается.
// - ParseError: фатальная ошибка (ввод-вывод или нарушение протокола
//   фрагментации). Разбор файла прекращается.
//
// ==============================================================================

#ifndef FIREUP_ERRORS_HPP
#define FIREUP_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fireup {

// ----------------------------------------------------------------------------
// Локальные ошибки
// ----------------------------------------------------------------------------

enum class DecodeErrorKind {
    InvalidRecordType,  // байт типа записи вне 1..4
    TruncatedHeader,    // остаток блока короче заголовка и не нули
    TruncatedRecord,    // данные записи выходят за границу блока
    ChecksumMismatch,   // CRC-32 не совпал
    UnparseableRecord   // полезная нагрузка не JSON
};

const char* decode_error_kind_to_string(DecodeErrorKind kind);

struct DecodeError {
    DecodeErrorKind kind = DecodeErrorKind::UnparseableRecord;
    std::string message;

    /// Позиция в журнале (для ошибок уровня записи)
    std::optional<std::uint64_t> block_index;
    std::optional<std::size_t> offset;

    /// Порядковый номер логической записи / строки (для ошибок декодирования)
    std::optional<std::uint64_t> record_index;

    /// "<kind>: <message> (block N, offset M)"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Фатальные ошибки
// ----------------------------------------------------------------------------

enum class ParseErrorKind {
    FileNotFound,  // файл/директория не существует
    Io,            // не удалось открыть, позиционироваться или прочитать
    Structure      // Middle/Last без открытого фрагмента
};

const char* parse_error_kind_to_string(ParseErrorKind kind);

struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Io;
    std::string message;
    std::string path;

    /// "[!] failed to parse backup '<path>' - <message>"
    std::string format() const;
};

}  // namespace fireup

#endif  // FIREUP_ERRORS_HPP
