// ==============================================================================
// fireup/firestore.hpp - Декодирование документов Firestore
// ==============================================================================
//
// Назначение:
// - Разбор полезной нагрузки записи (JSON) в FirestoreDocument
// - Определение коллекции и идентификатора документа
// - Распаковка типизированных значений (stringValue, integerValue, ...)
// - Фильтрация служебных записей экспорта
//
// Имя ресурса:
//   projects/<p>/databases/(default)/documents/<collection>/<id>
// Коллекция и идентификатор: два последних сегмента пути.
//
// ==============================================================================

#ifndef FIREUP_FIRESTORE_HPP
#define FIREUP_FIRESTORE_HPP

#include <fireup/errors.hpp>
#include <fireup/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fireup::config {
struct ParserConfig;
}

namespace fireup::firestore {

// ============================================================================
// DateTime: момент времени в UTC
// ============================================================================

struct DateTime {
    int year = 1970;
    int month = 1;        // 1-12
    int day = 1;          // 1-31
    int hour = 0;         // 0-23
    int minute = 0;       // 0-59
    int second = 0;       // 0-59
    int microsecond = 0;  // 0-999999

    /// Разобрать RFC 3339: YYYY-MM-DDTHH:MM:SS[.f](Z|±HH:MM).
    /// Смещение приводится к UTC, дробная часть усекается до микросекунд.
    static std::optional<DateTime> parse(std::string_view str);

    /// Микросекунды от 1970-01-01T00:00:00Z
    std::int64_t to_unix_micros() const;
    static DateTime from_unix_micros(std::int64_t micros);

    bool operator<(const DateTime& other) const;
    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }

    /// ISO 8601 в UTC ("2023-01-01T00:00:00Z", микросекунды если не ноль)
    std::string to_string() const;
};

// ============================================================================
// Документ
// ============================================================================

struct DocumentMetadata {
    std::optional<DateTime> created_at;
    std::optional<DateTime> updated_at;
    std::string path = "unknown";
    std::optional<std::uint64_t> size_bytes;
};

struct FirestoreDocument {
    std::string id;
    std::string collection;
    ValueObject data;

    /// Вложенные коллекции (декодер их не заполняет)
    std::vector<FirestoreDocument> subcollections;

    DocumentMetadata metadata;
};

struct DocumentIdentity {
    std::string collection = "unknown";
    std::string id = "unknown";
    std::string path = "unknown";
};

// ============================================================================
// Декодирование
// ============================================================================

/// Откуда пришла полезная нагрузка
enum class DecodeMode {
    Binary,    // логическая запись журнала; не-JSON: локальная ошибка
    JsonLines  // строка текстового экспорта; не-JSON пропускается молча
};

struct DecoderOptions {
    /// Бинарные записи короче: служебные
    std::size_t min_record_bytes = 10;

    /// Подстроки служебных записей
    std::vector<std::string> metadata_markers = {"_metadata", "_system"};

    static DecoderOptions from_config(const config::ParserConfig& cfg);
};

/// Результат декодирования одной записи.
/// Ни документа, ни ошибки: запись пропущена (служебная, не объект и т.п.)
struct DecodeOutcome {
    std::optional<FirestoreDocument> document;
    std::optional<DecodeError> error;

    bool skipped() const { return !document && !error; }
};

/// Распаковать типизированное значение рекурсивно.
/// Объект с единственным ключом из {stringValue, integerValue, doubleValue,
/// booleanValue, timestampValue, arrayValue, mapValue} заменяется значением;
/// всё остальное возвращается без изменений.
Value unwrap_typed_value(const Value& value);

/// Коллекция и идентификатор по полям name / path / id+collection
DocumentIdentity resolve_identity(const ValueObject& object);

/// Служебная запись по сырому тексту (длина, маркеры, префикс "__")
bool is_metadata_record(std::string_view payload, DecodeMode mode,
                        const DecoderOptions& options = {});

/// Декодировать запись
/// @param payload Байты записи или строка JSON Lines
/// @param index Порядковый номер записи (для сообщений об ошибках)
DecodeOutcome decode_record(std::string_view payload, std::uint64_t index, DecodeMode mode,
                            const DecoderOptions& options = {});

/// Документ в виде Value (для JSON вывода)
Value document_to_value(const FirestoreDocument& doc);

}  // namespace fireup::firestore

#endif  // FIREUP_FIRESTORE_HPP
