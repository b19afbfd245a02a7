// ==============================================================================
// fireup/parser.hpp - Разбор резервной копии Firestore
// ==============================================================================
//
// Назначение:
// - Определение формата входа (журнал LevelDB или JSON Lines)
// - Журнал: блоки → записи → сборка фрагментов → декодирование документов
// - JSON Lines: каждая непустая строка декодируется отдельно
// - Сбор документов, коллекций, статистики и локальных ошибок
// - Отчёт о ходе работы через ProgressSink
//
// Фатальные ошибки (ParseOutcome::ok == false):
// - файл не существует, не открывается или не читается
// - запись Middle/Last без предшествующей First
// Всё остальное попадает в ParseResult::errors.
//
// ==============================================================================

#ifndef FIREUP_PARSER_HPP
#define FIREUP_PARSER_HPP

#include <fireup/config.hpp>
#include <fireup/errors.hpp>
#include <fireup/firestore.hpp>
#include <fireup/format_detect.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fireup::monitoring {
class ProgressSink;
}

namespace fireup::parser {

struct BackupMetadata {
    std::uint64_t file_size = 0;
    std::uint64_t document_count = 0;
    std::uint64_t collection_count = 0;
    std::uint64_t blocks_processed = 0;

    /// Логические записи (журнал) или непустые строки (JSON Lines),
    /// переданные декодеру
    std::uint64_t records_processed = 0;
};

/// Подробная статистика разбора
struct ParseStats {
    std::uint64_t physical_records = 0;  // записи с верным CRC
    std::uint64_t corrupted_records = 0;  // локальные ошибки уровня записи
    std::uint64_t checksum_failures = 0;
    std::uint64_t skipped_bytes = 0;
    std::uint64_t abandoned_fragments = 0;
    std::uint64_t dropped_fragments = 0;
    std::uint64_t decode_failures = 0;
    std::uint64_t skipped_records = 0;  // служебные и не-объекты
};

struct ParseResult {
    std::vector<firestore::FirestoreDocument> documents;
    std::set<std::string> collections;
    BackupMetadata metadata;
    std::vector<DecodeError> errors;

    InputFormat format = InputFormat::LevelDbLog;
    ParseStats stats;

    /// Фактически разобранный файл (после разрешения директории)
    std::filesystem::path source;
};

struct ParseOutcome {
    bool ok = false;
    ParseResult result;
    ParseError error;

    explicit operator bool() const { return ok; }
};

class BackupParser {
public:
    /// @param sink Получатель событий мониторинга (может быть nullptr)
    /// @param log Диагностический вывод (может быть nullptr)
    explicit BackupParser(config::ParserConfig cfg = {}, monitoring::ProgressSink* sink = nullptr,
                          output::Writer* log = nullptr);

    /// Разобрать файл или директорию экспорта
    ParseOutcome parse(const std::filesystem::path& path) const;

    const config::ParserConfig& config() const { return config_; }

private:
    config::ParserConfig config_;
    monitoring::ProgressSink* sink_;
    output::Writer* log_;

    bool parse_log(const std::filesystem::path& file, ParseResult& result,
                   ParseError& error) const;
    bool parse_json_lines(const std::filesystem::path& file, ParseResult& result,
                          ParseError& error) const;

    void accept(firestore::DecodeOutcome outcome, ParseResult& result) const;
};

}  // namespace fireup::parser

#endif  // FIREUP_PARSER_HPP
