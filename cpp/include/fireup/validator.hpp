// ==============================================================================
// fireup/validator.hpp - Проверка резервной копии перед миграцией
// ==============================================================================
//
// Шаги проверки:
// 1. Доступ к файлу: существует, обычный файл, читается, не меньше 1 KB
// 2. Структура журнала: блоки, записи, доля повреждённых
// 3. Целостность: ошибки CRC, незавершённые фрагменты, ошибки декодирования
// 4. Формат Firestore: полный разбор, наличие документов
//
// Ошибки делают копию непригодной (is_valid = false), предупреждения: нет.
//
// ==============================================================================

#ifndef FIREUP_VALIDATOR_HPP
#define FIREUP_VALIDATOR_HPP

#include <fireup/config.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fireup::monitoring {
class ProgressSink;
}

namespace fireup::parser {

/// Минимальный размер файла резервной копии
constexpr std::uint64_t MIN_BACKUP_SIZE = 1024;

/// Доля повреждённых записей, выше которой выдаётся предупреждение
constexpr double CORRUPTED_RECORDS_WARNING_RATIO = 0.1;

/// Оценка целостности, ниже которой выдаётся предупреждение
constexpr double INTEGRITY_WARNING_SCORE = 0.9;

struct FileInfo {
    std::string file_path;
    std::uint64_t file_size = 0;
    bool is_readable = false;
    std::optional<std::chrono::system_clock::time_point> last_modified;
};

struct StructureInfo {
    std::uint64_t total_blocks = 0;
    std::uint64_t total_records = 0;
    std::uint64_t valid_records = 0;
    std::uint64_t corrupted_records = 0;
    std::uint64_t metadata_records = 0;
    std::uint64_t document_records = 0;
};

struct IntegrityInfo {
    std::uint64_t checksum_failures = 0;
    std::uint64_t incomplete_records = 0;
    std::uint64_t parsing_errors = 0;
    double overall_integrity_score = 0.0;  // 0.0 .. 1.0
};

struct ValidationResult {
    bool is_valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    FileInfo file_info;
    StructureInfo structure_info;
    IntegrityInfo integrity_info;
};

class BackupValidator {
public:
    /// @param sink Получает on_progress() по шагам (может быть nullptr)
    explicit BackupValidator(config::ParserConfig cfg = {},
                             monitoring::ProgressSink* sink = nullptr,
                             output::Writer* log = nullptr);

    /// Проверить файл. Никогда не бросает: проблемы попадают в errors/warnings.
    ValidationResult validate(const std::filesystem::path& path) const;

private:
    config::ParserConfig config_;
    monitoring::ProgressSink* sink_;
    output::Writer* log_;

    void report_progress(const std::string& step, std::uint64_t current,
                         std::uint64_t total) const;
};

/// Текстовый отчёт о проверке
std::string summary_report(const ValidationResult& result);

}  // namespace fireup::parser

#endif  // FIREUP_VALIDATOR_HPP
