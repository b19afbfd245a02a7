// ==============================================================================
// validator.cpp - Проверка резервной копии
// ==============================================================================

#include <fireup/firestore.hpp>
#include <fireup/leveldb_log.hpp>
#include <fireup/monitoring.hpp>
#include <fireup/output.hpp>
#include <fireup/parser.hpp>
#include <fireup/platform.hpp>
#include <fireup/validator.hpp>

#include <cstdio>
#include <fstream>
#include <system_error>

namespace fireup::parser {

namespace {

std::string percent(double ratio) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", ratio * 100.0);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> modification_time(
    const std::filesystem::path& path) {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    // file_time_type не обязан совпадать с system_clock в C++17
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

/// Фрагменты без начала или без конца в последовательности типов записей
std::uint64_t count_incomplete_fragments(const std::vector<leveldb::RecordType>& types) {
    std::uint64_t incomplete = 0;
    bool open = false;
    for (auto type : types) {
        switch (type) {
        case leveldb::RecordType::Full:
            if (open) {
                ++incomplete;
            }
            open = false;
            break;
        case leveldb::RecordType::First:
            if (open) {
                ++incomplete;
            }
            open = true;
            break;
        case leveldb::RecordType::Middle:
            if (!open) {
                ++incomplete;
            }
            break;
        case leveldb::RecordType::Last:
            if (!open) {
                ++incomplete;
            }
            open = false;
            break;
        }
    }
    if (open) {
        ++incomplete;
    }
    return incomplete;
}

}  // namespace

BackupValidator::BackupValidator(config::ParserConfig cfg, monitoring::ProgressSink* sink,
                                 output::Writer* log)
    : config_(std::move(cfg)), sink_(sink), log_(log) {}

void BackupValidator::report_progress(const std::string& step, std::uint64_t current,
                                      std::uint64_t total) const {
    if (sink_ != nullptr) {
        sink_->on_progress(step, current, total);
    }
}

ValidationResult BackupValidator::validate(const std::filesystem::path& path) const {
    ValidationResult result;
    const std::string path_text = platform::path_to_utf8(path);
    result.file_info.file_path = path_text;

    if (log_ != nullptr) {
        log_->info("validating backup '" + path_text + "'");
    }

    // ------------------------------------------------------------------------
    // 1. Доступ к файлу
    // ------------------------------------------------------------------------
    report_progress("Validating file access", 0, 100);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.errors.push_back("File does not exist: " + path_text);
        return result;
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.errors.push_back("Path is not a file: " + path_text);
        return result;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        result.errors.push_back("Failed to read file metadata: " + ec.message());
        return result;
    }
    result.file_info.file_size = size;
    result.file_info.last_modified = modification_time(path);
    result.file_info.is_readable = std::ifstream(path, std::ios::binary).is_open();

    if (size < MIN_BACKUP_SIZE) {
        result.errors.push_back("File too small to be a valid LevelDB backup: " +
                                std::to_string(size) + " bytes");
        return result;
    }

    const InputFormat format =
        detect_file_format(path, config_.detect_sample_bytes, config_.printable_ratio);

    // ------------------------------------------------------------------------
    // 2. Структура журнала
    // ------------------------------------------------------------------------
    report_progress("Validating LevelDB structure", 20, 100);

    std::vector<leveldb::RecordType> record_types;
    if (format == InputFormat::LevelDbLog) {
        auto blocks = leveldb::read_all_blocks(path, config_.block_size);
        if (!blocks) {
            result.errors.push_back("Failed to read LevelDB blocks: " + blocks.error.message);
        } else {
            auto& structure = result.structure_info;
            structure.total_blocks = blocks.blocks.size();
            for (std::size_t i = 0; i < blocks.blocks.size(); ++i) {
                report_progress("Validating block structure", i, blocks.blocks.size());
                auto scan = leveldb::parse_block(blocks.blocks[i]);
                structure.valid_records += scan.records.size();
                structure.corrupted_records += scan.errors.size();
                for (const auto& err : scan.errors) {
                    if (err.kind == DecodeErrorKind::ChecksumMismatch) {
                        ++result.integrity_info.checksum_failures;
                    }
                }
                for (const auto& record : scan.records) {
                    record_types.push_back(record.header.type);
                }
            }
            structure.total_records = structure.valid_records + structure.corrupted_records;

            if (structure.total_blocks == 0) {
                result.errors.push_back("No blocks found in LevelDB file");
            }
            if (structure.total_records == 0) {
                result.errors.push_back("No records found in LevelDB file");
            }
            if (structure.total_records > 0 &&
                static_cast<double>(structure.corrupted_records) >
                    static_cast<double>(structure.total_records) *
                        CORRUPTED_RECORDS_WARNING_RATIO) {
                result.warnings.push_back(
                    "High number of corrupted records: " +
                    std::to_string(structure.corrupted_records) + " out of " +
                    std::to_string(structure.total_records) + " (" +
                    percent(static_cast<double>(structure.corrupted_records) /
                            static_cast<double>(structure.total_records)) +
                    ")");
            }
        }
    }

    // ------------------------------------------------------------------------
    // 3. Целостность (нужен полный разбор для ошибок декодирования)
    // ------------------------------------------------------------------------
    report_progress("Validating data integrity", 60, 100);

    BackupParser parser(config_, nullptr, log_);
    ParseOutcome parsed = parser.parse(path);

    auto& integrity = result.integrity_info;
    integrity.incomplete_records = count_incomplete_fragments(record_types);
    if (parsed) {
        integrity.parsing_errors = parsed.result.stats.decode_failures;
        if (format == InputFormat::JsonLines) {
            // Строки JSON Lines: каждая строка: запись
            result.structure_info.total_records = parsed.result.metadata.records_processed;
            result.structure_info.valid_records = parsed.result.metadata.records_processed;
        }
        result.structure_info.document_records = parsed.result.metadata.document_count;
        result.structure_info.metadata_records = parsed.result.stats.skipped_records;
    }

    const std::uint64_t total = result.structure_info.total_records;
    if (total > 0) {
        const std::uint64_t failed =
            integrity.checksum_failures + integrity.incomplete_records + integrity.parsing_errors;
        const double score = 1.0 - static_cast<double>(failed) / static_cast<double>(total);
        integrity.overall_integrity_score = score < 0.0 ? 0.0 : score;
    }
    if (integrity.overall_integrity_score < INTEGRITY_WARNING_SCORE) {
        result.warnings.push_back("Low integrity score: " +
                                  percent(integrity.overall_integrity_score) +
                                  " - consider using a different backup file");
    }

    // ------------------------------------------------------------------------
    // 4. Формат Firestore
    // ------------------------------------------------------------------------
    report_progress("Validating Firestore format", 80, 100);

    if (parsed) {
        if (parsed.result.documents.empty()) {
            result.warnings.push_back("No Firestore documents found in backup");
        }
        if (!parsed.result.errors.empty()) {
            result.warnings.push_back("Encountered " +
                                      std::to_string(parsed.result.errors.size()) +
                                      " parsing errors while validating format");
        }
    } else {
        result.errors.push_back("Failed to parse Firestore documents: " + parsed.error.message);
    }

    report_progress("Validation complete", 100, 100);

    result.is_valid = result.errors.empty();
    if (log_ != nullptr) {
        log_->info(std::string("validation complete: ") +
                   (result.is_valid ? "VALID" : "INVALID") + " (errors: " +
                   std::to_string(result.errors.size()) +
                   ", warnings: " + std::to_string(result.warnings.size()) + ")");
    }
    return result;
}

// ============================================================================
// Отчёт
// ============================================================================

std::string summary_report(const ValidationResult& result) {
    std::string report;
    char buf[128];

    report += "=== Firestore Backup Validation Report ===\n\n";
    report += std::string("Overall Status: ") + (result.is_valid ? "✓ VALID" : "✗ INVALID") + "\n";

    report += "\n--- File Information ---\n";
    report += "Path: " + result.file_info.file_path + "\n";
    std::snprintf(buf, sizeof(buf), "Size: %llu bytes (%.2f MB)\n",
                  static_cast<unsigned long long>(result.file_info.file_size),
                  static_cast<double>(result.file_info.file_size) / 1024.0 / 1024.0);
    report += buf;
    report += std::string("Readable: ") + (result.file_info.is_readable ? "true" : "false") + "\n";
    if (result.file_info.last_modified) {
        const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                                 result.file_info.last_modified->time_since_epoch())
                                 .count();
        const auto dt = firestore::DateTime::from_unix_micros(static_cast<std::int64_t>(seconds) *
                                                              1000000);
        std::snprintf(buf, sizeof(buf), "Last Modified: %04d-%02d-%02d %02d:%02d:%02d UTC\n",
                      dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second);
        report += buf;
    }

    const auto& structure = result.structure_info;
    report += "\n--- Structure Information ---\n";
    report += "Total Blocks: " + std::to_string(structure.total_blocks) + "\n";
    report += "Total Records: " + std::to_string(structure.total_records) + "\n";
    report += "Valid Records: " + std::to_string(structure.valid_records) + "\n";
    report += "Corrupted Records: " + std::to_string(structure.corrupted_records) + "\n";

    const auto& integrity = result.integrity_info;
    report += "\n--- Integrity Information ---\n";
    report += "Integrity Score: " + percent(integrity.overall_integrity_score) + "\n";
    report += "Checksum Failures: " + std::to_string(integrity.checksum_failures) + "\n";
    report += "Incomplete Records: " + std::to_string(integrity.incomplete_records) + "\n";
    report += "Parsing Errors: " + std::to_string(integrity.parsing_errors) + "\n";

    if (!result.errors.empty()) {
        report += "\n--- Errors ---\n";
        for (std::size_t i = 0; i < result.errors.size(); ++i) {
            report += std::to_string(i + 1) + ". " + result.errors[i] + "\n";
        }
    }

    if (!result.warnings.empty()) {
        report += "\n--- Warnings ---\n";
        for (std::size_t i = 0; i < result.warnings.size(); ++i) {
            report += std::to_string(i + 1) + ". " + result.warnings[i] + "\n";
        }
    }

    report += "\n=== End of Report ===\n";
    return report;
}

}  // namespace fireup::parser
