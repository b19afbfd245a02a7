// ==============================================================================
// fireup/config.hpp - Конфигурация разбора резервной копии
// ==============================================================================
//
// Назначение:
// - ParserConfig: параметры формата и эвристик (по умолчанию: значения
//   формата экспорта Firestore)
// - Загрузка из YAML файла (yaml-cpp)
//
// Пример файла:
// @code
//   parser:
//     block_size: 32768
//     detect_sample_bytes: 8192
//     printable_ratio: 0.95
//     min_record_bytes: 10
//     metadata_markers: [_metadata, _system]
//   output:
//     quiet: false
//     verbose: 1
//     log_path: /var/log/fireup.log
//   audit_log_path: /var/log/fireup-audit.jsonl
// @endcode
//
// ==============================================================================

#ifndef FIREUP_CONFIG_HPP
#define FIREUP_CONFIG_HPP

#include <fireup/output.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fireup::config {

/// Размер блока журнала по умолчанию
constexpr std::size_t DEFAULT_BLOCK_SIZE = 32768;

/// Сколько байт читает детектор формата
constexpr std::size_t DEFAULT_DETECT_SAMPLE_BYTES = 8192;

/// Доля печатаемых символов для JSON Lines
constexpr double DEFAULT_PRINTABLE_RATIO = 0.95;

/// Записи короче: служебные
constexpr std::size_t DEFAULT_MIN_RECORD_BYTES = 10;

struct ParserConfig {
    std::size_t block_size = DEFAULT_BLOCK_SIZE;
    std::size_t detect_sample_bytes = DEFAULT_DETECT_SAMPLE_BYTES;
    double printable_ratio = DEFAULT_PRINTABLE_RATIO;
    std::size_t min_record_bytes = DEFAULT_MIN_RECORD_BYTES;

    /// Подстроки, по которым запись считается служебной
    std::vector<std::string> metadata_markers = {"_metadata", "_system"};

    output::OutputConfig output;

    /// JSON Lines файл для записей аудита (если задан)
    std::optional<std::filesystem::path> audit_log_path;
};

/// Ошибка загрузки конфигурации
struct ConfigError {
    std::string message;
    std::string path;

    /// "[!] failed to load config '<path>' - <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    ParserConfig config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из YAML файла.
/// Отсутствующие ключи получают значения по умолчанию, неизвестные игнорируются.
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML текста
ConfigResult parse_config(const std::string& yaml_text);

/// Проверить значения; пустая строка если всё корректно
std::string validate_config(const ParserConfig& cfg);

}  // namespace fireup::config

#endif  // FIREUP_CONFIG_HPP
