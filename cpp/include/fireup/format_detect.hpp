// ==============================================================================
// fireup/format_detect.hpp - Определение формата входного файла
// ==============================================================================
//
// Эвристика по префиксу файла (по умолчанию 8192 байта). JSON Lines, если
// префикс является корректным UTF-8, содержит '{' или '[', хотя бы один
// перевод строки и не менее 95% печатаемых символов (\n, \r, \t считаются
// печатаемыми). Иначе журнал LevelDB.
//
// Определение никогда не завершается ошибкой: при сбое чтения LevelDbLog.
//
// ==============================================================================

#ifndef FIREUP_FORMAT_DETECT_HPP
#define FIREUP_FORMAT_DETECT_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace fireup {

enum class InputFormat { LevelDbLog, JsonLines };

const char* input_format_to_string(InputFormat format);

/// Декодировать UTF-8 строго (без overlong форм, суррогатов и обрывов)
/// @return Кодовые точки, nullopt если последовательность некорректна
std::optional<std::vector<char32_t>> decode_utf8(std::string_view bytes);

/// Длина префикса без незавершённой многобайтовой последовательности в конце
std::size_t utf8_complete_prefix(std::string_view bytes);

/// Классифицировать префикс файла
/// @param printable_ratio Минимальная доля печатаемых символов
InputFormat detect_format(std::string_view sample, double printable_ratio = 0.95);

/// Прочитать до sample_bytes байт файла и классифицировать
InputFormat detect_file_format(const std::filesystem::path& path,
                               std::size_t sample_bytes = 8192,
                               double printable_ratio = 0.95);

}  // namespace fireup

#endif  // FIREUP_FORMAT_DETECT_HPP
