// ==============================================================================
// fireup/output.hpp - Диагностический вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Префиксы уровней: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI) при TTY
// - Дублирование сообщений в лог-файл (без цвета)
//
// Компоненты ядра принимают Writer* (nullptr = молча).
//
// ==============================================================================

#ifndef FIREUP_OUTPUT_HPP
#define FIREUP_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fireup::output {

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // info
    Yellow,  // warn
    Red,     // error
    Cyan,    // debug
    Magenta  // trace
};

/// Настройки вывода
struct OutputConfig {
    bool quiet = false;  // подавить info/warn
    int verbose = 0;     // 1 = debug, 2+ = trace

    /// Если задан: все сообщения дописываются в этот файл
    std::optional<std::filesystem::path> log_path;
};

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток как есть
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (verbose >= 1)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (verbose >= 2)
    void trace(std::string_view message);

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Лог-файл открыт
    bool has_log_file() const { return log_file_ != nullptr; }

private:
    void emit(std::string_view prefix, Color color, std::string_view message);

    OutputConfig config_;
    FILE* log_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[!] <message>\n"
std::string format_warning(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Поток подключён к терминалу
bool supports_color(Stream s);

}  // namespace fireup::output

#endif  // FIREUP_OUTPUT_HPP
