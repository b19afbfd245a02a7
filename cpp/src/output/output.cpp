// ==============================================================================
// output.cpp - Диагностический вывод
// ==============================================================================
//
// Байты первичны: пишем через fwrite, без std::endl.
//
// ==============================================================================

#include <fireup/output.hpp>

#include <fireup/platform.hpp>

namespace fireup::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

std::string with_prefix(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result.append(message);
    result.append("\n");
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.log_path.has_value()) {
#ifdef _WIN32
        log_file_ = _wfopen(config_.log_path->c_str(), L"ab");
#else
        log_file_ = std::fopen(platform::path_to_utf8(*config_.log_path).c_str(), "ab");
#endif
        if (log_file_ == nullptr) {
            // Лог-файл необязателен: сообщаем и продолжаем только со stderr
            error("could not open log file '" + platform::path_to_utf8(*config_.log_path) + "'");
        }
    }
}

Writer::~Writer() {
    flush();
    if (log_file_ != nullptr) {
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = (s == Stream::Stdout) ? stdout : stderr;
    std::fwrite(bytes.data(), 1, bytes.size(), f);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::emit(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
    write_line(Stream::Stderr, message);

    if (log_file_ != nullptr) {
        std::string line = with_prefix(prefix, message);
        std::fwrite(line.data(), 1, line.size(), log_file_);
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    emit("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    emit("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при quiet
    emit("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    emit("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    emit("[~] ", Color::Magenta, message);
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    return with_prefix("[+] ", message);
}

std::string format_error(std::string_view message) {
    return with_prefix("[x] ", message);
}

std::string format_warning(std::string_view message) {
    return with_prefix("[!] ", message);
}

std::string format_debug(std::string_view message) {
    return with_prefix("[*] ", message);
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
        return "";
    }
    return "";
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    return platform::is_tty(s == Stream::Stdout ? stdout : stderr);
}

}  // namespace fireup::output
