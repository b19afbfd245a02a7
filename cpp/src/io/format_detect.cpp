// ==============================================================================
// format_detect.cpp - Эвристика формата входа
// ==============================================================================

#include <fireup/format_detect.hpp>

#include <fstream>
#include <string>

namespace fireup {

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

/// Длина последовательности по ведущему байту; 0 для недопустимого
std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) {
        return 1;
    }
    if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    }
    if (lead >= 0xE0 && lead <= 0xEF) {
        return 3;
    }
    if (lead >= 0xF0 && lead <= 0xF4) {
        return 4;
    }
    return 0;
}

bool is_printable(char32_t cp) {
    if (cp == U'\n' || cp == U'\r' || cp == U'\t') {
        return true;
    }
    // Управляющие символы Unicode (категория Cc)
    if (cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F)) {
        return false;
    }
    return true;
}

}  // namespace

const char* input_format_to_string(InputFormat format) {
    switch (format) {
    case InputFormat::LevelDbLog:
        return "leveldb-log";
    case InputFormat::JsonLines:
        return "json-lines";
    }
    return "unknown";
}

std::optional<std::vector<char32_t>> decode_utf8(std::string_view bytes) {
    std::vector<char32_t> out;
    out.reserve(bytes.size());

    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        const std::size_t len = sequence_length(lead);
        if (len == 0 || i + len > bytes.size()) {
            return std::nullopt;
        }
        if (len == 1) {
            out.push_back(lead);
            ++i;
            continue;
        }

        const auto b1 = static_cast<unsigned char>(bytes[i + 1]);
        if (!is_continuation(b1)) {
            return std::nullopt;
        }
        // Overlong формы, суррогаты и значения больше U+10FFFF
        if ((lead == 0xE0 && b1 < 0xA0) || (lead == 0xED && b1 > 0x9F) ||
            (lead == 0xF0 && b1 < 0x90) || (lead == 0xF4 && b1 > 0x8F)) {
            return std::nullopt;
        }

        char32_t cp = 0;
        if (len == 2) {
            cp = static_cast<char32_t>(((lead & 0x1F) << 6) | (b1 & 0x3F));
        } else {
            const auto b2 = static_cast<unsigned char>(bytes[i + 2]);
            if (!is_continuation(b2)) {
                return std::nullopt;
            }
            if (len == 3) {
                cp = static_cast<char32_t>(((lead & 0x0F) << 12) | ((b1 & 0x3F) << 6) |
                                           (b2 & 0x3F));
            } else {
                const auto b3 = static_cast<unsigned char>(bytes[i + 3]);
                if (!is_continuation(b3)) {
                    return std::nullopt;
                }
                cp = static_cast<char32_t>(((lead & 0x07) << 18) | ((b1 & 0x3F) << 12) |
                                           ((b2 & 0x3F) << 6) | (b3 & 0x3F));
            }
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::size_t utf8_complete_prefix(std::string_view bytes) {
    const std::size_t size = bytes.size();
    std::size_t i = size;
    std::size_t steps = 0;
    while (i > 0 && steps < 4) {
        --i;
        ++steps;
        const auto c = static_cast<unsigned char>(bytes[i]);
        if (is_continuation(c)) {
            continue;
        }
        const std::size_t len = sequence_length(c);
        if (len > 1 && size - i < len) {
            return i;
        }
        return size;
    }
    return size;
}

InputFormat detect_format(std::string_view sample, double printable_ratio) {
    if (sample.empty()) {
        return InputFormat::LevelDbLog;
    }

    auto chars = decode_utf8(sample);
    if (!chars || chars->empty()) {
        return InputFormat::LevelDbLog;
    }

    const bool has_bracket =
        sample.find('{') != std::string_view::npos || sample.find('[') != std::string_view::npos;
    const bool has_newline = sample.find('\n') != std::string_view::npos;
    if (!has_bracket || !has_newline) {
        return InputFormat::LevelDbLog;
    }

    std::size_t printable = 0;
    for (char32_t cp : *chars) {
        if (is_printable(cp)) {
            ++printable;
        }
    }
    const double ratio = static_cast<double>(printable) / static_cast<double>(chars->size());
    return ratio >= printable_ratio ? InputFormat::JsonLines : InputFormat::LevelDbLog;
}

InputFormat detect_file_format(const std::filesystem::path& path, std::size_t sample_bytes,
                               double printable_ratio) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return InputFormat::LevelDbLog;
    }

    std::string buffer(sample_bytes, '\0');
    file.read(buffer.data(), static_cast<std::streamsize>(sample_bytes));
    if (file.bad()) {
        return InputFormat::LevelDbLog;
    }
    buffer.resize(static_cast<std::size_t>(file.gcount()));

    // Окно могло разрезать многобайтовый символ
    if (buffer.size() == sample_bytes) {
        buffer.resize(utf8_complete_prefix(buffer));
    }

    return detect_format(buffer, printable_ratio);
}

}  // namespace fireup
