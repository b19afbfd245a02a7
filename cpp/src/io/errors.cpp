// ==============================================================================
// errors.cpp - Форматирование ошибок разбора
// ==============================================================================

#include <fireup/errors.hpp>

namespace fireup {

const char* decode_error_kind_to_string(DecodeErrorKind kind) {
    switch (kind) {
    case DecodeErrorKind::InvalidRecordType:
        return "invalid record type";
    case DecodeErrorKind::TruncatedHeader:
        return "truncated header";
    case DecodeErrorKind::TruncatedRecord:
        return "truncated record";
    case DecodeErrorKind::ChecksumMismatch:
        return "checksum mismatch";
    case DecodeErrorKind::UnparseableRecord:
        return "unparseable record";
    }
    return "unknown";
}

std::string DecodeError::format() const {
    std::string result = decode_error_kind_to_string(kind);
    if (!message.empty()) {
        result += ": " + message;
    }
    if (block_index && offset) {
        result += " (block " + std::to_string(*block_index) + ", offset " +
                  std::to_string(*offset) + ")";
    } else if (record_index) {
        result += " (record " + std::to_string(*record_index) + ")";
    }
    return result;
}

const char* parse_error_kind_to_string(ParseErrorKind kind) {
    switch (kind) {
    case ParseErrorKind::FileNotFound:
        return "file not found";
    case ParseErrorKind::Io:
        return "io error";
    case ParseErrorKind::Structure:
        return "structure error";
    }
    return "unknown";
}

std::string ParseError::format() const {
    return "[!] failed to parse backup '" + path + "' - " + message;
}

}  // namespace fireup
