// ==============================================================================
// document.cpp - Декодирование документов Firestore
// ==============================================================================

#include <fireup/config.hpp>
#include <fireup/firestore.hpp>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace fireup::firestore {

namespace {

constexpr std::int64_t MICROS_PER_SECOND = 1000000;
constexpr std::int64_t SECONDS_PER_DAY = 86400;

/// Ключи верхнего уровня, которые не являются полями документа
constexpr const char* RESERVED_KEYS[] = {"name",       "path",       "id",      "collection",
                                         "createTime", "updateTime", "readTime"};

bool is_reserved_key(const std::string& key) {
    for (const char* reserved : RESERVED_KEYS) {
        if (key == reserved) {
            return true;
        }
    }
    return false;
}

bool starts_with(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.substr(0, prefix.size()) == prefix;
}

// ----------------------------------------------------------------------------
// Календарь (пролептический григорианский)
// ----------------------------------------------------------------------------

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

/// Дней от 1970-01-01
std::int64_t days_from_civil(std::int64_t y, int m, int d) {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const std::int64_t yoe = y - era * 400;
    const std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(std::int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t doe = z - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

bool parse_digits(std::string_view s, int& out) {
    if (s.empty()) {
        return false;
    }
    out = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return false;
        }
        out = out * 10 + (c - '0');
    }
    return true;
}

// ----------------------------------------------------------------------------
// Типизированные значения
// ----------------------------------------------------------------------------

/// strtoll/strtod пропускают ведущие пробелы, строгий разбор их не допускает
bool starts_with_space(const std::string& text) {
    return !text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0;
}

std::optional<std::int64_t> parse_int64(const std::string& text) {
    if (text.empty() || starts_with_space(text)) {
        return std::nullopt;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(value);
}

std::optional<double> parse_double(const std::string& text) {
    if (text.empty() || starts_with_space(text)) {
        return std::nullopt;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

Value unwrap_integer(const Value& inner) {
    if (const auto* text = inner.get_string()) {
        if (auto parsed = parse_int64(*text)) {
            return Value(*parsed);
        }
    }
    return inner;
}

Value unwrap_double(const Value& inner) {
    if (const auto* text = inner.get_string()) {
        if (auto parsed = parse_double(*text)) {
            return Value(*parsed);
        }
    }
    return inner;
}

Value unwrap_array(const Value& wrapper, const Value& inner) {
    const auto* obj = inner.get_object();
    if (obj == nullptr) {
        return wrapper;
    }
    ValueArray out;
    // Пустой массив Firestore кодирует как {"arrayValue": {}}
    if (const auto* values = inner.get("values")) {
        const auto* arr = values->get_array();
        if (arr == nullptr) {
            return wrapper;
        }
        out.reserve(arr->size());
        for (const auto& element : *arr) {
            out.push_back(unwrap_typed_value(element));
        }
    }
    return Value(std::move(out));
}

Value unwrap_map(const Value& wrapper, const Value& inner) {
    const auto* obj = inner.get_object();
    if (obj == nullptr) {
        return wrapper;
    }
    ValueObject out;
    if (const auto* fields = inner.get("fields")) {
        const auto* fields_obj = fields->get_object();
        if (fields_obj == nullptr) {
            return wrapper;
        }
        for (const auto& [key, field] : *fields_obj) {
            out.emplace(key, unwrap_typed_value(field));
        }
    }
    return Value(std::move(out));
}

/// Идентичность по имени ресурса; nullopt если сегментов меньше двух
std::optional<std::pair<std::string, std::string>> split_resource_path(const std::string& path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            slash = path.size();
        }
        if (slash > start) {
            segments.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    if (segments.size() < 2) {
        return std::nullopt;
    }
    return std::make_pair(segments[segments.size() - 2], segments.back());
}

std::optional<DateTime> parse_time_field(const ValueObject& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    const auto* text = it->second.get_string();
    if (text == nullptr) {
        return std::nullopt;
    }
    return DateTime::parse(*text);
}

Value optional_time(const std::optional<DateTime>& dt) {
    return dt ? Value(dt->to_string()) : Value();
}

}  // namespace

// ============================================================================
// DateTime
// ============================================================================

std::optional<DateTime> DateTime::parse(std::string_view str) {
    DateTime dt;

    // YYYY-MM-DDTHH:MM:SS + хотя бы 'Z'
    if (str.size() < 20) {
        return std::nullopt;
    }

    if (!parse_digits(str.substr(0, 4), dt.year) || str[4] != '-') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(5, 2), dt.month) || dt.month < 1 || dt.month > 12 ||
        str[7] != '-') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(8, 2), dt.day) || dt.day < 1 ||
        dt.day > days_in_month(dt.year, dt.month)) {
        return std::nullopt;
    }
    if (str[10] != 'T' && str[10] != 't' && str[10] != ' ') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(11, 2), dt.hour) || dt.hour > 23 || str[13] != ':') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(14, 2), dt.minute) || dt.minute > 59 || str[16] != ':') {
        return std::nullopt;
    }
    if (!parse_digits(str.substr(17, 2), dt.second) || dt.second > 59) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    if (str[pos] == '.') {
        ++pos;
        const std::size_t frac_start = pos;
        int micros = 0;
        while (pos < str.size() && str[pos] >= '0' && str[pos] <= '9') {
            if (pos - frac_start < 6) {
                micros = micros * 10 + (str[pos] - '0');
            }
            ++pos;
        }
        const std::size_t digits = pos - frac_start;
        if (digits == 0) {
            return std::nullopt;
        }
        for (std::size_t i = digits; i < 6; ++i) {
            micros *= 10;
        }
        dt.microsecond = micros;
    }

    if (pos >= str.size()) {
        return std::nullopt;
    }

    int offset_minutes = 0;
    if (str[pos] == 'Z' || str[pos] == 'z') {
        ++pos;
    } else if (str[pos] == '+' || str[pos] == '-') {
        const int sign = str[pos] == '-' ? -1 : 1;
        if (str.size() - pos != 6 || str[pos + 3] != ':') {
            return std::nullopt;
        }
        int hours = 0;
        int minutes = 0;
        if (!parse_digits(str.substr(pos + 1, 2), hours) || hours > 23 ||
            !parse_digits(str.substr(pos + 4, 2), minutes) || minutes > 59) {
            return std::nullopt;
        }
        offset_minutes = sign * (hours * 60 + minutes);
        pos += 6;
    } else {
        return std::nullopt;
    }

    if (pos != str.size()) {
        return std::nullopt;
    }

    if (offset_minutes == 0) {
        return dt;
    }
    return from_unix_micros(dt.to_unix_micros() -
                            static_cast<std::int64_t>(offset_minutes) * 60 * MICROS_PER_SECOND);
}

std::int64_t DateTime::to_unix_micros() const {
    const std::int64_t days = days_from_civil(year, month, day);
    const std::int64_t seconds =
        days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + static_cast<std::int64_t>(second);
    return seconds * MICROS_PER_SECOND + microsecond;
}

DateTime DateTime::from_unix_micros(std::int64_t micros) {
    std::int64_t seconds = micros / MICROS_PER_SECOND;
    std::int64_t rem_micros = micros % MICROS_PER_SECOND;
    if (rem_micros < 0) {
        rem_micros += MICROS_PER_SECOND;
        --seconds;
    }
    std::int64_t days = seconds / SECONDS_PER_DAY;
    std::int64_t rem_seconds = seconds % SECONDS_PER_DAY;
    if (rem_seconds < 0) {
        rem_seconds += SECONDS_PER_DAY;
        --days;
    }

    DateTime dt;
    civil_from_days(days, dt.year, dt.month, dt.day);
    dt.hour = static_cast<int>(rem_seconds / 3600);
    dt.minute = static_cast<int>((rem_seconds % 3600) / 60);
    dt.second = static_cast<int>(rem_seconds % 60);
    dt.microsecond = static_cast<int>(rem_micros);
    return dt;
}

bool DateTime::operator<(const DateTime& other) const {
    return to_unix_micros() < other.to_unix_micros();
}

bool DateTime::operator==(const DateTime& other) const {
    return year == other.year && month == other.month && day == other.day && hour == other.hour &&
           minute == other.minute && second == other.second && microsecond == other.microsecond;
}

std::string DateTime::to_string() const {
    char buf[64];
    if (microsecond > 0) {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06dZ", year, month, day,
                      hour, minute, second, microsecond);
    } else {
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ", year, month, day, hour,
                      minute, second);
    }
    return buf;
}

// ============================================================================
// Распаковка и идентичность
// ============================================================================

DecoderOptions DecoderOptions::from_config(const config::ParserConfig& cfg) {
    DecoderOptions options;
    options.min_record_bytes = cfg.min_record_bytes;
    options.metadata_markers = cfg.metadata_markers;
    return options;
}

Value unwrap_typed_value(const Value& value) {
    const auto* obj = value.get_object();
    if (obj == nullptr || obj->size() != 1) {
        return value;
    }

    const auto& [tag, inner] = *obj->begin();
    if (tag == "stringValue" || tag == "booleanValue" || tag == "timestampValue") {
        return inner;
    }
    if (tag == "integerValue") {
        return unwrap_integer(inner);
    }
    if (tag == "doubleValue") {
        return unwrap_double(inner);
    }
    if (tag == "arrayValue") {
        return unwrap_array(value, inner);
    }
    if (tag == "mapValue") {
        return unwrap_map(value, inner);
    }
    return value;
}

DocumentIdentity resolve_identity(const ValueObject& object) {
    DocumentIdentity identity;

    auto string_field = [&object](const char* key) -> const std::string* {
        auto it = object.find(key);
        return it != object.end() ? it->second.get_string() : nullptr;
    };

    const std::string* name = string_field("name");
    const std::string* path = string_field("path");

    if (name != nullptr) {
        identity.path = *name;
    } else if (path != nullptr) {
        identity.path = *path;
    }

    for (const std::string* resource : {name, path}) {
        if (resource == nullptr) {
            continue;
        }
        if (auto parts = split_resource_path(*resource)) {
            identity.collection = std::move(parts->first);
            identity.id = std::move(parts->second);
            return identity;
        }
    }

    const std::string* id = string_field("id");
    const std::string* collection = string_field("collection");
    if (id != nullptr && collection != nullptr) {
        identity.id = *id;
        identity.collection = *collection;
    }
    return identity;
}

bool is_metadata_record(std::string_view payload, DecodeMode mode, const DecoderOptions& options) {
    if (mode == DecodeMode::Binary && payload.size() < options.min_record_bytes) {
        return true;
    }
    for (const auto& marker : options.metadata_markers) {
        if (payload.find(marker) != std::string_view::npos) {
            return true;
        }
    }
    return starts_with(payload, "__");
}

// ============================================================================
// decode_record
// ============================================================================

DecodeOutcome decode_record(std::string_view payload, std::uint64_t index, DecodeMode mode,
                            const DecoderOptions& options) {
    DecodeOutcome outcome;

    if (is_metadata_record(payload, mode, options)) {
        return outcome;
    }

    auto parsed = Value::parse_json(payload);
    if (!parsed) {
        if (mode == DecodeMode::Binary) {
            DecodeError err;
            err.kind = DecodeErrorKind::UnparseableRecord;
            err.message = "payload is not valid JSON (" + std::to_string(payload.size()) + " bytes)";
            err.record_index = index;
            outcome.error = std::move(err);
        }
        return outcome;
    }

    const auto* object = parsed->get_object();
    if (object == nullptr) {
        return outcome;
    }

    DocumentIdentity identity = resolve_identity(*object);

    // Зарезервированные идентификаторы Firestore (__internal и т.п.)
    if (starts_with(identity.collection, "__") || starts_with(identity.id, "__")) {
        return outcome;
    }

    FirestoreDocument doc;
    doc.id = identity.id;
    doc.collection = identity.collection;
    doc.metadata.path = identity.path;
    doc.metadata.created_at = parse_time_field(*object, "createTime");
    doc.metadata.updated_at = parse_time_field(*object, "updateTime");

    const Value* fields = parsed->get("fields");
    if (fields != nullptr && fields->is_object()) {
        for (const auto& [key, field] : fields->as_object()) {
            doc.data.emplace(key, unwrap_typed_value(field));
        }
    } else {
        for (const auto& [key, field] : *object) {
            if (!is_reserved_key(key)) {
                doc.data.emplace(key, field);
            }
        }
    }

    outcome.document = std::move(doc);
    return outcome;
}

Value document_to_value(const FirestoreDocument& doc) {
    ValueObject metadata;
    metadata.emplace("path", Value(doc.metadata.path));
    metadata.emplace("created_at", optional_time(doc.metadata.created_at));
    metadata.emplace("updated_at", optional_time(doc.metadata.updated_at));
    metadata.emplace("size_bytes", doc.metadata.size_bytes ? Value(*doc.metadata.size_bytes)
                                                           : Value());

    ValueArray subcollections;
    subcollections.reserve(doc.subcollections.size());
    for (const auto& child : doc.subcollections) {
        subcollections.push_back(document_to_value(child));
    }

    ValueObject out;
    out.emplace("id", Value(doc.id));
    out.emplace("collection", Value(doc.collection));
    out.emplace("data", Value(doc.data));
    out.emplace("subcollections", Value(std::move(subcollections)));
    out.emplace("metadata", Value(std::move(metadata)));
    return Value(std::move(out));
}

}  // namespace fireup::firestore
