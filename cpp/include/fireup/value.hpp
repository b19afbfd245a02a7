// ==============================================================================
// fireup/value.hpp - Динамическое JSON значение (Value)
// ==============================================================================
//
// Назначение:
// - Представление полей документа Firestore после декодирования
// - Конверсия из/в RapidJSON Value
// - Явная типизация чисел: UInt64 → Int64 → Double
// - Структурное сравнение (для проверки идемпотентности распаковки)
//
// Object: неупорядоченный hash map: порядок ключей документа не значим.
//
// ==============================================================================

#ifndef FIREUP_VALUE_HPP
#define FIREUP_VALUE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 даёт ложные срабатывания -Wnull-dereference на std::get по variant
// при высоких уровнях оптимизации.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace fireup {

class Value;

/// Массив значений
using ValueArray = std::vector<Value>;

/// Объект (ключ -> значение), порядок не сохраняется
using ValueObject = std::unordered_map<std::string, Value>;

/// Динамическое JSON значение
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    // Array/Object хранятся через shared_ptr: Value неполный тип внутри variant
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    /// Числовой тип (int, uint или double)
    bool is_number() const { return is_int() || is_uint() || is_double(); }

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    /// Поле объекта по ключу (nullptr если нет ключа или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Строковое поле объекта (nullptr если нет или не строка)
    const String* get_string_field(const std::string& key) const {
        const Value* field = get(key);
        return field ? field->get_string() : nullptr;
    }

    bool has(const std::string& key) const { return get(key) != nullptr; }

    std::size_t array_size() const {
        const auto* arr = get_array();
        return arr ? arr->size() : 0;
    }

    std::size_t object_size() const {
        const auto* obj = get_object();
        return obj ? obj->size() : 0;
    }

    // -------------------------------------------------------------------------
    // Сравнение
    // -------------------------------------------------------------------------

    /// Структурное равенство. Int64/UInt64 сравниваются по числовому значению,
    /// Double с целыми не смешивается.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON (порядок для чисел: UInt → Int → Double)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON
    /// @throws std::runtime_error для NaN/Infinity
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Разобрать JSON текст; std::nullopt при синтаксической ошибке
    static std::optional<Value> parse_json(std::string_view text);

    /// Компактная JSON сериализация
    std::string to_json_string() const;
};

}  // namespace fireup

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // FIREUP_VALUE_HPP
