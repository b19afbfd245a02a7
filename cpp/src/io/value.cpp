// ==============================================================================
// value.cpp - Реализация Value
// ==============================================================================

#include <fireup/value.hpp>

#include <cmath>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <stdexcept>

namespace fireup {

// ----------------------------------------------------------------------------
// Сравнение
// ----------------------------------------------------------------------------

namespace {

bool integers_equal(const Value& a, const Value& b) {
    if (a.is_int() && b.is_int()) {
        return a.as_int() == b.as_int();
    }
    if (a.is_uint() && b.is_uint()) {
        return a.as_uint() == b.as_uint();
    }
    // Смешанный случай: отрицательный Int64 никогда не равен UInt64
    const Value& s = a.is_int() ? a : b;
    const Value& u = a.is_int() ? b : a;
    return s.as_int() >= 0 && static_cast<std::uint64_t>(s.as_int()) == u.as_uint();
}

}  // namespace

bool Value::operator==(const Value& other) const {
    bool lhs_integer = is_int() || is_uint();
    bool rhs_integer = other.is_int() || other.is_uint();
    if (lhs_integer && rhs_integer) {
        return integers_equal(*this, other);
    }

    if (data_.index() != other.data_.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_double()) {
        return as_double() == other.as_double();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (std::size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }

    const auto& lhs = as_object();
    const auto& rhs = other.as_object();
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (const auto& [key, val] : lhs) {
        auto it = rhs.find(key);
        if (it == rhs.end() || it->second != val) {
            return false;
        }
    }
    return true;
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        // Приоритет: UInt → Int → Double
        if (json.IsUint64()) {
            return Value(json.GetUint64());
        }
        if (json.IsInt64()) {
            return Value(json.GetInt64());
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            // При дублирующихся ключах побеждает последний
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_uint()) {
        out.SetUint64(as_uint());
        return;
    }

    if (is_double()) {
        double d = as_double();
        // JSON не умеет NaN/Infinity
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    out.SetObject();
    for (const auto& [key, val] : as_object()) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        val.to_rapidjson(v, alloc);
        out.AddMember(k, v, alloc);
    }
}

// ----------------------------------------------------------------------------
// Текстовый JSON
// ----------------------------------------------------------------------------

std::optional<Value> Value::parse_json(std::string_view text) {
    rapidjson::Document doc;
    // Полезная нагрузка записи не NUL-терминирована: парсим с явной длиной
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        return std::nullopt;
    }
    return from_rapidjson(doc);
}

std::string Value::to_json_string() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);

    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace fireup
