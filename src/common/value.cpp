// ---------------------------------------------------------------------------
// value.cpp
//
// Value 동적 타입 구현 (진리값, 동등성, JSON 직렬화).
// ---------------------------------------------------------------------------

#include "common/value.hpp"

#include <cmath>
#include <cstdio>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
void append_escaped(std::string& out, const std::string& str) {
    out += '"';
    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    out += buf;
                } else {
                    out += static_cast<char>(ch);
                }
                break;
        }
    }
    out += '"';
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: number 직렬화
// 정수로 표현 가능한 값은 소수점 없이, NaN/Inf 는 JSON 에 없으므로 null.
// ---------------------------------------------------------------------------
void append_number(std::string& out, double d) {
    if (!std::isfinite(d)) {
        out += "null";
        return;
    }
    if (std::trunc(d) == d && std::fabs(d) < 1e15) {
        out += std::to_string(static_cast<long long>(d));
        return;
    }
    char buf[32]{};
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    out += buf;
}

void append_json(std::string& out, const Value& value) {
    switch (value.type()) {
        case ValueType::kNull:
            out += "null";
            break;
        case ValueType::kBool:
            out += value.as_bool() ? "true" : "false";
            break;
        case ValueType::kNumber:
            append_number(out, value.as_number());
            break;
        case ValueType::kString:
            append_escaped(out, value.as_string());
            break;
        case ValueType::kArray: {
            out += '[';
            bool first = true;
            for (const auto& item : value.as_array()) {
                if (!first) {
                    out += ',';
                }
                first = false;
                append_json(out, item);
            }
            out += ']';
            break;
        }
        case ValueType::kObject: {
            out += '{';
            bool first = true;
            for (const auto& [key, item] : value.as_object()) {
                if (!first) {
                    out += ',';
                }
                first = false;
                append_escaped(out, key);
                out += ':';
                append_json(out, item);
            }
            out += '}';
            break;
        }
    }
}

}  // namespace

Value Value::array(std::initializer_list<Value> items) {
    return Value{Array(items)};
}

Value Value::object(std::initializer_list<std::pair<const std::string, Value>> items) {
    return Value{Object(items)};
}

ValueType Value::type() const noexcept {
    return static_cast<ValueType>(data_.index());
}

bool Value::as_bool() const {
    return std::get<bool>(data_);
}

double Value::as_number() const {
    return std::get<double>(data_);
}

const std::string& Value::as_string() const {
    return std::get<std::string>(data_);
}

const Value::Array& Value::as_array() const {
    return *std::get<std::shared_ptr<const Array>>(data_);
}

const Value::Object& Value::as_object() const {
    return *std::get<std::shared_ptr<const Object>>(data_);
}

const Value* Value::get(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    const auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

bool Value::truthy() const noexcept {
    switch (type()) {
        case ValueType::kNull:
            return false;
        case ValueType::kBool:
            return std::get<bool>(data_);
        case ValueType::kNumber: {
            const double d = std::get<double>(data_);
            return d != 0.0 && !std::isnan(d);
        }
        case ValueType::kString:
            return !std::get<std::string>(data_).empty();
        case ValueType::kArray:
            return !std::get<std::shared_ptr<const Array>>(data_)->empty();
        case ValueType::kObject:
            return true;
    }
    return false;
}

std::string Value::to_json() const {
    std::string out;
    append_json(out, *this);
    return out;
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.type() != rhs.type()) {
        return false;
    }
    switch (lhs.type()) {
        case ValueType::kNull:
            return true;
        case ValueType::kBool:
            return lhs.as_bool() == rhs.as_bool();
        case ValueType::kNumber:
            return lhs.as_number() == rhs.as_number();
        case ValueType::kString:
            return lhs.as_string() == rhs.as_string();
        case ValueType::kArray:
            return lhs.as_array() == rhs.as_array();
        case ValueType::kObject:
            return lhs.as_object() == rhs.as_object();
    }
    return false;
}

std::string_view type_name(ValueType type) noexcept {
    switch (type) {
        case ValueType::kNull:   return "null";
        case ValueType::kBool:   return "bool";
        case ValueType::kNumber: return "number";
        case ValueType::kString: return "string";
        case ValueType::kArray:  return "array";
        case ValueType::kObject: return "object";
    }
    return "unknown";
}
