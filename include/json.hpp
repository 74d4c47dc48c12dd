#pragma once

#include <string>
#include <string_view>
#include <map>
#include <vector>
#include <variant>
#include <expected>
#include <cstdint>

namespace ztgate::json {

class Value;
using Null = std::monostate;
using Boolean = bool;
using Number = double;
using String = std::string;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

class Value {
public:
    using VariantType = std::variant<Null, Boolean, Number, String, Array, Object>;
    Value() : data_(Null{}) {}
    Value(Null) : data_(Null{}) {}
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(int i) : data_(static_cast<double>(i)) {}
    Value(int64_t i) : data_(static_cast<double>(i)) {}
    Value(uint64_t i) : data_(static_cast<double>(i)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(Object o) : data_(std::move(o)) {}

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Boolean>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<Array>(data_); }
    bool is_object() const { return std::holds_alternative<Object>(data_); }

    bool as_bool() const { return std::get<Boolean>(data_); }
    double as_number() const { return std::get<Number>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }

    String& as_string() { return std::get<String>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    Object& as_object() { return std::get<Object>(data_); }

    bool contains(const std::string& key) const {
        return is_object() && as_object().count(key) > 0;
    }

    const Value& operator[](const std::string& key) const {
        static const Value null_value;
        if (!is_object()) return null_value;
        const auto& obj = as_object();
        auto it = obj.find(key);
        return it != obj.end() ? it->second : null_value;
    }

    // Typed lookups with a fallback for absent or mistyped members.
    std::string get_string(const std::string& key, std::string fallback = {}) const {
        const auto& v = (*this)[key];
        return v.is_string() ? v.as_string() : fallback;
    }
    double get_number(const std::string& key, double fallback) const {
        const auto& v = (*this)[key];
        return v.is_number() ? v.as_number() : fallback;
    }
    bool get_bool(const std::string& key, bool fallback) const {
        const auto& v = (*this)[key];
        return v.is_bool() ? v.as_bool() : fallback;
    }

    bool operator==(const Value& other) const { return data_ == other.data_; }

private:
    VariantType data_;
};

struct ParseError {
    std::string message;
    size_t offset = 0;
};

std::expected<Value, ParseError> parse(std::string_view input);

// Compact serialization. Object keys come out sorted (std::map order), so
// dump() of equal values is byte-identical and usable as a hash preimage.
std::string dump(const Value& value);

void append_escaped(std::string& out, std::string_view s);

} // namespace ztgate::json
