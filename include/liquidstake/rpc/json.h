// LIQUIDSTAKE - JSON Values
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License
//
// The JSON document model shared by the daemon, the client and the config
// loader. Integers are kept exact; amounts above 2^63 travel as strings.

#ifndef LIQUIDSTAKE_RPC_JSON_H
#define LIQUIDSTAKE_RPC_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace liquidstake {
namespace rpc {

enum class JSONType {
    Null,
    Bool,
    Int,
    Real,
    String,
    Array,
    Object
};

/// "null", "bool", "int", "real", "string", "array" or "object"
const char* JSONTypeName(JSONType type);

class JSONValue {
public:
    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() = default;
    JSONValue(std::nullptr_t) {}
    JSONValue(bool flag);
    JSONValue(int number);
    JSONValue(int64_t number);
    /// Values above INT64_MAX are clamped; format such amounts as strings
    JSONValue(uint64_t number);
    JSONValue(double number);
    JSONValue(const char* text);
    JSONValue(std::string text);
    JSONValue(Array items);
    JSONValue(Object fields);

    JSONType GetType() const { return kind_; }
    bool Is(JSONType type) const { return kind_ == type; }
    bool IsNull() const { return Is(JSONType::Null); }
    bool IsBool() const { return Is(JSONType::Bool); }
    bool IsInt() const { return Is(JSONType::Int); }
    bool IsReal() const { return Is(JSONType::Real); }
    bool IsNumber() const { return IsInt() || IsReal(); }
    bool IsString() const { return Is(JSONType::String); }
    bool IsArray() const { return Is(JSONType::Array); }
    bool IsObject() const { return Is(JSONType::Object); }

    /// Typed reads return fallback when the value holds another type
    bool GetBool(bool fallback = false) const;
    int64_t GetInt(int64_t fallback = 0) const;
    double GetReal(double fallback = 0.0) const;
    const std::string& GetString() const;
    std::string GetString(const std::string& fallback) const;

    const Array& Items() const;
    const Object& Fields() const;

    /// Member lookup; a missing key or a non-object reads as null
    const JSONValue& operator[](const std::string& key) const;
    /// Turns a non-object into an empty object first
    JSONValue& operator[](const std::string& key);
    bool HasKey(const std::string& key) const;

    /// Element lookup; out of range or a non-array reads as null
    const JSONValue& operator[](size_t index) const;
    /// Turns a non-array into an empty array first
    void Push(JSONValue value);

    /// Elements of an array or members of an object
    size_t Size() const;

    /// Compact text with object keys in sorted order
    std::string ToJSON() const;

    /// @throws std::runtime_error naming the offset of the first error
    static JSONValue Parse(const std::string& text);

    /// Whole document, no trailing characters
    static std::optional<JSONValue> TryParse(const std::string& text);

private:
    JSONType kind_{JSONType::Null};
    bool flag_{false};
    int64_t integer_{0};
    double real_{0.0};
    std::string text_;
    Array items_;
    Object fields_;
};

} // namespace rpc
} // namespace liquidstake

#endif // LIQUIDSTAKE_RPC_JSON_H
