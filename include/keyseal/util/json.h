// KEYSEAL - JSON Value
// Copyright (c) 2024 KEYSEAL Developers
// MIT License
//
// Small JSON document model used for keystore records and tool output.
// Objects keep their keys sorted, so serialization is deterministic.

#ifndef KEYSEAL_UTIL_JSON_H
#define KEYSEAL_UTIL_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace keyseal {
namespace util {

/// Thrown by JSONValue::Parse on malformed input
class JSONError : public std::runtime_error {
public:
    JSONError(const std::string& what, size_t position)
        : std::runtime_error(what + " at offset " + std::to_string(position))
        , position_(position) {}

    size_t Position() const { return position_; }

private:
    size_t position_;
};

// ============================================================================
// JSON Value
// ============================================================================

/**
 * Represents a JSON value.
 * Supports: null, bool, int64, double, string, array, object
 */
class JSONValue {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        Array,
        Object
    };

    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() : type_(Type::Null) {}
    JSONValue(std::nullptr_t) : type_(Type::Null) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint32_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(const std::string& value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string&& value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(const Array& value) : type_(Type::Array), arrayValue_(value) {}
    JSONValue(Array&& value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(const Object& value) : type_(Type::Object), objectValue_(value) {}
    JSONValue(Object&& value) : type_(Type::Object), objectValue_(std::move(value)) {}

    // Type checking
    Type GetType() const { return type_; }
    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return type_ == Type::Int || type_ == Type::Double; }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    // Value getters (with defaults on type mismatch)
    bool GetBool(bool defaultValue = false) const;
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString() const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    // Object access
    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    JSONValue& operator[](const std::string& key);

    // Array access
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    void Push(JSONValue value);

    bool operator==(const JSONValue& other) const;
    bool operator!=(const JSONValue& other) const { return !(*this == other); }

    /// Serialize; pretty output indents by two spaces per level
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// Parse a complete document
    /// @throws JSONError on malformed input or trailing characters
    static JSONValue Parse(const std::string& json);

    /// Parse a complete document, or nullopt on any error
    static std::optional<JSONValue> TryParse(const std::string& json);

    /// Get a null value reference (for returning from accessors)
    static const JSONValue& Null();

private:
    Type type_;
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;
};

/// Type name for error messages ("string", "object", ...)
const char* JSONTypeName(JSONValue::Type type);

} // namespace util
} // namespace keyseal

#endif // KEYSEAL_UTIL_JSON_H
