// VFACE - JSON Value
// Copyright (c) 2024 VFACE Developers
// MIT License
//
// Small JSON document model used by the RPC layer, the key store file,
// signed owner commands and consent token claims.

#ifndef VFACE_UTIL_JSON_H
#define VFACE_UTIL_JSON_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vface {
namespace util {

/**
 * Parsed or hand-built JSON document.
 *
 * Integers and doubles are kept apart so that "7" round-trips as 7 and
 * request ids survive unchanged. Object members live in a std::map, which
 * makes ToJSON() output canonical: signed owner commands and consent token
 * claims depend on that.
 *
 * Accessors never throw. A missing key or wrong type yields Null() or the
 * supplied default, so handlers validate with the Is*() predicates.
 */
class JSONValue {
public:
    using Array = std::vector<JSONValue>;
    using Object = std::map<std::string, JSONValue>;

    JSONValue() = default;
    JSONValue(std::nullptr_t) {}
    JSONValue(bool value) : type_(Type::Bool), boolValue_(value) {}
    JSONValue(int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(unsigned int value) : type_(Type::Int), intValue_(value) {}
    JSONValue(int64_t value) : type_(Type::Int), intValue_(value) {}
    JSONValue(uint64_t value) : type_(Type::Int), intValue_(static_cast<int64_t>(value)) {}
    JSONValue(double value) : type_(Type::Double), doubleValue_(value) {}
    JSONValue(const char* value) : type_(Type::String), stringValue_(value) {}
    JSONValue(std::string value) : type_(Type::String), stringValue_(std::move(value)) {}
    JSONValue(Array value) : type_(Type::Array), arrayValue_(std::move(value)) {}
    JSONValue(Object value) : type_(Type::Object), objectValue_(std::move(value)) {}

    bool IsNull() const { return type_ == Type::Null; }
    bool IsBool() const { return type_ == Type::Bool; }
    bool IsInt() const { return type_ == Type::Int; }
    bool IsDouble() const { return type_ == Type::Double; }
    bool IsNumber() const { return IsInt() || IsDouble(); }
    bool IsString() const { return type_ == Type::String; }
    bool IsArray() const { return type_ == Type::Array; }
    bool IsObject() const { return type_ == Type::Object; }

    bool GetBool(bool defaultValue = false) const;
    /// Doubles are truncated toward zero
    int64_t GetInt(int64_t defaultValue = 0) const;
    double GetDouble(double defaultValue = 0.0) const;
    const std::string& GetString(const std::string& defaultValue = emptyString_) const;
    const Array& GetArray() const;
    const Object& GetObject() const;

    bool HasKey(const std::string& key) const;
    const JSONValue& operator[](const std::string& key) const;
    /// Turns a non-object into an empty object first
    JSONValue& operator[](const std::string& key);

    /// Element count of an array or object, else 0
    size_t Size() const;
    const JSONValue& operator[](size_t index) const;
    /// Turns a non-array into an empty array first
    void Push(JSONValue value);

    /**
     * Render as text. Compact output has no whitespace; pretty output
     * indents by two spaces per level. Doubles use the shortest form that
     * parses back to the same value; NaN and infinities become null.
     */
    std::string ToJSON(bool pretty = false, int indent = 0) const;

    /// @throws std::runtime_error on any syntax error
    static JSONValue Parse(const std::string& json);

    /// Strict RFC 8259 parse, nesting capped at 64 levels
    static std::optional<JSONValue> TryParse(const std::string& json);

    static const JSONValue& Null() { return nullValue_; }

private:
    enum class Type { Null, Bool, Int, Double, String, Array, Object };

    Type type_{Type::Null};
    bool boolValue_{false};
    int64_t intValue_{0};
    double doubleValue_{0.0};
    std::string stringValue_;
    Array arrayValue_;
    Object objectValue_;

    static const JSONValue nullValue_;
    static const Array emptyArray_;
    static const Object emptyObject_;
    static const std::string emptyString_;
};

/// Quote and escape a string as a JSON string literal
std::string JSONQuote(const std::string& str);

} // namespace util
} // namespace vface

#endif // VFACE_UTIL_JSON_H
