// VFACE - JSON Value Implementation
// Copyright (c) 2024 VFACE Developers
// MIT License

#include "vface/util/json.h"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

namespace vface {
namespace util {

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;
const std::string JSONValue::emptyString_;

namespace {

std::string FormatDouble(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    char buf[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, value);
        if (std::strtod(buf, nullptr) == value) {
            break;
        }
    }
    return buf;
}

void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

std::string JSONQuote(const std::string& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out += '"';
    for (char c : str) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

// ============================================================================
// Accessors
// ============================================================================

bool JSONValue::GetBool(bool defaultValue) const {
    if (type_ == Type::Bool) return boolValue_;
    return defaultValue;
}

int64_t JSONValue::GetInt(int64_t defaultValue) const {
    if (type_ == Type::Int) return intValue_;
    if (type_ == Type::Double) return static_cast<int64_t>(doubleValue_);
    return defaultValue;
}

double JSONValue::GetDouble(double defaultValue) const {
    if (type_ == Type::Double) return doubleValue_;
    if (type_ == Type::Int) return static_cast<double>(intValue_);
    return defaultValue;
}

const std::string& JSONValue::GetString(const std::string& defaultValue) const {
    if (type_ == Type::String) return stringValue_;
    return defaultValue;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return emptyArray_;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return emptyObject_;
}

bool JSONValue::HasKey(const std::string& key) const {
    if (type_ != Type::Object) return false;
    return objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return nullValue_;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return nullValue_;
    return it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (type_ != Type::Object) {
        type_ = Type::Object;
        objectValue_.clear();
    }
    return objectValue_[key];
}

size_t JSONValue::Size() const {
    if (type_ == Type::Array) return arrayValue_.size();
    if (type_ == Type::Object) return objectValue_.size();
    return 0;
}

const JSONValue& JSONValue::operator[](size_t index) const {
    if (type_ != Type::Array || index >= arrayValue_.size()) return nullValue_;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

// ============================================================================
// Writer
// ============================================================================

namespace {

void AppendIndent(std::string& out, int depth) {
    out.append(static_cast<size_t>(depth) * 2, ' ');
}

/// Emit "[...]" or "{...}" members with shared comma and indent handling
template<typename Container, typename EmitMember>
void AppendContainer(std::string& out, const Container& members, char open, char close,
                     bool pretty, int depth, EmitMember emit) {
    out += open;
    if (members.empty()) {
        out += close;
        return;
    }
    bool first = true;
    for (const auto& member : members) {
        if (!first) out += ',';
        first = false;
        if (pretty) {
            out += '\n';
            AppendIndent(out, depth + 1);
        }
        emit(member);
    }
    if (pretty) {
        out += '\n';
        AppendIndent(out, depth);
    }
    out += close;
}

} // namespace

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    switch (type_) {
        case Type::Null:   return "null";
        case Type::Bool:   return boolValue_ ? "true" : "false";
        case Type::Int:    return std::to_string(intValue_);
        case Type::Double: return FormatDouble(doubleValue_);
        case Type::String: return JSONQuote(stringValue_);
        case Type::Array: {
            std::string out;
            AppendContainer(out, arrayValue_, '[', ']', pretty, indent,
                            [&](const JSONValue& item) {
                                out += item.ToJSON(pretty, indent + 1);
                            });
            return out;
        }
        case Type::Object: {
            std::string out;
            AppendContainer(out, objectValue_, '{', '}', pretty, indent,
                            [&](const Object::value_type& member) {
                                out += JSONQuote(member.first);
                                out += pretty ? ": " : ":";
                                out += member.second.ToJSON(pretty, indent + 1);
                            });
            return out;
        }
    }
    return "null";
}

// ============================================================================
// Reader
// ============================================================================

namespace {

/// Recursive descent over one complete document. Every Read* leaves pos_
/// just past what it consumed, or returns false on a syntax error.
class Reader {
public:
    explicit Reader(const std::string& text) : text_(text) {}

    bool ReadDocument(JSONValue& out) {
        if (!ReadValue(out)) return false;
        SkipSpace();
        return pos_ == text_.size();
    }

private:
    static constexpr int MAX_NESTING = 64;

    const std::string& text_;
    size_t pos_ = 0;
    int nesting_ = 0;

    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek() const { return text_[pos_]; }

    void SkipSpace() {
        while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek()))) ++pos_;
    }

    bool Consume(char c) {
        SkipSpace();
        if (AtEnd() || Peek() != c) return false;
        ++pos_;
        return true;
    }

    bool ConsumeWord(const char* word) {
        size_t len = std::strlen(word);
        if (text_.compare(pos_, len, word) != 0) return false;
        pos_ += len;
        return true;
    }

    size_t SkipDigits() {
        size_t begin = pos_;
        while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek()))) ++pos_;
        return pos_ - begin;
    }

    bool ReadValue(JSONValue& out) {
        SkipSpace();
        if (AtEnd()) return false;

        switch (Peek()) {
            case 'n': out = JSONValue(); return ConsumeWord("null");
            case 't': out = JSONValue(true); return ConsumeWord("true");
            case 'f': out = JSONValue(false); return ConsumeWord("false");
            case '"': {
                std::string str;
                if (!ReadString(str)) return false;
                out = JSONValue(std::move(str));
                return true;
            }
            case '[':
            case '{': {
                if (++nesting_ > MAX_NESTING) return false;
                bool ok = Peek() == '[' ? ReadArray(out) : ReadObject(out);
                --nesting_;
                return ok;
            }
            default:
                return ReadNumber(out);
        }
    }

    bool ReadHex4(uint32_t& unit) {
        if (pos_ + 4 > text_.size()) return false;
        unit = 0;
        for (int i = 0; i < 4; ++i) {
            int digit = HexDigit(text_[pos_++]);
            if (digit < 0) return false;
            unit = (unit << 4) | static_cast<uint32_t>(digit);
        }
        return true;
    }

    static int HexDigit(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    /// \uXXXX, including a surrogate pair spelled as two escapes
    bool ReadUnicodeEscape(std::string& out) {
        uint32_t cp = 0;
        if (!ReadHex4(cp)) return false;
        if (cp >= 0xDC00 && cp <= 0xDFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t low = 0;
            if (!ConsumeWord("\\u") || !ReadHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                return false;
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        AppendUtf8(out, cp);
        return true;
    }

    bool ReadString(std::string& out) {
        ++pos_;  // opening quote
        while (!AtEnd()) {
            char c = text_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return false;
            if (c != '\\') {
                out += c;
                continue;
            }
            if (AtEnd()) return false;
            // Escape letter followed by the character it stands for
            static const char escapes[] = "\"\"\\\\//b\bf\fn\nr\rt\t";
            char esc = text_[pos_++];
            if (esc == 'u') {
                if (!ReadUnicodeEscape(out)) return false;
                continue;
            }
            const char* hit = nullptr;
            for (const char* e = escapes; *e; e += 2) {
                if (*e == esc) { hit = e; break; }
            }
            if (!hit) return false;
            out += hit[1];
        }
        return false;
    }

    bool ReadNumber(JSONValue& out) {
        size_t begin = pos_;
        bool integral = true;

        if (Peek() == '-') ++pos_;
        if (SkipDigits() == 0) return false;
        if (!AtEnd() && Peek() == '.') {
            ++pos_;
            integral = false;
            if (SkipDigits() == 0) return false;
        }
        if (!AtEnd() && (Peek() == 'e' || Peek() == 'E')) {
            ++pos_;
            integral = false;
            if (!AtEnd() && (Peek() == '+' || Peek() == '-')) ++pos_;
            if (SkipDigits() == 0) return false;
        }

        std::string literal = text_.substr(begin, pos_ - begin);
        if (integral) {
            errno = 0;
            long long value = std::strtoll(literal.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                out = JSONValue(static_cast<int64_t>(value));
                return true;
            }
            // Out of int64 range: keep it as a double
        }
        out = JSONValue(std::strtod(literal.c_str(), nullptr));
        return true;
    }

    bool ReadArray(JSONValue& out) {
        ++pos_;
        Array items;
        if (!Consume(']')) {
            do {
                items.emplace_back();
                if (!ReadValue(items.back())) return false;
            } while (Consume(','));
            if (!Consume(']')) return false;
        }
        out = JSONValue(std::move(items));
        return true;
    }

    bool ReadObject(JSONValue& out) {
        ++pos_;
        Object members;
        if (!Consume('}')) {
            do {
                SkipSpace();
                std::string key;
                if (AtEnd() || Peek() != '"' || !ReadString(key)) return false;
                if (!Consume(':')) return false;
                if (!ReadValue(members[key])) return false;
            } while (Consume(','));
            if (!Consume('}')) return false;
        }
        out = JSONValue(std::move(members));
        return true;
    }

    using Array = JSONValue::Array;
    using Object = JSONValue::Object;
};

} // namespace

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    JSONValue doc;
    if (!Reader(json).ReadDocument(doc)) {
        return std::nullopt;
    }
    return doc;
}

JSONValue JSONValue::Parse(const std::string& json) {
    auto doc = TryParse(json);
    if (!doc) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*doc);
}

} // namespace util
} // namespace vface
