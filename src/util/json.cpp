// KEYSEAL - JSON Value Implementation
// Copyright (c) 2024 KEYSEAL Developers
// MIT License

#include "keyseal/util/json.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace keyseal {
namespace util {

namespace {

const JSONValue NULL_VALUE;
const JSONValue::Array EMPTY_ARRAY;
const JSONValue::Object EMPTY_OBJECT;
const std::string EMPTY_STRING;

/// Nesting limit for Parse
constexpr int MAX_DEPTH = 64;

void WriteEscaped(std::ostringstream& ss, const std::string& str) {
    ss << '"';
    for (char c : str) {
        switch (c) {
            case '"': ss << "\\\""; break;
            case '\\': ss << "\\\\"; break;
            case '\b': ss << "\\b"; break;
            case '\f': ss << "\\f"; break;
            case '\n': ss << "\\n"; break;
            case '\r': ss << "\\r"; break;
            case '\t': ss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    ss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec << std::setfill(' ');
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

void AppendUTF8(std::string& out, uint32_t cp) {
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

// ============================================================================
// Parser
// ============================================================================

/// Recursive-descent parser over a complete document
class JSONParser {
public:
    explicit JSONParser(const std::string& text) : text_(text) {}

    JSONValue ParseDocument() {
        JSONValue value = ParseValue(0);
        SkipWhitespace();
        if (pos_ != text_.size()) {
            Fail("unexpected trailing characters");
        }
        return value;
    }

private:
    const std::string& text_;
    size_t pos_{0};

    [[noreturn]] void Fail(const std::string& what) const {
        throw JSONError(what, pos_);
    }

    bool AtEnd() const { return pos_ >= text_.size(); }

    char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

    void SkipWhitespace() {
        while (!AtEnd()) {
            char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    void Expect(char c) {
        if (Peek() != c) {
            Fail(std::string("expected '") + c + "'");
        }
        ++pos_;
    }

    void ExpectLiteral(const char* literal) {
        for (const char* p = literal; *p; ++p) {
            if (Peek() != *p) {
                Fail(std::string("invalid literal, expected ") + literal);
            }
            ++pos_;
        }
    }

    JSONValue ParseValue(int depth) {
        if (depth > MAX_DEPTH) {
            Fail("nesting too deep");
        }

        SkipWhitespace();
        switch (Peek()) {
            case 'n': ExpectLiteral("null"); return JSONValue();
            case 't': ExpectLiteral("true"); return JSONValue(true);
            case 'f': ExpectLiteral("false"); return JSONValue(false);
            case '"': return JSONValue(ParseString());
            case '[': return ParseArray(depth);
            case '{': return ParseObject(depth);
            default:
                if (Peek() == '-' || (Peek() >= '0' && Peek() <= '9')) {
                    return ParseNumber();
                }
                Fail(AtEnd() ? "unexpected end of input" : "unexpected character");
        }
    }

    uint32_t ParseHex4() {
        if (pos_ + 4 > text_.size()) {
            Fail("truncated \\u escape");
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
            else Fail("invalid \\u escape");
        }
        return value;
    }

    std::string ParseString() {
        Expect('"');

        std::string result;
        while (true) {
            if (AtEnd()) {
                Fail("unterminated string");
            }
            char c = text_[pos_++];
            if (c == '"') {
                return result;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                Fail("control character in string");
            }
            if (c != '\\') {
                result += c;
                continue;
            }

            if (AtEnd()) {
                Fail("unterminated escape");
            }
            switch (text_[pos_++]) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    uint32_t cp = ParseHex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // Surrogate pair
                        if (text_.compare(pos_, 2, "\\u") != 0) {
                            Fail("unpaired surrogate");
                        }
                        pos_ += 2;
                        uint32_t low = ParseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            Fail("invalid low surrogate");
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        Fail("unpaired surrogate");
                    }
                    AppendUTF8(result, cp);
                    break;
                }
                default:
                    Fail("invalid escape");
            }
        }
    }

    JSONValue ParseNumber() {
        const size_t start = pos_;
        bool isFloat = false;

        if (Peek() == '-') ++pos_;

        if (Peek() == '0') {
            ++pos_;
        } else if (Peek() >= '1' && Peek() <= '9') {
            while (Peek() >= '0' && Peek() <= '9') ++pos_;
        } else {
            Fail("invalid number");
        }

        if (Peek() == '.') {
            isFloat = true;
            ++pos_;
            if (!(Peek() >= '0' && Peek() <= '9')) Fail("invalid fraction");
            while (Peek() >= '0' && Peek() <= '9') ++pos_;
        }

        if (Peek() == 'e' || Peek() == 'E') {
            isFloat = true;
            ++pos_;
            if (Peek() == '+' || Peek() == '-') ++pos_;
            if (!(Peek() >= '0' && Peek() <= '9')) Fail("invalid exponent");
            while (Peek() >= '0' && Peek() <= '9') ++pos_;
        }

        const std::string numStr = text_.substr(start, pos_ - start);
        errno = 0;
        if (!isFloat) {
            long long value = std::strtoll(numStr.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                return JSONValue(static_cast<int64_t>(value));
            }
            // Out of int64 range: keep it as a double
            errno = 0;
        }
        double value = std::strtod(numStr.c_str(), nullptr);
        if (errno == ERANGE && std::isinf(value)) {
            Fail("number out of range");
        }
        return JSONValue(value);
    }

    JSONValue ParseArray(int depth) {
        Expect('[');
        JSONValue::Array arr;

        SkipWhitespace();
        if (Peek() == ']') {
            ++pos_;
            return JSONValue(std::move(arr));
        }

        while (true) {
            arr.push_back(ParseValue(depth + 1));
            SkipWhitespace();
            if (Peek() == ']') {
                ++pos_;
                return JSONValue(std::move(arr));
            }
            Expect(',');
        }
    }

    JSONValue ParseObject(int depth) {
        Expect('{');
        JSONValue::Object obj;

        SkipWhitespace();
        if (Peek() == '}') {
            ++pos_;
            return JSONValue(std::move(obj));
        }

        while (true) {
            SkipWhitespace();
            const size_t keyPos = pos_;
            std::string key = ParseString();
            if (obj.count(key) > 0) {
                throw JSONError("duplicate key \"" + key + "\"", keyPos);
            }

            SkipWhitespace();
            Expect(':');
            obj.emplace(std::move(key), ParseValue(depth + 1));

            SkipWhitespace();
            if (Peek() == '}') {
                ++pos_;
                return JSONValue(std::move(obj));
            }
            Expect(',');
        }
    }
};

} // anonymous namespace

// ============================================================================
// JSONValue Implementation
// ============================================================================

const JSONValue& JSONValue::Null() {
    return NULL_VALUE;
}

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

const std::string& JSONValue::GetString() const {
    if (type_ == Type::String) return stringValue_;
    return EMPTY_STRING;
}

const JSONValue::Array& JSONValue::GetArray() const {
    if (type_ == Type::Array) return arrayValue_;
    return EMPTY_ARRAY;
}

const JSONValue::Object& JSONValue::GetObject() const {
    if (type_ == Type::Object) return objectValue_;
    return EMPTY_OBJECT;
}

bool JSONValue::HasKey(const std::string& key) const {
    if (type_ != Type::Object) return false;
    return objectValue_.count(key) > 0;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (type_ != Type::Object) return NULL_VALUE;
    auto it = objectValue_.find(key);
    if (it == objectValue_.end()) return NULL_VALUE;
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
    if (type_ != Type::Array || index >= arrayValue_.size()) return NULL_VALUE;
    return arrayValue_[index];
}

void JSONValue::Push(JSONValue value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

bool JSONValue::operator==(const JSONValue& other) const {
    if (type_ != other.type_) return false;
    switch (type_) {
        case Type::Null: return true;
        case Type::Bool: return boolValue_ == other.boolValue_;
        case Type::Int: return intValue_ == other.intValue_;
        case Type::Double: return doubleValue_ == other.doubleValue_;
        case Type::String: return stringValue_ == other.stringValue_;
        case Type::Array: return arrayValue_ == other.arrayValue_;
        case Type::Object: return objectValue_ == other.objectValue_;
    }
    return false;
}

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(indent * 2, ' ');
    std::string childIndent((indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            ss << intValue_;
            break;

        case Type::Double:
            if (!std::isfinite(doubleValue_)) {
                ss << "null";  // JSON has no NaN or Infinity
            } else {
                ss << std::setprecision(17) << doubleValue_;
            }
            break;

        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
                break;
            }
            ss << (pretty ? "[\n" : "[");
            for (size_t i = 0; i < arrayValue_.size(); ++i) {
                if (pretty) ss << childIndent;
                ss << arrayValue_[i].ToJSON(pretty, indent + 1);
                if (i + 1 < arrayValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "]";
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
                break;
            }
            ss << (pretty ? "{\n" : "{");
            size_t i = 0;
            for (const auto& [key, value] : objectValue_) {
                if (pretty) ss << childIndent;
                WriteEscaped(ss, key);
                ss << (pretty ? ": " : ":") << value.ToJSON(pretty, indent + 1);
                if (++i < objectValue_.size()) ss << ",";
                if (pretty) ss << "\n";
            }
            if (pretty) ss << indentStr;
            ss << "}";
            break;
        }
    }

    return ss.str();
}

JSONValue JSONValue::Parse(const std::string& json) {
    return JSONParser(json).ParseDocument();
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    try {
        return JSONParser(json).ParseDocument();
    } catch (const JSONError&) {
        return std::nullopt;
    }
}

const char* JSONTypeName(JSONValue::Type type) {
    switch (type) {
        case JSONValue::Type::Null: return "null";
        case JSONValue::Type::Bool: return "bool";
        case JSONValue::Type::Int: return "integer";
        case JSONValue::Type::Double: return "number";
        case JSONValue::Type::String: return "string";
        case JSONValue::Type::Array: return "array";
        case JSONValue::Type::Object: return "object";
    }
    return "unknown";
}

} // namespace util
} // namespace keyseal
