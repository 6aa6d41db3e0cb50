// LIQUIDSTAKE - JSON Values Implementation
// Copyright (c) 2024 LIQUIDSTAKE Developers
// MIT License

#include "liquidstake/rpc/json.h"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace liquidstake {
namespace rpc {

namespace {

const JSONValue NULL_VALUE;
const std::string EMPTY_TEXT;
const JSONValue::Array EMPTY_ITEMS;
const JSONValue::Object EMPTY_FIELDS;

constexpr int MAX_NESTING = 64;

// ============================================================================
// Writer
// ============================================================================

void WriteString(const std::string& text, std::string& out) {
    static const char HEX[] = "0123456789abcdef";
    out += '"';
    for (unsigned char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (c < 0x20) {
                    out += "\\u00";
                    out += HEX[c >> 4];
                    out += HEX[c & 0x0f];
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
}

void WriteReal(double number, std::string& out) {
    if (!std::isfinite(number)) {
        out += "null";
        return;
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", number);
    out += buffer;
}

void Write(const JSONValue& value, std::string& out) {
    switch (value.GetType()) {
        case JSONType::Null:
            out += "null";
            return;
        case JSONType::Bool:
            out += value.GetBool() ? "true" : "false";
            return;
        case JSONType::Int:
            out += std::to_string(value.GetInt());
            return;
        case JSONType::Real:
            WriteReal(value.GetReal(), out);
            return;
        case JSONType::String:
            WriteString(value.GetString(), out);
            return;
        case JSONType::Array: {
            out += '[';
            bool first = true;
            for (const JSONValue& item : value.Items()) {
                if (!first) out += ',';
                first = false;
                Write(item, out);
            }
            out += ']';
            return;
        }
        case JSONType::Object: {
            out += '{';
            bool first = true;
            for (const auto& field : value.Fields()) {
                if (!first) out += ',';
                first = false;
                WriteString(field.first, out);
                out += ':';
                Write(field.second, out);
            }
            out += '}';
            return;
        }
    }
}

// ============================================================================
// Reader
// ============================================================================

/// Recursive-descent reader over one document
class JSONReader {
public:
    explicit JSONReader(const std::string& text) : text_(text) {}

    bool ReadDocument(JSONValue& out) {
        if (!ReadValue(out, 0)) {
            return false;
        }
        SkipSpace();
        if (pos_ != text_.size()) {
            return Fail("trailing characters");
        }
        return true;
    }

    const std::string& Error() const { return error_; }
    size_t Offset() const { return pos_; }

private:
    bool Fail(const char* what) {
        if (error_.empty()) {
            error_ = what;
        }
        return false;
    }

    bool AtEnd() const { return pos_ >= text_.size(); }
    char Peek() const { return text_[pos_]; }

    void SkipSpace() {
        while (!AtEnd()) {
            char c = Peek();
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    bool Consume(char expected) {
        SkipSpace();
        if (AtEnd() || Peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    bool Keyword(const char* word, JSONValue value, JSONValue& out) {
        std::string expected(word);
        if (text_.compare(pos_, expected.size(), expected) != 0) {
            return Fail("unknown literal");
        }
        pos_ += expected.size();
        out = std::move(value);
        return true;
    }

    bool ReadValue(JSONValue& out, int depth) {
        SkipSpace();
        if (AtEnd()) {
            return Fail("unexpected end of input");
        }
        switch (Peek()) {
            case 'n': return Keyword("null", JSONValue(), out);
            case 't': return Keyword("true", JSONValue(true), out);
            case 'f': return Keyword("false", JSONValue(false), out);
            case '"': {
                std::string text;
                if (!ReadString(text)) return false;
                out = JSONValue(std::move(text));
                return true;
            }
            case '[': return ReadArray(out, depth + 1);
            case '{': return ReadObject(out, depth + 1);
            default:  return ReadNumber(out);
        }
    }

    bool ReadHex4(uint32_t& unit) {
        if (text_.size() - pos_ < 4) {
            return Fail("truncated \\u escape");
        }
        unit = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            unit <<= 4;
            if (c >= '0' && c <= '9') unit |= static_cast<uint32_t>(c - '0');
            else if (c >= 'a' && c <= 'f') unit |= static_cast<uint32_t>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') unit |= static_cast<uint32_t>(c - 'A' + 10);
            else return Fail("bad hex digit in \\u escape");
        }
        return true;
    }

    static void AppendCodePoint(uint32_t cp, std::string& out) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
            return;
        }
        if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        }
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }

    bool ReadEscape(std::string& out) {
        if (AtEnd()) {
            return Fail("unterminated escape");
        }
        char c = text_[pos_++];
        switch (c) {
            case '"':  out += '"'; return true;
            case '\\': out += '\\'; return true;
            case '/':  out += '/'; return true;
            case 'n':  out += '\n'; return true;
            case 'r':  out += '\r'; return true;
            case 't':  out += '\t'; return true;
            case 'b':  out += '\b'; return true;
            case 'f':  out += '\f'; return true;
            case 'u':  break;
            default:   return Fail("unknown escape");
        }

        uint32_t cp = 0;
        if (!ReadHex4(cp)) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            // High surrogate must be followed by an escaped low surrogate
            if (text_.compare(pos_, 2, "\\u") != 0) {
                return Fail("lone high surrogate");
            }
            pos_ += 2;
            uint32_t low = 0;
            if (!ReadHex4(low)) return false;
            if (low < 0xDC00 || low > 0xDFFF) {
                return Fail("bad low surrogate");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        AppendCodePoint(cp, out);
        return true;
    }

    bool ReadString(std::string& out) {
        ++pos_;  // opening quote
        while (!AtEnd()) {
            char c = text_[pos_++];
            if (c == '"') {
                return true;
            }
            if (c == '\\') {
                if (!ReadEscape(out)) return false;
            } else if (static_cast<unsigned char>(c) < 0x20) {
                return Fail("control character in string");
            } else {
                out += c;
            }
        }
        return Fail("unterminated string");
    }

    bool ReadNumber(JSONValue& out) {
        size_t start = pos_;
        bool integral = true;
        auto digits = [this]() {
            size_t from = pos_;
            while (!AtEnd() && Peek() >= '0' && Peek() <= '9') ++pos_;
            return pos_ > from;
        };

        if (!AtEnd() && Peek() == '-') ++pos_;
        if (!digits()) {
            return Fail("unexpected character");
        }
        if (!AtEnd() && Peek() == '.') {
            integral = false;
            ++pos_;
            if (!digits()) return Fail("missing fraction digits");
        }
        if (!AtEnd() && (Peek() == 'e' || Peek() == 'E')) {
            integral = false;
            ++pos_;
            if (!AtEnd() && (Peek() == '+' || Peek() == '-')) ++pos_;
            if (!digits()) return Fail("missing exponent digits");
        }

        std::string token = text_.substr(start, pos_ - start);
        errno = 0;
        if (integral) {
            long long number = std::strtoll(token.c_str(), nullptr, 10);
            if (errno == ERANGE) {
                return Fail("integer out of range");
            }
            out = JSONValue(static_cast<int64_t>(number));
        } else {
            double number = std::strtod(token.c_str(), nullptr);
            if (errno == ERANGE && std::isinf(number)) {
                return Fail("number out of range");
            }
            out = JSONValue(number);
        }
        return true;
    }

    bool ReadArray(JSONValue& out, int depth) {
        if (depth > MAX_NESTING) {
            return Fail("nesting too deep");
        }
        ++pos_;  // [
        JSONValue::Array items;
        if (Consume(']')) {
            out = JSONValue(std::move(items));
            return true;
        }
        do {
            JSONValue item;
            if (!ReadValue(item, depth)) return false;
            items.push_back(std::move(item));
        } while (Consume(','));

        if (!Consume(']')) {
            return Fail("expected ',' or ']'");
        }
        out = JSONValue(std::move(items));
        return true;
    }

    bool ReadObject(JSONValue& out, int depth) {
        if (depth > MAX_NESTING) {
            return Fail("nesting too deep");
        }
        ++pos_;  // {
        JSONValue::Object fields;
        if (Consume('}')) {
            out = JSONValue(std::move(fields));
            return true;
        }
        do {
            SkipSpace();
            if (AtEnd() || Peek() != '"') {
                return Fail("expected member name");
            }
            std::string key;
            if (!ReadString(key)) return false;
            if (!Consume(':')) {
                return Fail("expected ':'");
            }
            JSONValue value;
            if (!ReadValue(value, depth)) return false;
            fields[key] = std::move(value);
        } while (Consume(','));

        if (!Consume('}')) {
            return Fail("expected ',' or '}'");
        }
        out = JSONValue(std::move(fields));
        return true;
    }

    const std::string& text_;
    size_t pos_{0};
    std::string error_;
};

} // namespace

const char* JSONTypeName(JSONType type) {
    switch (type) {
        case JSONType::Null:   return "null";
        case JSONType::Bool:   return "bool";
        case JSONType::Int:    return "int";
        case JSONType::Real:   return "real";
        case JSONType::String: return "string";
        case JSONType::Array:  return "array";
        case JSONType::Object: return "object";
    }
    return "unknown";
}

// ============================================================================
// JSONValue
// ============================================================================

JSONValue::JSONValue(bool flag) : kind_(JSONType::Bool), flag_(flag) {}

JSONValue::JSONValue(int number) : kind_(JSONType::Int), integer_(number) {}

JSONValue::JSONValue(int64_t number) : kind_(JSONType::Int), integer_(number) {}

JSONValue::JSONValue(uint64_t number) : kind_(JSONType::Int) {
    constexpr uint64_t limit = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    integer_ = static_cast<int64_t>(number > limit ? limit : number);
}

JSONValue::JSONValue(double number) : kind_(JSONType::Real), real_(number) {}

JSONValue::JSONValue(const char* text) : kind_(JSONType::String), text_(text ? text : "") {}

JSONValue::JSONValue(std::string text) : kind_(JSONType::String), text_(std::move(text)) {}

JSONValue::JSONValue(Array items) : kind_(JSONType::Array), items_(std::move(items)) {}

JSONValue::JSONValue(Object fields) : kind_(JSONType::Object), fields_(std::move(fields)) {}

bool JSONValue::GetBool(bool fallback) const {
    return IsBool() ? flag_ : fallback;
}

int64_t JSONValue::GetInt(int64_t fallback) const {
    return IsInt() ? integer_ : fallback;
}

double JSONValue::GetReal(double fallback) const {
    if (IsReal()) return real_;
    if (IsInt()) return static_cast<double>(integer_);
    return fallback;
}

const std::string& JSONValue::GetString() const {
    return IsString() ? text_ : EMPTY_TEXT;
}

std::string JSONValue::GetString(const std::string& fallback) const {
    return IsString() ? text_ : fallback;
}

const JSONValue::Array& JSONValue::Items() const {
    return IsArray() ? items_ : EMPTY_ITEMS;
}

const JSONValue::Object& JSONValue::Fields() const {
    return IsObject() ? fields_ : EMPTY_FIELDS;
}

const JSONValue& JSONValue::operator[](const std::string& key) const {
    if (!IsObject()) return NULL_VALUE;
    auto it = fields_.find(key);
    return it == fields_.end() ? NULL_VALUE : it->second;
}

JSONValue& JSONValue::operator[](const std::string& key) {
    if (!IsObject()) {
        *this = JSONValue(Object());
    }
    return fields_[key];
}

bool JSONValue::HasKey(const std::string& key) const {
    return IsObject() && fields_.find(key) != fields_.end();
}

const JSONValue& JSONValue::operator[](size_t index) const {
    return IsArray() && index < items_.size() ? items_[index] : NULL_VALUE;
}

void JSONValue::Push(JSONValue value) {
    if (!IsArray()) {
        *this = JSONValue(Array());
    }
    items_.push_back(std::move(value));
}

size_t JSONValue::Size() const {
    if (IsArray()) return items_.size();
    if (IsObject()) return fields_.size();
    return 0;
}

std::string JSONValue::ToJSON() const {
    std::string out;
    Write(*this, out);
    return out;
}

JSONValue JSONValue::Parse(const std::string& text) {
    JSONReader reader(text);
    JSONValue value;
    if (!reader.ReadDocument(value)) {
        throw std::runtime_error("JSON parse error at offset " +
                                 std::to_string(reader.Offset()) + ": " + reader.Error());
    }
    return value;
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& text) {
    JSONReader reader(text);
    JSONValue value;
    if (!reader.ReadDocument(value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace rpc
} // namespace liquidstake
