// SPECTRE - JSON Value Implementation
// Copyright (c) 2024 SPECTRE Developers
// MIT License

#include "spectre/core/json.h"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace spectre {

// ============================================================================
// JSONValue Static Members
// ============================================================================

const JSONValue JSONValue::nullValue_;
const JSONValue::Array JSONValue::emptyArray_;
const JSONValue::Object JSONValue::emptyObject_;

namespace {

bool IsIntegerLiteral(const std::string& s) {
    size_t i = 0;
    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
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

std::optional<uint32_t> ParseHex4(const std::string& json, size_t pos) {
    if (pos + 4 > json.size()) return std::nullopt;
    uint32_t value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        char c = json[i];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<uint32_t>(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

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
                if (static_cast<unsigned char>(c) < 32) {
                    ss << "\\u" << std::hex << std::setw(4)
                       << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    ss << c;
                }
        }
    }
    ss << '"';
}

} // namespace

// ============================================================================
// JSONValue Implementation
// ============================================================================

JSONValue JSONValue::FromNumberText(const std::string& digits) {
    if (!IsIntegerLiteral(digits)) {
        throw std::invalid_argument("Not an integer literal: " + digits);
    }
    JSONValue value;
    value.type_ = Type::Int;
    value.numberText_ = digits;

    int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
    if (ec == std::errc() && ptr == digits.data() + digits.size()) {
        value.intValue_ = parsed;
    } else {
        value.intValue_ = digits[0] == '-' ? std::numeric_limits<int64_t>::min()
                                           : std::numeric_limits<int64_t>::max();
    }
    return value;
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

std::optional<std::string> JSONValue::AsScalarText() const {
    switch (type_) {
        case Type::String:
            return stringValue_;
        case Type::Int:
            if (!numberText_.empty()) return numberText_;
            return std::to_string(intValue_);
        case Type::Double:
            if (!numberText_.empty()) return numberText_;
            return ToJSON();
        default:
            return std::nullopt;
    }
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

JSONValue& JSONValue::operator[](size_t index) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    if (index >= arrayValue_.size()) {
        arrayValue_.resize(index + 1);
    }
    return arrayValue_[index];
}

void JSONValue::Push(const JSONValue& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(value);
}

void JSONValue::Push(JSONValue&& value) {
    if (type_ != Type::Array) {
        type_ = Type::Array;
        arrayValue_.clear();
    }
    arrayValue_.push_back(std::move(value));
}

std::string JSONValue::ToJSON(bool pretty, int indent) const {
    std::ostringstream ss;
    std::string indentStr(static_cast<size_t>(indent) * 2, ' ');
    std::string childIndent(static_cast<size_t>(indent + 1) * 2, ' ');

    switch (type_) {
        case Type::Null:
            ss << "null";
            break;

        case Type::Bool:
            ss << (boolValue_ ? "true" : "false");
            break;

        case Type::Int:
            if (!numberText_.empty()) {
                ss << numberText_;
            } else {
                ss << intValue_;
            }
            break;

        case Type::Double:
            if (!numberText_.empty()) {
                ss << numberText_;
            } else {
                ss << std::setprecision(15) << doubleValue_;
            }
            break;

        case Type::String:
            WriteEscaped(ss, stringValue_);
            break;

        case Type::Array: {
            if (arrayValue_.empty()) {
                ss << "[]";
            } else if (pretty) {
                ss << "[\n";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    ss << childIndent << arrayValue_[i].ToJSON(true, indent + 1);
                    if (i + 1 < arrayValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "]";
            } else {
                ss << "[";
                for (size_t i = 0; i < arrayValue_.size(); ++i) {
                    if (i > 0) ss << ",";
                    ss << arrayValue_[i].ToJSON(false, 0);
                }
                ss << "]";
            }
            break;
        }

        case Type::Object: {
            if (objectValue_.empty()) {
                ss << "{}";
            } else if (pretty) {
                ss << "{\n";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    ss << childIndent;
                    WriteEscaped(ss, key);
                    ss << ": " << value.ToJSON(true, indent + 1);
                    if (++i < objectValue_.size()) ss << ",";
                    ss << "\n";
                }
                ss << indentStr << "}";
            } else {
                ss << "{";
                size_t i = 0;
                for (const auto& [key, value] : objectValue_) {
                    if (i++ > 0) ss << ",";
                    WriteEscaped(ss, key);
                    ss << ":" << value.ToJSON(false, 0);
                }
                ss << "}";
            }
            break;
        }
    }

    return ss.str();
}

JSONValue JSONValue::Parse(const std::string& json) {
    auto result = TryParse(json);
    if (!result) {
        throw std::runtime_error("JSON parse error");
    }
    return std::move(*result);
}

std::optional<JSONValue> JSONValue::TryParse(const std::string& json) {
    size_t pos = 0;

    auto skipWhitespace = [&]() {
        while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
    };

    std::function<std::optional<JSONValue>(int)> parseValue;

    auto parseString = [&]() -> std::optional<std::string> {
        if (pos >= json.size() || json[pos] != '"') return std::nullopt;
        ++pos;

        std::string result;
        while (pos < json.size() && json[pos] != '"') {
            if (json[pos] == '\\') {
                if (++pos >= json.size()) return std::nullopt;
                switch (json[pos]) {
                    case '"': result += '"'; break;
                    case '\\': result += '\\'; break;
                    case '/': result += '/'; break;
                    case 'b': result += '\b'; break;
                    case 'f': result += '\f'; break;
                    case 'n': result += '\n'; break;
                    case 'r': result += '\r'; break;
                    case 't': result += '\t'; break;
                    case 'u': {
                        auto cp = ParseHex4(json, pos + 1);
                        if (!cp) return std::nullopt;
                        pos += 4;
                        uint32_t code = *cp;
                        // Surrogate pair
                        if (code >= 0xD800 && code <= 0xDBFF &&
                            pos + 2 < json.size() && json[pos + 1] == '\\' && json[pos + 2] == 'u') {
                            auto low = ParseHex4(json, pos + 3);
                            if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                                pos += 6;
                            }
                        }
                        AppendUtf8(result, code);
                        break;
                    }
                    default: return std::nullopt;
                }
            } else {
                result += json[pos];
            }
            ++pos;
        }
        if (pos >= json.size()) return std::nullopt;
        ++pos;  // Skip closing quote
        return result;
    };

    auto parseNumber = [&]() -> std::optional<JSONValue> {
        size_t start = pos;
        bool isFloat = false;

        if (json[pos] == '-') ++pos;

        size_t digitsStart = pos;
        while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        if (pos == digitsStart) return std::nullopt;

        if (pos < json.size() && json[pos] == '.') {
            isFloat = true;
            ++pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        }

        if (pos < json.size() && (json[pos] == 'e' || json[pos] == 'E')) {
            isFloat = true;
            ++pos;
            if (pos < json.size() && (json[pos] == '+' || json[pos] == '-')) ++pos;
            while (pos < json.size() && std::isdigit(static_cast<unsigned char>(json[pos]))) ++pos;
        }

        std::string numStr = json.substr(start, pos - start);
        if (!isFloat) {
            return FromNumberText(numStr);
        }

        errno = 0;
        char* end = nullptr;
        double d = std::strtod(numStr.c_str(), &end);
        if (end != numStr.c_str() + numStr.size() || errno == ERANGE) {
            return std::nullopt;
        }
        JSONValue value(d);
        value.numberText_ = numStr;
        return value;
    };

    // Nesting guard for untrusted request bodies
    constexpr int MAX_DEPTH = 64;

    auto parseArray = [&](int depth) -> std::optional<JSONValue> {
        if (pos >= json.size() || json[pos] != '[') return std::nullopt;
        ++pos;

        Array arr;
        skipWhitespace();

        if (pos < json.size() && json[pos] == ']') {
            ++pos;
            return JSONValue(arr);
        }

        while (true) {
            skipWhitespace();
            auto val = parseValue(depth + 1);
            if (!val) return std::nullopt;
            arr.push_back(std::move(*val));

            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;

            if (json[pos] == ']') {
                ++pos;
                return JSONValue(std::move(arr));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };

    auto parseObject = [&](int depth) -> std::optional<JSONValue> {
        if (pos >= json.size() || json[pos] != '{') return std::nullopt;
        ++pos;

        Object obj;
        skipWhitespace();

        if (pos < json.size() && json[pos] == '}') {
            ++pos;
            return JSONValue(obj);
        }

        while (true) {
            skipWhitespace();
            auto key = parseString();
            if (!key) return std::nullopt;

            skipWhitespace();
            if (pos >= json.size() || json[pos] != ':') return std::nullopt;
            ++pos;

            skipWhitespace();
            auto val = parseValue(depth + 1);
            if (!val) return std::nullopt;
            obj[*key] = std::move(*val);

            skipWhitespace();
            if (pos >= json.size()) return std::nullopt;

            if (json[pos] == '}') {
                ++pos;
                return JSONValue(std::move(obj));
            }
            if (json[pos] != ',') return std::nullopt;
            ++pos;
        }
    };

    parseValue = [&](int depth) -> std::optional<JSONValue> {
        if (depth > MAX_DEPTH) return std::nullopt;
        skipWhitespace();
        if (pos >= json.size()) return std::nullopt;

        char c = json[pos];

        if (c == 'n' && json.compare(pos, 4, "null") == 0) {
            pos += 4;
            return JSONValue();
        }
        if (c == 't' && json.compare(pos, 4, "true") == 0) {
            pos += 4;
            return JSONValue(true);
        }
        if (c == 'f' && json.compare(pos, 5, "false") == 0) {
            pos += 5;
            return JSONValue(false);
        }
        if (c == '"') {
            auto str = parseString();
            if (!str) return std::nullopt;
            return JSONValue(std::move(*str));
        }
        if (c == '[') return parseArray(depth);
        if (c == '{') return parseObject(depth);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();

        return std::nullopt;
    };

    auto result = parseValue(0);
    if (!result) return std::nullopt;

    skipWhitespace();
    if (pos != json.size()) return std::nullopt;  // Extra characters

    return result;
}

} // namespace spectre
