#include "JsonValue.h"

#include "NikaExceptions.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace {
class JsonParser {
public:
    explicit JsonParser(const std::string& source) : text(source) {}

    JsonValue parse() {
        skipWhitespace();
        JsonValue value = parseValue();
        skipWhitespace();
        if (position != text.size()) {
            throw Nika::RequestException("Unexpected trailing JSON content");
        }
        return value;
    }

private:
    static constexpr size_t kMaxNestingDepth = 256;

    const std::string& text;
    size_t position = 0;
    size_t depth = 0;

    void skipWhitespace() {
        while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
            ++position;
        }
    }

    char peek() const {
        if (position >= text.size()) {
            throw Nika::RequestException("Unexpected end of JSON input");
        }
        return text[position];
    }

    char take() {
        if (position >= text.size()) {
            throw Nika::RequestException("Unexpected end of JSON input");
        }
        return text[position++];
    }

    void expect(char expected) {
        const char value = take();
        if (value != expected) {
            throw Nika::RequestException(std::string("Expected JSON character '") + expected + "'");
        }
    }

    JsonValue parseValue() {
        skipWhitespace();
        const char c = peek();
        if (c == '{' || c == '[') {
            if (++depth > kMaxNestingDepth) {
                throw Nika::RequestException("JSON nesting too deep");
            }
            JsonValue nested = (c == '{') ? parseObject() : parseArray();
            --depth;
            return nested;
        }
        if (c == '"') return parseString();
        if (c == 't' || c == 'f') return parseBoolean();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber();
        throw Nika::RequestException("Invalid JSON token");
    }

    JsonValue parseObject() {
        JsonValue object = JsonValue::makeObject();

        expect('{');
        skipWhitespace();
        if (peek() == '}') {
            take();
            return object;
        }

        while (true) {
            skipWhitespace();
            if (peek() != '"') {
                throw Nika::RequestException("Expected string key in JSON object");
            }
            JsonValue key = parseString();
            skipWhitespace();
            expect(':');
            skipWhitespace();
            // Repeated keys keep the first position and the last value.
            object.set(std::move(key.stringValue), parseValue());

            skipWhitespace();
            const char next = take();
            if (next == '}') {
                break;
            }
            if (next != ',') {
                throw Nika::RequestException("Expected ',' or '}' in JSON object");
            }
        }

        return object;
    }

    JsonValue parseArray() {
        JsonValue array = JsonValue::makeArray();

        expect('[');
        skipWhitespace();
        if (peek() == ']') {
            take();
            return array;
        }

        while (true) {
            array.arrayValue.push_back(parseValue());
            skipWhitespace();
            const char next = take();
            if (next == ']') {
                break;
            }
            if (next != ',') {
                throw Nika::RequestException("Expected ',' or ']' in JSON array");
            }
        }

        return array;
    }

    unsigned parseHex4() {
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = take();
            code <<= 4;
            if (c >= '0' && c <= '9') code |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') code |= static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') code |= static_cast<unsigned>(c - 'A' + 10);
            else throw Nika::RequestException("Invalid \\u escape in JSON string");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned code) {
        if (code < 0x80) {
            out.push_back(static_cast<char>(code));
        } else if (code < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (code >> 6)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (code >> 12)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (code >> 18)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    JsonValue parseString() {
        JsonValue str = JsonValue::makeString("");

        expect('"');
        while (true) {
            const char c = take();
            if (c == '"') break;
            if (c == '\\') {
                const char escaped = take();
                switch (escaped) {
                    case '"': str.stringValue.push_back('"'); break;
                    case '\\': str.stringValue.push_back('\\'); break;
                    case '/': str.stringValue.push_back('/'); break;
                    case 'b': str.stringValue.push_back('\b'); break;
                    case 'f': str.stringValue.push_back('\f'); break;
                    case 'n': str.stringValue.push_back('\n'); break;
                    case 'r': str.stringValue.push_back('\r'); break;
                    case 't': str.stringValue.push_back('\t'); break;
                    case 'u': {
                        unsigned code = parseHex4();
                        // Surrogate pair
                        if (code >= 0xD800 && code <= 0xDBFF) {
                            if (take() != '\\' || take() != 'u') {
                                throw Nika::RequestException("Unpaired surrogate in JSON string");
                            }
                            const unsigned low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) {
                                throw Nika::RequestException("Invalid low surrogate in JSON string");
                            }
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        }
                        appendUtf8(str.stringValue, code);
                        break;
                    }
                    default:
                        throw Nika::RequestException("Unsupported escaped character in JSON string");
                }
                continue;
            }
            str.stringValue.push_back(c);
        }

        return str;
    }

    JsonValue parseBoolean() {
        JsonValue value;
        value.type = JsonValue::Type::Bool;
        if (text.compare(position, 4, "true") == 0) {
            value.booleanValue = true;
            position += 4;
            return value;
        }
        if (text.compare(position, 5, "false") == 0) {
            value.booleanValue = false;
            position += 5;
            return value;
        }
        throw Nika::RequestException("Invalid JSON boolean value");
    }

    JsonValue parseNull() {
        if (text.compare(position, 4, "null") != 0) {
            throw Nika::RequestException("Invalid JSON null value");
        }
        position += 4;
        return JsonValue{};
    }

    JsonValue parseNumber() {
        const size_t start = position;
        if (peek() == '-') take();

        if (position < text.size() && text[position] == '0') {
            ++position;
        } else {
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        if (position < text.size() && text[position] == '.') {
            ++position;
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        if (position < text.size() && (text[position] == 'e' || text[position] == 'E')) {
            ++position;
            if (position < text.size() && (text[position] == '+' || text[position] == '-')) {
                ++position;
            }
            while (position < text.size() && std::isdigit(static_cast<unsigned char>(text[position])) != 0) {
                ++position;
            }
        }

        const std::string token = text.substr(start, position - start);
        if (token.empty() || token == "-") {
            throw Nika::RequestException("Invalid JSON number");
        }

        JsonValue number;
        number.type = JsonValue::Type::Number;
        try {
            number.numberValue = std::stod(token);
        } catch (const std::exception&) {
            throw Nika::RequestException("Failed to parse JSON number: " + token);
        }
        return number;
    }
};
} // namespace

const JsonValue* JsonValue::find(const std::string& key) const {
    if (!isObject()) return nullptr;
    for (const auto& kv : objectValue) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

std::string JsonValue::dump() const {
    switch (type) {
        case Type::Null:
            return "null";
        case Type::Bool:
            return booleanValue ? "true" : "false";
        case Type::Number:
            return formatJsonNumber(numberValue);
        case Type::String:
            return "\"" + escapeJsonString(stringValue) + "\"";
        case Type::Array: {
            std::ostringstream out;
            out << '[';
            for (size_t i = 0; i < arrayValue.size(); ++i) {
                if (i > 0) out << ',';
                out << arrayValue[i].dump();
            }
            out << ']';
            return out.str();
        }
        case Type::Object: {
            std::ostringstream out;
            out << '{';
            bool first = true;
            for (const auto& kv : objectValue) {
                if (!first) out << ',';
                first = false;
                out << '"' << escapeJsonString(kv.first) << "\":" << kv.second.dump();
            }
            out << '}';
            return out.str();
        }
    }
    return "null";
}

JsonValue JsonValue::makeString(std::string value) {
    JsonValue out;
    out.type = Type::String;
    out.stringValue = std::move(value);
    return out;
}

JsonValue JsonValue::makeNumber(double value) {
    JsonValue out;
    out.type = Type::Number;
    out.numberValue = value;
    return out;
}

JsonValue JsonValue::makeArray() {
    JsonValue out;
    out.type = Type::Array;
    return out;
}

JsonValue JsonValue::makeObject() {
    JsonValue out;
    out.type = Type::Object;
    return out;
}

void JsonValue::push(JsonValue value) {
    arrayValue.push_back(std::move(value));
}

void JsonValue::set(std::string key, JsonValue value) {
    for (auto& kv : objectValue) {
        if (kv.first == key) {
            kv.second = std::move(value);
            return;
        }
    }
    objectValue.emplace_back(std::move(key), std::move(value));
}

JsonValue parseJsonText(const std::string& text) {
    JsonParser parser(text);
    return parser.parse();
}

std::string escapeJsonString(const std::string& value) {
    std::ostringstream out;
    for (char c : value) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out << buffer;
                } else {
                    out << c;
                }
                break;
        }
    }
    return out.str();
}

std::string formatJsonNumber(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return out.str();
}
