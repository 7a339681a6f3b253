#pragma once

#include <string>
#include <utility>
#include <vector>

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };

    Type type = Type::Null;
    bool booleanValue = false;
    double numberValue = 0.0;
    std::string stringValue;
    std::vector<JsonValue> arrayValue;
    // Members keep document order.
    std::vector<std::pair<std::string, JsonValue>> objectValue;

    bool isNull() const noexcept { return type == Type::Null; }
    bool isObject() const noexcept { return type == Type::Object; }
    bool isArray() const noexcept { return type == Type::Array; }
    bool isString() const noexcept { return type == Type::String; }
    bool isNumber() const noexcept { return type == Type::Number; }
    bool isBool() const noexcept { return type == Type::Bool; }

    /**
     * @brief First member named key, or nullptr when absent or not an object.
     */
    const JsonValue* find(const std::string& key) const;

    /**
     * @brief Compact JSON text; non-finite numbers render as null.
     */
    std::string dump() const;

    static JsonValue makeString(std::string value);
    static JsonValue makeNumber(double value);
    static JsonValue makeArray();
    static JsonValue makeObject();

    void push(JsonValue value);
    void set(std::string key, JsonValue value);
};

/**
 * @brief Parses a complete JSON document.
 * @throws Nika::RequestException on malformed input or trailing content.
 */
JsonValue parseJsonText(const std::string& text);

std::string escapeJsonString(const std::string& value);
std::string formatJsonNumber(double value);
