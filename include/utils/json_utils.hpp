#pragma once

#include <string>
#include <map>
#include <vector>

namespace fastnet {
namespace utils {

enum class JsonType {
    NULL_VALUE,
    BOOLEAN,
    NUMBER,
    STRING,
    ARRAY,
    OBJECT
};

/**
 * Minimal JSON document model used for configuration files.
 */
class JsonValue {
public:
    JsonValue() : type_(JsonType::NULL_VALUE) {}
    explicit JsonValue(bool value) : type_(JsonType::BOOLEAN), bool_value_(value) {}
    explicit JsonValue(double value) : type_(JsonType::NUMBER), number_value_(value) {}
    explicit JsonValue(const std::string& value) : type_(JsonType::STRING), string_value_(value) {}

    static JsonValue object();
    static JsonValue array();

    JsonType getType() const { return type_; }
    bool isObject() const { return type_ == JsonType::OBJECT; }

    bool asBool() const { return bool_value_; }
    double asNumber() const { return number_value_; }
    const std::string& asString() const { return string_value_; }

    // Array operations
    void addArrayElement(const JsonValue& value) { type_ = JsonType::ARRAY; array_value_.push_back(value); }
    const std::vector<JsonValue>& asArray() const { return array_value_; }

    // Object operations
    JsonValue& set(const std::string& key, const JsonValue& value);
    const std::map<std::string, JsonValue>& asObject() const { return object_value_; }
    bool hasProperty(const std::string& key) const { return object_value_.find(key) != object_value_.end(); }
    const JsonValue& getProperty(const std::string& key) const;

    /**
     * Typed lookups on an object. A missing key yields the fallback,
     * a key of the wrong type throws std::runtime_error.
     */
    double getNumber(const std::string& key, double fallback) const;
    bool getBool(const std::string& key, bool fallback) const;
    std::string getString(const std::string& key, const std::string& fallback) const;

private:
    JsonType type_;
    bool bool_value_ = false;
    double number_value_ = 0.0;
    std::string string_value_;
    std::vector<JsonValue> array_value_;
    std::map<std::string, JsonValue> object_value_;
    static const JsonValue null_value_;
};

class JsonParser {
public:
    /**
     * Parses a complete document; trailing non-whitespace is an error.
     * Throws std::runtime_error with the offending position on malformed input.
     */
    static JsonValue parse(const std::string& json);
    static std::string stringify(const JsonValue& value, bool pretty = false);

private:
    static JsonValue parseValue(const std::string& json, size_t& pos);
    static JsonValue parseObject(const std::string& json, size_t& pos);
    static JsonValue parseArray(const std::string& json, size_t& pos);
    static JsonValue parseString(const std::string& json, size_t& pos);
    static JsonValue parseNumber(const std::string& json, size_t& pos);
    static JsonValue parseLiteral(const std::string& json, size_t& pos);

    static void skipWhitespace(const std::string& json, size_t& pos);
    static void stringifyValue(const JsonValue& value, bool pretty, int depth, std::string& out);
    static std::string escapeString(const std::string& str);
};

} // namespace utils
} // namespace fastnet
