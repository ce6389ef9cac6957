#include "utils/json_utils.hpp"
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <locale>

namespace fastnet {
namespace utils {

namespace {

std::runtime_error parseError(const std::string& what, size_t pos) {
    return std::runtime_error(what + " at offset " + std::to_string(pos));
}

void appendUtf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

const JsonValue JsonValue::null_value_;

JsonValue JsonValue::object() {
    JsonValue value;
    value.type_ = JsonType::OBJECT;
    return value;
}

JsonValue JsonValue::array() {
    JsonValue value;
    value.type_ = JsonType::ARRAY;
    return value;
}

JsonValue& JsonValue::set(const std::string& key, const JsonValue& value) {
    type_ = JsonType::OBJECT;
    object_value_[key] = value;
    return *this;
}

const JsonValue& JsonValue::getProperty(const std::string& key) const {
    auto it = object_value_.find(key);
    return (it != object_value_.end()) ? it->second : null_value_;
}

double JsonValue::getNumber(const std::string& key, double fallback) const {
    auto it = object_value_.find(key);
    if (it == object_value_.end()) {
        return fallback;
    }
    if (it->second.getType() != JsonType::NUMBER) {
        throw std::runtime_error("Expected number for key '" + key + "'");
    }
    return it->second.asNumber();
}

bool JsonValue::getBool(const std::string& key, bool fallback) const {
    auto it = object_value_.find(key);
    if (it == object_value_.end()) {
        return fallback;
    }
    if (it->second.getType() != JsonType::BOOLEAN) {
        throw std::runtime_error("Expected boolean for key '" + key + "'");
    }
    return it->second.asBool();
}

std::string JsonValue::getString(const std::string& key, const std::string& fallback) const {
    auto it = object_value_.find(key);
    if (it == object_value_.end()) {
        return fallback;
    }
    if (it->second.getType() != JsonType::STRING) {
        throw std::runtime_error("Expected string for key '" + key + "'");
    }
    return it->second.asString();
}

JsonValue JsonParser::parse(const std::string& json) {
    size_t pos = 0;
    JsonValue value = parseValue(json, pos);
    skipWhitespace(json, pos);
    if (pos != json.length()) {
        throw parseError("Trailing characters after JSON document", pos);
    }
    return value;
}

std::string JsonParser::stringify(const JsonValue& value, bool pretty) {
    std::string out;
    stringifyValue(value, pretty, 0, out);
    return out;
}

JsonValue JsonParser::parseValue(const std::string& json, size_t& pos) {
    skipWhitespace(json, pos);

    if (pos >= json.length()) {
        throw parseError("Unexpected end of JSON", pos);
    }

    char c = json[pos];

    if (c == '{') {
        return parseObject(json, pos);
    } else if (c == '[') {
        return parseArray(json, pos);
    } else if (c == '"') {
        return parseString(json, pos);
    } else if (c == 't' || c == 'f' || c == 'n') {
        return parseLiteral(json, pos);
    } else if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber(json, pos);
    }
    throw parseError("Unexpected character '" + std::string(1, c) + "'", pos);
}

JsonValue JsonParser::parseObject(const std::string& json, size_t& pos) {
    JsonValue obj = JsonValue::object();

    pos++; // '{'
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == '}') {
        pos++;
        return obj;
    }

    while (pos < json.length()) {
        skipWhitespace(json, pos);

        if (pos >= json.length() || json[pos] != '"') {
            throw parseError("Expected string key in object", pos);
        }

        JsonValue key = parseString(json, pos);
        skipWhitespace(json, pos);

        if (pos >= json.length() || json[pos] != ':') {
            throw parseError("Expected ':' after object key", pos);
        }
        pos++;

        obj.set(key.asString(), parseValue(json, pos));

        skipWhitespace(json, pos);

        if (pos >= json.length()) {
            break;
        }
        if (json[pos] == '}') {
            pos++;
            return obj;
        }
        if (json[pos] != ',') {
            throw parseError("Expected ',' or '}' in object", pos);
        }
        pos++;
    }

    throw parseError("Unexpected end of JSON in object", pos);
}

JsonValue JsonParser::parseArray(const std::string& json, size_t& pos) {
    JsonValue arr = JsonValue::array();

    pos++; // '['
    skipWhitespace(json, pos);

    if (pos < json.length() && json[pos] == ']') {
        pos++;
        return arr;
    }

    while (pos < json.length()) {
        arr.addArrayElement(parseValue(json, pos));

        skipWhitespace(json, pos);

        if (pos >= json.length()) {
            break;
        }
        if (json[pos] == ']') {
            pos++;
            return arr;
        }
        if (json[pos] != ',') {
            throw parseError("Expected ',' or ']' in array", pos);
        }
        pos++;
    }

    throw parseError("Unexpected end of JSON in array", pos);
}

JsonValue JsonParser::parseString(const std::string& json, size_t& pos) {
    pos++; // opening '"'
    std::string result;

    while (pos < json.length()) {
        char c = json[pos];

        if (c == '"') {
            pos++;
            return JsonValue(result);
        }

        if (c == '\\') {
            pos++;
            if (pos >= json.length()) {
                throw parseError("Unexpected end of JSON in string escape", pos);
            }

            char escaped = json[pos];
            switch (escaped) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': {
                    if (pos + 4 >= json.length()) {
                        throw parseError("Truncated unicode escape", pos);
                    }
                    unsigned int cp = 0;
                    for (int i = 1; i <= 4; ++i) {
                        char h = json[pos + i];
                        cp <<= 4;
                        if (h >= '0' && h <= '9') cp |= static_cast<unsigned int>(h - '0');
                        else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned int>(h - 'a' + 10);
                        else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned int>(h - 'A' + 10);
                        else throw parseError("Invalid unicode escape", pos);
                    }
                    appendUtf8(result, cp);
                    pos += 4;
                    break;
                }
                default:
                    throw parseError("Invalid escape sequence \\" + std::string(1, escaped), pos);
            }
        } else {
            result += c;
        }

        pos++;
    }

    throw parseError("Unterminated string", pos);
}

JsonValue JsonParser::parseNumber(const std::string& json, size_t& pos) {
    size_t start = pos;

    if (json[pos] == '-') {
        pos++;
    }

    auto isDigitAt = [&json](size_t p) {
        return p < json.length() && std::isdigit(static_cast<unsigned char>(json[p]));
    };

    if (!isDigitAt(pos)) {
        throw parseError("Invalid number format", pos);
    }

    if (json[pos] == '0') {
        pos++;
    } else {
        while (isDigitAt(pos)) pos++;
    }

    if (pos < json.length() && json[pos] == '.') {
        pos++;
        if (!isDigitAt(pos)) {
            throw parseError("Invalid number format", pos);
        }
        while (isDigitAt(pos)) pos++;
    }

    if (pos < json.length() && (json[pos] == 'e' || json[pos] == 'E')) {
        pos++;
        if (pos < json.length() && (json[pos] == '+' || json[pos] == '-')) {
            pos++;
        }
        if (!isDigitAt(pos)) {
            throw parseError("Invalid number format", pos);
        }
        while (isDigitAt(pos)) pos++;
    }

    std::istringstream iss(json.substr(start, pos - start));
    iss.imbue(std::locale::classic());
    double value = 0.0;
    iss >> value;
    return JsonValue(value);
}

JsonValue JsonParser::parseLiteral(const std::string& json, size_t& pos) {
    if (json.compare(pos, 4, "true") == 0) {
        pos += 4;
        return JsonValue(true);
    } else if (json.compare(pos, 5, "false") == 0) {
        pos += 5;
        return JsonValue(false);
    } else if (json.compare(pos, 4, "null") == 0) {
        pos += 4;
        return JsonValue();
    }
    throw parseError("Invalid literal", pos);
}

void JsonParser::skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) {
        pos++;
    }
}

void JsonParser::stringifyValue(const JsonValue& value, bool pretty, int depth, std::string& out) {
    const std::string indent = pretty ? std::string(static_cast<size_t>(depth + 1) * 2, ' ') : "";
    const std::string closing = pretty ? std::string(static_cast<size_t>(depth) * 2, ' ') : "";
    const char* newline = pretty ? "\n" : "";

    switch (value.getType()) {
        case JsonType::NULL_VALUE:
            out += "null";
            return;
        case JsonType::BOOLEAN:
            out += value.asBool() ? "true" : "false";
            return;
        case JsonType::NUMBER: {
            std::ostringstream oss;
            oss.imbue(std::locale::classic());
            oss.precision(15);
            oss << value.asNumber();
            out += oss.str();
            return;
        }
        case JsonType::STRING:
            out += "\"" + escapeString(value.asString()) + "\"";
            return;
        case JsonType::ARRAY: {
            const auto& arr = value.asArray();
            out += "[";
            for (size_t i = 0; i < arr.size(); ++i) {
                out += i > 0 ? "," : "";
                out += newline + indent;
                stringifyValue(arr[i], pretty, depth + 1, out);
            }
            if (!arr.empty()) out += newline + closing;
            out += "]";
            return;
        }
        case JsonType::OBJECT: {
            const auto& obj = value.asObject();
            out += "{";
            bool first = true;
            for (const auto& pair : obj) {
                out += first ? "" : ",";
                out += newline + indent;
                out += "\"" + escapeString(pair.first) + "\":" + (pretty ? " " : "");
                stringifyValue(pair.second, pretty, depth + 1, out);
                first = false;
            }
            if (!obj.empty()) out += newline + closing;
            out += "}";
            return;
        }
    }
    out += "null";
}

std::string JsonParser::escapeString(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }
    return result;
}

} // namespace utils
} // namespace fastnet
