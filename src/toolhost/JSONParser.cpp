//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Minimalistic JSON parser/serializer and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <cctype>
#include <cmath>
#include <format>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include "toolhost/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace toolhost {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

const JSONValue* JSONValue::find(const std::string& key) const {
    if (!isObject()) {
        return nullptr;
    }
    const auto& obj = std::get<Object>(value);
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

// -------------------------------
// Minimal recursive JSON parser
// -------------------------------
namespace {
constexpr unsigned int MaxNestingDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    unsigned int depth{0};

    explicit JsonParser(const std::string& str, std::size_t start = 0) : s(str), i(start) {}

    [[noreturn]] void fail(const char* what) const {
        throw std::runtime_error(std::format("{} at offset {}", what, i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Control character in string");
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (i >= s.size()) fail("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    // Combine UTF-16 surrogate pairs; a lone surrogate becomes U+FFFD
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low >= 0xDC00 && low <= 0xDFFF) {
                                code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                            } else {
                                appendUtf8(out, 0xFFFD);
                                code = low;
                            }
                        } else {
                            code = 0xFFFD;
                        }
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        code = 0xFFFD;
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: fail("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == intStart) fail("Invalid number");
        if (s[intStart] == '0' && i - intStart > 1) fail("Leading zero in number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == fracStart) fail("Invalid number fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
            if (i == expStart) fail("Invalid number exponent");
        }
        std::string num = s.substr(start, i - start);
        if (!isFloat) {
            try {
                return JSONValue(static_cast<int64_t>(std::stoll(num)));
            } catch (const std::out_of_range&) {
                // Integers beyond int64 degrade to double precision
            }
        }
        try {
            return JSONValue(std::stod(num));
        } catch (const std::exception&) {
            fail("Number out of range");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{' || c == '[') {
            if (++depth > MaxNestingDepth) fail("Nesting too deep");
            JSONValue v = (c == '{') ? parseObject() : parseArray();
            --depth;
            return v;
        }
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        return parseNumber();
    }
};

void appendEscaped(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void serializeInto(std::ostringstream& oss, const JSONValue& value) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (std::isfinite(v)) {
                oss << std::format("{}", v);
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            bool first = true;
            for (const auto& item : v) {
                if (!first) oss << ',';
                first = false;
                if (item) { serializeInto(oss, *item); } else { oss << "null"; }
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                appendEscaped(oss, key);
                oss << ':';
                if (val) { serializeInto(oss, *val); } else { oss << "null"; }
            }
            oss << '}';
        }
    }, value.get());
}

void serializeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

// Reads a top-level id member; absent ids leave the target untouched.
bool readId(const JSONValue& root, JSONRPCId& out) {
    const JSONValue* idVal = root.find("id");
    if (!idVal) {
        return false;
    }
    if (std::holds_alternative<int64_t>(idVal->value)) {
        out = std::get<int64_t>(idVal->value);
    } else if (std::holds_alternative<std::string>(idVal->value)) {
        out = std::get<std::string>(idVal->value);
    } else if (idVal->isNull()) {
        out = nullptr;
    } else {
        throw std::runtime_error("id must be a string, integer or null");
    }
    return true;
}

std::optional<std::string> readMethod(const JSONValue& root) {
    const JSONValue* m = root.find("method");
    if (!m || !m->isString()) {
        return std::nullopt;
    }
    return std::get<std::string>(m->value);
}
} // namespace

JSONValue ParseJSON(const std::string& text) {
    JsonParser p(text);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != text.size()) {
        p.fail("Trailing characters after JSON value");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    FUNC_SCOPE();
    std::ostringstream oss;
    serializeInto(oss, value);
    return oss.str();
}

JSONValue CloneJSON(const JSONValue& value) {
    if (value.isArray()) {
        JSONValue::Array out;
        const auto& arr = std::get<JSONValue::Array>(value.value);
        out.reserve(arr.size());
        for (const auto& item : arr) {
            out.push_back(item ? std::make_shared<JSONValue>(CloneJSON(*item)) : nullptr);
        }
        return JSONValue(std::move(out));
    }
    if (value.isObject()) {
        JSONValue::Object out;
        for (const auto& [key, item] : std::get<JSONValue::Object>(value.value)) {
            out[key] = item ? std::make_shared<JSONValue>(CloneJSON(*item)) : nullptr;
        }
        return JSONValue(std::move(out));
    }
    return value;
}

// JSONRPCRequest implementation
std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    appendEscaped(oss, jsonrpc);
    oss << ",\"id\":";
    serializeId(oss, id);
    oss << ",\"method\":";
    appendEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        serializeInto(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue root = ParseJSON(json);
        auto m = readMethod(root);
        if (!m.has_value() || !readId(root, id)) {
            return false;
        }
        method = std::move(m.value());
        if (const JSONValue* p = root.find("params")) {
            params = *p;
        }
        return !method.empty();
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    appendEscaped(oss, jsonrpc);
    oss << ",\"id\":";
    serializeId(oss, id);
    if (error.has_value()) {
        oss << ",\"error\":";
        serializeInto(oss, error.value());
    } else {
        oss << ",\"result\":";
        serializeInto(oss, result.has_value() ? result.value() : JSONValue{});
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue root = ParseJSON(json);
        if (!root.isObject() || !readId(root, id)) {
            return false;
        }
        const JSONValue* r = root.find("result");
        const JSONValue* e = root.find("error");
        if (e && !e->isNull()) {
            error = *e;
        } else if (r) {
            result = *r;
        } else {
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":";
    appendEscaped(oss, jsonrpc);
    oss << ",\"method\":";
    appendEscaped(oss, method);
    if (params.has_value()) {
        oss << ",\"params\":";
        serializeInto(oss, params.value());
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        JSONValue root = ParseJSON(json);
        if (root.find("id")) {
            return false;
        }
        auto m = readMethod(root);
        if (!m.has_value()) {
            return false;
        }
        method = std::move(m.value());
        if (const JSONValue* p = root.find("params")) {
            params = *p;
        }
        return !method.empty();
    } catch (const std::exception& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace toolhost
