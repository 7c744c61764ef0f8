//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: JSON parser/serializer and JSON-RPC envelope (de)serialization using only std library
//==========================================================================================================

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <iomanip>
#include "adomcp/JSONRPCTypes.h"
#include "logging/Logger.h"


namespace adomcp {

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

const JSONValue* JSONValue::Find(const std::string& key) const {
    if (!std::holds_alternative<Object>(value)) {
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
// Strict recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 256;

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};
    // When set, receives the source text of a numeric top-level "id" member.
    std::string* rawIdText{nullptr};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what, i);
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
        if (i + 4 > s.size()) fail("Truncated unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex digit in unicode escape");
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
        for (;;) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) fail("Unescaped control character in string");
            if (c != '\\') { out.push_back(c); continue; }
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
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate must be followed by an escaped low surrogate
                        if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') fail("Unpaired high surrogate");
                        i += 2;
                        unsigned int low = parseHex4();
                        if (low < 0xDC00 || low > 0xDFFF) fail("Invalid low surrogate");
                        code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        fail("Unpaired low surrogate");
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
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Invalid number");
        if (s[i] == '0') {
            ++i;
        } else {
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Expected digit after '.'");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("Expected digit in exponent");
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) {
                return JSONValue(v);
            }
            // Out of int64 range: fall through to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec == std::errc::result_out_of_range) {
            d = (*first == '-') ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        } else if (ec != std::errc() || ptr != last) {
            fail("Invalid number");
        }
        return JSONValue(d);
    }

    JSONValue parseArray() {
        ++i; // '['
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' or ']' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        ++i; // '{'
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            skipWs();
            const std::size_t valueStart = i;
            JSONValue val = parseValue();
            if (rawIdText != nullptr && depth == 1 && key == "id" &&
                (std::holds_alternative<int64_t>(val.value) || std::holds_alternative<double>(val.value))) {
                *rawIdText = s.substr(valueStart, i - valueStart);
            }
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' or '}' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        char c = s[i];
        if (c == '"') return JSONValue(parseString());
        if (c == '{' || c == '[') {
            if (++depth > kMaxDepth) fail("Nesting too deep");
            JSONValue v = (c == '{') ? parseObject() : parseArray();
            --depth;
            return v;
        }
        if (s.compare(i, 4, "true") == 0) { i += 4; return JSONValue(true); }
        if (s.compare(i, 5, "false") == 0) { i += 5; return JSONValue(false); }
        if (s.compare(i, 4, "null") == 0) { i += 4; return JSONValue(nullptr); }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail(std::string("Unexpected character '") + c + "'");
    }

    JSONValue parseDocument() {
        JSONValue v = parseValue();
        skipWs();
        if (i != s.size()) fail("Trailing characters after JSON value");
        return v;
    }
};

void writeEscaped(std::ostringstream& oss, const std::string& v) {
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
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}

void writeNewline(std::ostringstream& oss, int indent, int level) {
    if (indent < 0) return;
    oss << '\n' << std::string(static_cast<std::size_t>(indent * level), ' ');
}

void writeValue(std::ostringstream& oss, const JSONValue& value, int indent, int level) {
    std::visit([&](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                oss << "null";
            } else {
                char buf[32];
                auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
                oss << (ec == std::errc() ? std::string(buf, ptr) : std::string("null"));
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            oss << '[';
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) oss << ',';
                writeNewline(oss, indent, level + 1);
                if (v[k]) { writeValue(oss, *v[k], indent, level + 1); } else { oss << "null"; }
            }
            if (!v.empty()) writeNewline(oss, indent, level);
            oss << ']';
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            // Keys are emitted sorted so output is deterministic
            std::vector<const std::string*> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(&kv.first);
            std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b){ return *a < *b; });
            oss << '{';
            bool first = true;
            for (const std::string* key : keys) {
                if (!first) oss << ',';
                first = false;
                writeNewline(oss, indent, level + 1);
                writeEscaped(oss, *key);
                oss << (indent < 0 ? ":" : ": ");
                const auto& member = v.at(*key);
                if (member) { writeValue(oss, *member, indent, level + 1); } else { oss << "null"; }
            }
            if (!v.empty()) writeNewline(oss, indent, level);
            oss << '}';
        }
    }, value.get());
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            writeEscaped(oss, v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else if constexpr (std::is_same_v<T, JSONRPCNumberId>) {
            oss << v.text;
        } else {
            oss << "null";
        }
    }, id);
}

// Parses a JSON-RPC envelope, also returning the source text of a numeric "id".
JSONValue parseEnvelope(const std::string& json, std::string& rawIdText) {
    JsonParser p(json);
    p.rawIdText = &rawIdText;
    return p.parseDocument();
}

// Reads "id" into out; returns false when present with a type JSON-RPC does not allow.
// Numbers that do not round-trip through int64 keep their source text.
bool readId(const JSONValue& envelope, const std::string& rawIdText, JSONRPCId& out, bool& present) {
    const JSONValue* idVal = envelope.Find("id");
    present = (idVal != nullptr);
    if (!present) {
        out = nullptr;
        return true;
    }
    if (std::holds_alternative<std::string>(idVal->value)) {
        out = std::get<std::string>(idVal->value);
    } else if (std::holds_alternative<int64_t>(idVal->value) &&
               std::to_string(std::get<int64_t>(idVal->value)) == rawIdText) {
        out = std::get<int64_t>(idVal->value);
    } else if (std::holds_alternative<int64_t>(idVal->value) || std::holds_alternative<double>(idVal->value)) {
        if (rawIdText.empty()) {
            return false;
        }
        out = JSONRPCNumberId{rawIdText};
    } else if (idVal->IsNull()) {
        out = nullptr;
    } else {
        return false;
    }
    return true;
}
} // namespace

JSONValue ParseJSONValue(const std::string& text) {
    JsonParser p(text);
    return p.parseDocument();
}

std::string SerializeJSONValue(const JSONValue& value, int indent) {
    std::ostringstream oss;
    writeValue(oss, value, indent, 0);
    return oss.str();
}

std::string IdToString(const JSONRPCId& id) {
    std::ostringstream oss;
    writeId(oss, id);
    return oss.str();
}

// JSONRPCRequest implementation
bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        std::string rawIdText;
        JSONValue envelope = parseEnvelope(json, rawIdText);
        if (!envelope.IsObject()) {
            LOG_DEBUG("JSON-RPC request is not an object");
            return false;
        }
        const JSONValue* m = envelope.Find("method");
        if (m == nullptr || !m->IsString() || std::get<std::string>(m->value).empty()) {
            LOG_DEBUG("JSON-RPC request has no method");
            return false;
        }
        JSONRPCId parsedId{nullptr};
        bool idPresent = false;
        if (!readId(envelope, rawIdText, parsedId, idPresent)) {
            LOG_DEBUG("JSON-RPC request id has an unsupported type");
            return false;
        }
        const JSONValue* v = envelope.Find("jsonrpc");
        jsonrpc = (v != nullptr && v->IsString()) ? std::get<std::string>(v->value) : std::string();
        method = std::get<std::string>(m->value);
        id = std::move(parsedId);
        hasId = idPresent;
        const JSONValue* p = envelope.Find("params");
        if (p != nullptr) {
            params = *p;
        } else {
            params.reset();
        }
        return true;
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

// JSONRPCResponse implementation
std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"2.0\",\"id\":";
    writeId(oss, id);
    // Exactly one of result/error goes on the wire; error wins if both were set.
    if (error.has_value()) {
        oss << ",\"error\":" << SerializeJSONValue(error.value());
    } else {
        oss << ",\"result\":" << (result.has_value() ? SerializeJSONValue(result.value()) : std::string("null"));
    }
    oss << "}";
    return oss.str();
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        std::string rawIdText;
        JSONValue envelope = parseEnvelope(json, rawIdText);
        if (!envelope.IsObject()) {
            return false;
        }
        bool idPresent = false;
        if (!readId(envelope, rawIdText, id, idPresent)) {
            return false;
        }
        const JSONValue* r = envelope.Find("result");
        const JSONValue* e = envelope.Find("error");
        if ((r == nullptr) == (e == nullptr)) {
            return false;
        }
        if (r != nullptr) { result = *r; } else { result.reset(); }
        if (e != nullptr) { error = *e; } else { error.reset(); }
        return true;
    } catch (const JSONParseError& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
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
    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace adomcp
