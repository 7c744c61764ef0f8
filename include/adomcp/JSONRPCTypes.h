//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 envelope types
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <vector>

namespace adomcp {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool IsNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool IsObject() const { return std::holds_alternative<Object>(value); }
    bool IsArray() const { return std::holds_alternative<Array>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }

    //==========================================================================================================
    // Returns the member named key when this value is an object holding it; nullptr otherwise.
    //==========================================================================================================
    const JSONValue* Find(const std::string& key) const;
};

//==========================================================================================================
// JSONParseError
// Purpose: Thrown by ParseJSONValue on malformed input; offset is the byte position of the failure.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

//==========================================================================================================
// ParseJSONValue
// Purpose: Strict parse of a complete JSON document (only whitespace may follow the value).
// Returns:
//   Parsed value. Integers fitting int64 stay integral; other numbers are doubles.
// Throws:
//   JSONParseError on any syntax error.
//==========================================================================================================
JSONValue ParseJSONValue(const std::string& text);

//==========================================================================================================
// SerializeJSONValue
// Purpose: Serialize a value; compact when indent < 0, otherwise pretty-printed with indent spaces.
//==========================================================================================================
std::string SerializeJSONValue(const JSONValue& value, int indent = -1);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, other number, or null.
// Notes:
//   Numbers that do not read back as the same int64 (1.0, 1.5, 1e3, 18446744073709551615) are kept
//   as JSONRPCNumberId holding their source text and written back unchanged.
//==========================================================================================================
struct JSONRPCNumberId {
    std::string text;
};

using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t, JSONRPCNumberId>;

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request message with id, method, and optional params.
// Notes:
//   hasId distinguishes an absent "id" member from an explicit null.
//   Deserialize accepts an object with a string "method"; "id" must be a string, number or null.
//==========================================================================================================
class JSONRPCRequest {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id{nullptr};
    bool hasId = false;
    std::string method;
    std::optional<JSONValue> params;

    // Parses json into this object; returns false for anything that is not a usable request.
    bool Deserialize(const std::string& json);
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response message carrying either result or error.
// Methods:
//   Serialize()/Deserialize(json)
//   IsError(): True when error is present.
//==========================================================================================================
class JSONRPCResponse {
public:
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}

    std::string Serialize() const;
    bool Deserialize(const std::string& json);

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Convenience to wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

// Renders an id for logs: strings quoted, numbers bare, null as "null".
std::string IdToString(const JSONRPCId& id);

} // namespace adomcp
