//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/adomcp/ToolArguments.cpp
// Purpose: Typed accessors over the untyped tools/call argument object
//==========================================================================================================

#include <cmath>

#include "adomcp/ToolArguments.h"

namespace adomcp {

ToolArguments::ToolArguments(const JSONValue& arguments) : args(arguments) {
    if (!args.IsNull() && !args.IsObject()) {
        throw ToolArgumentError("arguments must be an object");
    }
}

const JSONValue* ToolArguments::member(const std::string& name) const {
    const JSONValue* v = args.Find(name);
    if (v == nullptr || v->IsNull()) {
        return nullptr;
    }
    return v;
}

std::optional<int64_t> ToolArguments::asInteger(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) {
        return std::get<int64_t>(v.value);
    }
    if (std::holds_alternative<double>(v.value)) {
        const double d = std::get<double>(v.value);
        // 2^63 is exactly representable; anything at or beyond it does not fit int64
        if (!std::isfinite(d) || std::trunc(d) != d || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

int64_t ToolArguments::RequireInteger(const std::string& name) const {
    const JSONValue* v = member(name);
    if (v == nullptr) {
        throw ToolArgumentError(name + " is required and must be an integer");
    }
    auto n = asInteger(*v);
    if (!n.has_value()) {
        throw ToolArgumentError(name + " must be an integer");
    }
    return n.value();
}

int64_t ToolArguments::OptionalInteger(const std::string& name, int64_t defaultValue) const {
    const JSONValue* v = member(name);
    if (v == nullptr) {
        return defaultValue;
    }
    auto n = asInteger(*v);
    if (!n.has_value()) {
        throw ToolArgumentError(name + " must be an integer");
    }
    return n.value();
}

std::string ToolArguments::RequireString(const std::string& name) const {
    auto s = OptionalString(name);
    if (!s.has_value() || s->empty()) {
        throw ToolArgumentError(name + " is required and must be a non-empty string");
    }
    return s.value();
}

std::optional<std::string> ToolArguments::OptionalString(const std::string& name) const {
    const JSONValue* v = member(name);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->IsString()) {
        throw ToolArgumentError(name + " must be a string");
    }
    return std::get<std::string>(v->value);
}

int64_t ToolArguments::CheckRange(const std::string& name, int64_t value, int64_t lo, int64_t hi) {
    if (value < lo || value > hi) {
        throw ToolArgumentError(name + " must be between " + std::to_string(lo) + " and " + std::to_string(hi));
    }
    return value;
}

} // namespace adomcp
