//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolArguments.h
// Purpose: Typed accessors over the untyped tools/call argument object
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "adomcp/JSONRPCTypes.h"

namespace adomcp {

//==========================================================================================================
// ToolArgumentError
// Purpose: Argument failed validation; surfaced to the client as a tool-level error.
//==========================================================================================================
class ToolArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

//==========================================================================================================
// ToolArguments
// Purpose: Reads named values out of the arguments object with explicit type checks.
// Notes:
//   - A null or absent arguments value behaves like an empty object; any other non-object throws.
//   - Integers accept JSON integers and integral doubles (clients often send 5.0); fractional,
//     non-finite or out-of-range numbers throw "<name> must be an integer".
//   - A member present with JSON null counts as absent.
//   - A present member of the wrong type always throws; optional readers never fall back silently.
//==========================================================================================================
class ToolArguments {
public:
    explicit ToolArguments(const JSONValue& arguments);

    int64_t RequireInteger(const std::string& name) const;
    int64_t OptionalInteger(const std::string& name, int64_t defaultValue) const;
    std::string RequireString(const std::string& name) const;
    std::optional<std::string> OptionalString(const std::string& name) const;

    // Range check helper: throws "<name> must be between lo and hi" when outside [lo, hi].
    static int64_t CheckRange(const std::string& name, int64_t value, int64_t lo, int64_t hi);

private:
    const JSONValue* member(const std::string& name) const;
    static std::optional<int64_t> asInteger(const JSONValue& v);

    const JSONValue& args;
};

} // namespace adomcp
