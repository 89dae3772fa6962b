// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text <-> Value.
///
/// Usage:
/// @code
///   #include <diffx/serialization.h>
///
///   Value data = from_json(R"({"name": "Alice", "age": 30})");
///   std::string pretty  = to_json(data);        // 2-space indentation
///   std::string compact = to_json(data, true);  // {"name":"Alice","age":30}
/// @endcode
///
/// Mapping keys are written in insertion order, so parse -> write keeps the
/// source key order.

#pragma once

#include "api.h"
#include "value.h"

#include <string>
#include <string_view>

namespace diffx {

/// Convert Value to JSON text
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @note NaN and infinities have no JSON spelling and are written as null
[[nodiscard]] DIFFX_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON text (RFC 8259) into a Value
/// @throws ParseError (format "json") on malformed input or trailing content
[[nodiscard]] DIFFX_API Value from_json(std::string_view json_str);

/// Shortest decimal text that reads back as the same double.
/// Integral values print without a fraction ("30", not "30.0").
[[nodiscard]] DIFFX_API std::string number_to_string(double number);

/// Quote and escape a string for JSON output
[[nodiscard]] DIFFX_API std::string json_quote(std::string_view s);

} // namespace diffx
