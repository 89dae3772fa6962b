// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file format_adapters.h
/// @brief Text -> Value decoders for JSON, YAML, TOML, CSV, INI and XML.
///
/// Every adapter either returns a complete Value or throws ParseError with
/// its format name; there is no partial result.
///
/// Output shapes:
/// - JSON, YAML, TOML: whatever root the text encodes
/// - CSV: always a Sequence of Mapping, one per data row, keyed by header;
///   cells stay strings
/// - INI: Mapping; each [section] becomes a nested Mapping; values are strings
/// - XML: {rootTag: element}; attributes as "@name", repeated child tags as a
///   Sequence, text beside children or attributes as "#text"
///
/// Usage:
/// @code
///   Value cfg = parse(read_file(path), detect_format(path));
/// @endcode

#pragma once

#include "api.h"
#include "value.h"

#include <string_view>

namespace diffx {

enum class InputFormat {
    Json,
    Yaml,
    Toml,
    Csv,
    Ini,
    Xml
};

/// "json", "yaml", "toml", "csv", "ini" or "xml"
[[nodiscard]] DIFFX_API std::string_view to_string(InputFormat format) noexcept;

/// Parse an input format name ("yml" is accepted for yaml)
/// @throws UnsupportedFormat
[[nodiscard]] DIFFX_API InputFormat parse_input_format(std::string_view name);

/// Map a file name's extension to its format (case-insensitive):
/// .json .yaml .yml .toml .csv .ini .cfg .xml
/// @throws UnsupportedFormat for anything else
[[nodiscard]] DIFFX_API InputFormat detect_format(std::string_view filename);

[[nodiscard]] DIFFX_API Value parse_json(std::string_view content);
[[nodiscard]] DIFFX_API Value parse_yaml(std::string_view content);
[[nodiscard]] DIFFX_API Value parse_toml(std::string_view content);
[[nodiscard]] DIFFX_API Value parse_csv(std::string_view content);
[[nodiscard]] DIFFX_API Value parse_ini(std::string_view content);
[[nodiscard]] DIFFX_API Value parse_xml(std::string_view content);

/// Dispatch to the adapter for format
[[nodiscard]] DIFFX_API Value parse(std::string_view content, InputFormat format);

} // namespace diffx
