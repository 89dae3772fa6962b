// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file formatter.h
/// @brief Render DiffRecord lists as json, yaml or the compact diffx notation.
///
/// diffx notation, one line per record:
/// @code
///   + path: <new>
///   - path: <old>
///   ~ path: <old> -> <new>
///   ! path: <old> -> <new>      (type changed)
/// @endcode
/// Values are compact JSON; the root path is shown as "(root)".
///
/// json: an array of objects with "diffType", "path" and then "newValue"
/// (Added), "value" (Removed) or "oldValue" + "newValue" (Modified,
/// TypeChanged). records_from_json() reads that shape back.

#pragma once

#include "api.h"
#include "options.h"
#include "value_diff.h"

#include <string>
#include <string_view>
#include <vector>

namespace diffx {

/// Process exit codes for the "differences found" contract
enum class ExitStatus : int {
    NoDifferences    = 0,
    DifferencesFound = 1,
    Error            = 2    // for callers that caught a diffx::Error
};

[[nodiscard]] DIFFX_API std::string format_output(const std::vector<DiffRecord>& records, OutputFormat format);

/// @throws UnsupportedFormat if format is not "diffx", "json" or "yaml"
[[nodiscard]] DIFFX_API std::string format_output(const std::vector<DiffRecord>& records, std::string_view format);

/// The json rendering as a Value (Sequence of Mapping)
[[nodiscard]] DIFFX_API Value records_to_value(const std::vector<DiffRecord>& records);

/// Read records back from the json rendering
/// @throws ParseError (format "json") on malformed text or a result missing its fields
[[nodiscard]] DIFFX_API std::vector<DiffRecord> records_from_json(std::string_view json);

/// Honour quiet_mode (""), then brief_mode ("Objects differ\n" or ""),
/// then output_format
/// @throws UnsupportedFormat
[[nodiscard]] DIFFX_API std::string render(const std::vector<DiffRecord>& records, const DiffOptions& options);

[[nodiscard]] DIFFX_API ExitStatus exit_status(const std::vector<DiffRecord>& records) noexcept;

} // namespace diffx
