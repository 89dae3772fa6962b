// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Validated, immutable configuration for one diff invocation.
///
/// Callers fill a DiffOptionsOverrides with only the fields they care
/// about; DiffOptions::from() merges them onto the defaults and validates
/// the result before any comparison work starts.
///
/// Usage:
/// @code
///   DiffOptionsOverrides o;
///   o.epsilon = 0.01;
///   o.array_id_key = "id";
///   auto records = diff(old_val, new_val, DiffOptions::from(o));
/// @endcode
///
/// Defaults:
///   epsilon 0, no array id key, no ignored keys, no path filter,
///   output format "diffx", all flags false.

#pragma once

#include "api.h"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace diffx {

enum class OutputFormat {
    Diffx,
    Json,
    Yaml
};

/// "diffx", "json" or "yaml"
[[nodiscard]] DIFFX_API std::string_view to_string(OutputFormat format) noexcept;

/// Parse an output format name (exact, lower-case)
/// @throws UnsupportedFormat for anything else
[[nodiscard]] DIFFX_API OutputFormat parse_output_format(std::string_view name);

/// Partial options; unset fields take their default
struct DiffOptionsOverrides {
    std::optional<double> epsilon;
    std::optional<std::string> array_id_key;
    std::optional<std::string> ignore_keys_regex;
    std::optional<std::string> path_filter;
    std::optional<std::string> output_format;
    std::optional<bool> ignore_whitespace;
    std::optional<bool> ignore_case;
    std::optional<bool> brief_mode;
    std::optional<bool> quiet_mode;
};

class DIFFX_API DiffOptions {
public:
    /// All defaults
    DiffOptions() = default;

    /// Merge overrides onto the defaults and validate.
    /// @throws InvalidOptions "invalid epsilon" when epsilon is negative or not finite
    /// @throws InvalidOptions "invalid pattern" when ignore_keys_regex or path_filter is
    ///         empty, or the regex does not compile
    /// @throws InvalidOptions "invalid array id key" when array_id_key is empty
    [[nodiscard]] static DiffOptions from(const DiffOptionsOverrides& overrides);

    [[nodiscard]] double epsilon() const noexcept { return epsilon_; }
    [[nodiscard]] const std::optional<std::string>& array_id_key() const noexcept { return array_id_key_; }
    [[nodiscard]] const std::optional<std::string>& ignore_keys_pattern() const noexcept { return ignore_keys_pattern_; }
    [[nodiscard]] const std::optional<std::string>& path_filter() const noexcept { return path_filter_; }

    /// Advisory; checked by the formatter, not here
    [[nodiscard]] const std::string& output_format() const noexcept { return output_format_; }

    [[nodiscard]] bool ignore_whitespace() const noexcept { return ignore_whitespace_; }
    [[nodiscard]] bool ignore_case() const noexcept { return ignore_case_; }
    [[nodiscard]] bool brief_mode() const noexcept { return brief_mode_; }
    [[nodiscard]] bool quiet_mode() const noexcept { return quiet_mode_; }

    /// True if the ignore-keys regex matches anywhere in key
    [[nodiscard]] bool ignores_key(const std::string& key) const;

    /// True if no path filter is set or path contains it
    [[nodiscard]] bool keeps_path(std::string_view path) const noexcept;

private:
    double epsilon_ = 0.0;
    std::optional<std::string> array_id_key_;
    std::optional<std::string> ignore_keys_pattern_;
    std::shared_ptr<const std::regex> ignore_keys_regex_;
    std::optional<std::string> path_filter_;
    std::string output_format_ = "diffx";
    bool ignore_whitespace_ = false;
    bool ignore_case_ = false;
    bool brief_mode_ = false;
    bool quiet_mode_ = false;
};

} // namespace diffx
