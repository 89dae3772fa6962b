// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural, type-aware comparison of two Value trees.
///
/// Usage:
/// @code
///   Value old_val = from_json(R"({"name": "Alice", "age": 30})");
///   Value new_val = from_json(R"({"name": "Alice", "age": 31})");
///
///   for (const auto& rec : diff(old_val, new_val)) {
///       // rec.type == DiffRecord::Type::Modified, rec.path == "age"
///   }
/// @endcode
///
/// Traversal order is deterministic:
/// - Mappings: old's keys in insertion order, then new-only keys in new's order
/// - Sequences: by position, or by id when DiffOptions::array_id_key() applies
///
/// A kind mismatch (e.g. string vs number) is always TypeChanged, whatever
/// the tolerance options say.

#pragma once

#include "api.h"
#include "format_adapters.h"
#include "options.h"
#include "value.h"

#include <string>
#include <string_view>
#include <vector>

namespace diffx {

struct DIFFX_API DiffRecord {
    enum class Type { Added, Removed, Modified, TypeChanged };

    Type type = Type::Added;
    std::string path;       // Rendered path, "" for the root
    Value old_value;        // Meaningful for Removed, Modified, TypeChanged
    Value new_value;        // Meaningful for Added, Modified, TypeChanged

    [[nodiscard]] static DiffRecord added(std::string path, Value new_value);
    [[nodiscard]] static DiffRecord removed(std::string path, Value old_value);
    [[nodiscard]] static DiffRecord modified(std::string path, Value old_value, Value new_value);
    [[nodiscard]] static DiffRecord type_changed(std::string path, Value old_value, Value new_value);

    /// Old value for Removed, new value otherwise
    [[nodiscard]] const Value& value() const {
        return type == Type::Removed ? old_value : new_value;
    }

    bool operator==(const DiffRecord& other) const {
        return type == other.type && path == other.path &&
               old_value == other.old_value && new_value == other.new_value;
    }
};

/// "Added", "Removed", "Modified" or "TypeChanged"
[[nodiscard]] DIFFX_API std::string_view to_string(DiffRecord::Type type) noexcept;

// ============================================================
// DiffCollector - collects differences as a flat list of DiffRecord
//
// Reusable: each diff() call replaces the previous result.
// ============================================================

class DIFFX_API DiffCollector {
public:
    DiffCollector() = default;
    explicit DiffCollector(DiffOptions options);

    void diff(const Value& old_val, const Value& new_val);

    /// Like diff(), but stops at the first difference whatever brief_mode says
    bool find_first(const Value& old_val, const Value& new_val);

    [[nodiscard]] const std::vector<DiffRecord>& get_diffs() const;
    [[nodiscard]] std::vector<DiffRecord> take_diffs();
    [[nodiscard]] bool has_changes() const;
    [[nodiscard]] const DiffOptions& options() const noexcept { return options_; }
    void clear();
    void print_diffs() const;

private:
    DiffOptions options_;
    std::vector<DiffRecord> diffs_;
    std::size_t limit_ = 0;     // 0 = unlimited

    void run(const Value& old_val, const Value& new_val, std::size_t limit);
    [[nodiscard]] bool stopped() const noexcept;

    void diff_value(const Value& old_val, const Value& new_val, Path& current_path);
    void diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path);
    void diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path);
    bool diff_vector_by_id(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path);
    void diff_scalar(const Value& old_val, const Value& new_val, Path& current_path);

    void emit(DiffRecord::Type type, const Path& current_path, const Value& old_val, const Value& new_val);
};

/// Compare two trees with validated options
[[nodiscard]] DIFFX_API std::vector<DiffRecord> diff(const Value& old_val,
                                                     const Value& new_val,
                                                     const DiffOptions& options = DiffOptions{});

/// Compare two trees, validating the overrides first
/// @throws InvalidOptions
[[nodiscard]] DIFFX_API std::vector<DiffRecord> diff(const Value& old_val,
                                                     const Value& new_val,
                                                     const DiffOptionsOverrides& overrides);

/// True if diff() would return at least one record; stops at the first one
[[nodiscard]] DIFFX_API bool has_any_difference(const Value& old_val,
                                                const Value& new_val,
                                                const DiffOptions& options = DiffOptions{});

/// Parse both texts with the adapter for format, then diff
/// @throws ParseError if either text is malformed
[[nodiscard]] DIFFX_API std::vector<DiffRecord> diff_strings(std::string_view old_text,
                                                             std::string_view new_text,
                                                             InputFormat format,
                                                             const DiffOptions& options = DiffOptions{});

namespace detail {
    /// Case/whitespace-normalized string equality used by the engine
    [[nodiscard]] DIFFX_API bool strings_equal(std::string_view a, std::string_view b, const DiffOptions& options);
    /// |a-b| <= epsilon; NaN equals NaN
    [[nodiscard]] DIFFX_API bool numbers_equal(double a, double b, double epsilon) noexcept;
}

} // namespace diffx
