// value_diff.cpp - DiffCollector and diff entry points

#include <diffx/value_diff.h>
#include <diffx/serialization.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <unordered_map>

namespace diffx {

namespace {

bool same_storage(const ValueVector& a, const ValueVector& b) noexcept
{
    return a.impl().root == b.impl().root &&
           a.impl().tail == b.impl().tail &&
           a.impl().size == b.impl().size;
}

bool is_space(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Collapse whitespace runs to one space and trim both ends; fold ASCII case
std::string normalize(std::string_view s, const DiffOptions& options)
{
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (options.ignore_whitespace() && is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += options.ignore_case()
                   ? static_cast<char>(std::tolower(static_cast<unsigned char>(c)))
                   : c;
    }
    return out;
}

// Text used in the "[key=id]" path selector, and to match elements.
// 1 and "1" render alike, so they are the same element.
std::string id_text(const Value& id)
{
    if (auto* s = id.get_if<std::string>()) return *s;
    return to_json(id, true);
}

} // anonymous namespace

// ============================================================
// DiffRecord
// ============================================================

DiffRecord DiffRecord::added(std::string path, Value new_value)
{
    return DiffRecord{Type::Added, std::move(path), Value{}, std::move(new_value)};
}

DiffRecord DiffRecord::removed(std::string path, Value old_value)
{
    return DiffRecord{Type::Removed, std::move(path), std::move(old_value), Value{}};
}

DiffRecord DiffRecord::modified(std::string path, Value old_value, Value new_value)
{
    return DiffRecord{Type::Modified, std::move(path), std::move(old_value), std::move(new_value)};
}

DiffRecord DiffRecord::type_changed(std::string path, Value old_value, Value new_value)
{
    return DiffRecord{Type::TypeChanged, std::move(path), std::move(old_value), std::move(new_value)};
}

std::string_view to_string(DiffRecord::Type type) noexcept
{
    switch (type) {
        case DiffRecord::Type::Added:       return "Added";
        case DiffRecord::Type::Removed:     return "Removed";
        case DiffRecord::Type::Modified:    return "Modified";
        case DiffRecord::Type::TypeChanged: return "TypeChanged";
    }
    return "Modified";
}

namespace detail {

bool strings_equal(std::string_view a, std::string_view b, const DiffOptions& options)
{
    if (a == b) return true;
    if (!options.ignore_case() && !options.ignore_whitespace()) return false;
    return normalize(a, options) == normalize(b, options);
}

bool numbers_equal(double a, double b, double epsilon) noexcept
{
    if (a == b) return true;
    if (std::isnan(a) && std::isnan(b)) return true;
    return std::fabs(a - b) <= epsilon;
}

} // namespace detail

// ============================================================
// DiffCollector Implementation
// ============================================================

DiffCollector::DiffCollector(DiffOptions options)
    : options_(std::move(options))
{
}

void DiffCollector::diff(const Value& old_val, const Value& new_val)
{
    run(old_val, new_val, options_.brief_mode() ? 1 : 0);
}

bool DiffCollector::find_first(const Value& old_val, const Value& new_val)
{
    run(old_val, new_val, 1);
    return has_changes();
}

void DiffCollector::run(const Value& old_val, const Value& new_val, std::size_t limit)
{
    diffs_.clear();
    limit_ = limit;

    // Fast path: same object
    if (&old_val.data == &new_val.data) {
        return;
    }

    Path root_path;
    root_path.reserve(16);
    diff_value(old_val, new_val, root_path);
}

const std::vector<DiffRecord>& DiffCollector::get_diffs() const
{
    return diffs_;
}

std::vector<DiffRecord> DiffCollector::take_diffs()
{
    return std::move(diffs_);
}

bool DiffCollector::has_changes() const
{
    return !diffs_.empty();
}

void DiffCollector::clear()
{
    diffs_.clear();
}

void DiffCollector::print_diffs() const
{
    if (diffs_.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& d : diffs_) {
        std::string type_str;
        switch (d.type) {
            case DiffRecord::Type::Added:       type_str = "ADDED   "; break;
            case DiffRecord::Type::Removed:     type_str = "REMOVED "; break;
            case DiffRecord::Type::Modified:    type_str = "MODIFIED"; break;
            case DiffRecord::Type::TypeChanged: type_str = "TYPE    "; break;
        }
        std::cout << "  " << type_str << " " << (d.path.empty() ? "(root)" : d.path);
        if (d.type == DiffRecord::Type::Added) {
            std::cout << ": " << value_to_string(d.new_value);
        } else if (d.type == DiffRecord::Type::Removed) {
            std::cout << ": " << value_to_string(d.old_value);
        } else {
            std::cout << ": " << value_to_string(d.old_value) << " -> " << value_to_string(d.new_value);
        }
        std::cout << "\n";
    }
}

bool DiffCollector::stopped() const noexcept
{
    return limit_ != 0 && diffs_.size() >= limit_;
}

void DiffCollector::emit(DiffRecord::Type type, const Path& current_path,
                         const Value& old_val, const Value& new_val)
{
    std::string path = path_to_string(current_path);
    // path_filter: drop here so brief mode stops on the first kept record
    if (!options_.keeps_path(path)) {
        return;
    }
    diffs_.push_back(DiffRecord{type, std::move(path), old_val, new_val});
}

void DiffCollector::diff_value(const Value& old_val, const Value& new_val, Path& current_path)
{
    if (stopped()) return;

    if (old_val.kind() != new_val.kind()) [[unlikely]] {
        emit(DiffRecord::Type::TypeChanged, current_path, old_val, new_val);
        return;
    }

    switch (old_val.kind()) {
        case ValueKind::Mapping: {
            const auto& old_map = std::get<ValueMap>(old_val.data);
            const auto& new_map = std::get<ValueMap>(new_val.data);
            // O(1) identity check
            if (old_map.shares_storage_with(new_map)) [[likely]] {
                return;
            }
            diff_map(old_map, new_map, current_path);
            break;
        }
        case ValueKind::Sequence: {
            const auto& old_vec = std::get<ValueVector>(old_val.data);
            const auto& new_vec = std::get<ValueVector>(new_val.data);
            if (same_storage(old_vec, new_vec)) [[likely]] {
                return;
            }
            diff_vector(old_vec, new_vec, current_path);
            break;
        }
        default:
            diff_scalar(old_val, new_val, current_path);
            break;
    }
}

void DiffCollector::diff_scalar(const Value& old_val, const Value& new_val, Path& current_path)
{
    bool equal = true;
    switch (old_val.kind()) {
        case ValueKind::Null:
            break;
        case ValueKind::Bool:
            equal = old_val.as_bool() == new_val.as_bool();
            break;
        case ValueKind::Number:
            equal = detail::numbers_equal(old_val.as_number(), new_val.as_number(), options_.epsilon());
            break;
        case ValueKind::String:
            equal = detail::strings_equal(old_val.as_string_view(), new_val.as_string_view(), options_);
            break;
        default:
            break;
    }
    if (!equal) {
        emit(DiffRecord::Type::Modified, current_path, old_val, new_val);
    }
}

void DiffCollector::diff_map(const ValueMap& old_map, const ValueMap& new_map, Path& current_path)
{
    // Old keys in insertion order: removed or retained
    for (const auto& [key, old_box] : old_map) {
        if (stopped()) return;
        if (options_.ignores_key(key)) continue;

        current_path.push_back(key);
        if (auto* new_box = new_map.find(key)) {
            // Same box, unchanged
            if (&old_box.get() != &new_box->get()) {
                diff_value(*old_box, **new_box, current_path);
            }
        } else {
            emit(DiffRecord::Type::Removed, current_path, *old_box, Value{});
        }
        current_path.pop_back();
    }

    // New-only keys in new's insertion order
    for (const auto& [key, new_box] : new_map) {
        if (stopped()) return;
        if (old_map.count(key) || options_.ignores_key(key)) continue;

        current_path.push_back(key);
        emit(DiffRecord::Type::Added, current_path, Value{}, *new_box);
        current_path.pop_back();
    }
}

void DiffCollector::diff_vector(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path)
{
    if (options_.array_id_key() && diff_vector_by_id(old_vec, new_vec, current_path)) {
        return;
    }

    const std::size_t old_size = old_vec.size();
    const std::size_t new_size = new_vec.size();
    const std::size_t common_size = std::min(old_size, new_size);

    for (std::size_t i = 0; i < common_size; ++i) {
        if (stopped()) return;
        const auto& old_box = old_vec[i];
        const auto& new_box = new_vec[i];

        if (&old_box.get() == &new_box.get()) [[likely]] {
            continue;
        }

        current_path.push_back(i);
        diff_value(*old_box, *new_box, current_path);
        current_path.pop_back();
    }

    // Removed tail elements
    for (std::size_t i = common_size; i < old_size; ++i) {
        if (stopped()) return;
        current_path.push_back(i);
        emit(DiffRecord::Type::Removed, current_path, *old_vec[i], Value{});
        current_path.pop_back();
    }

    // Added tail elements
    for (std::size_t i = common_size; i < new_size; ++i) {
        if (stopped()) return;
        current_path.push_back(i);
        emit(DiffRecord::Type::Added, current_path, Value{}, *new_vec[i]);
        current_path.pop_back();
    }
}

// Returns false (and emits nothing) when the sequences are not uniformly
// keyed by the id field with unique ids per side; the caller then falls
// back to positional comparison.
bool DiffCollector::diff_vector_by_id(const ValueVector& old_vec, const ValueVector& new_vec, Path& current_path)
{
    const std::string& id_key = *options_.array_id_key();

    struct Keyed {
        std::unordered_map<std::string, std::size_t> index;
        std::vector<std::string> ids;   // id text per element
    };

    auto build = [&id_key](const ValueVector& vec, Keyed& out) -> bool {
        out.index.reserve(vec.size());
        out.ids.reserve(vec.size());
        for (std::size_t i = 0; i < vec.size(); ++i) {
            auto* m = vec[i]->get_if<ValueMap>();
            if (!m) return false;
            auto* id_box = m->find(id_key);
            if (!id_box) return false;
            std::string text = id_text(**id_box);
            if (!out.index.emplace(text, i).second) return false;
            out.ids.push_back(std::move(text));
        }
        return true;
    };

    Keyed old_keyed;
    Keyed new_keyed;
    if (!build(old_vec, old_keyed) || !build(new_vec, new_keyed)) {
        return false;
    }

    // Old order first: matched ids recurse, unmatched are removed
    for (std::size_t i = 0; i < old_vec.size(); ++i) {
        if (stopped()) return true;
        current_path.push_back(IdSelector{id_key, old_keyed.ids[i]});
        auto it = new_keyed.index.find(old_keyed.ids[i]);
        if (it != new_keyed.index.end()) {
            const auto& old_box = old_vec[i];
            const auto& new_box = new_vec[it->second];
            if (&old_box.get() != &new_box.get()) {
                diff_value(*old_box, *new_box, current_path);
            }
        } else {
            emit(DiffRecord::Type::Removed, current_path, *old_vec[i], Value{});
        }
        current_path.pop_back();
    }

    // New-only ids in new order
    for (std::size_t i = 0; i < new_vec.size(); ++i) {
        if (stopped()) return true;
        if (old_keyed.index.count(new_keyed.ids[i])) continue;
        current_path.push_back(IdSelector{id_key, new_keyed.ids[i]});
        emit(DiffRecord::Type::Added, current_path, Value{}, *new_vec[i]);
        current_path.pop_back();
    }

    return true;
}

// ============================================================
// Entry points
// ============================================================

std::vector<DiffRecord> diff(const Value& old_val, const Value& new_val, const DiffOptions& options)
{
    DiffCollector collector{options};
    collector.diff(old_val, new_val);
    return collector.take_diffs();
}

std::vector<DiffRecord> diff(const Value& old_val, const Value& new_val, const DiffOptionsOverrides& overrides)
{
    return diff(old_val, new_val, DiffOptions::from(overrides));
}

bool has_any_difference(const Value& old_val, const Value& new_val, const DiffOptions& options)
{
    DiffCollector collector{options};
    return collector.find_first(old_val, new_val);
}

std::vector<DiffRecord> diff_strings(std::string_view old_text,
                                     std::string_view new_text,
                                     InputFormat format,
                                     const DiffOptions& options)
{
    const Value old_val = parse(old_text, format);
    const Value new_val = parse(new_text, format);
    return diff(old_val, new_val, options);
}

} // namespace diffx
