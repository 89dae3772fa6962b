// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type shared by every format adapter, the diff engine and the formatter.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Bool
/// - Number (always double, whatever the source format called it)
/// - String
/// - Sequence (immer::vector of boxed Values)
/// - Mapping (string keys, unique, iteration in insertion order)
///
/// All containers are immutable and structurally shared: copying a Value
/// is O(1) and a copy can never observe later edits made elsewhere.
///
/// The Value type is templated on an immer memory policy. `Value` uses the
/// single-threaded policy; `SyncValue` uses atomic reference counts.

#pragma once

#include "diffx_config.h"
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace diffx {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DIFFX_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DIFFX_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DIFFX_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

/// Arithmetic types other than bool; all of them become a double Number.
template<typename T>
concept NumericType = std::is_arithmetic_v<std::decay_t<T>> &&
                      !std::is_same_v<std::decay_t<T>, bool>;

/// Value variants, in the same order as BasicValue::data alternatives
enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Sequence,
    Mapping
};

/// Lower-case name of a kind ("null", "bool", "number", "string", "sequence", "mapping")
[[nodiscard]] DIFFX_API std::string_view kind_name(ValueKind kind) noexcept;

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
struct BasicMapEntry {
    std::string key;
    BasicValueBox<MemoryPolicy> value;

    bool operator==(const BasicMapEntry& other) const {
        return key == other.key && value == other.value;
    }
};

// ============================================================
// BasicValueMap - insertion-ordered persistent mapping
//
// Entries live in an immer::vector in insertion order; an immer::map
// indexes key -> position. Replacing an existing key keeps its position.
// ============================================================

template <typename MemoryPolicy>
class BasicValueMap {
public:
    using value_box    = BasicValueBox<MemoryPolicy>;
    using entry_type   = BasicMapEntry<MemoryPolicy>;
    using entries_type = immer::vector<entry_type, MemoryPolicy>;
    using index_type   = immer::map<std::string,
                                    std::size_t,
                                    std::hash<std::string>,
                                    std::equal_to<std::string>,
                                    MemoryPolicy>;
    using const_iterator = typename entries_type::const_iterator;
    using iterator       = const_iterator;

    class transient_type {
    public:
        explicit transient_type(const BasicValueMap& m)
            : entries_(m.entries_.transient()), index_(m.index_.transient()) {}

        [[nodiscard]] const value_box* find(const std::string& key) const {
            if (auto* pos = index_.find(key)) return &entries_[*pos].value;
            return nullptr;
        }

        [[nodiscard]] std::size_t count(const std::string& key) const { return index_.count(key); }
        [[nodiscard]] std::size_t size() const { return entries_.size(); }

        void set(const std::string& key, value_box val) {
            if (auto* pos = index_.find(key)) {
                entries_.set(*pos, entry_type{key, std::move(val)});
                return;
            }
            index_.set(key, entries_.size());
            entries_.push_back(entry_type{key, std::move(val)});
        }

        [[nodiscard]] BasicValueMap persistent() {
            return BasicValueMap{entries_.persistent(), index_.persistent()};
        }

    private:
        typename entries_type::transient_type entries_;
        typename index_type::transient_type index_;
    };

    BasicValueMap() = default;

    BasicValueMap(std::initializer_list<std::pair<std::string, value_box>> init) {
        auto t = transient();
        for (const auto& [key, val] : init) {
            t.set(key, val);
        }
        *this = t.persistent();
    }

    [[nodiscard]] const value_box* find(const std::string& key) const {
        if (auto* pos = index_.find(key)) return &entries_[*pos].value;
        return nullptr;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const { return index_.count(key); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.size() == 0; }

    [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const { return entries_.end(); }

    /// Entry at insertion position
    [[nodiscard]] const entry_type& entry(std::size_t pos) const { return entries_[pos]; }

    [[nodiscard]] BasicValueMap set(const std::string& key, value_box val) const {
        if (auto* pos = index_.find(key)) {
            return BasicValueMap{entries_.set(*pos, entry_type{key, std::move(val)}), index_};
        }
        return BasicValueMap{entries_.push_back(entry_type{key, std::move(val)}),
                             index_.set(key, entries_.size())};
    }

    /// Remove a key; later entries shift down one position
    [[nodiscard]] BasicValueMap erase(const std::string& key) const {
        if (!index_.count(key)) return *this;
        auto t = BasicValueMap{}.transient();
        for (const auto& e : entries_) {
            if (e.key != key) t.set(e.key, e.value);
        }
        return t.persistent();
    }

    [[nodiscard]] transient_type transient() const { return transient_type{*this}; }

    /// O(1) check that both maps share the same storage
    [[nodiscard]] bool shares_storage_with(const BasicValueMap& other) const noexcept {
        return entries_.impl().root == other.entries_.impl().root &&
               entries_.impl().tail == other.entries_.impl().tail &&
               entries_.impl().size == other.entries_.impl().size;
    }

    /// Same key set with equal values; insertion order is not significant
    bool operator==(const BasicValueMap& other) const {
        if (shares_storage_with(other)) return true;
        if (size() != other.size()) return false;
        for (const auto& e : entries_) {
            auto* found = other.find(e.key);
            if (!found || !(*found == e.value)) return false;
        }
        return true;
    }

private:
    BasicValueMap(entries_type entries, index_type index)
        : entries_(std::move(entries)), index_(std::move(index)) {}

    entries_type entries_;
    index_type index_;
};

// ============================================================
// Paths
// ============================================================

/// Locates a sequence element by the value of its id field ("[id=1]")
struct IdSelector {
    std::string key;
    std::string id;

    bool operator==(const IdSelector&) const = default;
};

using PathElement = std::variant<std::string, std::size_t, IdSelector>;
using Path        = std::vector<PathElement>;

// ============================================================
// BasicValue
// ============================================================

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using map_entry     = BasicMapEntry<MemoryPolicy>;

    // Alternative order matches ValueKind
    std::variant<std::monostate,
                 bool,
                 double,
                 std::string,
                 value_vector,
                 value_map>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}
    template <NumericType T>
    BasicValue(T v) noexcept : data(static_cast<double>(v)) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}

    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_sequence() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_mapping() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_sequence() || is_mapping(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key) > 0;
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) return index < v->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        if (is_null()) return value_map{}.set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-mapping type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "cannot set on non-sequence type");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* v = get_if<value_vector>()) return v->push_back(value_box{std::move(val)});
        if (is_null()) return value_vector{}.push_back(value_box{std::move(val)});
        detail::log_access_error("Value::push_back", "cannot append to non-sequence type");
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Single-threaded memory policy: non-atomic refcount + no locks
using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

// Value: single-threaded, used by the adapters, the engine and the formatter.
// Diffing runs on trees owned by one thread, so atomic refcounts buy nothing.
using Value       = BasicValue<unsafe_memory_policy>;
using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueMap    = BasicValueMap<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;
using MapEntry    = BasicMapEntry<unsafe_memory_policy>;

// SyncValue: for trees handed between threads
using SyncValue       = BasicValue<thread_safe_memory_policy>;
using SyncValueBox    = BasicValueBox<thread_safe_memory_policy>;
using SyncValueMap    = BasicValueMap<thread_safe_memory_policy>;
using SyncValueVector = BasicValueVector<thread_safe_memory_policy>;

/// Structural equality. Mappings compare as key sets; NaN is unequal to itself.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Short human-readable description ("\"Alice\"", "30", "{mapping:2}", "[sequence:3]")
[[nodiscard]] DIFFX_API std::string value_to_string(const Value& val);

/// Print Value with indentation
DIFFX_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

/// Render a path as text: "user.profile.age", "items[2]", "users[id=1].name".
/// The root path renders as "".
[[nodiscard]] DIFFX_API std::string path_to_string(const Path& path);

/// Copy a Value between memory policies
[[nodiscard]] DIFFX_API SyncValue to_sync_value(const Value& val);
[[nodiscard]] DIFFX_API Value from_sync_value(const SyncValue& val);

extern template struct BasicValue<unsafe_memory_policy>;
extern template struct BasicValue<thread_safe_memory_policy>;
extern template class BasicValueMap<unsafe_memory_policy>;
extern template class BasicValueMap<thread_safe_memory_policy>;

} // namespace diffx
