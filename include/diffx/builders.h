// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-based builders for O(n) construction of Value containers.
///
/// - MapBuilder: insertion-ordered Mapping
/// - VectorBuilder: Sequence
///
/// The format adapters build every container through these, and tests use
/// them to assemble expected trees.
///
/// Usage:
/// @code
///   #include <diffx/builders.h>
///
///   Value user = MapBuilder()
///       .set("name", "Alice")
///       .set("age", 30)
///       .set("tags", VectorBuilder().push_back("admin").push_back("ops").finish())
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace diffx {

/// Builder for an insertion-ordered mapping
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using value_map      = BasicValueMap<MemoryPolicy>;
    using transient_type = typename value_map::transient_type;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}
    explicit BasicMapBuilder(const value_map& existing) : transient_(existing.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // Transients must not be shared
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Set a key; an existing key keeps its original position
    template <typename T>
    BasicMapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicMapBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Previously set value, or default_val when the key is absent
    [[nodiscard]] value_type get(const std::string& key, value_type default_val = value_type{}) const {
        if (auto* found = transient_.find(key)) {
            return found->get();
        }
        return default_val;
    }

    /// Finish building and return the immutable Value.
    /// The builder must not be used afterwards.
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

    [[nodiscard]] value_map finish_map() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for a sequence
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type     = BasicValue<MemoryPolicy>;
    using value_box      = BasicValueBox<MemoryPolicy>;
    using value_vector   = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}
    explicit BasicVectorBuilder(const value_vector& existing) : transient_(existing.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;

    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    template <typename T>
    BasicVectorBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Element at index, or null when out of range
    [[nodiscard]] value_type get(std::size_t index) const {
        if (index < transient_.size()) {
            return transient_[index].get();
        }
        return value_type{};
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

    [[nodiscard]] value_vector finish_vector() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

using MapBuilder    = BasicMapBuilder<unsafe_memory_policy>;
using VectorBuilder = BasicVectorBuilder<unsafe_memory_policy>;

using SyncMapBuilder    = BasicMapBuilder<thread_safe_memory_policy>;
using SyncVectorBuilder = BasicVectorBuilder<thread_safe_memory_policy>;

} // namespace diffx
