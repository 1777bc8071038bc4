// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief The observed Value: canonical, immutable, cycle-free projection of live state.
///
/// A Value is exactly one of:
/// - Scalar: null (std::monostate), bool, int64_t, double, std::string
/// - Sequence: immer::vector of boxed Values, indexed 0..n-1
/// - Record: string-keyed fields with a stable enumeration order
///
/// Containers are immer persistent structures, so two snapshots taken on
/// successive ticks share every subtree that did not change. The diff engine
/// relies on that sharing to skip unchanged subtrees by pointer identity.
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.

#pragma once

#include <state_observer/state_observer_config.h>
#include <state_observer/api.h>

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
#include <utility>
#include <variant>
#include <vector>

namespace state_observer {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STATE_OBSERVER_VERBOSE_LOG
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
#if STATE_OBSERVER_VERBOSE_LOG
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
#if STATE_OBSERVER_VERBOSE_LOG
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

/// Non-error diagnostics of a projection pass (dropped values, cut cycles)
inline void log_projection_note(
    std::string_view func,
    std::string_view message,
    std::size_t count,
    std::source_location loc = std::source_location::current()) noexcept
{
#if STATE_OBSERVER_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message << ": " << count
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)count;
    (void)loc;
#endif
}

} // namespace detail

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicFieldMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicKeyVector = immer::vector<std::string, MemoryPolicy>;

// ============================================================
// BasicValueRecord - keyed record with a stable enumeration order
//
// immer::map is hash-ordered, so the enumeration order is kept in a
// separate key vector. Lookup goes through the map; iteration goes
// through the key vector. Both halves are persistent and shared.
//
// Equality ignores key order: a record whose keys were merely
// re-ordered is the same record as far as patches are concerned.
// ============================================================
template <typename MemoryPolicy>
struct BasicValueRecord
{
    using value_box  = BasicValueBox<MemoryPolicy>;
    using field_map  = BasicFieldMap<MemoryPolicy>;
    using key_vector = BasicKeyVector<MemoryPolicy>;

    key_vector keys;
    field_map  fields;

    [[nodiscard]] std::size_t size() const noexcept { return keys.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys.empty(); }

    [[nodiscard]] const value_box* find(const std::string& key) const { return fields.find(key); }
    [[nodiscard]] bool contains(const std::string& key) const { return fields.count(key) > 0; }

    /// Returns a record with `key` bound to `val`; a new key goes last.
    [[nodiscard]] BasicValueRecord set(const std::string& key, value_box val) const {
        BasicValueRecord result{keys, fields};
        if (!contains(key)) {
            result.keys = std::move(result.keys).push_back(key);
        }
        result.fields = std::move(result.fields).set(key, std::move(val));
        return result;
    }

    [[nodiscard]] BasicValueRecord erase(const std::string& key) const {
        if (!contains(key)) return *this;
        auto order = key_vector{}.transient();
        for (const auto& k : keys) {
            if (k != key) order.push_back(k);
        }
        return BasicValueRecord{order.persistent(), fields.erase(key)};
    }

    /// Visit fields in enumeration order: fn(const std::string&, const value_box&)
    template <typename Fn>
    void for_each(Fn&& fn) const {
        for (const auto& key : keys) {
            if (const auto* box = fields.find(key)) {
                fn(key, *box);
            }
        }
    }

    /// O(1) check that both records are the very same persistent nodes
    [[nodiscard]] bool shares_storage_with(const BasicValueRecord& other) const noexcept {
        return fields.impl().root == other.fields.impl().root
            && fields.impl().size == other.fields.impl().size
            && keys.impl().root == other.keys.impl().root
            && keys.impl().tail == other.keys.impl().tail;
    }

    bool operator==(const BasicValueRecord& other) const {
        return shares_storage_with(other) || fields == other.fields;
    }

    bool operator!=(const BasicValueRecord& other) const {
        return !(*this == other);
    }
};

using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// Coarse shape of a Value: patches never recurse across a shape change
enum class ValueShape : std::uint8_t { Scalar, Sequence, Record };

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using value_record  = BasicValueRecord<MemoryPolicy>;

    std::variant<bool,
                 int64_t,
                 double,
                 std::string,
                 value_vector,
                 value_record,
                 std::monostate>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    constexpr BasicValue(T v) noexcept : data(static_cast<int64_t>(v)) {}

    template <std::floating_point T>
    constexpr BasicValue(T v) noexcept : data(static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_record v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue record(std::initializer_list<std::pair<std::string, BasicValue>> init = {}) {
        auto order  = BasicKeyVector<MemoryPolicy>{}.transient();
        auto fields = BasicFieldMap<MemoryPolicy>{}.transient();
        for (const auto& [key, val] : init) {
            if (fields.count(key) == 0) {
                order.push_back(key);
            }
            fields.set(key, value_box{val});
        }
        return BasicValue{value_record{order.persistent(), fields.persistent()}};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init = {}) {
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

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_record() const noexcept { return is<value_record>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_vector() || is_record(); }

    [[nodiscard]] ValueShape shape() const noexcept {
        if (is_vector()) return ValueShape::Sequence;
        if (is_record()) return ValueShape::Record;
        return ValueShape::Scalar;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* r = get_if<value_record>()) {
            if (auto* found = r->find(key)) return found->get();
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

    [[nodiscard]] BasicValue at_or(const std::string& key, BasicValue default_val) const {
        if (auto* r = get_if<value_record>()) {
            if (auto* found = r->find(key)) return found->get();
        }
        return default_val;
    }

    [[nodiscard]] BasicValue at_or(std::size_t index, BasicValue default_val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        return default_val;
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
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

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* r = get_if<value_record>()) return r->contains(key);
        return false;
    }

    [[nodiscard]] bool contains(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) return index < v->size();
        return false;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* r = get_if<value_record>()) return r->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-record type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "cannot set on non-vector type or out of range");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* v = get_if<value_vector>()) return v->push_back(value_box{std::move(val)});
        detail::log_access_error("Value::push_back", "cannot append to non-vector type");
        return *this;
    }

    /// Insert before `index`; index == size() appends
    [[nodiscard]] BasicValue insert(std::size_t index, BasicValue val) const {
        auto* v = get_if<value_vector>();
        if (!v || index > v->size()) {
            detail::log_index_error("Value::insert", index, "out of range or type mismatch");
            return *this;
        }
        if (index == v->size()) return v->push_back(value_box{std::move(val)});
        auto t = value_vector{}.transient();
        for (std::size_t i = 0; i < v->size(); ++i) {
            if (i == index) t.push_back(value_box{std::move(val)});
            t.push_back((*v)[i]);
        }
        return t.persistent();
    }

    [[nodiscard]] BasicValue erase(const std::string& key) const {
        if (auto* r = get_if<value_record>()) {
            if (r->contains(key)) return r->erase(key);
        }
        detail::log_key_error("Value::erase", key, "not found or type mismatch");
        return *this;
    }

    [[nodiscard]] BasicValue erase(std::size_t index) const {
        auto* v = get_if<value_vector>();
        if (!v || index >= v->size()) {
            detail::log_index_error("Value::erase", index, "out of range or type mismatch");
            return *this;
        }
        if (index + 1 == v->size()) return v->take(index);
        auto t = value_vector{}.transient();
        for (std::size_t i = 0; i < v->size(); ++i) {
            if (i != index) t.push_back((*v)[i]);
        }
        return t.persistent();
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* r = get_if<value_record>()) return r->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Memory Policy Definitions
// ============================================================

/// Thread-safe memory policy: atomic refcount + spinlock
using thread_safe_memory_policy = immer::default_memory_policy;

// ============================================================
// Default Value Type Aliases
//
// Value is what the projector, diff engine and observers produce.
// Snapshots of different observers may be released on different threads.
// ============================================================

using Value        = BasicValue<thread_safe_memory_policy>;
using ValueBox     = BasicValueBox<thread_safe_memory_policy>;
using ValueVector  = BasicValueVector<thread_safe_memory_policy>;
using ValueRecord  = BasicValueRecord<thread_safe_memory_policy>;
using FieldMap     = BasicFieldMap<thread_safe_memory_policy>;
using KeyVector    = BasicKeyVector<thread_safe_memory_policy>;

// ============================================================
// BasicValue comparison
//
// Structural equality. int64_t and double are distinct kinds, so
// Value{1} != Value{1.0}; records ignore key order.
// ============================================================

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

// ============================================================
// Utility functions
// ============================================================

// Convert Value to a short human-readable string ("{record:3}", "[vector:2]", ...)
[[nodiscard]] STATE_OBSERVER_API std::string value_to_string(const Value& val);

// Serialize Value as compact JSON text, fields in enumeration order
[[nodiscard]] STATE_OBSERVER_API std::string value_to_json(const Value& val);

// Print Value with indentation
STATE_OBSERVER_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

// Convert Path to dot-notation string (e.g., ".objs[0].x")
[[nodiscard]] STATE_OBSERVER_API std::string path_to_string(const Path& path);

extern template struct BasicValue<thread_safe_memory_policy>;
extern template struct BasicValueRecord<thread_safe_memory_policy>;

} // namespace state_observer
