// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file live_value.h
/// @brief Mutable host-side state tree observed by StateObserver.
///
/// LiveValue is what game/server code mutates every tick. It supports:
/// - Scalars: null, bool, int64_t, double, std::string
/// - LiveRecord: insertion-ordered string-keyed fields (shared, mutable)
/// - LiveArray: ordered elements (shared, mutable)
/// - Observable: custom objects, optionally with a to_json() hook
/// - Opaque: handles that belong to the state but can never be projected
///   (process-wide contexts, callbacks, OS handles)
///
/// ## Key Differences from Value (immutable)
/// - Containers are held through std::shared_ptr, so the same record can be
///   reachable from several places, including from its own descendants
///   (owner/parent back-references). The projector guards against cycles.
/// - Every container carries a revision counter that is bumped by each
///   mutation. Scalars are stored inline in their container, so changing a
///   scalar always bumps the revision of the container holding it.
///
/// ## Usage Example
/// ```cpp
/// auto state = LiveRecord::make({{"hp", 100}, {"name", "orc"}});
/// StateObserver observer{state};
/// state->set("hp", 80);
/// auto patches = observer.get_patches();   // [{replace, /hp, 80}]
/// ```

#pragma once

#include <state_observer/state_observer_config.h>
#include <state_observer/api.h>

#include <tsl/robin_map.h>

#include <concepts>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace state_observer {

// ============================================================
// Transparent Hash/Equal for robin_map heterogeneous lookup
// ============================================================

struct LiveStringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};

struct LiveStringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

class LiveRecord;
class LiveArray;
class Observable;
struct LiveValue;

using LiveRecordPtr = std::shared_ptr<LiveRecord>;
using LiveArrayPtr  = std::shared_ptr<LiveArray>;
using ObservablePtr = std::shared_ptr<Observable>;

/// Field visitor used by Observable::for_each_field
using FieldVisitor = std::function<void(std::string_view key, const LiveValue& value)>;

// ============================================================
// Observable - capability interface for custom objects
//
// to_json() is the canonical-serialization hook. When it returns a
// value, that value is projected instead of the object, so fields the
// hook leaves out (owner back-references, sockets, caches) never reach
// a snapshot or a patch. Returning std::nullopt means "no hook": the
// fields reported by for_each_field() are projected as a record.
// ============================================================
class STATE_OBSERVER_API Observable {
public:
    virtual ~Observable();

    [[nodiscard]] virtual std::optional<LiveValue> to_json() const;

    virtual void for_each_field(const FieldVisitor& visit) const;
};

/// Part of the live state that is never projected
struct Opaque {
    std::shared_ptr<const void> handle;

    bool operator==(const Opaque& other) const noexcept { return handle == other.handle; }
};

// ============================================================
// LiveValue
// ============================================================
struct STATE_OBSERVER_API LiveValue {
    using DataVariant = std::variant<std::monostate,
                                     bool,
                                     int64_t,
                                     double,
                                     std::string,
                                     LiveRecordPtr,
                                     LiveArrayPtr,
                                     ObservablePtr,
                                     Opaque>;

    DataVariant data;

    // Not explicit, so that record->set("hp", 100) reads naturally
    LiveValue() noexcept : data(std::monostate{}) {}
    LiveValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    LiveValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires(!std::same_as<T, bool>)
    LiveValue(T v) noexcept : data(static_cast<int64_t>(v)) {}

    template <std::floating_point T>
    LiveValue(T v) noexcept : data(static_cast<double>(v)) {}

    LiveValue(std::string v) : data(std::move(v)) {}
    LiveValue(const char* v) : data(std::string(v)) {}
    LiveValue(std::string_view v) : data(std::string(v)) {}
    LiveValue(LiveRecordPtr v) noexcept : data(std::move(v)) {}
    LiveValue(LiveArrayPtr v) noexcept : data(std::move(v)) {}
    LiveValue(Opaque v) noexcept : data(std::move(v)) {}

    template <std::derived_from<Observable> T>
    LiveValue(std::shared_ptr<T> v) noexcept : data(ObservablePtr{std::move(v)}) {}

    /// Create a shared record
    [[nodiscard]] static LiveValue record(std::initializer_list<std::pair<std::string, LiveValue>> init = {});

    /// Create a shared array
    [[nodiscard]] static LiveValue array(std::initializer_list<LiveValue> init = {});

    /// Wrap a handle that must never be projected
    [[nodiscard]] static LiveValue opaque(std::shared_ptr<const void> handle = {}) {
        return LiveValue{Opaque{std::move(handle)}};
    }

    template <typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(data);
    }

    [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_record() const noexcept { return is<LiveRecordPtr>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<LiveArrayPtr>(); }
    [[nodiscard]] bool is_observable() const noexcept { return is<ObservablePtr>(); }
    [[nodiscard]] bool is_opaque() const noexcept { return is<Opaque>(); }

    /// The shared record, or nullptr
    [[nodiscard]] LiveRecord* record_ptr() const noexcept {
        auto* p = get_if<LiveRecordPtr>();
        return p ? p->get() : nullptr;
    }

    /// The shared array, or nullptr
    [[nodiscard]] LiveArray* array_ptr() const noexcept {
        auto* p = get_if<LiveArrayPtr>();
        return p ? p->get() : nullptr;
    }

    /// Shallow identity: scalars by value, shared nodes by address
    bool operator==(const LiveValue& other) const noexcept { return data == other.data; }
};

// ============================================================
// LiveRecord - insertion-ordered fields
// ============================================================
class STATE_OBSERVER_API LiveRecord {
public:
    using Field          = std::pair<std::string, LiveValue>;
    using const_iterator = std::vector<Field>::const_iterator;

    [[nodiscard]] static LiveRecordPtr make(std::initializer_list<Field> init = {});

    /// Bind `key`; an existing key keeps its position, a new one goes last.
    /// Returns *this for chaining: r.set("x", 1).set("y", 2);
    LiveRecord& set(std::string_view key, LiveValue value);

    /// Field value, or nullptr when absent
    [[nodiscard]] const LiveValue* get(std::string_view key) const;

    /// Field value; throws std::out_of_range when absent
    [[nodiscard]] const LiveValue& at(std::string_view key) const;

    /// Erase a field (returns true if the key existed)
    bool erase(std::string_view key);

    void clear();

    [[nodiscard]] bool contains(std::string_view key) const;
    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }
    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return fields_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return fields_.end(); }

    /// Incremented by every mutation of this record (not of its children)
    [[nodiscard]] std::uint64_t revision() const noexcept { return revision_; }

private:
    std::vector<Field> fields_;
    tsl::robin_map<std::string, std::size_t, LiveStringHash, LiveStringEqual> index_;
    std::uint64_t revision_ = 0;
};

// ============================================================
// LiveArray - ordered elements
// ============================================================
class STATE_OBSERVER_API LiveArray {
public:
    using const_iterator = std::vector<LiveValue>::const_iterator;

    [[nodiscard]] static LiveArrayPtr make(std::initializer_list<LiveValue> init = {});

    void push_back(LiveValue value);
    void pop_back();

    /// Insert before `index`; index == size() appends. Throws std::out_of_range.
    void insert(std::size_t index, LiveValue value);

    /// Throws std::out_of_range
    void erase(std::size_t index);

    /// Throws std::out_of_range
    void set(std::size_t index, LiveValue value);

    /// Throws std::out_of_range
    [[nodiscard]] const LiveValue& at(std::size_t index) const;

    /// Shrink, or grow with nulls
    void resize(std::size_t size);
    void clear();

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }

    /// Incremented by every mutation of this array (not of its elements)
    [[nodiscard]] std::uint64_t revision() const noexcept { return revision_; }

private:
    std::vector<LiveValue> items_;
    std::uint64_t revision_ = 0;
};

} // namespace state_observer
