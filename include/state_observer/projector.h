// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file projector.h
/// @brief Projection of live state into the immutable observed Value.
///
/// Rules, applied per node:
/// - Observable with a to_json() hook: the hook's result is projected instead
/// - Observable without hook: for_each_field() is projected as a record
/// - LiveArray -> Sequence of equal length; LiveRecord -> Record in insertion order
/// - Scalars pass through; NaN and infinities become null
/// - Unprojectable values (Opaque, null shared pointers, references back into
///   the node's own ancestry) are omitted from records and become null as
///   sequence elements or as the whole value
///
/// With a ProjectionCache, a container whose revision did not change and whose
/// nested containers re-project to the same immer nodes hands back its previous
/// projection unchanged. Unchanged subtrees therefore cost a walk but no
/// allocation, and keep pointer identity across snapshots for the diff.

#pragma once

#include <state_observer/live_value.h>
#include <state_observer/value.h>

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <cstdint>
#include <memory>
#include <optional>

namespace state_observer {

/// Counters of the last projection pass
struct ProjectionStats {
    std::size_t containers_visited = 0;  ///< records, arrays and observables walked
    std::size_t containers_reused  = 0;  ///< projections handed back from the cache unchanged
    std::size_t values_dropped     = 0;  ///< unprojectable values omitted or replaced by null
    std::size_t cycles_cut         = 0;  ///< references back into their own ancestry
};

// ============================================================
// ProjectionCache
//
// Per-root memo of the last projection of every live container,
// keyed by container address. Each entry holds a weak reference to
// its container, so an address recycled by a new container is never
// mistaken for the old one. Entries not touched during a pass are
// evicted by sweep().
// ============================================================
class STATE_OBSERVER_API ProjectionCache {
public:
    struct Entry {
        std::weak_ptr<const void> owner;
        std::uint64_t revision   = 0;
        std::uint64_t generation = 0;
        ValueBox projection;
    };

    /// Start a projection pass
    void begin_pass() noexcept { ++generation_; }

    /// Live entry for `node`, or nullptr. Marks the entry as used in this pass.
    /// The pointer is invalidated by the next store().
    [[nodiscard]] const Entry* lookup(const std::shared_ptr<const void>& node);

    void store(const std::shared_ptr<const void>& node, std::uint64_t revision, ValueBox projection);

    void forget(const void* node);

    /// Evict entries not used in the current pass
    void sweep();

    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    tsl::robin_map<const void*, Entry> entries_;
    std::uint64_t generation_ = 0;
};

// ============================================================
// Projector
// ============================================================
class STATE_OBSERVER_API Projector {
public:
    /// @param cache optional memo owned by the caller (one per tracked root)
    explicit Projector(ProjectionCache* cache = nullptr) noexcept : cache_(cache) {}

    /// Project a live value. Never throws for supported shapes.
    [[nodiscard]] Value project(const LiveValue& value);

    [[nodiscard]] const ProjectionStats& stats() const noexcept { return stats_; }

private:
    // nullopt = unprojectable; `cut` is set when a cycle was cut inside
    std::optional<ValueBox> project_node(const LiveValue& value, bool& cut);
    std::optional<ValueBox> project_record(const LiveRecordPtr& record, bool& cut);
    std::optional<ValueBox> project_array(const LiveArrayPtr& array, bool& cut);
    std::optional<ValueBox> project_observable(const ObservablePtr& object, bool& cut);

    ValueBox rebuild_record(const LiveRecord& record, bool& cut);
    ValueBox rebuild_array(const LiveArray& array, bool& cut);

    bool enter(const void* node);
    void leave(const void* node) noexcept { active_.erase(node); }

    ProjectionCache* cache_ = nullptr;
    tsl::robin_set<const void*> active_;  // nodes on the current projection stack
    ProjectionStats stats_;
};

/// Project without a cache
[[nodiscard]] STATE_OBSERVER_API Value project(const LiveValue& value);

} // namespace state_observer
