// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural diff of two observed Values into an ordered patch list.
///
/// Rules:
/// - Different kinds, or two unequal scalars: one replace, no recursion
/// - Pointer-identical immer nodes: nothing, in O(1)
/// - Records: keys of the previous value in reverse enumeration order
///   (remove / recurse), then keys new in the current value in forward
///   order (add)
/// - Sequences: previous indices from the highest down (remove the tail,
///   recurse on the shared range), then new trailing indices ascending (add)
///
/// Tail removals come out highest index first, so the list can be applied
/// in order. There is no move detection: an insertion in the middle of a
/// sequence is a run of replaces plus a trailing add.

#pragma once

#include <state_observer/api.h>
#include <state_observer/patch.h>
#include <state_observer/value.h>

namespace state_observer {

// ============================================================
// PatchCollector
//
// Collects the patches between two Values. Added and replaced values
// are the current snapshot's own boxes, so patches never copy data.
// ============================================================
class STATE_OBSERVER_API PatchCollector {
public:
    /// Compare `previous` against `current`, replacing any earlier result
    void diff(const Value& previous, const Value& current);

    [[nodiscard]] const Patches& get_patches() const noexcept { return patches_; }

    /// Move the result out, leaving the collector empty
    [[nodiscard]] Patches take_patches() noexcept { return std::move(patches_); }

    void clear() noexcept { patches_.clear(); }

    [[nodiscard]] bool has_changes() const noexcept { return !patches_.empty(); }

private:
    // Path is passed by reference and grown/shrunk with push_back/pop_back
    void diff_value(const ValueBox& previous, const ValueBox& current, Path& path);
    void diff_record(const ValueRecord& previous, const ValueRecord& current, Path& path);
    void diff_vector(const ValueVector& previous, const ValueVector& current, Path& path);

    Patches patches_;
};

/// Convenience wrapper around PatchCollector
[[nodiscard]] STATE_OBSERVER_API Patches diff(const Value& previous, const Value& current);

/// Early-exit check: true as soon as one difference is found.
/// Shallow mode reports any non-identical container as different.
[[nodiscard]] STATE_OBSERVER_API bool has_any_difference(const Value& previous, const Value& current,
                                                         bool recursive = true);

namespace detail {
[[nodiscard]] bool values_differ(const Value& previous, const Value& current, bool recursive);
[[nodiscard]] bool records_differ(const ValueRecord& previous, const ValueRecord& current, bool recursive);
[[nodiscard]] bool vectors_differ(const ValueVector& previous, const ValueVector& current, bool recursive);
} // namespace detail

} // namespace state_observer
