// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file snapshot_store.h
/// @brief Last emitted observed Value of one tracked root.

#pragma once

#include <state_observer/api.h>
#include <state_observer/projector.h>
#include <state_observer/value.h>

namespace state_observer {

// ============================================================
// SnapshotStore
//
// Owns the previous snapshot and the projection cache of one root.
// The stored Value is immutable, so it stays independent of the live
// tree without a deep copy. Stores of different roots share nothing.
// ============================================================
class STATE_OBSERVER_API SnapshotStore {
public:
    /// Replace the stored snapshot
    void capture(Value value);

    /// Last captured snapshot; the empty record before the first capture
    [[nodiscard]] const Value& previous() const { return has_snapshot_ ? snapshot_ : empty_record(); }

    [[nodiscard]] bool has_snapshot() const noexcept { return has_snapshot_; }

    /// Drop the snapshot and the projection cache
    void clear();

    [[nodiscard]] ProjectionCache& cache() noexcept { return cache_; }
    [[nodiscard]] const ProjectionCache& cache() const noexcept { return cache_; }

private:
    static const Value& empty_record();

    Value snapshot_;
    bool has_snapshot_ = false;
    ProjectionCache cache_;
};

} // namespace state_observer
