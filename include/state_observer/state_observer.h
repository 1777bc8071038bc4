// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file state_observer.h
/// @brief Patch emitter: tracks one live root and reports its changes.
///
/// Each get_patches() call projects the live root, diffs the projection
/// against the stored snapshot, stores the new projection and returns the
/// patches. Applying them in order to the previous snapshot yields the new one.
///
/// ## Usage Example
/// ```cpp
/// auto state = LiveRecord::make({{"hp", 100}});
/// StateObserver observer{state};
///
/// // every network tick
/// state->set("hp", 90);
/// for (const auto& p : observer.get_patches()) {
///     send(op_to_string(p.op), p.pointer(), p.get_value());
/// }
/// ```
///
/// Not thread safe: mutation of the root and get_patches() must be
/// serialized by the caller. Separate observers share no state.

#pragma once

#include <state_observer/api.h>
#include <state_observer/live_value.h>
#include <state_observer/patch.h>
#include <state_observer/projector.h>
#include <state_observer/snapshot_store.h>
#include <state_observer/value.h>

namespace state_observer {

struct ObserverOptions {
    /// Reuse projections of unchanged live containers between calls
    bool use_projection_cache = true;
};

class STATE_OBSERVER_API StateObserver {
public:
    /// Start observing `root`; the initial snapshot is taken immediately
    explicit StateObserver(LiveValue root, ObserverOptions options = {});

    /// Patches since the previous call (or construction). The new state
    /// becomes the snapshot even when nothing changed.
    [[nodiscard]] Patches get_patches();

    /// Currently stored snapshot
    [[nodiscard]] const Value& snapshot() const noexcept { return store_.previous(); }

    /// Whether the live root differs from the snapshot. Takes no snapshot.
    [[nodiscard]] bool has_changes();

    /// Take a new snapshot, discarding pending changes
    void reset();

    [[nodiscard]] const LiveValue& root() const noexcept { return root_; }

    [[nodiscard]] const ObserverOptions& options() const noexcept { return options_; }

    /// Counters of the most recent projection
    [[nodiscard]] const ProjectionStats& last_stats() const noexcept { return stats_; }

private:
    Value project_root();

    LiveValue root_;
    ObserverOptions options_;
    SnapshotStore store_;
    ProjectionStats stats_;
};

} // namespace state_observer
