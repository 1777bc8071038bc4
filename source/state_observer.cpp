// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// state_observer.cpp - Projector -> diff -> snapshot update

#include <state_observer/state_observer.h>
#include <state_observer/value_diff.h>

namespace state_observer {

StateObserver::StateObserver(LiveValue root, ObserverOptions options)
    : root_(std::move(root))
    , options_(options)
{
    store_.capture(project_root());
}

Value StateObserver::project_root()
{
    Projector projector{options_.use_projection_cache ? &store_.cache() : nullptr};
    Value current = projector.project(root_);

    const auto& stats = projector.stats();
    // Only report when the shape of the problem changes, not on every tick
    if (stats.values_dropped != stats_.values_dropped) {
        detail::log_projection_note("StateObserver", "unprojectable values dropped", stats.values_dropped);
    }
    if (stats.cycles_cut != stats_.cycles_cut) {
        detail::log_projection_note("StateObserver", "cyclic references cut", stats.cycles_cut);
    }
    stats_ = stats;
    return current;
}

Patches StateObserver::get_patches()
{
    Value current = project_root();
    Patches patches = diff(store_.previous(), current);
    store_.capture(std::move(current));
    return patches;
}

bool StateObserver::has_changes()
{
    return has_any_difference(store_.previous(), project_root());
}

void StateObserver::reset()
{
    store_.capture(project_root());
}

} // namespace state_observer
