// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <state_observer/snapshot_store.h>

namespace state_observer {

void SnapshotStore::capture(Value value)
{
    snapshot_ = std::move(value);
    has_snapshot_ = true;
}

void SnapshotStore::clear()
{
    snapshot_ = Value{};
    has_snapshot_ = false;
    cache_.clear();
}

const Value& SnapshotStore::empty_record()
{
    static const Value empty = Value::record();
    return empty;
}

} // namespace state_observer
