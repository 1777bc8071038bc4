// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value_diff.cpp - PatchCollector and difference checks

#include <state_observer/value_diff.h>

#include <iostream>

namespace state_observer {

namespace {

bool same_box(const ValueBox& a, const ValueBox& b) noexcept
{
    return &a.get() == &b.get();
}

bool same_vector(const ValueVector& a, const ValueVector& b) noexcept
{
    return a.impl().root == b.impl().root &&
           a.impl().tail == b.impl().tail &&
           a.impl().size == b.impl().size;
}

} // anonymous namespace

// ============================================================
// PatchCollector
// ============================================================

void PatchCollector::diff(const Value& previous, const Value& current)
{
    patches_.clear();

    // Same object compared to itself
    if (&previous.data == &current.data) {
        return;
    }

    Path path;
    path.reserve(16);
    diff_value(ValueBox{previous}, ValueBox{current}, path);
}

void PatchCollector::diff_value(const ValueBox& previous, const ValueBox& current, Path& path)
{
    if (same_box(previous, current)) [[likely]] {
        return;
    }

    const Value& old_val = *previous;
    const Value& new_val = *current;

    if (old_val.type_index() != new_val.type_index()) [[unlikely]] {
        patches_.emplace_back(PatchOp::Replace, path, current);
        return;
    }

    std::visit([&](const auto& old_arg) {
        using T = std::decay_t<decltype(old_arg)>;

        if constexpr (std::is_same_v<T, ValueRecord>) {
            const auto& new_rec = std::get<ValueRecord>(new_val.data);
            if (old_arg.shares_storage_with(new_rec)) [[likely]] {
                return;
            }
            diff_record(old_arg, new_rec, path);
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            const auto& new_vec = std::get<ValueVector>(new_val.data);
            if (same_vector(old_arg, new_vec)) [[likely]] {
                return;
            }
            diff_vector(old_arg, new_vec, path);
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            // Both null
        }
        else {
            if (old_arg != std::get<T>(new_val.data)) {
                patches_.emplace_back(PatchOp::Replace, path, current);
            }
        }
    }, old_val.data);
}

void PatchCollector::diff_record(const ValueRecord& previous, const ValueRecord& current, Path& path)
{
    // Previous keys, last to first
    for (std::size_t i = previous.keys.size(); i-- > 0;) {
        const auto& key = previous.keys[i];
        const auto* old_box = previous.find(key);
        if (!old_box) {
            continue;
        }
        path.push_back(key);
        if (const auto* new_box = current.find(key)) {
            diff_value(*old_box, *new_box, path);
        } else {
            patches_.emplace_back(PatchOp::Remove, path);
        }
        path.pop_back();
    }

    // New keys, first to last
    for (const auto& key : current.keys) {
        if (previous.contains(key)) {
            continue;
        }
        if (const auto* new_box = current.find(key)) {
            path.push_back(key);
            patches_.emplace_back(PatchOp::Add, path, *new_box);
            path.pop_back();
        }
    }
}

void PatchCollector::diff_vector(const ValueVector& previous, const ValueVector& current, Path& path)
{
    const std::size_t old_size = previous.size();
    const std::size_t new_size = current.size();

    for (std::size_t i = old_size; i-- > 0;) {
        path.push_back(i);
        if (i >= new_size) {
            patches_.emplace_back(PatchOp::Remove, path);
        } else {
            diff_value(previous[i], current[i], path);
        }
        path.pop_back();
    }

    for (std::size_t i = old_size; i < new_size; ++i) {
        path.push_back(i);
        patches_.emplace_back(PatchOp::Add, path, current[i]);
        path.pop_back();
    }
}

Patches diff(const Value& previous, const Value& current)
{
    PatchCollector collector;
    collector.diff(previous, current);
    return collector.take_patches();
}

// ============================================================
// has_any_difference
// ============================================================

bool has_any_difference(const Value& previous, const Value& current, bool recursive)
{
    if (&previous.data == &current.data) {
        return false;
    }
    return detail::values_differ(previous, current, recursive);
}

namespace detail {

bool values_differ(const Value& previous, const Value& current, bool recursive)
{
    if (previous.type_index() != current.type_index()) [[unlikely]] {
        return true;
    }

    return std::visit([&](const auto& old_arg) -> bool {
        using T = std::decay_t<decltype(old_arg)>;

        if constexpr (std::is_same_v<T, ValueRecord>) {
            const auto& new_rec = std::get<ValueRecord>(current.data);
            if (old_arg.shares_storage_with(new_rec)) [[likely]] {
                return false;
            }
            if (!recursive) {
                return true;
            }
            return records_differ(old_arg, new_rec, recursive);
        }
        else if constexpr (std::is_same_v<T, ValueVector>) {
            const auto& new_vec = std::get<ValueVector>(current.data);
            if (same_vector(old_arg, new_vec)) [[likely]] {
                return false;
            }
            if (!recursive) {
                return true;
            }
            return vectors_differ(old_arg, new_vec, recursive);
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            return false;
        }
        else {
            return old_arg != std::get<T>(current.data);
        }
    }, previous.data);
}

bool records_differ(const ValueRecord& previous, const ValueRecord& current, bool recursive)
{
    if (previous.size() != current.size()) {
        return true;
    }

    // Same size, so every previous key present in current means same key set
    for (const auto& key : previous.keys) {
        const auto* old_box = previous.find(key);
        const auto* new_box = current.find(key);
        if (!old_box || !new_box) {
            return true;
        }
        if (same_box(*old_box, *new_box)) [[likely]] {
            continue;
        }
        if (!recursive || values_differ(**old_box, **new_box, recursive)) {
            return true;
        }
    }
    return false;
}

bool vectors_differ(const ValueVector& previous, const ValueVector& current, bool recursive)
{
    if (previous.size() != current.size()) {
        return true;
    }

    for (std::size_t i = 0; i < previous.size(); ++i) {
        const auto& old_box = previous[i];
        const auto& new_box = current[i];
        if (same_box(old_box, new_box)) [[likely]] {
            continue;
        }
        if (!recursive || values_differ(*old_box, *new_box, recursive)) {
            return true;
        }
    }
    return false;
}

} // namespace detail

} // namespace state_observer
