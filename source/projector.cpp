// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// projector.cpp - Live state -> observed Value

#include <state_observer/projector.h>

#include <cmath>

namespace state_observer {

namespace {

/// Nodes that may hide changes without a revision change of their parent
bool is_shared_node(const LiveValue& value) noexcept
{
    return value.is_record() || value.is_array() || value.is_observable();
}

/// Same immer node: O(1), no value comparison
bool same_node(const ValueBox& a, const ValueBox& b) noexcept
{
    return &a.get() == &b.get();
}

} // anonymous namespace

// ============================================================
// ProjectionCache
// ============================================================

const ProjectionCache::Entry* ProjectionCache::lookup(const std::shared_ptr<const void>& node)
{
    auto it = entries_.find(node.get());
    if (it == entries_.end()) {
        return nullptr;
    }
    // Same address but a different control block: the old node died
    // and its address was recycled
    const auto& owner = it->second.owner;
    if (owner.owner_before(node) || node.owner_before(owner)) {
        entries_.erase(it);
        return nullptr;
    }
    it.value().generation = generation_;
    return &it->second;
}

void ProjectionCache::store(const std::shared_ptr<const void>& node, std::uint64_t revision, ValueBox projection)
{
    auto& entry = entries_[node.get()];
    entry.owner = node;
    entry.revision = revision;
    entry.generation = generation_;
    entry.projection = std::move(projection);
}

void ProjectionCache::forget(const void* node)
{
    entries_.erase(node);
}

void ProjectionCache::sweep()
{
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.generation != generation_) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================
// Projector
// ============================================================

Value Projector::project(const LiveValue& value)
{
    stats_ = ProjectionStats{};
    // A hook that threw during the previous pass may have left nodes behind
    active_.clear();
    if (cache_) {
        cache_->begin_pass();
    }

    bool cut = false;
    auto box = project_node(value, cut);

    if (cache_) {
        cache_->sweep();
    }
    if (!box) {
        return Value{};
    }
    return box->get();
}

bool Projector::enter(const void* node)
{
    if (!active_.insert(node).second) {
        ++stats_.cycles_cut;
        return false;
    }
    ++stats_.containers_visited;
    return true;
}

std::optional<ValueBox> Projector::project_node(const LiveValue& value, bool& cut)
{
    return std::visit([&](const auto& arg) -> std::optional<ValueBox> {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, LiveRecordPtr>) {
            if (!arg) {
                ++stats_.values_dropped;
                return std::nullopt;
            }
            return project_record(arg, cut);
        } else if constexpr (std::is_same_v<T, LiveArrayPtr>) {
            if (!arg) {
                ++stats_.values_dropped;
                return std::nullopt;
            }
            return project_array(arg, cut);
        } else if constexpr (std::is_same_v<T, ObservablePtr>) {
            if (!arg) {
                ++stats_.values_dropped;
                return std::nullopt;
            }
            return project_observable(arg, cut);
        } else if constexpr (std::is_same_v<T, Opaque>) {
            ++stats_.values_dropped;
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return ValueBox{};
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(arg)) {
                return ValueBox{};
            }
            return ValueBox{Value{arg}};
        } else {
            return ValueBox{Value{arg}};
        }
    }, value.data);
}

std::optional<ValueBox> Projector::project_record(const LiveRecordPtr& record, bool& cut)
{
    const void* id = record.get();
    if (!enter(id)) {
        cut = true;
        return std::nullopt;
    }

    // Copy out of the cache: projecting children may rehash it
    std::optional<ValueBox> previous_box;
    std::uint64_t previous_revision = 0;
    if (cache_) {
        if (const auto* entry = cache_->lookup(record)) {
            previous_box = entry->projection;
            previous_revision = entry->revision;
        }
    }
    const ValueRecord* previous = previous_box ? (*previous_box)->get_if<ValueRecord>() : nullptr;

    bool subtree_cut = false;
    ValueBox result;

    if (previous && previous_revision == record->revision()) {
        // Same fields and scalars as last time; only nested containers can differ
        FieldMap fields = previous->fields;
        bool changed = false;
        bool presence_changed = false;

        for (const auto& [key, child] : *record) {
            if (!is_shared_node(child)) {
                continue;
            }
            auto box = project_node(child, subtree_cut);
            const ValueBox* before = previous->find(key);
            if (box && before && same_node(*box, *before)) {
                continue;
            }
            if (!box && !before) {
                continue;
            }
            changed = true;
            if (box) {
                presence_changed = presence_changed || before == nullptr;
                fields = std::move(fields).set(key, std::move(*box));
            } else {
                presence_changed = true;
                fields = std::move(fields).erase(key);
            }
        }

        if (!changed) {
            ++stats_.containers_reused;
            result = *previous_box;
        } else if (!presence_changed) {
            result = ValueBox{Value{ValueRecord{previous->keys, std::move(fields)}}};
        } else {
            auto order = KeyVector{}.transient();
            for (const auto& field : *record) {
                if (fields.count(field.first) > 0) {
                    order.push_back(field.first);
                }
            }
            result = ValueBox{Value{ValueRecord{order.persistent(), std::move(fields)}}};
        }
    } else {
        result = rebuild_record(*record, subtree_cut);
    }

    leave(id);

    if (cache_) {
        // A cut subtree depends on its ancestry, so it can't be reused elsewhere
        if (subtree_cut) {
            cache_->forget(id);
        } else {
            cache_->store(record, record->revision(), result);
        }
    }
    cut = cut || subtree_cut;
    return result;
}

ValueBox Projector::rebuild_record(const LiveRecord& record, bool& cut)
{
    auto order = KeyVector{}.transient();
    auto fields = FieldMap{}.transient();

    for (const auto& [key, child] : record) {
        auto box = project_node(child, cut);
        if (!box) {
            continue;
        }
        order.push_back(key);
        fields.set(key, std::move(*box));
    }
    return ValueBox{Value{ValueRecord{order.persistent(), fields.persistent()}}};
}

std::optional<ValueBox> Projector::project_array(const LiveArrayPtr& array, bool& cut)
{
    const void* id = array.get();
    if (!enter(id)) {
        cut = true;
        return std::nullopt;
    }

    std::optional<ValueBox> previous_box;
    std::uint64_t previous_revision = 0;
    if (cache_) {
        if (const auto* entry = cache_->lookup(array)) {
            previous_box = entry->projection;
            previous_revision = entry->revision;
        }
    }
    const ValueVector* previous = previous_box ? (*previous_box)->get_if<ValueVector>() : nullptr;

    bool subtree_cut = false;
    ValueBox result;

    if (previous && previous_revision == array->revision() && previous->size() == array->size()) {
        ValueVector items = *previous;
        bool changed = false;

        for (std::size_t i = 0; i < array->size(); ++i) {
            const auto& child = array->at(i);
            if (!is_shared_node(child)) {
                continue;
            }
            // Unprojectable elements keep their slot as null
            ValueBox box = project_node(child, subtree_cut).value_or(ValueBox{});
            if (same_node(box, (*previous)[i])) {
                continue;
            }
            changed = true;
            items = std::move(items).set(i, std::move(box));
        }

        if (!changed) {
            ++stats_.containers_reused;
            result = *previous_box;
        } else {
            result = ValueBox{Value{std::move(items)}};
        }
    } else {
        result = rebuild_array(*array, subtree_cut);
    }

    leave(id);

    if (cache_) {
        if (subtree_cut) {
            cache_->forget(id);
        } else {
            cache_->store(array, array->revision(), result);
        }
    }
    cut = cut || subtree_cut;
    return result;
}

ValueBox Projector::rebuild_array(const LiveArray& array, bool& cut)
{
    auto items = ValueVector{}.transient();
    for (const auto& child : array) {
        items.push_back(project_node(child, cut).value_or(ValueBox{}));
    }
    return ValueBox{Value{items.persistent()}};
}

std::optional<ValueBox> Projector::project_observable(const ObservablePtr& object, bool& cut)
{
    const void* id = object.get();
    if (!enter(id)) {
        cut = true;
        return std::nullopt;
    }

    std::optional<ValueBox> result;
    if (auto plain = object->to_json()) {
        result = project_node(*plain, cut);
    } else {
        auto order = KeyVector{}.transient();
        auto fields = FieldMap{}.transient();
        object->for_each_field([&](std::string_view key, const LiveValue& field) {
            auto box = project_node(field, cut);
            if (!box) {
                return;
            }
            std::string name{key};
            if (fields.count(name) == 0) {
                order.push_back(name);
            }
            fields.set(std::move(name), std::move(*box));
        });
        result = ValueBox{Value{ValueRecord{order.persistent(), fields.persistent()}}};
    }

    leave(id);
    return result;
}

Value project(const LiveValue& value)
{
    Projector projector;
    return projector.project(value);
}

} // namespace state_observer
