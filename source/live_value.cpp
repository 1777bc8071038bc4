// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <state_observer/live_value.h>

#include <stdexcept>

namespace state_observer {

// ============================================================
// Observable
// ============================================================

Observable::~Observable() = default;

std::optional<LiveValue> Observable::to_json() const
{
    return std::nullopt;
}

void Observable::for_each_field(const FieldVisitor& /*visit*/) const {}

// ============================================================
// LiveValue factories
// ============================================================

LiveValue LiveValue::record(std::initializer_list<std::pair<std::string, LiveValue>> init)
{
    return LiveValue{LiveRecord::make(init)};
}

LiveValue LiveValue::array(std::initializer_list<LiveValue> init)
{
    return LiveValue{LiveArray::make(init)};
}

// ============================================================
// LiveRecord
// ============================================================

LiveRecordPtr LiveRecord::make(std::initializer_list<Field> init)
{
    auto record = std::make_shared<LiveRecord>();
    for (const auto& [key, value] : init) {
        record->set(key, value);
    }
    return record;
}

LiveRecord& LiveRecord::set(std::string_view key, LiveValue value)
{
    // Heterogeneous lookup - no allocation if key exists
    auto it = index_.find(key);
    if (it != index_.end()) {
        auto& slot = fields_[it->second].second;
        if (slot == value) {
            return *this;
        }
        slot = std::move(value);
    } else {
        index_.emplace(std::string{key}, fields_.size());
        fields_.emplace_back(std::string{key}, std::move(value));
    }
    ++revision_;
    return *this;
}

const LiveValue* LiveRecord::get(std::string_view key) const
{
    auto it = index_.find(key);
    if (it == index_.end()) return nullptr;
    return &fields_[it->second].second;
}

const LiveValue& LiveRecord::at(std::string_view key) const
{
    if (const auto* value = get(key)) {
        return *value;
    }
    throw std::out_of_range("LiveRecord::at: no field '" + std::string{key} + "'");
}

bool LiveRecord::erase(std::string_view key)
{
    auto it = index_.find(key);
    if (it == index_.end()) return false;

    const std::size_t pos = it->second;
    index_.erase(it);
    fields_.erase(fields_.begin() + static_cast<std::ptrdiff_t>(pos));

    // Fields after the erased one moved down by one slot
    for (std::size_t i = pos; i < fields_.size(); ++i) {
        index_[fields_[i].first] = i;
    }
    ++revision_;
    return true;
}

void LiveRecord::clear()
{
    if (fields_.empty()) return;
    fields_.clear();
    index_.clear();
    ++revision_;
}

bool LiveRecord::contains(std::string_view key) const
{
    return index_.find(key) != index_.end();
}

// ============================================================
// LiveArray
// ============================================================

LiveArrayPtr LiveArray::make(std::initializer_list<LiveValue> init)
{
    auto array = std::make_shared<LiveArray>();
    array->items_.assign(init.begin(), init.end());
    return array;
}

void LiveArray::push_back(LiveValue value)
{
    items_.push_back(std::move(value));
    ++revision_;
}

void LiveArray::pop_back()
{
    if (items_.empty()) {
        throw std::out_of_range("LiveArray::pop_back: array is empty");
    }
    items_.pop_back();
    ++revision_;
}

void LiveArray::insert(std::size_t index, LiveValue value)
{
    if (index > items_.size()) {
        throw std::out_of_range("LiveArray::insert: index " + std::to_string(index) + " out of range");
    }
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
    ++revision_;
}

void LiveArray::erase(std::size_t index)
{
    if (index >= items_.size()) {
        throw std::out_of_range("LiveArray::erase: index " + std::to_string(index) + " out of range");
    }
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(index));
    ++revision_;
}

void LiveArray::set(std::size_t index, LiveValue value)
{
    if (index >= items_.size()) {
        throw std::out_of_range("LiveArray::set: index " + std::to_string(index) + " out of range");
    }
    if (items_[index] == value) {
        return;
    }
    items_[index] = std::move(value);
    ++revision_;
}

const LiveValue& LiveArray::at(std::size_t index) const
{
    if (index >= items_.size()) {
        throw std::out_of_range("LiveArray::at: index " + std::to_string(index) + " out of range");
    }
    return items_[index];
}

void LiveArray::resize(std::size_t size)
{
    if (size == items_.size()) return;
    items_.resize(size);
    ++revision_;
}

void LiveArray::clear()
{
    if (items_.empty()) return;
    items_.clear();
    ++revision_;
}

} // namespace state_observer
