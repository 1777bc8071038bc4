// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file patch.h
/// @brief JSON-Patch style operations produced by the diff engine.
///
/// Only add / replace / remove are ever produced. Paths are kept as a Path
/// (string keys and array indices) and rendered as RFC 6901 JSON Pointers
/// on demand; the empty path is the root and renders as "".

#pragma once

#include <state_observer/value.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace state_observer {

enum class PatchOp : std::uint8_t { Add, Replace, Remove };

struct STATE_OBSERVER_API PatchOperation {
    PatchOp op = PatchOp::Add;
    Path path;
    ValueBox value;  // shares the snapshot's node; null for Remove

    PatchOperation() = default;

    PatchOperation(PatchOp o, Path p, ValueBox v = {})
        : op(o), path(std::move(p)), value(std::move(v)) {}

    PatchOperation(PatchOp o, Path p, const Value& v)
        : op(o), path(std::move(p)), value(ValueBox{v}) {}

    [[nodiscard]] const Value& get_value() const { return *value; }

    /// The path as a JSON Pointer ("/objs/0/x")
    [[nodiscard]] std::string pointer() const;

    bool operator==(const PatchOperation& other) const {
        return op == other.op && path == other.path && *value == *other.value;
    }
    bool operator!=(const PatchOperation& other) const { return !(*this == other); }
};

using Patches = std::vector<PatchOperation>;

/// "add", "replace" or "remove"
[[nodiscard]] STATE_OBSERVER_API std::string_view op_to_string(PatchOp op) noexcept;

/// {"op":"replace","path":"/objs/0/x","value":100}; remove has no "value"
[[nodiscard]] STATE_OBSERVER_API std::string patch_to_json(const PatchOperation& patch);

/// JSON array of patch_to_json()
[[nodiscard]] STATE_OBSERVER_API std::string patches_to_json(const Patches& patches);

/// One line per operation to std::cout
STATE_OBSERVER_API void print_patches(const Patches& patches);

} // namespace state_observer
