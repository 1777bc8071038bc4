// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) paths for patches and snapshots.
///
/// Patch paths are rendered externally as JSON Pointers:
///   ["objs", 0, "x"]  ->  "/objs/0/x"
///
/// RFC 6901: https://datatracker.ietf.org/doc/html/rfc6901
///
/// - Paths start with "/" (root reference)
/// - Segments separated by "/"
/// - Numeric segments (e.g., "0", "123") are parsed as array indices;
///   applied to a record they address the key of the same spelling
/// - Escape sequences: "~0" -> "~", "~1" -> "/"
/// - Empty pointer "" refers to the whole document

#pragma once

#include <state_observer/value.h>

#include <lager/lens.hpp>
#include <lager/lenses.hpp>
#include <zug/compose.hpp>

#include <string>
#include <string_view>

namespace state_observer {

// ============================================================
// JSON Pointer parsing and conversion
// ============================================================

// Parse JSON Pointer string into Path
//   "/objs/0/x"   -> ["objs", 0, "x"]
//   ""            -> []  (root)
//   "/"           -> [""]  (key is empty string)
[[nodiscard]] STATE_OBSERVER_API Path parse_json_pointer(std::string_view pointer);

// Convert Path to JSON Pointer string ("" for the root)
[[nodiscard]] STATE_OBSERVER_API std::string path_to_json_pointer(const Path& path);

// Escape a single reference token: "~" -> "~0", "/" -> "~1"
[[nodiscard]] STATE_OBSERVER_API std::string escape_pointer_segment(std::string_view segment);

// ============================================================
// Lenses over Value
// ============================================================

using LagerValueLens = lager::lens<Value, Value>;

/// @brief Lens focusing a record field (null when absent)
[[nodiscard]] inline auto key_lens(const std::string& key)
{
    return lager::lenses::getset(
        [key](const Value& obj) -> Value {
            if (auto* rec = obj.get_if<ValueRecord>()) {
                if (auto* found = rec->find(key)) {
                    return found->get();
                }
            }
            return Value{};
        },
        [key](Value obj, Value value) -> Value {
            if (auto* rec = obj.get_if<ValueRecord>()) {
                return Value{rec->set(key, ValueBox{std::move(value)})};
            }
            return obj;
        });
}

/// @brief Lens focusing a sequence element; on a record it focuses the
/// field whose key spells the index
[[nodiscard]] inline auto index_lens(std::size_t index)
{
    return lager::lenses::getset(
        [index](const Value& obj) -> Value {
            if (auto* vec = obj.get_if<ValueVector>()) {
                if (index < vec->size()) {
                    return (*vec)[index].get();
                }
            }
            if (obj.is_record()) {
                return obj.at_or(std::to_string(index), Value{});
            }
            return Value{};
        },
        [index](Value obj, Value value) -> Value {
            if (auto* vec = obj.get_if<ValueVector>()) {
                if (index < vec->size()) {
                    return Value{vec->set(index, ValueBox{std::move(value)})};
                }
            }
            if (obj.is_record()) {
                return obj.set(std::to_string(index), std::move(value));
            }
            return obj;
        });
}

/// @brief Build a type-erased lens from a runtime Path
[[nodiscard]] STATE_OBSERVER_API LagerValueLens pointer_lens(const Path& path);

/// @brief Build a lens from a JSON Pointer string
[[nodiscard]] STATE_OBSERVER_API LagerValueLens json_pointer_lens(std::string_view pointer);

// ============================================================
// Convenience functions
// ============================================================

// Get value by JSON Pointer; null Value if the path does not exist
[[nodiscard]] STATE_OBSERVER_API Value get_by_pointer(const Value& data, std::string_view pointer);

// Replace the value at an existing JSON Pointer; returns the new immutable Value
[[nodiscard]] STATE_OBSERVER_API Value set_by_pointer(const Value& data, std::string_view pointer, Value new_value);

} // namespace state_observer
