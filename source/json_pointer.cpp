// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// json_pointer.cpp
// JSON Pointer (RFC 6901) parsing, rendering and lenses

#include <state_observer/json_pointer.h>

#include <algorithm>
#include <cctype>

namespace state_observer {

namespace {

/// Unescape a JSON Pointer segment according to RFC 6901
/// ~1 -> /, ~0 -> ~
std::string unescape_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());

    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] == '~' && i + 1 < segment.size()) {
            if (segment[i + 1] == '1') {
                result += '/';
                ++i;
                continue;
            } else if (segment[i + 1] == '0') {
                result += '~';
                ++i;
                continue;
            }
        }
        result += segment[i];
    }

    return result;
}

/// Canonical array index: digits only, no leading zero (except "0" itself)
bool is_array_index(const std::string& s)
{
    if (s.empty() || s.size() > 19) {
        return false;
    }
    if (s.size() > 1 && s[0] == '0') {
        return false;
    }
    return std::ranges::all_of(s, [](unsigned char c) { return std::isdigit(c); });
}

} // anonymous namespace

Path parse_json_pointer(std::string_view pointer)
{
    if (pointer.empty()) {
        return Path{};
    }

    if (pointer[0] != '/') {
        detail::log_access_error("parse_json_pointer",
                                 "invalid pointer, must start with '/': " + std::string{pointer});
        return Path{};
    }

    Path path;
    pointer = pointer.substr(1);

    while (true) {
        auto pos = pointer.find('/');
        std::string_view segment = (pos == std::string_view::npos)
                                    ? pointer
                                    : pointer.substr(0, pos);

        std::string unescaped = unescape_segment(segment);
        if (is_array_index(unescaped)) {
            path.emplace_back(static_cast<std::size_t>(std::stoull(unescaped)));
        } else {
            path.emplace_back(std::move(unescaped));
        }

        if (pos == std::string_view::npos) {
            break;
        }
        pointer = pointer.substr(pos + 1);
    }

    return path;
}

std::string escape_pointer_segment(std::string_view segment)
{
    std::string result;
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

std::string path_to_json_pointer(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        result += '/';
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += escape_pointer_segment(v);
            } else {
                result += std::to_string(v);
            }
        }, elem);
    }
    return result;
}

// Note: zug::comp() is used instead of operator| because ADL may not
// find zug's operator| when both operands are lager::lens<> instances.
LagerValueLens pointer_lens(const Path& path)
{
    LagerValueLens lens = zug::identity;
    for (const auto& elem : path) {
        if (const auto* key = std::get_if<std::string>(&elem)) {
            lens = zug::comp(lens, key_lens(*key));
        } else {
            lens = zug::comp(lens, index_lens(std::get<std::size_t>(elem)));
        }
    }
    return lens;
}

LagerValueLens json_pointer_lens(std::string_view pointer)
{
    return pointer_lens(parse_json_pointer(pointer));
}

Value get_by_pointer(const Value& data, std::string_view pointer)
{
    return lager::view(json_pointer_lens(pointer), data);
}

Value set_by_pointer(const Value& data, std::string_view pointer, Value new_value)
{
    return lager::set(json_pointer_lens(pointer), data, std::move(new_value));
}

} // namespace state_observer
