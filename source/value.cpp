// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// value.cpp - Value type utilities

#include <state_observer/value.h>

#include <cmath>
#include <cstdio>
#include <sstream>

namespace state_observer {

namespace {

std::string format_double(double d)
{
    if (!std::isfinite(d)) {
        return "null";
    }
    // Integral doubles print without a fraction, like JSON.stringify
    if (d == std::floor(d) && std::fabs(d) < 1e15) {
        std::ostringstream oss;
        oss << static_cast<int64_t>(d);
        return oss.str();
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.17g", d);
    return buf;
}

void append_json_string(std::string& out, std::string_view s)
{
    out += '"';
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
}

void append_json(std::string& out, const Value& val)
{
    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            out += format_double(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            append_json_string(out, arg);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            out += '[';
            bool first = true;
            for (const auto& box : arg) {
                if (!first) out += ',';
                first = false;
                append_json(out, *box);
            }
            out += ']';
        } else if constexpr (std::is_same_v<T, ValueRecord>) {
            out += '{';
            bool first = true;
            arg.for_each([&](const std::string& key, const ValueBox& box) {
                if (!first) out += ',';
                first = false;
                append_json_string(out, key);
                out += ':';
                append_json(out, *box);
            });
            out += '}';
        } else {
            out += "null";
        }
    }, val.data);
}

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            return format_double(arg);
        } else if constexpr (std::is_same_v<T, ValueRecord>) {
            return "{record:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[vector:" + std::to_string(arg.size()) + "]";
        } else {
            return "null";
        }
    }, val.data);
}

std::string value_to_json(const Value& val)
{
    std::string out;
    append_json(out, val);
    return out;
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    std::visit(
        [&](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;

            if constexpr (std::is_same_v<T, ValueRecord>) {
                arg.for_each([&](const std::string& key, const ValueBox& box) {
                    std::cout << std::string(depth * 2, ' ') << prefix << key << ":\n";
                    print_value(*box, "", depth + 1);
                });
            } else if constexpr (std::is_same_v<T, ValueVector>) {
                for (std::size_t i = 0; i < arg.size(); ++i) {
                    std::cout << std::string(depth * 2, ' ') << prefix << "[" << i << "]:\n";
                    print_value(*arg[i], "", depth + 1);
                }
            } else {
                std::cout << std::string(depth * 2, ' ') << prefix << value_to_string(val) << "\n";
            }
        },
        val.data);
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += "." + v;
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, elem);
    }
    return result;
}

// ============================================================
// Explicit Template Instantiations
// ============================================================

template struct BasicValue<thread_safe_memory_policy>;
template struct BasicValueRecord<thread_safe_memory_policy>;

} // namespace state_observer
