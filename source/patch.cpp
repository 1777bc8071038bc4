// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// patch.cpp - Patch rendering

#include <state_observer/patch.h>
#include <state_observer/json_pointer.h>

#include <iostream>

namespace state_observer {

std::string PatchOperation::pointer() const
{
    return path_to_json_pointer(path);
}

std::string_view op_to_string(PatchOp op) noexcept
{
    switch (op) {
        case PatchOp::Add:     return "add";
        case PatchOp::Replace: return "replace";
        case PatchOp::Remove:  return "remove";
    }
    return "unknown";
}

std::string patch_to_json(const PatchOperation& patch)
{
    std::string out = "{\"op\":\"";
    out += op_to_string(patch.op);
    out += "\",\"path\":";
    out += value_to_json(Value{patch.pointer()});
    if (patch.op != PatchOp::Remove) {
        out += ",\"value\":";
        out += value_to_json(*patch.value);
    }
    out += '}';
    return out;
}

std::string patches_to_json(const Patches& patches)
{
    std::string out = "[";
    for (std::size_t i = 0; i < patches.size(); ++i) {
        if (i > 0) out += ',';
        out += patch_to_json(patches[i]);
    }
    out += ']';
    return out;
}

void print_patches(const Patches& patches)
{
    if (patches.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& p : patches) {
        std::cout << "  " << op_to_string(p.op) << " " << p.pointer();
        if (p.op != PatchOp::Remove) {
            std::cout << ": " << value_to_json(*p.value);
        }
        std::cout << "\n";
    }
}

} // namespace state_observer
