#pragma once

#include <span>
#include <string_view>

enum class ActionKind { Query, Mutation };

// A catalog verb and the script fragment applied to the window bound to `w`.
struct ActionDef {
    std::string_view verb;
    std::string_view fragment;
    ActionKind kind;
};

namespace actions {

// Exact-match lookup, nullptr for unknown verbs.
const ActionDef* find(std::string_view verb);

bool contains(std::string_view verb);

// All catalog entries in help order.
std::span<const ActionDef> all();

} // namespace actions
