#pragma once

#include <string>
#include <variant>

// Which windows an action applies to.
struct WindowIdSelector {
    std::string id;
    bool operator==(const WindowIdSelector&) const = default;
};

// 1-based position in the window stack. Range is checked when the script runs.
struct StackIndexSelector {
    int index = 1;
    bool operator==(const StackIndexSelector&) const = default;
};

struct StackAllSelector {
    bool operator==(const StackAllSelector&) const = default;
};

using Selector = std::variant<WindowIdSelector, StackIndexSelector, StackAllSelector>;

struct SearchIntent {
    std::string term;
    bool operator==(const SearchIntent&) const = default;
};

struct GetActiveWindowIntent {
    bool operator==(const GetActiveWindowIntent&) const = default;
};

struct ActionIntent {
    std::string verb;
    Selector selector;
    bool operator==(const ActionIntent&) const = default;
};

using CommandIntent = std::variant<SearchIntent, GetActiveWindowIntent, ActionIntent>;

// Search and getactivewindow replace the window stack.
inline bool is_query(const CommandIntent& intent) {
    return !std::holds_alternative<ActionIntent>(intent);
}
