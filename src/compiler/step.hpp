#pragma once

#include <string>
#include <variant>

// How a search term is tested against a window's text fields.
enum class SearchMatch { All, Any };

struct SearchStep {
    std::string term;
    SearchMatch match = SearchMatch::All;
    bool operator==(const SearchStep&) const = default;
};

struct GetActiveWindowStep {
    bool operator==(const GetActiveWindowStep&) const = default;
};

struct ActionOnIdStep {
    std::string verb;
    std::string window_id;
    bool operator==(const ActionOnIdStep&) const = default;
};

struct ActionOnStackItemStep {
    std::string verb;
    int index = 1;
    bool operator==(const ActionOnStackItemStep&) const = default;
};

struct ActionOnStackAllStep {
    std::string verb;
    bool operator==(const ActionOnStackAllStep&) const = default;
};

// Prints the identity of every window left on the stack.
struct FinalOutputStep {
    bool operator==(const FinalOutputStep&) const = default;
};

using Step = std::variant<SearchStep, GetActiveWindowStep, ActionOnIdStep,
                          ActionOnStackItemStep, ActionOnStackAllStep, FinalOutputStep>;

// Compile-time inputs that change the emitted text.
struct RenderContext {
    std::string marker;
    bool debug = false;
    bool kde5 = false; // KWin 5 lists windows with clientList()
};
