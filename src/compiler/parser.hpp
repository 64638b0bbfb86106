#pragma once

#include "compiler/command.hpp"
#include "compiler/token_stream.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class Parser {
public:
    explicit Parser(TokenStream& tokens);

    // Parse the next command from the stream.
    // Returns nullopt once the stream is exhausted, or an error naming the bad token.
    std::expected<std::optional<CommandIntent>, std::string> next();

    // Parse every remaining command. Fails on the first bad token.
    std::expected<std::vector<CommandIntent>, std::string> parse_all();

    // "%@" -> all, "%N" -> stack index N, anything else -> window id.
    static std::expected<Selector, std::string> parse_selector(const std::string& token);

    // search, getactivewindow or a catalog action.
    static bool is_verb(std::string_view token);

private:
    std::expected<CommandIntent, std::string> parse_search();
    std::expected<CommandIntent, std::string> parse_action(std::string verb);

    TokenStream& tokens_;
};
