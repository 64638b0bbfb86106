#include "compiler/parser.hpp"

#include "compiler/actions.hpp"

#include <charconv>
#include <format>

Parser::Parser(TokenStream& tokens)
    : tokens_(tokens) {}

std::expected<std::optional<CommandIntent>, std::string> Parser::next() {
    auto token = tokens_.next();
    if (!token) return std::nullopt;

    if (TokenStream::is_option(*token)) {
        return std::unexpected(std::format("unexpected option: {}", *token));
    }

    if (*token == "search") {
        auto intent = parse_search();
        if (!intent) return std::unexpected(intent.error());
        return *intent;
    }

    if (*token == "getactivewindow") {
        return GetActiveWindowIntent{};
    }

    if (actions::contains(*token)) {
        auto intent = parse_action(*token);
        if (!intent) return std::unexpected(intent.error());
        return *intent;
    }

    return std::unexpected(std::format("unknown command: {}", *token));
}

std::expected<std::vector<CommandIntent>, std::string> Parser::parse_all() {
    std::vector<CommandIntent> intents;
    while (true) {
        auto intent = next();
        if (!intent) return std::unexpected(intent.error());
        if (!*intent) break;
        intents.push_back(std::move(**intent));
    }
    return intents;
}

std::expected<CommandIntent, std::string> Parser::parse_search() {
    auto term = tokens_.next();
    if (!term) {
        return std::unexpected("missing search term");
    }
    if (TokenStream::is_option(*term)) {
        return std::unexpected(std::format("missing search term (found option {})", *term));
    }
    return SearchIntent{std::move(*term)};
}

std::expected<CommandIntent, std::string> Parser::parse_action(std::string verb) {
    // Per-action options are reserved; none are defined yet.
    while (tokens_.next_is_option()) {
        tokens_.next();
    }

    Selector selector = StackIndexSelector{1};
    auto peeked = tokens_.peek();
    if (peeked && !is_verb(*peeked)) {
        auto parsed = parse_selector(*peeked);
        if (!parsed) return std::unexpected(parsed.error());
        selector = std::move(*parsed);
        tokens_.next();
    }

    return ActionIntent{std::move(verb), std::move(selector)};
}

std::expected<Selector, std::string> Parser::parse_selector(const std::string& token) {
    if (token.empty() || token.front() != '%') {
        return WindowIdSelector{token};
    }

    if (token == "%@") {
        return StackAllSelector{};
    }

    int index = 0;
    const char* first = token.data() + 1;
    const char* last = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(first, last, index);
    if (first == last || ec != std::errc{} || ptr != last || *first == '-' || *first == '+') {
        return std::unexpected(std::format("invalid window selector: {}", token));
    }
    return StackIndexSelector{index};
}

bool Parser::is_verb(std::string_view token) {
    return token == "search" || token == "getactivewindow" || actions::contains(token);
}
