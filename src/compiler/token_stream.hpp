#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Ordered command-line tokens with a cursor and one token of lookahead.
class TokenStream {
public:
    explicit TokenStream(std::vector<std::string> tokens);
    TokenStream(int argc, char* argv[], int first = 1);

    bool at_end() const { return pos_ >= tokens_.size(); }

    // Next token without consuming it, nullopt at end.
    std::optional<std::string> peek() const;

    // Consume and return the next token, nullopt at end.
    std::optional<std::string> next();

    // True if the next token exists and looks like an option ("-x", "--foo").
    bool next_is_option() const;

    size_t position() const { return pos_; }

    static bool is_option(const std::string& token);

private:
    std::vector<std::string> tokens_;
    size_t pos_ = 0;
};
