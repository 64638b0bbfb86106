#include "compiler/token_stream.hpp"

TokenStream::TokenStream(std::vector<std::string> tokens)
    : tokens_(std::move(tokens)) {}

TokenStream::TokenStream(int argc, char* argv[], int first) {
    for (int i = first; i < argc; i++) {
        tokens_.emplace_back(argv[i]);
    }
}

std::optional<std::string> TokenStream::peek() const {
    if (at_end()) return std::nullopt;
    return tokens_[pos_];
}

std::optional<std::string> TokenStream::next() {
    if (at_end()) return std::nullopt;
    return tokens_[pos_++];
}

bool TokenStream::next_is_option() const {
    return !at_end() && is_option(tokens_[pos_]);
}

bool TokenStream::is_option(const std::string& token) {
    // A lone "-" is a value.
    return token.size() > 1 && token.front() == '-';
}
