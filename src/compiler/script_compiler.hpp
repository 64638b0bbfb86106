#pragma once

#include "compiler/command.hpp"
#include "compiler/step.hpp"
#include "compiler/token_stream.hpp"

#include <expected>
#include <string>
#include <vector>

struct CompiledScript {
    std::string text;
    std::vector<Step> steps;
};

// Lowers a command line into a KWin script in a single left-to-right pass.
class ScriptCompiler {
public:
    explicit ScriptCompiler(RenderContext ctx, SearchMatch search_match = SearchMatch::All);

    // Parse and lower every token. On error nothing is returned but the message.
    std::expected<CompiledScript, std::string> compile(TokenStream& tokens) const;

    // Lower already parsed intents.
    CompiledScript compile(const std::vector<CommandIntent>& intents) const;

    const RenderContext& context() const { return ctx_; }

    Step lower(const CommandIntent& intent) const;

private:
    // Appends the step for `intent` and returns whether it was a query.
    bool emit(const CommandIntent& intent, CompiledScript& out) const;
    void finish(bool last_is_query, CompiledScript& out) const;

    RenderContext ctx_;
    SearchMatch search_match_;
};
