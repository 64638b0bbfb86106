#include "compiler/script_compiler.hpp"

#include "compiler/parser.hpp"
#include "compiler/render.hpp"

ScriptCompiler::ScriptCompiler(RenderContext ctx, SearchMatch search_match)
    : ctx_(std::move(ctx)), search_match_(search_match) {}

std::expected<CompiledScript, std::string> ScriptCompiler::compile(TokenStream& tokens) const {
    Parser parser(tokens);
    CompiledScript out;
    out.text = render::prologue(ctx_);

    bool last_is_query = false;
    while (true) {
        auto intent = parser.next();
        if (!intent) return std::unexpected(intent.error());
        if (!*intent) break;
        last_is_query = emit(**intent, out);
    }

    finish(last_is_query, out);
    return out;
}

CompiledScript ScriptCompiler::compile(const std::vector<CommandIntent>& intents) const {
    CompiledScript out;
    out.text = render::prologue(ctx_);

    bool last_is_query = false;
    for (const auto& intent : intents) {
        last_is_query = emit(intent, out);
    }

    finish(last_is_query, out);
    return out;
}

Step ScriptCompiler::lower(const CommandIntent& intent) const {
    if (auto* search = std::get_if<SearchIntent>(&intent)) {
        return SearchStep{search->term, search_match_};
    }
    if (std::holds_alternative<GetActiveWindowIntent>(intent)) {
        return GetActiveWindowStep{};
    }

    const auto& action = std::get<ActionIntent>(intent);
    if (auto* id = std::get_if<WindowIdSelector>(&action.selector)) {
        return ActionOnIdStep{action.verb, id->id};
    }
    if (auto* item = std::get_if<StackIndexSelector>(&action.selector)) {
        return ActionOnStackItemStep{action.verb, item->index};
    }
    return ActionOnStackAllStep{action.verb};
}

bool ScriptCompiler::emit(const CommandIntent& intent, CompiledScript& out) const {
    auto step = lower(intent);
    out.text += render::step(step, ctx_);
    out.steps.push_back(std::move(step));
    return is_query(intent);
}

void ScriptCompiler::finish(bool last_is_query, CompiledScript& out) const {
    if (last_is_query) {
        Step final_output = FinalOutputStep{};
        out.text += render::step(final_output, ctx_);
        out.steps.push_back(std::move(final_output));
    }
    out.text += render::epilogue(ctx_);
}
