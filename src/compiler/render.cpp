#include "compiler/render.hpp"

#include "compiler/actions.hpp"
#include "protocol/output_protocol.hpp"

#include <format>
#include <string_view>

namespace render {

namespace {

using protocol::string_literal;

std::string_view window_list_call(const RenderContext& ctx) {
    return ctx.kde5 ? "workspace.clientList()" : "workspace.windowList()";
}

std::string debug_trace(std::string_view text) {
    return std::format("        output_debug({});\n", string_literal(text));
}

// Catalog fragment for a verb. Verbs are validated by the parser.
std::string_view fragment(const std::string& verb) {
    auto* def = actions::find(verb);
    return def ? def->fragment : std::string_view{};
}

std::string render_search(const SearchStep& s, const RenderContext& ctx) {
    std::string out = "    {\n";
    out += debug_trace("STEP search " + s.term);
    out += std::format("        const re = new RegExp({}, \"i\");\n", string_literal(s.term));
    out += std::format("        const t = {};\n", window_list_call(ctx));
    out += "        window_stack = [];\n"
           "        for (var i = 0; i < t.length; i++) {\n"
           "            var w = t[i];\n"
           "            var candidates = [w.caption, w.resourceClass, w.resourceName, w.windowRole];\n"
           "            output_debug(candidates);\n";
    if (s.match == SearchMatch::Any) {
        out += "            for (var j = 0; j < candidates.length; j++) {\n"
               "                if (candidates[j].search(re) >= 0) {\n"
               "                    window_stack.push(w);\n"
               "                    break;\n"
               "                }\n"
               "            }\n";
    } else {
        out += "            var mismatch = false;\n"
               "            for (var j = 0; j < candidates.length; j++) {\n"
               "                if (candidates[j].search(re) < 0) {\n"
               "                    mismatch = true;\n"
               "                    break;\n"
               "                }\n"
               "            }\n"
               "            if (!mismatch) {\n"
               "                window_stack.push(w);\n"
               "            }\n";
    }
    out += "        }\n"
           "    }\n";
    return out;
}

std::string render_get_active_window(const RenderContext&) {
    std::string out = "    {\n";
    out += debug_trace("STEP getactivewindow");
    out += "        window_stack = [workspace.activeWindow];\n"
           "    }\n";
    return out;
}

std::string render_action_on_id(const ActionOnIdStep& s, const RenderContext& ctx) {
    std::string out = "    {\n";
    out += debug_trace("STEP " + s.verb);
    out += std::format("        const t = {};\n", window_list_call(ctx));
    out += "        for (var i = 0; i < t.length; i++) {\n"
           "            var w = t[i];\n";
    out += std::format("            if (w.internalId == {}) {{\n", string_literal(s.window_id));
    out += std::format("                {}\n", fragment(s.verb));
    out += "                break;\n"
           "            }\n"
           "        }\n"
           "    }\n";
    return out;
}

std::string render_action_on_stack_item(const ActionOnStackItemStep& s, const RenderContext&) {
    auto message = std::format("Invalid window stack selection '{}' (out of range)", s.index);

    std::string out = "    {\n";
    out += debug_trace("STEP " + s.verb);
    out += "        if (window_stack.length > 0) {\n";
    out += std::format("            if ({0} > window_stack.length || {0} < 1) {{\n", s.index);
    out += std::format("                output_error({});\n", string_literal(message));
    out += "            } else {\n";
    out += std::format("                var w = window_stack[{}];\n", s.index - 1);
    out += std::format("                {}\n", fragment(s.verb));
    out += "            }\n"
           "        }\n"
           "    }\n";
    return out;
}

std::string render_action_on_stack_all(const ActionOnStackAllStep& s, const RenderContext&) {
    std::string out = "    {\n";
    out += debug_trace("STEP " + s.verb);
    out += "        for (var i = 0; i < window_stack.length; i++) {\n"
           "            var w = window_stack[i];\n";
    out += std::format("            {}\n", fragment(s.verb));
    out += "        }\n"
           "    }\n";
    return out;
}

std::string render_final_output(const RenderContext&) {
    return "    for (var i = 0; i < window_stack.length; i++) {\n"
           "        output_result(window_stack[i].internalId);\n"
           "    }\n";
}

} // namespace

std::string prologue(const RenderContext& ctx) {
    std::string out;
    out += protocol::print_statement(ctx.marker, Channel::Start) + "\n\n";

    out += "function output_debug(message) {\n";
    if (ctx.debug) {
        out += "    " + protocol::print_statement(ctx.marker, Channel::Debug, "message") + "\n";
    }
    out += "}\n\n";

    out += "function output_error(message) {\n";
    out += "    " + protocol::print_statement(ctx.marker, Channel::Error, "message") + "\n";
    out += "}\n\n";

    out += "function output_result(message) {\n";
    out += "    " + protocol::print_statement(ctx.marker, Channel::Result, "message") + "\n";
    out += "}\n\n";

    out += "function run() {\n"
           "    var window_stack = [];\n";
    return out;
}

std::string epilogue(const RenderContext& ctx) {
    std::string out = "}\n\nrun();\n\n";
    out += protocol::print_statement(ctx.marker, Channel::Finish) + "\n";
    return out;
}

std::string step(const Step& step, const RenderContext& ctx) {
    struct Visitor {
        const RenderContext& ctx;
        std::string operator()(const SearchStep& s) const { return render_search(s, ctx); }
        std::string operator()(const GetActiveWindowStep&) const { return render_get_active_window(ctx); }
        std::string operator()(const ActionOnIdStep& s) const { return render_action_on_id(s, ctx); }
        std::string operator()(const ActionOnStackItemStep& s) const { return render_action_on_stack_item(s, ctx); }
        std::string operator()(const ActionOnStackAllStep& s) const { return render_action_on_stack_all(s, ctx); }
        std::string operator()(const FinalOutputStep&) const { return render_final_output(ctx); }
    };
    return std::visit(Visitor{ctx}, step);
}

} // namespace render
