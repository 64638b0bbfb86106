#include <catch2/catch_test_macros.hpp>

#include "compiler/script_compiler.hpp"
#include "protocol/output_protocol.hpp"

#include <string>
#include <vector>

namespace {

const std::string MARKER = "kdotool-Ab12Cd";

std::expected<CompiledScript, std::string> compile(std::vector<std::string> args,
                                                   RenderContext ctx = {MARKER, false, false}) {
    TokenStream tokens(std::move(args));
    ScriptCompiler compiler(std::move(ctx));
    return compiler.compile(tokens);
}

size_t count(const std::string& haystack, const std::string& needle) {
    size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("Lowering", "[compiler]") {

    SECTION("SearchThenQueryHasNoFinalOutput") {
        auto script = compile({"search", "firefox", "getwindowname", "%1"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.size() == 2);
        REQUIRE(script->steps[0] == Step{SearchStep{"firefox", SearchMatch::All}});
        REQUIRE(script->steps[1] == Step{ActionOnStackItemStep{"getwindowname", 1}});
    }

    SECTION("SearchAloneAppendsFinalOutput") {
        auto script = compile({"search", "firefox"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.size() == 2);
        REQUIRE(script->steps[0] == Step{SearchStep{"firefox", SearchMatch::All}});
        REQUIRE(std::holds_alternative<FinalOutputStep>(script->steps[1]));
        REQUIRE(script->text.find("output_result(window_stack[i].internalId);") != std::string::npos);
    }

    SECTION("GetActiveWindowAloneAppendsFinalOutput") {
        auto script = compile({"getactivewindow"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.size() == 2);
        REQUIRE(std::holds_alternative<GetActiveWindowStep>(script->steps[0]));
        REQUIRE(std::holds_alternative<FinalOutputStep>(script->steps[1]));
        REQUIRE(script->text.find("window_stack = [workspace.activeWindow];") != std::string::npos);
    }

    SECTION("ActionWithoutSelector") {
        auto script = compile({"windowclose"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.size() == 1);
        REQUIRE(script->steps[0] == Step{ActionOnStackItemStep{"windowclose", 1}});
        REQUIRE(script->text.find("w.closeWindow();") != std::string::npos);
    }

    SECTION("ActionOnAllStackItems") {
        auto script = compile({"search", "konsole", "windowminimize", "%@"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.size() == 2);
        REQUIRE(script->steps[1] == Step{ActionOnStackAllStep{"windowminimize"}});
        REQUIRE(script->text.find("for (var i = 0; i < window_stack.length; i++) {\n"
                                  "            var w = window_stack[i];\n"
                                  "            w.minimized = true;") != std::string::npos);
    }

    SECTION("ActionOnWindowId") {
        auto script = compile({"windowactivate", "{1234-abcd}"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps[0] == Step{ActionOnIdStep{"windowactivate", "{1234-abcd}"}});
        REQUIRE(script->text.find(R"(if (w.internalId == "{1234-abcd}") {)") != std::string::npos);
        REQUIRE(script->text.find("workspace.setActiveWindow(w);") != std::string::npos);
    }

    SECTION("QueryAfterActionAppendsFinalOutput") {
        auto script = compile({"getactivewindow", "windowraise", "search", "dolphin"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.size() == 4);
        REQUIRE(std::holds_alternative<FinalOutputStep>(script->steps.back()));
    }

    SECTION("ActionAfterQueryHasNoFinalOutput") {
        auto script = compile({"search", "dolphin", "getactivewindow", "windowkill"});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.size() == 3);
        REQUIRE_FALSE(std::holds_alternative<FinalOutputStep>(script->steps.back()));
        REQUIRE(script->text.find("window_stack[i].internalId") == std::string::npos);
    }

    SECTION("StepsAppearInCommandLineOrder") {
        auto script = compile({"search", "kate", "windowminimize", "%@", "getactivewindow", "getwindowpid"});
        REQUIRE(script.has_value());
        auto search = script->text.find("STEP search kate");
        auto minimize = script->text.find("STEP windowminimize");
        auto active = script->text.find("STEP getactivewindow");
        auto pid = script->text.find("STEP getwindowpid");
        REQUIRE(search < minimize);
        REQUIRE(minimize < active);
        REQUIRE(active < pid);
    }

    SECTION("EmptyCommandLine") {
        auto script = compile({});
        REQUIRE(script.has_value());
        REQUIRE(script->steps.empty());
        REQUIRE(script->text.find("run();") != std::string::npos);
    }
}

TEST_CASE("Compile errors", "[compiler]") {

    SECTION("UnknownVerbProducesNoScript") {
        auto script = compile({"foobar"});
        REQUIRE_FALSE(script.has_value());
        REQUIRE(script.error().find("foobar") != std::string::npos);
    }

    SECTION("ErrorAfterValidCommands") {
        auto script = compile({"search", "firefox", "windowclose", "%@", "search"});
        REQUIRE_FALSE(script.has_value());
        REQUIRE(script.error() == "missing search term");
    }
}

TEST_CASE("Rendered script", "[compiler]") {

    SECTION("StackIndexCheckedAtRuntime") {
        auto script = compile({"search", "firefox", "windowraise", "%5"});
        REQUIRE(script.has_value());
        REQUIRE(script->text.find("if (5 > window_stack.length || 5 < 1) {") != std::string::npos);
        REQUIRE(script->text.find("output_error(\"Invalid window stack selection '5' (out of range)\");")
                != std::string::npos);
        REQUIRE(script->text.find("var w = window_stack[4];") != std::string::npos);
    }

    SECTION("EveryPrintCarriesTheMarker") {
        auto script = compile({"search", "firefox", "getwindowgeometry", "%@"}, {MARKER, true, false});
        REQUIRE(script.has_value());
        REQUIRE(count(script->text, "print(") == 5);
        REQUIRE(count(script->text, "print(\"" + MARKER + " ") == 5);
        REQUIRE(script->text.starts_with("print(\"" + MARKER + " START\");"));
        REQUIRE(script->text.ends_with("print(\"" + MARKER + " FINISH\");\n"));
    }

    SECTION("DebugPrintOnlyWhenEnabled") {
        auto quiet = compile({"getactivewindow"}, {MARKER, false, false});
        auto loud = compile({"getactivewindow"}, {MARKER, true, false});
        REQUIRE(quiet->text.find(MARKER + " DEBUG") == std::string::npos);
        REQUIRE(loud->text.find("print(\"" + MARKER + " DEBUG\", message);") != std::string::npos);
        // Traces are emitted either way, the helper decides whether they print
        REQUIRE(quiet->text.find("output_debug(\"STEP getactivewindow\");") != std::string::npos);
    }

    SECTION("WindowEnumerationFollowsKWinVersion") {
        auto kwin6 = compile({"search", "x"}, {MARKER, false, false});
        auto kwin5 = compile({"search", "x"}, {MARKER, false, true});
        REQUIRE(kwin6->text.find("workspace.windowList()") != std::string::npos);
        REQUIRE(kwin6->text.find("workspace.clientList()") == std::string::npos);
        REQUIRE(kwin5->text.find("workspace.clientList()") != std::string::npos);
        REQUIRE(kwin5->text.find("workspace.windowList()") == std::string::npos);
    }

    SECTION("SearchTermIsEscaped") {
        auto script = compile({"search", R"(a"b\d)"});
        REQUIRE(script.has_value());
        REQUIRE(script->text.find(R"(new RegExp("a\"b\\d", "i");)") != std::string::npos);
    }

    SECTION("AllFieldsMustMatchByDefault") {
        auto script = compile({"search", "x"});
        REQUIRE(script->text.find("var mismatch = false;") != std::string::npos);
        REQUIRE(script->text.find("search(re) >= 0") == std::string::npos);
    }

    SECTION("AnyFieldModeThroughTheApi") {
        ScriptCompiler compiler({MARKER, false, false}, SearchMatch::Any);
        auto script = compiler.compile(std::vector<CommandIntent>{SearchIntent{"x"}});
        REQUIRE(script.steps[0] == Step{SearchStep{"x", SearchMatch::Any}});
        REQUIRE(script.text.find("search(re) >= 0") != std::string::npos);
        REQUIRE(script.text.find("var mismatch") == std::string::npos);
    }

    SECTION("MultipleSearchesDoNotRedeclare") {
        auto script = compile({"search", "a", "search", "b"});
        REQUIRE(script.has_value());
        // Each step is its own block so const declarations do not collide
        REQUIRE(count(script->text, "    {\n        output_debug(") == 2);
    }

    SECTION("Idempotent") {
        std::vector<std::string> args = {"search", "firefox", "windowminimize", "%@", "getactivewindow"};
        auto first = compile(args, {MARKER, true, false});
        auto second = compile(args, {MARKER, true, false});
        REQUIRE(first->text == second->text);
    }
}

TEST_CASE("Compiled output decodes", "[compiler][protocol]") {
    auto script = compile({"search", "firefox"});
    REQUIRE(script.has_value());

    // What KWin would log for a run that found two windows
    std::string log = "js: " + MARKER + " START\n"
                      "js: " + MARKER + " RESULT {aaa}\n"
                      "js: " + MARKER + " RESULT {bbb}\n"
                      "js: " + MARKER + " FINISH\n";
    auto run = protocol::decode(log, MARKER);
    REQUIRE(run.started);
    REQUIRE(run.finished);
    REQUIRE(run.results == std::vector<std::string>{"{aaa}", "{bbb}"});
}
