#include "compiler/actions.hpp"
#include "compiler/script_compiler.hpp"
#include "compiler/token_stream.hpp"
#include "config.hpp"
#include "platform/linux/journal_log_source.hpp"
#include "platform/linux/kwin_dbus_host.hpp"
#include "platform/linux/temp_script_file.hpp"
#include "platform/platform_paths.hpp"
#include "runner.hpp"

#include <print>
#include <string>

static void usage() {
    std::println("Usage: kdotool [options] <command> [args...]");
    std::println("");
    std::println("Options:");
    std::println("  -h, --help         Show this help");
    std::println("  -d, --debug        Enable debug output");
    std::println("  -n, --dry-run      Don't actually run the script. Just print it to stdout.");
    std::println("  -v, --verbose      Log each step to stderr");
    std::println("  -c, --config PATH  Config file path");
    std::println("");
    std::println("Commands:");
    std::println("  search <term>");
    std::println("  getactivewindow");
    for (const auto& action : actions::all()) {
        std::println("  {} <window>", action.verb);
    }
    std::println("");
    std::println("Window can be specified as:");
    std::println("  %1 - the first window in the stack (default)");
    std::println("  %2 - the second window in the stack");
    std::println("  %@ - all windows in the stack");
    std::println("  <window id> - the window with the given ID");
}

int main(int argc, char* argv[]) {
    TokenStream tokens(argc, argv);
    if (tokens.at_end()) {
        usage();
        return 0;
    }

    bool debug = false;
    bool dry_run = false;
    bool verbose = false;
    std::string config_path;

    // Global options come before the first command
    while (tokens.next_is_option()) {
        auto arg = *tokens.next();
        if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else if (arg == "--debug" || arg == "-d") {
            debug = true;
        } else if (arg == "--dry-run" || arg == "-n") {
            dry_run = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            auto value = tokens.next();
            if (!value) {
                std::println(stderr, "Error: {} requires a path", arg);
                return 1;
            }
            config_path = *value;
        } else {
            std::println(stderr, "Error: unexpected option: {}", arg);
            return 1;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    // The script file's unique name is the marker for this invocation
    auto script_file = TempScriptFile::create(platform::temp_dir(), config.script.prefix);
    if (!script_file) {
        std::println(stderr, "Error: failed to create script file: {}", script_file.error());
        return 1;
    }

    RenderContext ctx{
        .marker = (*script_file)->marker(),
        .debug = debug,
        .kde5 = config.target_kde5(),
    };
    ScriptCompiler compiler(std::move(ctx));
    auto script = compiler.compile(tokens);
    if (!script) {
        std::println(stderr, "Error: {}", script.error());
        return 1;
    }

    if (dry_run) {
        std::print("{}", script->text);
        return 0;
    }

    KWinDbusHost host(config.kwin.service, config.kwin.timeout_ms);
    JournalLogSource journal(config.journal.units);
    Runner runner(config, verbose, host, journal);

    auto run = runner.execute(*script, **script_file);
    if (!run) {
        std::println(stderr, "Error: {}", run.error());
        return 1;
    }

    for (const auto& line : run->results) {
        std::println("{}", line);
    }
    for (const auto& line : run->errors) {
        std::println(stderr, "{}", line);
    }
    return 0;
}
