#include "platform/linux/kwin_dbus_host.hpp"

#include "platform/linux/subprocess.hpp"

#include <charconv>
#include <format>
#include <sstream>

KWinDbusHost::KWinDbusHost(std::string service, uint32_t timeout_ms)
    : service_(std::move(service)), timeout_ms_(timeout_ms) {}

std::expected<int, std::string> KWinDbusHost::load(const std::string& path) {
    auto reply = call(method_call("/Scripting", "org.kde.kwin.Scripting.loadScript",
                                  {"string:" + path}));
    if (!reply) return std::unexpected(reply.error());
    return parse_load_reply(*reply);
}

std::expected<void, std::string> KWinDbusHost::run(int script_id) {
    auto reply = call(method_call(std::format("/Scripting/Script{}", script_id),
                                  "org.kde.kwin.Script.run"));
    if (!reply) return std::unexpected(reply.error());
    return {};
}

std::expected<void, std::string> KWinDbusHost::stop(int script_id) {
    auto reply = call(method_call(std::format("/Scripting/Script{}", script_id),
                                  "org.kde.kwin.Script.stop"));
    if (!reply) return std::unexpected(reply.error());
    return {};
}

std::expected<int, std::string> KWinDbusHost::parse_load_reply(const std::string& reply) {
    std::istringstream in(reply);
    std::string word;
    while (in >> word) {
        if (word != "int32") continue;
        if (!(in >> word)) break;

        int id = 0;
        auto [ptr, ec] = std::from_chars(word.data(), word.data() + word.size(), id);
        if (ec != std::errc{} || ptr != word.data() + word.size()) break;
        if (id < 0) return std::unexpected(std::format("KWin refused to load the script (id {})", id));
        return id;
    }
    return std::unexpected("no script id in loadScript reply");
}

std::vector<std::string> KWinDbusHost::method_call(const std::string& object_path,
                                                   const std::string& method,
                                                   const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {
        "dbus-send",
        "--session",
        "--print-reply",
        std::format("--reply-timeout={}", timeout_ms_),
        "--dest=" + service_,
        object_path,
        method,
    };
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

std::expected<std::string, std::string> KWinDbusHost::call(const std::vector<std::string>& argv) const {
    auto result = platform::run_process(argv);
    if (!result) return std::unexpected(result.error());

    if (result->exit_code == 127) {
        return std::unexpected("dbus-send not found");
    }
    if (result->exit_code != 0) {
        return std::unexpected(std::format("dbus-send {} exited with code {}",
                                           argv[6], result->exit_code));
    }
    return std::move(result->out);
}
