#include "protocol/output_protocol.hpp"

#include <array>
#include <format>
#include <nlohmann/json.hpp>
#include <utility>

namespace protocol {

namespace {

constexpr std::array<std::pair<Channel, std::string_view>, 5> CHANNELS = {{
    {Channel::Start, "START"},
    {Channel::Debug, "DEBUG"},
    {Channel::Error, "ERROR"},
    {Channel::Result, "RESULT"},
    {Channel::Finish, "FINISH"},
}};

} // namespace

std::string_view channel_name(Channel channel) {
    for (const auto& [c, name] : CHANNELS) {
        if (c == channel) return name;
    }
    return {};
}

std::optional<Channel> parse_channel(std::string_view name) {
    for (const auto& [c, n] : CHANNELS) {
        if (n == name) return c;
    }
    return std::nullopt;
}

std::string encode_line(std::string_view marker, Channel channel, std::string_view payload) {
    if (payload.empty()) {
        return std::format("{} {}", marker, channel_name(channel));
    }
    return std::format("{} {} {}", marker, channel_name(channel), payload);
}

std::string print_statement(std::string_view marker, Channel channel, std::string_view argument) {
    // print() joins its arguments with a single space.
    auto head = string_literal(encode_line(marker, channel));
    if (argument.empty()) {
        return std::format("print({});", head);
    }
    return std::format("print({}, {});", head, argument);
}

std::string string_literal(std::string_view text) {
    // A JSON string is a valid script string literal. Invalid UTF-8 is replaced
    // rather than thrown on.
    return nlohmann::json(std::string(text))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<DecodedLine> decode_line(std::string_view line, std::string_view marker,
                                       std::string_view prefix) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (!line.starts_with(prefix)) return std::nullopt;
    line.remove_prefix(prefix.size());

    if (!line.starts_with(marker)) return std::nullopt;
    line.remove_prefix(marker.size());

    // Marker must be followed by a space, otherwise it is a longer marker.
    if (!line.starts_with(' ')) return std::nullopt;
    line.remove_prefix(1);

    auto space = line.find(' ');
    auto name = line.substr(0, space);
    auto channel = parse_channel(name);
    if (!channel) return std::nullopt;

    DecodedLine decoded{*channel, {}};
    if (space != std::string_view::npos) {
        decoded.payload = std::string(line.substr(space + 1));
    }
    return decoded;
}

DecodedRun decode(std::string_view log, std::string_view marker, std::string_view prefix) {
    DecodedRun run;

    while (!log.empty()) {
        auto eol = log.find('\n');
        auto line = log.substr(0, eol);
        log.remove_prefix(eol == std::string_view::npos ? log.size() : eol + 1);

        auto decoded = decode_line(line, marker, prefix);
        if (!decoded) continue;

        switch (decoded->channel) {
            case Channel::Start:
                run.started = true;
                break;
            case Channel::Finish:
                run.finished = true;
                break;
            case Channel::Debug:
                run.debug.push_back(std::move(decoded->payload));
                break;
            case Channel::Error:
                run.errors.push_back(std::move(decoded->payload));
                break;
            case Channel::Result:
                run.results.push_back(std::move(decoded->payload));
                break;
        }
    }

    return run;
}

} // namespace protocol
