#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Every line a script writes is "<marker> <CHANNEL> <payload>".
enum class Channel { Start, Debug, Error, Result, Finish };

namespace protocol {

// Prefix KWin puts in front of print() output in its log.
inline constexpr std::string_view KWIN_LOG_PREFIX = "js: ";

std::string_view channel_name(Channel channel);
std::optional<Channel> parse_channel(std::string_view name);

// Plain-text form of one protocol line.
std::string encode_line(std::string_view marker, Channel channel, std::string_view payload = {});

// Script statement that prints one protocol line. `argument` is a script
// expression appended as the payload; empty means no payload.
std::string print_statement(std::string_view marker, Channel channel,
                            std::string_view argument = {});

// Script string literal for arbitrary text, quotes and control characters escaped.
std::string string_literal(std::string_view text);

struct DecodedLine {
    Channel channel;
    std::string payload;
};

// Parse a single log line. Lines that do not start with prefix + marker, or
// carry an unknown channel, yield nullopt.
std::optional<DecodedLine> decode_line(std::string_view line, std::string_view marker,
                                       std::string_view prefix = KWIN_LOG_PREFIX);

struct DecodedRun {
    bool started = false;
    bool finished = false;
    std::vector<std::string> results;
    std::vector<std::string> errors;
    std::vector<std::string> debug;

    // START seen without FINISH: the script aborted or the log was cut short.
    bool incomplete() const { return started && !finished; }
};

// Demultiplex every line of `log` that belongs to `marker`.
DecodedRun decode(std::string_view log, std::string_view marker,
                  std::string_view prefix = KWIN_LOG_PREFIX);

} // namespace protocol
