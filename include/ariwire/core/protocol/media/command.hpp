#pragma once

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace ariwire::core::protocol::media {

/*
===============================================================================
Media control plane
===============================================================================

Text messages on a media connection are plain commands, never ARI JSON:

  Inbound notifications (peer → us)
    MEDIA_START channel:<name> optimal_frame_size:<n> [key:value ...]
    MEDIA_XOFF                    stop sending until MEDIA_XON
    MEDIA_XON
    MEDIA_BUFFERING_COMPLETED [<argument>]
    HANGUP                        end of stream

  Outbound commands (us → peer)
    START_MEDIA_BUFFERING
    STOP_MEDIA_BUFFERING [<argument>]
    HANGUP

Tokens are separated by single spaces. A token of the form key:value is a
parameter; the first other token after the name is the argument.
===============================================================================
*/

enum class NoticeType : std::uint8_t {
    MediaStart,
    MediaXoff,
    MediaXon,
    BufferingCompleted,
    Hangup,
    Unknown
};

[[nodiscard]]
inline constexpr std::string_view to_string(NoticeType t) noexcept {
    switch (t) {
    case NoticeType::MediaStart:         return "MEDIA_START";
    case NoticeType::MediaXoff:          return "MEDIA_XOFF";
    case NoticeType::MediaXon:           return "MEDIA_XON";
    case NoticeType::BufferingCompleted: return "MEDIA_BUFFERING_COMPLETED";
    case NoticeType::Hangup:             return "HANGUP";
    default:                             return "UNKNOWN";
    }
}

struct Notice {
    NoticeType type{NoticeType::Unknown};
    std::string name;                   // first token as received
    std::string argument;
    std::vector<std::pair<std::string, std::string>> params;
    std::string raw;

    // MEDIA_START shortcuts
    std::string channel;
    std::uint32_t optimal_frame_size{0};

    [[nodiscard]]
    inline std::string_view param(std::string_view key) const noexcept {
        for (const auto& [k, v] : params) {
            if (k == key) return v;
        }
        return {};
    }
};

enum class Command : std::uint8_t {
    StartMediaBuffering,
    StopMediaBuffering,
    Hangup
};

[[nodiscard]]
inline constexpr std::string_view to_string(Command c) noexcept {
    switch (c) {
    case Command::StartMediaBuffering: return "START_MEDIA_BUFFERING";
    case Command::StopMediaBuffering:  return "STOP_MEDIA_BUFFERING";
    case Command::Hangup:              return "HANGUP";
    default:                           return "UNKNOWN";
    }
}

[[nodiscard]]
inline std::string format_command(Command c, std::string_view argument = {}) {
    std::string out(to_string(c));
    if (!argument.empty()) {
        out += ' ';
        out.append(argument.data(), argument.size());
    }
    return out;
}

[[nodiscard]]
inline constexpr NoticeType to_notice_type(std::string_view name) noexcept {
    if (name == "MEDIA_START")               return NoticeType::MediaStart;
    if (name == "MEDIA_XOFF")                return NoticeType::MediaXoff;
    if (name == "MEDIA_XON")                 return NoticeType::MediaXon;
    if (name == "MEDIA_BUFFERING_COMPLETED") return NoticeType::BufferingCompleted;
    if (name == "HANGUP")                    return NoticeType::Hangup;
    return NoticeType::Unknown;
}

// Returns false for an empty message or a malformed optimal_frame_size
[[nodiscard]]
inline bool parse_notice(std::string_view text, Notice& out) {
    out = Notice{};
    out.raw.assign(text.data(), text.size());

    bool first = true;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t end = text.find(' ', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const std::string_view token = text.substr(pos, end - pos);
        pos = end + 1;
        if (token.empty()) {
            continue;
        }
        if (first) {
            out.name.assign(token.data(), token.size());
            out.type = to_notice_type(token);
            first = false;
            continue;
        }
        const std::size_t colon = token.find(':');
        if (colon == std::string_view::npos) {
            if (out.argument.empty()) {
                out.argument.assign(token.data(), token.size());
            }
            continue;
        }
        out.params.emplace_back(std::string(token.substr(0, colon)), std::string(token.substr(colon + 1)));
    }
    if (first) {
        return false;
    }

    out.channel = std::string(out.param("channel"));
    const std::string_view size = out.param("optimal_frame_size");
    if (!size.empty()) {
        const auto [ptr, ec] = std::from_chars(size.data(), size.data() + size.size(), out.optimal_frame_size);
        if (ec != std::errc{} || ptr != size.data() + size.size()) {
            out.optimal_frame_size = 0;
            return false;
        }
    }
    return true;
}

} // namespace ariwire::core::protocol::media
