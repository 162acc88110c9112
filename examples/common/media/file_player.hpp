#pragma once

/*
===============================================================================
FilePlayer: streams a ulaw file over a media session
===============================================================================

The file is bracketed by START_MEDIA_BUFFERING / STOP_MEDIA_BUFFERING <name>
so the peer reports MEDIA_BUFFERING_COMPLETED <name> once it has played it.

send_frame() never blocks: frames refused by XOFF or a full transport queue
stay in the player and are retried on the next pump().
===============================================================================
*/

#include <cstddef>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include "ariwire/core/manager.hpp"
#include "lcr/log/logger.hpp"


namespace ariwire::examples::media {

// Reads a whole binary file. Returns false when it cannot be opened.
[[nodiscard]]
inline bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

class FilePlayer {
public:
    using Error = core::protocol::media::Error;
    using Command = core::protocol::media::Command;

    // Loads `path` and announces it. Returns false (and logs) when the file
    // cannot be read or the announcement cannot be sent.
    [[nodiscard]]
    inline bool start(core::MediaSession& session, std::string path) {
        if (!read_file(path, audio_)) {
            AW_ERROR("[PLAYER] Cannot read '" << path << "'");
            return false;
        }
        const Error err = session.send_command(Command::StartMediaBuffering);
        if (err != Error::None) {
            AW_WARN("[PLAYER] START_MEDIA_BUFFERING not sent (" << core::protocol::media::to_string(err) << ")");
            return false;
        }
        name_ = std::move(path);
        offset_ = 0;
        playing_ = true;
        AW_INFO("[PLAYER] Playing '" << name_ << "' (" << audio_.size() << " bytes)");
        return true;
    }

    // Sends what the session accepts. Returns true when anything was sent.
    inline bool pump(core::MediaSession& session) {
        if (!playing_) {
            return false;
        }
        const std::size_t before = offset_;
        offset_ += session.send_audio(std::string_view(audio_).substr(offset_));
        if (offset_ >= audio_.size()) {
            playing_ = false;
            const Error err = session.send_command(Command::StopMediaBuffering, name_);
            if (err != Error::None) {
                AW_WARN("[PLAYER] STOP_MEDIA_BUFFERING not sent (" << core::protocol::media::to_string(err) << ")");
            }
            AW_INFO("[PLAYER] Stopping '" << name_ << "'");
        }
        return offset_ != before;
    }

    [[nodiscard]] inline bool playing() const noexcept { return playing_; }
    [[nodiscard]] inline const std::string& name() const noexcept { return name_; }
    [[nodiscard]] inline std::size_t sent() const noexcept { return offset_; }

private:
    std::string audio_;
    std::string name_;
    std::size_t offset_{0};
    bool playing_{false};
};

} // namespace ariwire::examples::media
