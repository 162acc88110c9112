#pragma once

/*
===============================================================================
EchoWithPrompts: the media side of a test call
===============================================================================

  MEDIA_START                     -> play the announcement
  MEDIA_BUFFERING_COMPLETED       -> echo caller audio for a while
  echo period elapsed             -> play the goodbye prompt
  MEDIA_BUFFERING_COMPLETED (bye) -> HANGUP

Inbound audio is dropped while a prompt is playing.
===============================================================================
*/

#include <chrono>
#include <string>
#include <utility>

#include "ariwire/core/manager.hpp"
#include "common/media/file_player.hpp"
#include "lcr/log/logger.hpp"
#include "lcr/optional.hpp"


namespace ariwire::examples::media {

class EchoWithPrompts {
public:
    using clock = std::chrono::steady_clock;

    EchoWithPrompts(std::string announce, std::string goodbye, std::chrono::seconds echo_period)
        : announce_(std::move(announce))
        , goodbye_(std::move(goodbye))
        , echo_period_(echo_period)
    {}

    // One step after MediaSession::poll(). Returns true when work was done.
    inline bool step(core::MediaSession& session) {
        using namespace core::protocol::media;
        bool did_work = false;

        session.drain_notices([&](const Notice& n) {
            did_work = true;
            switch (n.type) {
            case NoticeType::MediaStart:
                if (!player_.start(session, announce_)) {
                    (void)session.finish();
                }
                break;
            case NoticeType::BufferingCompleted:
                if (n.argument.find(goodbye_) != std::string::npos) {
                    AW_INFO("[CALL] Goodbye played, hanging up");
                    (void)session.finish();
                }
                else {
                    goodbye_at_ = clock::now() + echo_period_;
                }
                break;
            default:
                break;
            }
        });

        session.drain_errors([&](const ErrorReport& r) {
            AW_DEBUG("[CALL] Media " << to_string(r.error) << ": " << r.detail);
        });

        session.drain_frames([&](const InboundFrame& f) {
            did_work = true;
            if (player_.playing() || f.synthesized) {
                return;
            }
            const Error err = session.send_frame(f.payload);
            if (err != Error::None) {
                AW_DEBUG("[CALL] Echo of frame " << f.sequence << " refused (" << to_string(err) << ")");
            }
        });

        if (goodbye_at_.has() && clock::now() >= goodbye_at_.value()) {
            goodbye_at_.reset();
            if (!player_.start(session, goodbye_)) {
                (void)session.finish();
            }
        }

        did_work |= player_.pump(session);
        return did_work;
    }

private:
    std::string announce_;
    std::string goodbye_;
    std::chrono::seconds echo_period_;
    FilePlayer player_;
    lcr::optional<clock::time_point> goodbye_at_;
};

} // namespace ariwire::examples::media
