#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "castd/CastChannel.hpp"

namespace castd {

struct Command {
    enum class Kind { Play, Pause, Stop, Seek, Begin };

    Kind kind = Kind::Play;
    double seconds = 0.0;      // Seek
    uint32_t media_index = 0;  // Begin

    static Command play() { return Command{Kind::Play}; }
    static Command pause() { return Command{Kind::Pause}; }
    static Command stop() { return Command{Kind::Stop}; }
    static Command seek(double seconds) { return Command{Kind::Seek, seconds}; }
    static Command begin(uint32_t media_index) { return Command{Kind::Begin, 0.0, media_index}; }
};

const char* to_string(Command::Kind kind);

/**
 * Issues playback commands against whatever media session is running on the
 * device. Every call opens its own connection, looks up the transport and
 * media session ids fresh, and closes the connection before returning.
 *
 * Throws StateError(NoActiveMedia) without sending a command when the device
 * has no running application or no media entry.
 */
class CommandDispatcher {
   public:
    CommandDispatcher(std::shared_ptr<CastConnector> connector, std::string address,
                      uint16_t port = kCastPort,
                      std::chrono::milliseconds reply_timeout = std::chrono::seconds(10));

    void resume();
    void pause();
    void stop();
    void seek(double seconds);

    // Begin(index) is answered with ApplicationError.
    void dispatch(const Command& command);

   private:
    void change_media_state(const Command& command);

    std::shared_ptr<CastConnector> connector_;
    std::string address_;
    uint16_t port_;
    std::chrono::milliseconds reply_timeout_;
};

}  // namespace castd
