#include "castd/CommandDispatcher.hpp"

#include <iostream>

#include "castd/CastDevice.hpp"
#include "castd/Errors.hpp"

namespace castd {

namespace {

// Closes the virtual connection and the socket on every exit path.
class ScopedConnection {
   public:
    explicit ScopedConnection(std::unique_ptr<CastChannel> channel)
        : channel_(std::move(channel)) {}

    ~ScopedConnection() {
        try {
            CastDevice(*channel_).disconnect(kReceiverId);
        } catch (const CastError& e) {
            std::cout << "[Command] CLOSE not delivered: " << e.what() << "\n";
        }
        channel_->close();
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    CastChannel& channel() { return *channel_; }

   private:
    std::unique_ptr<CastChannel> channel_;
};

}  // namespace

const char* to_string(Command::Kind kind) {
    switch (kind) {
        case Command::Kind::Play:
            return "Play";
        case Command::Kind::Pause:
            return "Pause";
        case Command::Kind::Stop:
            return "Stop";
        case Command::Kind::Seek:
            return "Seek";
        case Command::Kind::Begin:
            return "Begin";
    }
    return "Unknown";
}

CommandDispatcher::CommandDispatcher(std::shared_ptr<CastConnector> connector, std::string address,
                                     uint16_t port, std::chrono::milliseconds reply_timeout)
    : connector_(std::move(connector)),
      address_(std::move(address)),
      port_(port),
      reply_timeout_(reply_timeout) {}

void CommandDispatcher::resume() { change_media_state(Command::play()); }

void CommandDispatcher::pause() { change_media_state(Command::pause()); }

void CommandDispatcher::stop() { change_media_state(Command::stop()); }

void CommandDispatcher::seek(double seconds) { change_media_state(Command::seek(seconds)); }

void CommandDispatcher::dispatch(const Command& command) {
    if (command.kind == Command::Kind::Begin) {
        // TODO: needs a media library to map the index to a file; casting is
        // started through Caster::begin until then.
        throw ApplicationError("Casting media #" + std::to_string(command.media_index) +
                               " by library index is not supported yet");
    }
    change_media_state(command);
}

void CommandDispatcher::change_media_state(const Command& command) {
    ScopedConnection connection(connector_->open(address_, port_));
    CastDevice device(connection.channel(), reply_timeout_);
    device.connect(kReceiverId);

    auto apps = device.receiver_status();
    if (apps.empty() || apps.front().transport_id.empty()) {
        throw StateError(StateFault::NoActiveMedia,
                         "Cannot change media state. No running application.");
    }
    const std::string transport_id = apps.front().transport_id;
    device.connect(transport_id);

    auto entries = device.media_status(transport_id);
    if (entries.empty()) {
        throw StateError(StateFault::NoActiveMedia, "Cannot change media state. No active media.");
    }
    const int64_t media_session_id = entries.front().media_session_id;

    std::cout << "[Command] " << to_string(command.kind) << " -> " << address_ << " (transport "
              << transport_id << ", mediaSessionId " << media_session_id << ")\n";
    switch (command.kind) {
        case Command::Kind::Play:
            device.play(transport_id, media_session_id);
            break;
        case Command::Kind::Pause:
            device.pause(transport_id, media_session_id);
            break;
        case Command::Kind::Stop:
            device.stop(transport_id, media_session_id);
            break;
        case Command::Kind::Seek:
            device.seek(transport_id, media_session_id, command.seconds);
            break;
        case Command::Kind::Begin:
            throw ApplicationError("Begin is not a playback state change");
    }
}

}  // namespace castd
