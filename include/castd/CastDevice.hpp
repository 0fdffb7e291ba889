#pragma once

#include <json/json.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "castd/CastChannel.hpp"
#include "castd/MediaStatus.hpp"

namespace castd {

namespace ns {
constexpr const char* kConnection = "urn:x-cast:com.google.cast.tp.connection";
constexpr const char* kHeartbeat = "urn:x-cast:com.google.cast.tp.heartbeat";
constexpr const char* kReceiver = "urn:x-cast:com.google.cast.receiver";
constexpr const char* kMedia = "urn:x-cast:com.google.cast.media";
}  // namespace ns

constexpr const char* kSenderId = "sender-0";
constexpr const char* kReceiverId = "receiver-0";
constexpr const char* kDefaultMediaReceiverAppId = "CC1AD845";

enum class MessageKind { Connection, Heartbeat, Receiver, Media, Unparsed };

const char* to_string(MessageKind kind);

struct DeviceMessage {
    MessageKind kind = MessageKind::Unparsed;
    std::string source_id;
    std::string type;  // payload "type", empty when unparsed
    Json::Value payload;
    std::string raw;
};

struct Application {
    std::string app_id;
    std::string display_name;
    std::string session_id;
    std::string transport_id;
    std::string status_text;
};

struct MediaInfo {
    std::string content_id;
    std::string content_type = "video/mp4";
    std::string stream_type = "BUFFERED";
};

std::vector<Application> parse_applications(const Json::Value& receiver_status);
std::vector<MediaEntry> parse_media_entries(const Json::Value& media_status);

/**
 * Typed Cast V2 operations on top of one CastChannel.
 *
 * Request/reply calls stamp a requestId and read until a reply with that
 * requestId arrives on the request's namespace, answering heartbeat PINGs meanwhile. A reply that does not show
 * up within the reply timeout is a ProtocolError.
 */
class CastDevice {
   public:
    // first_request_id continues the numbering of an earlier CastDevice on
    // the same channel, so a late reply to its requests cannot match ours.
    explicit CastDevice(CastChannel& channel,
                        std::chrono::milliseconds reply_timeout = std::chrono::seconds(10),
                        int first_request_id = 1);

    // Virtual connection open/close; no reply is expected.
    void connect(const std::string& destination_id);
    void disconnect(const std::string& destination_id);

    void pong();

    std::vector<Application> receiver_status();
    Application launch(const std::string& app_id);

    std::vector<MediaEntry> load(const std::string& transport_id, const std::string& session_id,
                                 const MediaInfo& media);
    std::vector<MediaEntry> media_status(const std::string& transport_id);

    void play(const std::string& transport_id, int64_t media_session_id);
    void pause(const std::string& transport_id, int64_t media_session_id);
    void stop(const std::string& transport_id, int64_t media_session_id);
    // resumeState is left out so the player keeps its current state.
    void seek(const std::string& transport_id, int64_t media_session_id, double seconds);

    std::optional<DeviceMessage> receive(std::chrono::milliseconds timeout);

    int next_request_id() const { return request_id_; }

   private:
    void send(const char* namespace_name, const std::string& destination_id,
              const Json::Value& payload);
    Json::Value request(const char* namespace_name, const std::string& destination_id,
                        Json::Value payload);
    std::vector<MediaEntry> media_request(const std::string& transport_id, Json::Value payload);

    CastChannel& channel_;
    std::chrono::milliseconds reply_timeout_;
    int request_id_ = 1;
};

}  // namespace castd
