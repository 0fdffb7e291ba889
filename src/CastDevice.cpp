#include "castd/CastDevice.hpp"

#include <iostream>

#include "castd/CastFrame.hpp"
#include "castd/Errors.hpp"
#include "castd/JsonUtil.hpp"

namespace castd {

namespace {

MessageKind kind_of(const std::string& namespace_name) {
    if (namespace_name == ns::kConnection) return MessageKind::Connection;
    if (namespace_name == ns::kHeartbeat) return MessageKind::Heartbeat;
    if (namespace_name == ns::kReceiver) return MessageKind::Receiver;
    if (namespace_name == ns::kMedia) return MessageKind::Media;
    return MessageKind::Unparsed;
}

// Error replies the receiver and media namespaces can answer with.
bool is_error_reply(const std::string& type) {
    return type == "LAUNCH_ERROR" || type == "LOAD_FAILED" || type == "LOAD_CANCELLED" ||
           type == "INVALID_REQUEST" || type == "INVALID_PLAYER_STATE";
}

void expect_reply(const Json::Value& reply, const char* expected, const std::string& what) {
    const Json::Value& type_value = reply["type"];
    const std::string type = type_value.isString() ? type_value.asString() : "";
    if (type == expected) return;
    std::string message = what + " failed: " + (type.empty() ? "untyped reply" : type);
    const Json::Value& reason_value = reply["reason"];
    const std::string reason = reason_value.isString() ? reason_value.asString() : "";
    if (!reason.empty()) message += " (" + reason + ")";
    if (!is_error_reply(type)) message += ", expected " + std::string(expected);
    throw ProtocolError(message);
}

}  // namespace

const char* to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Connection:
            return "Connection";
        case MessageKind::Heartbeat:
            return "Heartbeat";
        case MessageKind::Receiver:
            return "Receiver";
        case MessageKind::Media:
            return "Media";
        case MessageKind::Unparsed:
            return "Unparsed";
    }
    return "Unparsed";
}

std::vector<Application> parse_applications(const Json::Value& receiver_status) {
    std::vector<Application> apps;
    const Json::Value& list = receiver_status["status"]["applications"];
    if (!list.isArray()) return apps;

    try {
        for (const auto& item : list) {
            Application app;
            app.app_id = item.get("appId", "").asString();
            app.display_name = item.get("displayName", "").asString();
            app.session_id = item.get("sessionId", "").asString();
            app.transport_id = item.get("transportId", "").asString();
            app.status_text = item.get("statusText", "").asString();
            apps.push_back(std::move(app));
        }
    } catch (const Json::Exception& e) {
        throw ProtocolError(std::string("Malformed RECEIVER_STATUS: ") + e.what());
    }
    return apps;
}

std::vector<MediaEntry> parse_media_entries(const Json::Value& media_status) {
    std::vector<MediaEntry> entries;
    const Json::Value& list = media_status["status"];
    if (!list.isArray()) return entries;

    try {
        for (const auto& item : list) {
            MediaEntry entry;
            const std::string state = item.get("playerState", "IDLE").asString();
            auto player_state = parse_player_state(state);
            if (!player_state) {
                throw ProtocolError("Unknown player state: " + state);
            }
            entry.player_state = *player_state;
            entry.media_session_id = item.get("mediaSessionId", 0).asInt64();
            entry.current_time = item.get("currentTime", 0.0).asDouble();

            const Json::Value& duration = item["media"]["duration"];
            if (duration.isNumeric()) {
                entry.duration = duration.asDouble();
            }
            entries.push_back(entry);
        }
    } catch (const Json::Exception& e) {
        throw ProtocolError(std::string("Malformed MEDIA_STATUS: ") + e.what());
    }
    return entries;
}

CastDevice::CastDevice(CastChannel& channel, std::chrono::milliseconds reply_timeout,
                       int first_request_id)
    : channel_(channel), reply_timeout_(reply_timeout), request_id_(first_request_id) {}

void CastDevice::send(const char* namespace_name, const std::string& destination_id,
                      const Json::Value& payload) {
    channel_.send(make_string_message(kSenderId, destination_id, namespace_name,
                                      write_compact(payload)));
}

void CastDevice::connect(const std::string& destination_id) {
    Json::Value payload;
    payload["type"] = "CONNECT";
    send(ns::kConnection, destination_id, payload);
}

void CastDevice::disconnect(const std::string& destination_id) {
    Json::Value payload;
    payload["type"] = "CLOSE";
    send(ns::kConnection, destination_id, payload);
}

void CastDevice::pong() {
    Json::Value payload;
    payload["type"] = "PONG";
    send(ns::kHeartbeat, kReceiverId, payload);
}

std::optional<DeviceMessage> CastDevice::receive(std::chrono::milliseconds timeout) {
    auto message = channel_.receive(timeout);
    if (!message) return std::nullopt;

    DeviceMessage out;
    out.source_id = message->source_id();
    out.kind = kind_of(message->namespace_());
    if (message->payload_type() != cast_channel::CastMessage::STRING) {
        out.kind = MessageKind::Unparsed;
        out.raw = message->payload_binary();
        return out;
    }

    out.raw = message->payload_utf8();
    auto payload = parse_json(out.raw);
    if (!payload || !payload->isObject()) {
        out.kind = MessageKind::Unparsed;
        return out;
    }
    const Json::Value& type = (*payload)["type"];
    out.type = type.isString() ? type.asString() : "";
    out.payload = std::move(*payload);
    return out;
}

Json::Value CastDevice::request(const char* namespace_name, const std::string& destination_id,
                                Json::Value payload) {
    const int request_id = request_id_++;
    const MessageKind reply_kind = kind_of(namespace_name);
    const std::string type = payload["type"].asString();
    payload["requestId"] = request_id;
    send(namespace_name, destination_id, payload);

    const auto deadline = std::chrono::steady_clock::now() + reply_timeout_;
    for (;;) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw ProtocolError("No reply to " + type + " (requestId " +
                                std::to_string(request_id) + ")");
        }
        auto message =
            receive(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (!message) continue;

        if (message->kind == MessageKind::Heartbeat && message->type == "PING") {
            pong();
            continue;
        }
        const Json::Value& reply_id = message->payload["requestId"];
        if (message->kind == reply_kind && reply_id.isIntegral() &&
            reply_id.asInt64() == request_id) {
            return message->payload;
        }
        std::cout << "[Cast] Skipping " << to_string(message->kind) << " message while waiting for "
                  << type << ": " << message->raw << "\n";
    }
}

std::vector<Application> CastDevice::receiver_status() {
    Json::Value payload;
    payload["type"] = "GET_STATUS";
    auto reply = request(ns::kReceiver, kReceiverId, payload);
    expect_reply(reply, "RECEIVER_STATUS", "GET_STATUS");
    return parse_applications(reply);
}

Application CastDevice::launch(const std::string& app_id) {
    Json::Value payload;
    payload["type"] = "LAUNCH";
    payload["appId"] = app_id;
    auto reply = request(ns::kReceiver, kReceiverId, payload);
    expect_reply(reply, "RECEIVER_STATUS", "LAUNCH " + app_id);

    for (auto& app : parse_applications(reply)) {
        if (app.app_id == app_id && !app.transport_id.empty()) {
            return app;
        }
    }
    throw ProtocolError("Application " + app_id + " is not running after LAUNCH");
}

std::vector<MediaEntry> CastDevice::media_request(const std::string& transport_id,
                                                  Json::Value payload) {
    const std::string type = payload["type"].asString();
    auto reply = request(ns::kMedia, transport_id, std::move(payload));
    expect_reply(reply, "MEDIA_STATUS", type);
    return parse_media_entries(reply);
}

std::vector<MediaEntry> CastDevice::load(const std::string& transport_id,
                                         const std::string& session_id, const MediaInfo& media) {
    Json::Value payload;
    payload["type"] = "LOAD";
    payload["sessionId"] = session_id;
    payload["autoplay"] = true;
    payload["currentTime"] = 0.0;
    payload["media"]["contentId"] = media.content_id;
    payload["media"]["contentType"] = media.content_type;
    payload["media"]["streamType"] = media.stream_type;
    return media_request(transport_id, std::move(payload));
}

std::vector<MediaEntry> CastDevice::media_status(const std::string& transport_id) {
    Json::Value payload;
    payload["type"] = "GET_STATUS";
    return media_request(transport_id, std::move(payload));
}

void CastDevice::play(const std::string& transport_id, int64_t media_session_id) {
    Json::Value payload;
    payload["type"] = "PLAY";
    payload["mediaSessionId"] = static_cast<Json::Int64>(media_session_id);
    media_request(transport_id, std::move(payload));
}

void CastDevice::pause(const std::string& transport_id, int64_t media_session_id) {
    Json::Value payload;
    payload["type"] = "PAUSE";
    payload["mediaSessionId"] = static_cast<Json::Int64>(media_session_id);
    media_request(transport_id, std::move(payload));
}

void CastDevice::stop(const std::string& transport_id, int64_t media_session_id) {
    Json::Value payload;
    payload["type"] = "STOP";
    payload["mediaSessionId"] = static_cast<Json::Int64>(media_session_id);
    media_request(transport_id, std::move(payload));
}

void CastDevice::seek(const std::string& transport_id, int64_t media_session_id, double seconds) {
    Json::Value payload;
    payload["type"] = "SEEK";
    payload["mediaSessionId"] = static_cast<Json::Int64>(media_session_id);
    payload["currentTime"] = seconds;
    media_request(transport_id, std::move(payload));
}

}  // namespace castd
