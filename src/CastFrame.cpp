#include "castd/CastFrame.hpp"

#include "castd/Errors.hpp"

namespace castd {

std::string encode_frame(const cast_channel::CastMessage& message) {
    std::string serialized;
    if (!message.SerializeToString(&serialized)) {
        throw ProtocolError("Failed to serialize message for " + message.namespace_());
    }
    const auto len = static_cast<uint32_t>(serialized.size());
    std::string frame;
    frame.reserve(4 + serialized.size());
    frame.push_back(static_cast<char>((len >> 24) & 0xFF));
    frame.push_back(static_cast<char>((len >> 16) & 0xFF));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>(len & 0xFF));
    frame.append(serialized);
    return frame;
}

cast_channel::CastMessage make_string_message(const std::string& source_id,
                                              const std::string& destination_id,
                                              const std::string& namespace_name,
                                              const std::string& payload) {
    cast_channel::CastMessage message;
    message.set_protocol_version(cast_channel::CastMessage::CASTV2_1_0);
    message.set_source_id(source_id);
    message.set_destination_id(destination_id);
    message.set_namespace_(namespace_name);
    message.set_payload_type(cast_channel::CastMessage::STRING);
    message.set_payload_utf8(payload);
    return message;
}

void FrameReader::append(const char* data, std::size_t size) {
    buffer_.append(data, size);
}

std::optional<cast_channel::CastMessage> FrameReader::next() {
    if (buffer_.size() < 4) return std::nullopt;

    const auto* p = reinterpret_cast<const unsigned char*>(buffer_.data());
    const uint32_t msg_len = (static_cast<uint32_t>(p[0]) << 24) |
                             (static_cast<uint32_t>(p[1]) << 16) |
                             (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    if (msg_len > kMaxFrameSize) {
        throw ProtocolError("Invalid message length: " + std::to_string(msg_len));
    }
    if (buffer_.size() < 4 + static_cast<std::size_t>(msg_len)) return std::nullopt;

    cast_channel::CastMessage message;
    const bool parsed = message.ParseFromArray(buffer_.data() + 4, static_cast<int>(msg_len));
    buffer_.erase(0, 4 + static_cast<std::size_t>(msg_len));
    if (!parsed) {
        throw ProtocolError("Failed to parse protobuf message");
    }
    return message;
}

}  // namespace castd
