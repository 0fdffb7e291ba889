#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "cast_channel.pb.h"

namespace castd {

// Frames larger than this are treated as a protocol error.
constexpr uint32_t kMaxFrameSize = 65536;

// 4-byte big-endian length prefix followed by the serialized CastMessage.
std::string encode_frame(const cast_channel::CastMessage& message);

cast_channel::CastMessage make_string_message(const std::string& source_id,
                                              const std::string& destination_id,
                                              const std::string& namespace_name,
                                              const std::string& payload);

/**
 * Accumulates raw bytes read from the device stream and hands out complete
 * CastMessages. Throws ProtocolError on an oversize frame or a body that does
 * not parse.
 */
class FrameReader {
   public:
    void append(const char* data, std::size_t size);
    std::optional<cast_channel::CastMessage> next();

    std::size_t buffered() const { return buffer_.size(); }

   private:
    std::string buffer_;
};

}  // namespace castd
