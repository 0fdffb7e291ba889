#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cast_channel.pb.h"

namespace castd {

constexpr uint16_t kCastPort = 8009;

// One connection to a cast device. Not thread-safe: a channel is owned by
// exactly one thread of control at a time.
class CastChannel {
   public:
    virtual ~CastChannel() = default;

    virtual void send(const cast_channel::CastMessage& message) = 0;

    // Blocks until one complete message arrives or the timeout elapses
    // (std::nullopt). Throws TransportError when the link fails.
    virtual std::optional<cast_channel::CastMessage> receive(std::chrono::milliseconds timeout) = 0;

    // Address of this end of the connection, as seen by the device.
    virtual std::string local_address() const = 0;

    virtual void close() noexcept = 0;
};

class CastConnector {
   public:
    virtual ~CastConnector() = default;

    // Throws TransportError when the device cannot be reached.
    virtual std::unique_ptr<CastChannel> open(const std::string& host, uint16_t port) = 0;
};

// TLS to the device without host verification; cast devices present
// self-signed certificates.
class TlsCastConnector : public CastConnector {
   public:
    std::unique_ptr<CastChannel> open(const std::string& host, uint16_t port) override;
};

}  // namespace castd
