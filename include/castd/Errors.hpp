#pragma once

#include <stdexcept>
#include <string>

namespace castd {

// Root of every failure castd reports. Catch this at API boundaries.
class CastError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

// I/O failure talking to the device, over multicast or over HTTP.
class TransportError : public CastError {
   public:
    using CastError::CastError;
};

// The multicast layer itself failed (not a single unreachable device).
class DiscoveryError : public TransportError {
   public:
    using TransportError::TransportError;
};

// Malformed, unexpected or missing device response.
class ProtocolError : public CastError {
   public:
    using CastError::CastError;
};

enum class StateFault {
    NoDeviceSelected,
    DeviceNotFound,
    NoActiveMedia,
    AlreadyStreaming,
};

const char* to_string(StateFault fault);

class StateError : public CastError {
   public:
    StateError(StateFault fault, const std::string& what);

    StateFault fault() const noexcept { return fault_; }

   private:
    StateFault fault_;
};

// Bad caller input, or a request castd does not support.
class ApplicationError : public CastError {
   public:
    using CastError::CastError;
};

// Short name of the most derived category, used in JSON error replies.
std::string error_kind(const CastError& error);

}  // namespace castd
