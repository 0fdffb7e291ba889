#include "castd/Errors.hpp"

namespace castd {

const char* to_string(StateFault fault) {
    switch (fault) {
        case StateFault::NoDeviceSelected:
            return "NoDeviceSelected";
        case StateFault::DeviceNotFound:
            return "DeviceNotFound";
        case StateFault::NoActiveMedia:
            return "NoActiveMedia";
        case StateFault::AlreadyStreaming:
            return "AlreadyStreaming";
    }
    return "Unknown";
}

StateError::StateError(StateFault fault, const std::string& what)
    : CastError(what), fault_(fault) {}

std::string error_kind(const CastError& error) {
    if (auto* state = dynamic_cast<const StateError*>(&error)) {
        return to_string(state->fault());
    }
    if (dynamic_cast<const DiscoveryError*>(&error)) return "DiscoveryError";
    if (dynamic_cast<const TransportError*>(&error)) return "TransportError";
    if (dynamic_cast<const ProtocolError*>(&error)) return "ProtocolError";
    if (dynamic_cast<const ApplicationError*>(&error)) return "ApplicationError";
    return "CastError";
}

}  // namespace castd
