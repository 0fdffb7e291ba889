#pragma once

#include <boost/asio/ip/address.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "castd/CastChannel.hpp"
#include "castd/CommandDispatcher.hpp"
#include "castd/Discovery.hpp"
#include "castd/MediaStatus.hpp"
#include "castd/StatusLoop.hpp"

namespace castd {

enum class CastState { Idle, Connecting, AppLaunching, MediaLoading, Streaming, Closing };

const char* to_string(CastState state);

struct CasterOptions {
    uint16_t device_port = kCastPort;
    StatusLoopOptions status;
};

/**
 * Owns the cast session with one device: the connection opened by begin(),
 * the status thread that keeps it alive, and the shared status cell.
 *
 * Playback commands go through a CommandDispatcher on connections of their
 * own, so they never contend with the status thread.
 */
class Caster {
   public:
    explicit Caster(std::shared_ptr<CastConnector> connector, CasterOptions options = {});
    ~Caster();

    Caster(const Caster&) = delete;
    Caster& operator=(const Caster&) = delete;

    // Most recent discovery result; select_device() only accepts these.
    void update_devices(std::vector<DiscoveredDevice> devices);
    std::vector<DiscoveredDevice> devices() const;

    void select_device(const std::string& address);
    std::optional<DiscoveredDevice> target() const;

    // Launches the Default Media Receiver and loads
    // http://{local ip}:{media_port} on the selected device.
    void begin(uint16_t media_port);

    // Stops playback (best effort) and tears the status thread down.
    void close();

    void resume();
    void pause();
    void stop();
    void seek(double seconds);
    void dispatch(const Command& command);

    MediaStatus status() const { return status_->media(); }
    StatusSnapshot snapshot() const { return status_->snapshot(); }
    bool link_lost() const { return status_->snapshot().link_lost; }

    CastState state() const { return state_.load(); }
    // A status thread exists and has not finished.
    bool polling() const;

   private:
    CommandDispatcher dispatcher() const;

    std::shared_ptr<CastConnector> connector_;
    CasterOptions options_;
    std::shared_ptr<StatusCell> status_;

    std::mutex lifecycle_mutex_;  // serializes begin() and close()
    mutable std::mutex mutex_;
    std::vector<DiscoveredDevice> devices_;
    std::optional<DiscoveredDevice> target_;
    std::unique_ptr<StatusLoop> poller_;
    std::atomic<CastState> state_{CastState::Idle};
};

}  // namespace castd
