#pragma once

#include <json/json.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace castd {

enum class PlayerState { Idle, Playing, Paused, Buffering };

// Device spelling: "IDLE", "PLAYING", "PAUSED", "BUFFERING".
const char* to_string(PlayerState state);
std::optional<PlayerState> parse_player_state(const std::string& text);

// One entry of a MEDIA_STATUS "status" array.
struct MediaEntry {
    PlayerState player_state = PlayerState::Idle;
    double current_time = 0.0;
    std::optional<double> duration;
    int64_t media_session_id = 0;
};

// Inactive when no entry is held.
class MediaStatus {
   public:
    MediaStatus() = default;

    static MediaStatus inactive() { return MediaStatus{}; }
    static MediaStatus active(MediaEntry entry) { return MediaStatus{std::move(entry)}; }

    bool is_active() const { return entry_.has_value(); }
    const std::optional<MediaEntry>& entry() const { return entry_; }

   private:
    explicit MediaStatus(MediaEntry entry) : entry_(std::move(entry)) {}

    std::optional<MediaEntry> entry_;
};

// {"playbackState": ..., "currentTime"?: ..., "videoLength"?: ...}
Json::Value to_json(const MediaStatus& status);

struct StatusSnapshot {
    MediaStatus media;
    bool link_lost = false;
};

/**
 * Shared status cell between the status thread (single writer) and any
 * reader. Reads copy out under the lock.
 */
class StatusCell {
   public:
    StatusSnapshot snapshot() const;
    MediaStatus media() const;

    void store(MediaStatus status);
    void mark_link_lost();
    // Called when a new poller takes over the cell.
    void clear_link_lost();

   private:
    mutable std::mutex mutex_;
    StatusSnapshot value_;
};

}  // namespace castd
