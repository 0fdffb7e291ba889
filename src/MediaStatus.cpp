#include "castd/MediaStatus.hpp"

namespace castd {

const char* to_string(PlayerState state) {
    switch (state) {
        case PlayerState::Idle:
            return "IDLE";
        case PlayerState::Playing:
            return "PLAYING";
        case PlayerState::Paused:
            return "PAUSED";
        case PlayerState::Buffering:
            return "BUFFERING";
    }
    return "IDLE";
}

std::optional<PlayerState> parse_player_state(const std::string& text) {
    if (text == "IDLE") return PlayerState::Idle;
    if (text == "PLAYING") return PlayerState::Playing;
    if (text == "PAUSED") return PlayerState::Paused;
    if (text == "BUFFERING") return PlayerState::Buffering;
    return std::nullopt;
}

Json::Value to_json(const MediaStatus& status) {
    Json::Value json(Json::objectValue);
    if (!status.is_active()) {
        json["playbackState"] = "Inactive";
        return json;
    }
    const MediaEntry& entry = *status.entry();
    json["playbackState"] = to_string(entry.player_state);
    json["currentTime"] = entry.current_time;
    if (entry.duration) {
        json["videoLength"] = *entry.duration;
    }
    return json;
}

StatusSnapshot StatusCell::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return value_;
}

MediaStatus StatusCell::media() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return value_.media;
}

void StatusCell::store(MediaStatus status) {
    std::lock_guard<std::mutex> lk(mutex_);
    value_.media = std::move(status);
}

void StatusCell::mark_link_lost() {
    std::lock_guard<std::mutex> lk(mutex_);
    value_.link_lost = true;
}

void StatusCell::clear_link_lost() {
    std::lock_guard<std::mutex> lk(mutex_);
    value_.link_lost = false;
}

}  // namespace castd
