#include "castd/StatusLoop.hpp"

#include <iostream>

#include "castd/CastDevice.hpp"
#include "castd/Errors.hpp"

namespace castd {

StatusLoop::StatusLoop(std::unique_ptr<CastChannel> channel, std::string transport_id,
                       std::shared_ptr<StatusCell> status, StatusLoopOptions options,
                       int first_request_id)
    : channel_(std::move(channel)),
      transport_id_(std::move(transport_id)),
      status_(std::move(status)),
      options_(options),
      first_request_id_(first_request_id) {}

StatusLoop::~StatusLoop() { shutdown(); }

void StatusLoop::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread(&StatusLoop::run, this, shutdown_tx_.get_future());
}

void StatusLoop::shutdown() {
    if (!signalled_) {
        shutdown_tx_.set_value();
        signalled_ = true;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

void StatusLoop::run(std::future<void> shutdown_signal) {
    CastDevice device(*channel_, options_.reply_timeout, first_request_id_);
    auto last_media_status = std::chrono::steady_clock::now();
    auto status_delay = options_.first_poll_delay;

    for (;;) {
        // A broken promise also makes the future ready.
        if (shutdown_signal.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            std::cout << "[Status] Stopping status communication thread.\n";
            break;
        }

        // Handle device communication. If PINGs are not answered the device
        // drops the connection.
        try {
            if (auto message = device.receive(options_.receive_timeout)) {
                if (message->kind == MessageKind::Heartbeat && message->type == "PING") {
                    device.pong();
                }
                std::cout << "[Device=>" << to_string(message->kind) << "] " << message->raw
                          << "\n";
            }
        } catch (const CastError& e) {
            std::cerr << "[Status] Lost connection to device: " << e.what() << "\n";
            status_->mark_link_lost();
            break;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now - last_media_status < status_delay) continue;
        status_delay = options_.poll_interval;
        last_media_status = now;

        try {
            auto entries = device.media_status(transport_id_);
            MediaStatus status = entries.empty() ? MediaStatus::inactive()
                                                 : MediaStatus::active(entries.front());
            std::cout << "[Status] " << to_json(status)["playbackState"].asString() << "\n";
            status_->store(std::move(status));
        } catch (const TransportError& e) {
            std::cerr << "[Status] Lost connection to device: " << e.what() << "\n";
            status_->mark_link_lost();
            break;
        } catch (const CastError& e) {
            // retried next interval
            std::cout << "[Status] Status fetch failed: " << e.what() << "\n";
        }
    }

    channel_->close();
    finished_ = true;
}

}  // namespace castd
