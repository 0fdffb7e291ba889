#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "castd/CastChannel.hpp"
#include "castd/MediaStatus.hpp"

namespace castd {

struct StatusLoopOptions {
    // Delay before the first GET_STATUS, so the freshly loaded media can settle.
    std::chrono::milliseconds first_poll_delay{5000};
    std::chrono::milliseconds poll_interval{500};
    // Upper bound on one receive; also bounds how long close() waits.
    std::chrono::milliseconds receive_timeout{1000};
    std::chrono::milliseconds reply_timeout{10000};
};

/**
 * Background keep-alive/status poller for one cast session.
 *
 * Owns the device channel for its whole lifetime. Each iteration checks the
 * shutdown signal, receives at most one device message (answering PINGs), and
 * refreshes the shared status cell when the poll interval has elapsed.
 * Losing the link marks the cell link_lost and ends the thread.
 */
class StatusLoop {
   public:
    // first_request_id is the next id free on the channel after the
    // handshake that preceded the loop.
    StatusLoop(std::unique_ptr<CastChannel> channel, std::string transport_id,
               std::shared_ptr<StatusCell> status, StatusLoopOptions options,
               int first_request_id = 1);
    ~StatusLoop();

    StatusLoop(const StatusLoop&) = delete;
    StatusLoop& operator=(const StatusLoop&) = delete;

    void start();

    // Signals the thread and joins it. Safe to call more than once.
    void shutdown();

    // True once the thread function has returned.
    bool finished() const { return finished_.load(); }

   private:
    void run(std::future<void> shutdown_signal);

    std::unique_ptr<CastChannel> channel_;
    std::string transport_id_;
    std::shared_ptr<StatusCell> status_;
    StatusLoopOptions options_;
    int first_request_id_;

    std::promise<void> shutdown_tx_;
    bool signalled_ = false;
    std::thread thread_;
    std::atomic<bool> finished_{false};
};

}  // namespace castd
