#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>

#include "castd/Caster.hpp"
#include "castd/CommandDispatcher.hpp"
#include "castd/Discovery.hpp"

namespace castd {

struct ApiRequest {
    enum class Kind { MediaStatus, Devices, Discover, SelectDevice, Begin, Close, Control };

    Kind kind = Kind::MediaStatus;
    std::string address;         // SelectDevice
    std::optional<uint16_t> port;  // Begin
    Command command;             // Control
};

// HTTP status plus JSON body.
struct ApiReply {
    unsigned status = 200;
    std::string body;
};

/**
 * Maps gateway requests onto the Caster and Discovery and turns the outcome
 * into a JSON reply. Owns the discovery cache through the Caster.
 * Meant to be driven from a single worker thread (see serve()).
 */
class Api {
   public:
    Api(Caster& caster, Discovery& discovery, uint16_t media_port,
        std::chrono::milliseconds scan_timeout);

    ApiReply handle(const ApiRequest& request);

   private:
    ApiReply execute(const ApiRequest& request);

    Caster& caster_;
    Discovery& discovery_;
    uint16_t media_port_;
    std::chrono::milliseconds scan_timeout_;
};

// Multi-producer queue feeding the API worker. Each request carries a
// single-use reply promise; a caller that dropped its future never sees
// the reply.
class RequestQueue {
   public:
    struct Pending {
        ApiRequest request;
        std::promise<ApiReply> reply;
    };

    std::future<ApiReply> submit(ApiRequest request);

    // Blocks for the next request. std::nullopt once closed and drained.
    std::optional<Pending> pop();

    void close();

   private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Pending> queue_;
    bool closed_ = false;
};

// Worker loop: handles requests until the queue is closed.
void serve(Api& api, RequestQueue& queue);

}  // namespace castd
