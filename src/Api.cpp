#include "castd/Api.hpp"

#include <iostream>

#include "castd/Errors.hpp"
#include "castd/JsonUtil.hpp"

namespace castd {

namespace {

ApiReply ok() {
    Json::Value body;
    body["result"] = "ok";
    return ApiReply{200, write_compact(body)};
}

unsigned http_status_for(const CastError& error) {
    if (dynamic_cast<const StateError*>(&error)) return 409;
    if (dynamic_cast<const ApplicationError*>(&error)) return 400;
    return 502;
}

ApiReply failure(const CastError& error) {
    Json::Value body;
    body["error"] = error_kind(error);
    body["message"] = error.what();
    return ApiReply{http_status_for(error), write_compact(body)};
}

}  // namespace

Api::Api(Caster& caster, Discovery& discovery, uint16_t media_port,
         std::chrono::milliseconds scan_timeout)
    : caster_(caster),
      discovery_(discovery),
      media_port_(media_port),
      scan_timeout_(scan_timeout) {}

ApiReply Api::handle(const ApiRequest& request) {
    try {
        return execute(request);
    } catch (const CastError& e) {
        std::cout << "[API] Request failed: " << error_kind(e) << ": " << e.what() << "\n";
        return failure(e);
    }
}

ApiReply Api::execute(const ApiRequest& request) {
    switch (request.kind) {
        case ApiRequest::Kind::MediaStatus: {
            const StatusSnapshot snapshot = caster_.snapshot();
            Json::Value body = to_json(snapshot.media);
            if (snapshot.link_lost) {
                body["linkLost"] = true;
            }
            return ApiReply{200, write_compact(body)};
        }
        case ApiRequest::Kind::Devices: {
            Json::Value body(Json::arrayValue);
            for (const auto& device : caster_.devices()) {
                Json::Value item;
                item["name"] = device.friendly_name;
                item["address"] = device.address.to_string();
                body.append(item);
            }
            return ApiReply{200, write_compact(body)};
        }
        case ApiRequest::Kind::Discover:
            std::cout << "[API] Request received: DiscoverDevices\n";
            caster_.update_devices(discovery_.run(scan_timeout_));
            return ok();
        case ApiRequest::Kind::SelectDevice:
            std::cout << "[API] Request received: select device '" << request.address << "'\n";
            caster_.select_device(request.address);
            return ok();
        case ApiRequest::Kind::Begin:
            std::cout << "[API] Request received: begin casting\n";
            caster_.begin(request.port.value_or(media_port_));
            return ok();
        case ApiRequest::Kind::Close:
            std::cout << "[API] Request received: close\n";
            caster_.close();
            return ok();
        case ApiRequest::Kind::Control:
            std::cout << "[API] Request received: " << to_string(request.command.kind) << "\n";
            caster_.dispatch(request.command);
            return ok();
    }
    throw ApplicationError("Unknown request");
}

std::future<ApiReply> RequestQueue::submit(ApiRequest request) {
    Pending pending{std::move(request), std::promise<ApiReply>()};
    auto reply = pending.reply.get_future();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (closed_) {
            throw ApplicationError("API worker is shut down");
        }
        queue_.push_back(std::move(pending));
    }
    cv_.notify_one();
    return reply;
}

std::optional<RequestQueue::Pending> RequestQueue::pop() {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) return std::nullopt;
    Pending pending = std::move(queue_.front());
    queue_.pop_front();
    return pending;
}

void RequestQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

void serve(Api& api, RequestQueue& queue) {
    while (auto pending = queue.pop()) {
        pending->reply.set_value(api.handle(pending->request));
    }
    std::cout << "[API] Worker stopped.\n";
}

}  // namespace castd
