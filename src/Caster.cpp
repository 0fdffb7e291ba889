#include "castd/Caster.hpp"

#include <iostream>

#include "castd/CastDevice.hpp"
#include "castd/Errors.hpp"

namespace castd {

namespace {

std::string media_url(const std::string& local_ip, uint16_t port) {
    const bool v6 = local_ip.find(':') != std::string::npos;
    return "http://" + (v6 ? "[" + local_ip + "]" : local_ip) + ":" + std::to_string(port);
}

}  // namespace

const char* to_string(CastState state) {
    switch (state) {
        case CastState::Idle:
            return "Idle";
        case CastState::Connecting:
            return "Connecting";
        case CastState::AppLaunching:
            return "AppLaunching";
        case CastState::MediaLoading:
            return "MediaLoading";
        case CastState::Streaming:
            return "Streaming";
        case CastState::Closing:
            return "Closing";
    }
    return "Idle";
}

Caster::Caster(std::shared_ptr<CastConnector> connector, CasterOptions options)
    : connector_(std::move(connector)),
      options_(options),
      status_(std::make_shared<StatusCell>()) {}

Caster::~Caster() { close(); }

void Caster::update_devices(std::vector<DiscoveredDevice> devices) {
    std::lock_guard<std::mutex> lk(mutex_);
    devices_ = std::move(devices);
}

std::vector<DiscoveredDevice> Caster::devices() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return devices_;
}

void Caster::select_device(const std::string& address) {
    boost::system::error_code ec;
    const auto wanted = boost::asio::ip::make_address(address, ec);
    if (ec) {
        throw ApplicationError("Invalid device address '" + address + "'");
    }

    std::lock_guard<std::mutex> lk(mutex_);
    for (const auto& device : devices_) {
        if (device.address == wanted) {
            target_ = device;
            std::cout << "[Cast] Selected " << device.friendly_name << " @ " << address << "\n";
            return;
        }
    }
    throw StateError(StateFault::DeviceNotFound,
                     "Device " + address + " was not found by the last discovery");
}

std::optional<DiscoveredDevice> Caster::target() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return target_;
}

bool Caster::polling() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return poller_ && !poller_->finished();
}

void Caster::begin(uint16_t media_port) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::string address;
    std::unique_ptr<StatusLoop> dead_poller;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!target_) {
            throw StateError(StateFault::NoDeviceSelected, "No device address selected.");
        }
        if (poller_ && !poller_->finished()) {
            throw StateError(StateFault::AlreadyStreaming,
                             "Already casting to " + target_->address.to_string());
        }
        // A poller that lost its link is reaped before starting over.
        dead_poller = std::move(poller_);
        address = target_->address.to_string();
    }
    dead_poller.reset();

    try {
        state_ = CastState::Connecting;
        auto channel = connector_->open(address, options_.device_port);
        CastDevice device(*channel, options_.status.reply_timeout);
        device.connect(kReceiverId);
        std::cout << "[Cast] Connected to device " << address << "\n";

        state_ = CastState::AppLaunching;
        std::cout << "[Cast] Launching Default Media Receiver...\n";
        const Application app = device.launch(kDefaultMediaReceiverAppId);
        std::cout << "[Cast] Launched media app (transport " << app.transport_id << ", session "
                  << app.session_id << ")\n";

        state_ = CastState::MediaLoading;
        device.connect(app.transport_id);
        MediaInfo media;
        media.content_id = media_url(channel->local_address(), media_port);
        std::cout << "[Cast] Media URL = " << media.content_id << "\n";
        device.load(app.transport_id, app.session_id, media);
        std::cout << "[Cast] Loaded media.\n";

        status_->clear_link_lost();
        auto poller = std::make_unique<StatusLoop>(std::move(channel), app.transport_id, status_,
                                                   options_.status, device.next_request_id());
        poller->start();
        {
            std::lock_guard<std::mutex> lk(mutex_);
            poller_ = std::move(poller);
        }
        state_ = CastState::Streaming;
    } catch (...) {
        state_ = CastState::Idle;
        throw;
    }
}

void Caster::close() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::unique_ptr<StatusLoop> poller;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        poller = std::move(poller_);
    }
    if (!poller) return;

    if (!poller->finished()) {
        try {
            dispatcher().stop();
        } catch (const CastError& e) {
            std::cout << "[Cast] Stop on close failed: " << e.what() << "\n";
        }
    }

    state_ = CastState::Closing;
    poller->shutdown();
    poller.reset();
    state_ = CastState::Idle;
    std::cout << "[Cast] Session closed.\n";
}

CommandDispatcher Caster::dispatcher() const {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!target_) {
        throw StateError(StateFault::NoDeviceSelected, "No device address set.");
    }
    return CommandDispatcher(connector_, target_->address.to_string(), options_.device_port,
                             options_.status.reply_timeout);
}

void Caster::resume() { dispatcher().resume(); }

void Caster::pause() { dispatcher().pause(); }

void Caster::stop() { dispatcher().stop(); }

void Caster::seek(double seconds) { dispatcher().seek(seconds); }

void Caster::dispatch(const Command& command) { dispatcher().dispatch(command); }

}  // namespace castd
