#include "castd/CastChannel.hpp"

#include <boost/asio.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

#include <array>
#include <iostream>

#include "castd/CastFrame.hpp"
#include "castd/Errors.hpp"

namespace net = boost::asio;
using tcp = net::ip::tcp;
using ssl_socket = net::ssl::stream<tcp::socket>;

namespace castd {

namespace {

class TlsCastChannel : public CastChannel {
   public:
    TlsCastChannel() : ssl_ctx_(net::ssl::context::tlsv12_client), stream_(io_, ssl_ctx_) {}

    ~TlsCastChannel() override { close(); }

    void connect(const std::string& host, uint16_t port) {
        boost::system::error_code ec;
        ssl_ctx_.set_default_verify_paths(ec);
        stream_.set_verify_mode(net::ssl::verify_none);

        tcp::resolver resolver(io_);
        auto endpoints = resolver.resolve(host, std::to_string(port), ec);
        if (ec) {
            throw TransportError("Failed to resolve " + host + ": " + ec.message());
        }

        std::cout << "[Cast] Connecting to " << host << ":" << port << "...\n";
        net::connect(stream_.lowest_layer(), endpoints, ec);
        if (ec) {
            throw TransportError("Failed to connect to " + host + ": " + ec.message());
        }

        stream_.handshake(net::ssl::stream_base::client, ec);
        if (ec) {
            throw TransportError("TLS handshake with " + host + " failed: " + ec.message());
        }
        std::cout << "[Cast] TLS connection established with " << host << "\n";
    }

    void send(const cast_channel::CastMessage& message) override {
        const std::string frame = encode_frame(message);
        boost::system::error_code ec;
        net::write(stream_, net::buffer(frame), ec);
        if (ec) {
            throw TransportError("Failed to send on " + message.namespace_() + ": " + ec.message());
        }
    }

    std::optional<cast_channel::CastMessage> receive(std::chrono::milliseconds timeout) override {
        if (auto message = reader_.next()) return message;

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            boost::system::error_code ec = net::error::would_block;
            std::size_t bytes_read = 0;
            stream_.async_read_some(net::buffer(chunk_),
                                    [&](const boost::system::error_code& e, std::size_t n) {
                                        ec = e;
                                        bytes_read = n;
                                    });

            // Bounded blocking read: run until the read completes or the
            // deadline passes, then cancel whatever is still pending.
            io_.restart();
            io_.run_until(deadline);
            if (!io_.stopped()) {
                stream_.lowest_layer().cancel();
                io_.run();
            }

            if (ec == net::error::operation_aborted) return std::nullopt;
            if (ec) {
                throw TransportError("Failed to read from device: " + ec.message());
            }

            reader_.append(chunk_.data(), bytes_read);
            if (auto message = reader_.next()) return message;
            if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;
        }
    }

    std::string local_address() const override {
        boost::system::error_code ec;
        auto endpoint = stream_.lowest_layer().local_endpoint(ec);
        if (ec) {
            throw TransportError("Failed to get local address: " + ec.message());
        }
        return endpoint.address().to_string();
    }

    void close() noexcept override {
        boost::system::error_code ec;
        if (!stream_.lowest_layer().is_open()) return;
        stream_.lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
        stream_.lowest_layer().close(ec);
    }

   private:
    net::io_context io_;
    net::ssl::context ssl_ctx_;
    ssl_socket stream_;
    FrameReader reader_;
    std::array<char, 4096> chunk_{};
};

}  // namespace

std::unique_ptr<CastChannel> TlsCastConnector::open(const std::string& host, uint16_t port) {
    auto channel = std::make_unique<TlsCastChannel>();
    channel->connect(host, port);
    return channel;
}

}  // namespace castd
