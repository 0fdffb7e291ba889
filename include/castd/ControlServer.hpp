#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "castd/Api.hpp"
#include "castd/ConnectionThreads.hpp"

namespace castd {

// Maps an HTTP method and target (plus JSON body) onto an ApiRequest.
// std::nullopt for unknown routes; ApplicationError for a bad body.
std::optional<ApiRequest> route_request(boost::beast::http::verb method, const std::string& target,
                                        const std::string& body);

/**
 * REST façade in front of the API worker. Every connection is served on its
 * own thread; requests are handed to the RequestQueue and the handler blocks
 * on the reply. The queue must keep being served until run() has returned.
 */
class ControlServer {
   public:
    ControlServer(RequestQueue& queue, uint16_t port);

    // Accept loop; returns after stop().
    void run();
    void stop();

    uint16_t port() const { return port_; }
    size_t open_connections() const { return connections_.active(); }

   private:
    RequestQueue& queue_;
    boost::asio::io_context ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    ConnectionThreads connections_;
};

}  // namespace castd
