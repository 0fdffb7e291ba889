#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "castd/ConnectionThreads.hpp"

namespace castd {

struct ByteRange {
    uint64_t start = 0;
    uint64_t end = 0;  // inclusive

    uint64_t length() const { return end - start + 1; }
};

// Parses "bytes=a-b", "bytes=a-" and "bytes=-n" against a file size.
// std::nullopt when the header is malformed or not satisfiable.
std::optional<ByteRange> parse_byte_range(const std::string& header, uint64_t file_size);

// Serves exactly one file, whatever the request path, with Range support
// so the receiver can seek. run() returns once stop() was called and every
// connection handler has finished.
class MediaServer {
   public:
    MediaServer(std::string file_path, uint16_t port);

    void run();
    void stop();

    uint16_t port() const { return port_; }
    size_t open_connections() const { return connections_.active(); }

   private:
    std::string file_path_;
    boost::asio::io_context ioc_{1};
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t port_ = 0;
    std::atomic<bool> stopping_{false};
    ConnectionThreads connections_;
};

}  // namespace castd
