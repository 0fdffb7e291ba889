#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace castd {

// One accepted client. The socket is registered with the connection's own
// io_context, so it never depends on the server that accepted it.
struct Connection {
    boost::asio::io_context ioc{1};
    boost::asio::ip::tcp::socket socket{ioc};
};

/**
 * Thread-per-connection bookkeeping for the HTTP servers. Handler threads
 * are tracked instead of detached: interrupt() shuts down every open socket
 * so a blocked read or write returns, and join_all() waits for them.
 */
class ConnectionThreads {
   public:
    using Handler = std::function<void(boost::asio::ip::tcp::socket&)>;

    ConnectionThreads() = default;
    ConnectionThreads(const ConnectionThreads&) = delete;
    ConnectionThreads& operator=(const ConnectionThreads&) = delete;
    ~ConnectionThreads();

    // Runs handler on its own thread. Threads that already finished are
    // joined here, so a long-lived server does not accumulate them.
    void spawn(std::shared_ptr<Connection> connection, Handler handler);

    void interrupt();
    void join_all();

    // Handlers still running.
    size_t active() const;

   private:
    struct Entry {
        std::shared_ptr<Connection> connection;
        std::thread thread;
        bool done = false;
    };

    mutable std::mutex mutex_;
    std::list<Entry> entries_;
};

}  // namespace castd
