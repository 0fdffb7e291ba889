#include "castd/ConnectionThreads.hpp"

#include <exception>
#include <iterator>
#include <iostream>

namespace castd {

ConnectionThreads::~ConnectionThreads() {
    interrupt();
    join_all();
}

void ConnectionThreads::spawn(std::shared_ptr<Connection> connection, Handler handler) {
    std::list<Entry> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            auto next = std::next(it);
            if (it->done) finished.splice(finished.end(), entries_, it);
            it = next;
        }

        entries_.emplace_back();
        Entry* entry = &entries_.back();
        entry->connection = connection;
        entry->thread = std::thread([this, entry, connection, handler = std::move(handler)] {
            try {
                handler(connection->socket);
            } catch (const std::exception& e) {
                std::cerr << "[ERROR] Connection handler: " << e.what() << "\n";
            }
            std::lock_guard<std::mutex> done_lock(mutex_);
            entry->done = true;
        });
    }
    for (auto& entry : finished) entry.thread.join();
}

void ConnectionThreads::interrupt() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : entries_) {
        if (entry.done) continue;
        boost::system::error_code ec;
        entry.connection->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    }
}

void ConnectionThreads::join_all() {
    std::list<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.swap(entries_);
    }
    for (auto& entry : entries) {
        if (entry.thread.joinable()) entry.thread.join();
    }
}

size_t ConnectionThreads::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : entries_) {
        if (!entry.done) ++count;
    }
    return count;
}

}  // namespace castd
