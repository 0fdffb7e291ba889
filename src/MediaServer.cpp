#include "castd/MediaServer.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace castd {

namespace {

bool parse_u64(const std::string& text, uint64_t& out) {
    auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
    if (text.empty() || !std::all_of(text.begin(), text.end(), is_digit)) return false;
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

template <class Body>
void set_media_headers(http::response<Body>& res) {
    res.set(http::field::server, "castd");
    res.set(http::field::content_type, "video/mp4");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::accept_ranges, "bytes");
}

void serve_file(tcp::socket& sock, const std::string& file_path) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(sock, buffer, req, ec);
    if (ec) {
        std::cout << "[HTTP] Read error: " << ec.message() << "\n";
        return;
    }

    beast::file file;
    file.open(file_path.c_str(), beast::file_mode::scan, ec);
    if (ec) {
        http::response<http::string_body> err{http::status::not_found, req.version()};
        err.set(http::field::content_type, "text/plain");
        err.body() = "Not found";
        err.prepare_payload();
        http::write(sock, err, ec);
        return;
    }
    const uint64_t file_size = file.size(ec);
    if (ec) {
        http::response<http::string_body> err{http::status::internal_server_error, req.version()};
        err.set(http::field::content_type, "text/plain");
        err.body() = "File size error";
        err.prepare_payload();
        http::write(sock, err, ec);
        return;
    }

    auto range_header = req.find(http::field::range);
    if (range_header == req.end()) {
        // No Range header - serve full file
        http::response<http::file_body> res{http::status::ok, req.version()};
        res.body().open(file_path.c_str(), beast::file_mode::scan, ec);
        if (ec) {
            std::cout << "[HTTP] File open error for full serve: " << ec.message() << "\n";
            return;
        }
        set_media_headers(res);
        res.prepare_payload();
        http::write(sock, res, ec);
        std::cout << "[HTTP] Served full file (" << file_size << " bytes)\n";
    } else {
        const std::string value(range_header->value().data(), range_header->value().size());
        auto range = parse_byte_range(value, file_size);
        if (!range) {
            http::response<http::string_body> err{http::status::range_not_satisfiable,
                                                  req.version()};
            err.set(http::field::content_range, "bytes */" + std::to_string(file_size));
            err.prepare_payload();
            http::write(sock, err, ec);
            return;
        }

        http::response<http::empty_body> res{http::status::partial_content, req.version()};
        set_media_headers(res);
        res.set(http::field::content_range, "bytes " + std::to_string(range->start) + "-" +
                                                std::to_string(range->end) + "/" +
                                                std::to_string(file_size));
        res.content_length(range->length());

        file.seek(range->start, ec);
        if (ec) {
            std::cout << "[HTTP] Seek error: " << ec.message() << "\n";
            return;
        }

        http::response_serializer<http::empty_body> sr{res};
        http::write_header(sock, sr, ec);
        if (ec) return;

        std::vector<char> chunk(std::min<uint64_t>(range->length(), 8192));
        uint64_t remaining = range->length();
        while (remaining > 0) {
            const size_t to_read = static_cast<size_t>(std::min<uint64_t>(remaining, chunk.size()));
            const size_t bytes_read = file.read(chunk.data(), to_read, ec);
            if (ec || bytes_read == 0) break;
            net::write(sock, net::buffer(chunk.data(), bytes_read), ec);
            if (ec) break;
            remaining -= bytes_read;
        }
        std::cout << "[HTTP] Served range " << range->start << "-" << range->end << " ("
                  << range->length() << " bytes)\n";
    }

    sock.shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace

std::optional<ByteRange> parse_byte_range(const std::string& header, uint64_t file_size) {
    if (header.rfind("bytes=", 0) != 0 || file_size == 0) return std::nullopt;

    const std::string range_spec = header.substr(6);
    const size_t dash_pos = range_spec.find('-');
    if (dash_pos == std::string::npos || range_spec.find(',') != std::string::npos) {
        return std::nullopt;
    }
    const std::string start_str = range_spec.substr(0, dash_pos);
    const std::string end_str = range_spec.substr(dash_pos + 1);

    ByteRange range{0, file_size - 1};
    if (start_str.empty()) {
        // Suffix range: the last n bytes
        uint64_t suffix = 0;
        if (!parse_u64(end_str, suffix) || suffix == 0) return std::nullopt;
        range.start = suffix >= file_size ? 0 : file_size - suffix;
        return range;
    }

    if (!parse_u64(start_str, range.start)) return std::nullopt;
    if (!end_str.empty()) {
        if (!parse_u64(end_str, range.end)) return std::nullopt;
        range.end = std::min(range.end, file_size - 1);
    }
    if (range.start >= file_size || range.start > range.end) return std::nullopt;
    return range;
}

MediaServer::MediaServer(std::string file_path, uint16_t port)
    : file_path_(std::move(file_path)), acceptor_(ioc_, {tcp::v4(), port}) {
    port_ = acceptor_.local_endpoint().port();
}

void MediaServer::run() {
    const std::string filename = file_path_.substr(file_path_.find_last_of("/\\") + 1);
    std::cout << "[HTTP] Serving " << filename << " on port " << port_ << "\n";

    while (!stopping_) {
        auto connection = std::make_shared<Connection>();
        beast::error_code ec;
        acceptor_.accept(connection->socket, ec);
        if (ec) {
            std::cout << "[HTTP] Accept error: " << ec.message() << "\n";
            continue;
        }
        if (stopping_) break;
        connections_.spawn(std::move(connection),
                           [path = file_path_](tcp::socket& sock) { serve_file(sock, path); });
    }
    beast::error_code ec;
    acceptor_.close(ec);
    connections_.interrupt();
    connections_.join_all();
}

void MediaServer::stop() {
    if (stopping_.exchange(true)) return;
    connections_.interrupt();
    net::io_context ioc;
    tcp::socket wake{ioc};
    beast::error_code ec;
    wake.connect({net::ip::address_v4::loopback(), port_}, ec);
}

}  // namespace castd
