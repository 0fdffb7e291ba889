#include "castd/ControlServer.hpp"

#include <boost/beast/core.hpp>

#include <iostream>

#include "castd/Errors.hpp"
#include "castd/JsonUtil.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace castd {

namespace {

Json::Value parse_body(const std::string& body) {
    if (body.empty()) return Json::Value(Json::objectValue);
    auto parsed = parse_json(body);
    if (!parsed || !parsed->isObject()) {
        throw ApplicationError("Request body is not a JSON object");
    }
    return *parsed;
}

const Json::Value& require(const Json::Value& body, const char* field) {
    const Json::Value& value = body[field];
    if (value.isNull()) {
        throw ApplicationError(std::string("Missing field '") + field + "'");
    }
    return value;
}

ApiRequest control(Command command) {
    ApiRequest request;
    request.kind = ApiRequest::Kind::Control;
    request.command = command;
    return request;
}

http::response<http::string_body> json_response(unsigned status, const std::string& body,
                                                 unsigned version) {
    http::response<http::string_body> res{static_cast<http::status>(status), version};
    res.set(http::field::server, "castd");
    res.set(http::field::content_type, "application/json");
    res.set(http::field::access_control_allow_origin, "*");
    res.keep_alive(false);
    res.body() = body;
    res.prepare_payload();
    return res;
}

std::string error_body(const char* kind, const std::string& message) {
    Json::Value body;
    body["error"] = kind;
    body["message"] = message;
    return write_compact(body);
}

}  // namespace

std::optional<ApiRequest> route_request(http::verb method, const std::string& target,
                                        const std::string& body) {
    const std::string path = target.substr(0, target.find('?'));
    ApiRequest request;

    if (method == http::verb::get) {
        if (path == "/api/status") {
            request.kind = ApiRequest::Kind::MediaStatus;
            return request;
        }
        if (path == "/api/devices") {
            request.kind = ApiRequest::Kind::Devices;
            return request;
        }
        return std::nullopt;
    }
    if (method != http::verb::put) return std::nullopt;

    if (path == "/api/discover") {
        request.kind = ApiRequest::Kind::Discover;
        return request;
    }
    if (path == "/api/close") {
        request.kind = ApiRequest::Kind::Close;
        return request;
    }
    if (path == "/api/play") return control(Command::play());
    if (path == "/api/pause") return control(Command::pause());
    if (path == "/api/stop") return control(Command::stop());

    if (path == "/api/select") {
        const Json::Value json = parse_body(body);
        const Json::Value& address = require(json, "address");
        if (!address.isString()) throw ApplicationError("'address' must be a string");
        request.kind = ApiRequest::Kind::SelectDevice;
        request.address = address.asString();
        return request;
    }
    if (path == "/api/begin") {
        const Json::Value json = parse_body(body);
        request.kind = ApiRequest::Kind::Begin;
        if (json.isMember("port")) {
            const Json::Value& port = json["port"];
            if (!port.isUInt() || port.asUInt() == 0 || port.asUInt() > 65535) {
                throw ApplicationError("'port' must be between 1 and 65535");
            }
            request.port = static_cast<uint16_t>(port.asUInt());
        }
        return request;
    }
    if (path == "/api/seek") {
        const Json::Value json = parse_body(body);
        const Json::Value& seconds = require(json, "seconds");
        if (!seconds.isNumeric() || seconds.asDouble() < 0.0) {
            throw ApplicationError("'seconds' must be a non-negative number");
        }
        return control(Command::seek(seconds.asDouble()));
    }
    if (path == "/api/cast") {
        const Json::Value json = parse_body(body);
        const Json::Value& index = require(json, "index");
        if (!index.isUInt()) throw ApplicationError("'index' must be a non-negative integer");
        return control(Command::begin(index.asUInt()));
    }
    return std::nullopt;
}

namespace {

void serve_request(tcp::socket& socket, RequestQueue& queue) {
    beast::error_code ec;
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    if (ec) {
        std::cout << "[API] Read error: " << ec.message() << "\n";
        return;
    }

    const std::string target(req.target().data(), req.target().size());
    http::response<http::string_body> res;
    try {
        auto request = route_request(req.method(), target, req.body());
        if (!request) {
            res = json_response(404, error_body("NotFound", "No route for " + target), req.version());
        } else {
            ApiReply reply = queue.submit(std::move(*request)).get();
            res = json_response(reply.status, reply.body, req.version());
        }
    } catch (const CastError& e) {
        res = json_response(400, error_body(error_kind(e).c_str(), e.what()), req.version());
    } catch (const std::future_error& e) {
        res = json_response(503, error_body("Unavailable", e.what()), req.version());
    }

    http::write(socket, res, ec);
    if (ec) {
        std::cout << "[API] Write error: " << ec.message() << "\n";
    }
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

}  // namespace

ControlServer::ControlServer(RequestQueue& queue, uint16_t port)
    : queue_(queue), acceptor_(ioc_, {tcp::v4(), port}) {
    port_ = acceptor_.local_endpoint().port();
}

void ControlServer::run() {
    std::cout << "[API] Listening on port " << port_ << "\n";
    while (!stopping_) {
        auto connection = std::make_shared<Connection>();
        beast::error_code ec;
        acceptor_.accept(connection->socket, ec);
        if (ec) {
            std::cout << "[API] Accept error: " << ec.message() << "\n";
            continue;
        }
        if (stopping_) break;
        RequestQueue& queue = queue_;
        connections_.spawn(std::move(connection),
                           [&queue](tcp::socket& socket) { serve_request(socket, queue); });
    }
    beast::error_code ec;
    acceptor_.close(ec);
    connections_.interrupt();
    connections_.join_all();
    std::cout << "[API] Stopped.\n";
}

void ControlServer::stop() {
    if (stopping_.exchange(true)) return;
    connections_.interrupt();
    // Wake the blocking accept with a throwaway connection.
    net::io_context ioc;
    tcp::socket wake{ioc};
    beast::error_code ec;
    wake.connect({net::ip::address_v4::loopback(), port_}, ec);
}

}  // namespace castd
