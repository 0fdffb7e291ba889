// castd: discovers cast devices via mDNS, serves a local MP4 over HTTP, casts
// it to the chosen device using the Cast V2 protocol and exposes a REST API
// to control playback.

#include <curl/curl.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <thread>

#include "castd/Api.hpp"
#include "castd/Caster.hpp"
#include "castd/ControlServer.hpp"
#include "castd/Discovery.hpp"
#include "castd/Errors.hpp"
#include "castd/JsonUtil.hpp"
#include "castd/MediaServer.hpp"

namespace {

constexpr uint16_t kDefaultApiPort = 8080;
constexpr int kDefaultScanSeconds = 3;

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <MP4_PATH> <MEDIA_PORT> [API_PORT] [SCAN_SECONDS]\n";
}

bool parse_port(const std::string& text, uint16_t& port) {
    try {
        const int value = std::stoi(text);
        if (value <= 0 || value > 65535) return false;
        port = static_cast<uint16_t>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Submits a request to the API worker and prints its reply.
castd::ApiReply call(castd::RequestQueue& queue, castd::ApiRequest request) {
    castd::ApiReply reply = queue.submit(std::move(request)).get();
    if (reply.status != 200) {
        std::cerr << "[ERROR] " << reply.body << "\n";
    }
    return reply;
}

// Lists the discovered devices and lets the user pick one to cast to.
void choose_and_cast(castd::RequestQueue& queue) {
    castd::ApiRequest discover;
    discover.kind = castd::ApiRequest::Kind::Discover;
    if (call(queue, discover).status != 200) return;

    castd::ApiRequest list_request;
    list_request.kind = castd::ApiRequest::Kind::Devices;
    auto list = castd::parse_json(call(queue, list_request).body);
    if (!list || !list->isArray() || list->empty()) {
        std::cerr << "No cast devices found. Use PUT /api/discover to scan again.\n";
        return;
    }

    std::cout << "Found devices:\n";
    for (Json::ArrayIndex i = 0; i < list->size(); ++i) {
        std::cout << " " << (i + 1) << ". " << (*list)[i]["name"].asString() << " @ "
                  << (*list)[i]["address"].asString() << "\n";
    }

    int choice = -1;
    while (choice < 0 || choice > static_cast<int>(list->size())) {
        std::cout << "Select device [1-" << list->size() << "], 0 to skip: ";
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) return;
            std::cin.clear();
            std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            std::cerr << "Invalid input.\n";
            choice = -1;
        }
    }
    if (choice == 0) return;

    castd::ApiRequest select;
    select.kind = castd::ApiRequest::Kind::SelectDevice;
    select.address = (*list)[choice - 1]["address"].asString();
    if (call(queue, select).status != 200) return;

    castd::ApiRequest begin;
    begin.kind = castd::ApiRequest::Kind::Begin;
    if (call(queue, begin).status == 200) {
        std::cout << "[Cast] Check your TV! Video should start playing now.\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 3 || argc > 5) {
        usage(argv[0]);
        return 1;
    }
    const std::string file_path = argv[1];
    uint16_t media_port = 0;
    uint16_t api_port = kDefaultApiPort;
    int scan_seconds = kDefaultScanSeconds;
    if (!parse_port(argv[2], media_port) || (argc > 3 && !parse_port(argv[3], api_port))) {
        usage(argv[0]);
        return 1;
    }
    if (argc > 4) {
        try {
            scan_seconds = std::stoi(argv[4]);
        } catch (const std::exception&) {
            scan_seconds = 0;
        }
        if (scan_seconds <= 0) {
            usage(argv[0]);
            return 1;
        }
    }
    if (!std::filesystem::is_regular_file(file_path)) {
        std::cerr << "[ERROR] Not a file: " << file_path << "\n";
        return 1;
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);
    int exit_code = 0;
    try {
        // 1) Media and control servers, API worker. Both servers bind in
        // their constructors, before any thread is started.
        castd::MediaServer media_server(file_path, media_port);
        castd::Caster caster(std::make_shared<castd::TlsCastConnector>());
        castd::Discovery discovery = castd::make_default_discovery();
        castd::Api api(caster, discovery, media_port, std::chrono::seconds(scan_seconds));
        castd::RequestQueue queue;
        castd::ControlServer control_server(queue, api_port);

        std::thread media_thread([&] { media_server.run(); });
        std::thread worker([&] { castd::serve(api, queue); });
        std::thread control_thread([&] { control_server.run(); });

        // 2) Discover, choose and cast. SIGINT keeps its default action
        // here, so Ctrl+C at the menu ends the program.
        try {
            choose_and_cast(queue);
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] " << e.what() << "\n";
        }

        std::cout << "[Cast] Control API on port " << control_server.port()
                  << ", media on port " << media_server.port() << ". Press Ctrl+C to stop.\n";

        // 3) Wait for shutdown
        try {
            boost::asio::io_context signal_ioc;
            boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
            signals.async_wait([](const boost::system::error_code&, int signal_number) {
                std::cout << "[Cast] Stop signal (" << signal_number
                          << ") received. Shutting down...\n";
            });
            signal_ioc.run();
        } catch (const boost::system::system_error& e) {
            std::cerr << "[ERROR] Signal handling: " << e.what() << "\n";
            exit_code = 1;
        }

        control_server.stop();
        control_thread.join();
        queue.close();
        worker.join();
        caster.close();
        media_server.stop();
        media_thread.join();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        exit_code = 1;
    }
    curl_global_cleanup();
    return exit_code;
}
