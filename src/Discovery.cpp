#include "castd/Discovery.hpp"

#include <algorithm>
#include <iostream>
#include <regex>

namespace castd {

std::string description_url(const boost::asio::ip::address& address) {
    const std::string host =
        address.is_v6() ? "[" + address.to_string() + "]" : address.to_string();
    return "http://" + host + ":8008/ssdp/device-desc.xml";
}

std::optional<std::string> extract_friendly_name(const std::string& description) {
    static const std::regex pattern("<friendlyName>(.*?)</friendlyName>");
    std::smatch match;
    if (!std::regex_search(description, match, pattern)) {
        return std::nullopt;
    }
    return match[1].str();
}

Discovery::Discovery(std::unique_ptr<ServiceBrowser> browser,
                     std::unique_ptr<DescriptionFetcher> fetcher)
    : browser_(std::move(browser)), fetcher_(std::move(fetcher)) {}

std::vector<DiscoveredDevice> Discovery::run(std::chrono::milliseconds timeout) {
    std::cout << "[Discover] Scanning for cast devices... (" << timeout.count() << "ms)\n";

    std::vector<boost::asio::ip::address> addresses;
    for (const auto& addr : browser_->browse(timeout)) {
        if (std::find(addresses.begin(), addresses.end(), addr) == addresses.end()) {
            addresses.push_back(addr);
        }
    }

    // Name lookups run one after another; a failed lookup only costs the label.
    std::vector<DiscoveredDevice> devices;
    devices.reserve(addresses.size());
    for (const auto& addr : addresses) {
        std::string name = kUnknownDeviceName;
        if (auto body = fetcher_->fetch(description_url(addr))) {
            if (auto friendly = extract_friendly_name(*body)) {
                name = *friendly;
            }
        }
        std::cout << "[Discover] " << name << " @ " << addr.to_string() << "\n";
        devices.push_back(DiscoveredDevice{std::move(name), addr});
    }
    return devices;
}

Discovery make_default_discovery() {
    return Discovery(std::make_unique<AvahiBrowser>(),
                     std::make_unique<CurlDescriptionFetcher>());
}

}  // namespace castd
