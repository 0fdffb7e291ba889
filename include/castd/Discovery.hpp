#pragma once

#include <boost/asio/ip/address.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace castd {

constexpr const char* kCastServiceType = "_googlecast._tcp";
constexpr const char* kUnknownDeviceName = "Unknown";

struct DiscoveredDevice {
    std::string friendly_name;
    boost::asio::ip::address address;
};

// Multicast service query. Returns every address record seen before the
// timeout, duplicates included. Throws DiscoveryError if the query fails.
class ServiceBrowser {
   public:
    virtual ~ServiceBrowser() = default;
    virtual std::vector<boost::asio::ip::address> browse(std::chrono::milliseconds timeout) = 0;
};

// HTTP GET of a device description. std::nullopt on any failure.
class DescriptionFetcher {
   public:
    virtual ~DescriptionFetcher() = default;
    virtual std::optional<std::string> fetch(const std::string& url) = 0;
};

// mDNS browse/resolve through the Avahi daemon.
class AvahiBrowser : public ServiceBrowser {
   public:
    explicit AvahiBrowser(std::string service_type = kCastServiceType);
    std::vector<boost::asio::ip::address> browse(std::chrono::milliseconds timeout) override;

   private:
    std::string service_type_;
};

class CurlDescriptionFetcher : public DescriptionFetcher {
   public:
    explicit CurlDescriptionFetcher(long timeout_seconds = 2);
    std::optional<std::string> fetch(const std::string& url) override;

   private:
    long timeout_seconds_;
};

// http://{address}:8008/ssdp/device-desc.xml, IPv6 literals bracketed.
std::string description_url(const boost::asio::ip::address& address);

std::optional<std::string> extract_friendly_name(const std::string& description);

class Discovery {
   public:
    Discovery(std::unique_ptr<ServiceBrowser> browser, std::unique_ptr<DescriptionFetcher> fetcher);

    // Unique addresses in first-seen order, each paired with its friendly
    // name or "Unknown".
    std::vector<DiscoveredDevice> run(std::chrono::milliseconds timeout);

   private:
    std::unique_ptr<ServiceBrowser> browser_;
    std::unique_ptr<DescriptionFetcher> fetcher_;
};

// Avahi + libcurl.
Discovery make_default_discovery();

}  // namespace castd
